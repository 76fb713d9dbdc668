#ifndef MWAREADER_GPUBOXCATALOG_HPP
#define MWAREADER_GPUBOXCATALOG_HPP

#include "mwareader/FileIdentity.hpp"
#include "mwareader/Geometry.hpp"
#include "mwareader/MWAVersion.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mwareader
{

struct Metadata;

/**
 * @brief      Where the visibilities of one timestep and coarse channel
 *             live. Weights, when present, are in the following HDU.
 */
struct HduLocation {
    std::string path;
    int hdu_index = 0;
};

/**
 * @brief      All gpubox files sharing a batch number, sorted by channel
 */
struct GpuboxBatch {
    std::size_t batch_number = 0;
    std::vector<FileIdentity> files;
};

/**
 * UNIX time (ms) -> gpubox channel identifier -> HDU
 */
using GpuboxTimeMap =
    std::map<std::uint64_t, std::map<std::size_t, HduLocation>>;

/**
 * @brief      Index of a set of correlator files
 */
struct GpuboxCatalog {
    MWAVersion version = MWAVersion::CorrMWAXv2;
    std::vector<GpuboxBatch> batches;
    GpuboxTimeMap time_map;
};

/**
 * @brief      Group correlator files into batches
 *
 * @details    Batch numbers must run contiguously from zero and every
 *             batch must hold the same number of files. Throws
 *             CatalogError.
 */
std::vector<GpuboxBatch>
group_gpubox_batches(std::vector<FileIdentity> const& files);

/**
 * @brief      Open every correlator file and index its data HDUs
 *
 * @param      files     Identities of the supplied files, all of one version
 * @param      metadata  The observation metadata (version applied)
 * @param      geometry  The expected HDU geometry
 *
 * @details    Checks each file's OBSID and CORR_VER keys and the axes
 *             of every data HDU. Throws CatalogError.
 */
GpuboxCatalog build_gpubox_catalog(std::vector<FileIdentity> const& files,
                                   Metadata const& metadata,
                                   CorrelatorGeometry const& geometry);

} // namespace mwareader

#endif // MWAREADER_GPUBOXCATALOG_HPP
