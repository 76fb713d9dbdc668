#ifndef MWAREADER_VOLTAGECATALOG_HPP
#define MWAREADER_VOLTAGECATALOG_HPP

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
class ContextConfig;

/**
 * @brief      All voltage files starting at one GPS second, sorted by
 *             receiver channel
 */
struct VoltageBatch {
    std::uint64_t gps_time = 0;
    std::vector<FileIdentity> files;
};

/**
 * GPS time (ms) -> receiver channel -> file path
 */
using VoltageTimeMap =
    std::map<std::uint64_t, std::map<std::size_t, std::string>>;

/**
 * @brief      Index of a set of voltage files
 */
struct VoltageCatalog {
    MWAVersion version = MWAVersion::VCSMWAXv2;
    std::vector<VoltageBatch> batches;
    VoltageTimeMap time_map;
    std::size_t file_size_bytes = 0;
};

/**
 * @brief      Group voltage files by GPS time
 *
 * @param      files                 Identities of the supplied files
 * @param      timestep_duration_ms  Time covered by one file
 *
 * @details    Batches must be spaced by exactly one file duration and
 *             hold the same set of channels. Throws CatalogError.
 */
std::vector<VoltageBatch>
group_voltage_batches(std::vector<FileIdentity> const& files,
                      std::uint64_t timestep_duration_ms);

/**
 * @brief      Check and index a set of voltage files
 *
 * @param      files     Identities of the supplied files, all of one version
 * @param      metadata  The observation metadata (version applied)
 * @param      geometry  The expected file layout
 * @param      config    Controls the size and header checks
 *
 * @details    Throws CatalogError.
 */
VoltageCatalog build_voltage_catalog(std::vector<FileIdentity> const& files,
                                     Metadata const& metadata,
                                     VoltageGeometry const& geometry,
                                     ContextConfig const& config);

} // namespace mwareader

#endif // MWAREADER_VOLTAGECATALOG_HPP
