#ifndef MWAREADER_VOLTAGECONTEXT_HPP
#define MWAREADER_VOLTAGECONTEXT_HPP

#include "mwareader/ContextConfig.hpp"
#include "mwareader/Geometry.hpp"
#include "mwareader/Metadata.hpp"
#include "mwareader/Timestep.hpp"
#include "mwareader/VoltageCatalog.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mwareader
{

/**
 * @brief      Observation metadata plus a set of voltage files
 *
 * @details    Legacy files hold one second of [sample][fine chan]
 *             [antenna][pol] bytes, each byte packing a 4 bit real and
 *             imaginary part. MWAX subfiles hold blocks of [antenna][pol]
 *             [sample][real, imag] signed bytes. Samples are returned
 *             exactly as stored.
 */
class VoltageContext
{
  public:
    explicit VoltageContext(ContextConfig const& config);
    VoltageContext(std::string const& metafits_file,
                   std::vector<std::string> const& voltage_files);
    ~VoltageContext();

    Metadata const& metadata() const;
    std::shared_ptr<Metadata const> shared_metadata() const;
    MWAVersion version() const;
    VoltageGeometry const& geometry() const;
    VoltageCatalog const& catalog() const;

    /**
     * @brief      Union of the metafits timesteps and the file start
     *             times, sorted by time
     */
    std::vector<Timestep> const& timesteps() const;
    std::vector<std::size_t> const& provided_timestep_indices() const;
    std::vector<std::size_t> const& provided_coarse_chan_indices() const;
    std::vector<std::size_t> const& common_timestep_indices() const;

    /**
     * @brief      First GPS second covered by the supplied files
     */
    std::uint64_t start_gps_time_ms() const;

    /**
     * @brief      GPS time just after the last supplied file ends
     */
    std::uint64_t end_gps_time_ms() const;

    /**
     * @brief      Read the data section of one file
     *
     * @return     voltage blocks per timestep x block size bytes
     *
     * @details    Throws DataError.
     */
    std::vector<std::int8_t> read_file(std::size_t timestep_index,
                                       std::size_t coarse_chan_index) const;

    /**
     * @brief      Read whole seconds of data for one coarse channel
     *
     * @param      gps_second_start   The first GPS second to read
     * @param      num_seconds        How many seconds to read
     * @param      coarse_chan_index  Index into metadata().coarse_chans
     *
     * @return     num_seconds x voltage blocks per second x block size bytes
     *
     * @details    Throws DataError.
     */
    std::vector<std::int8_t> read_second(std::uint64_t gps_second_start,
                                         std::size_t num_seconds,
                                         std::size_t coarse_chan_index) const;

    std::string to_string() const;

  private:
    std::size_t check_coarse_chan_index(std::size_t coarse_chan_index) const;
    void index_timesteps();

    std::shared_ptr<Metadata const> _metadata;
    VoltageGeometry _geometry;
    VoltageCatalog _catalog;
    std::vector<Timestep> _timesteps;
    std::vector<std::size_t> _provided_timestep_indices;
    std::vector<std::size_t> _provided_coarse_chan_indices;
    std::vector<std::size_t> _common_timestep_indices;
};

} // namespace mwareader

#endif // MWAREADER_VOLTAGECONTEXT_HPP
