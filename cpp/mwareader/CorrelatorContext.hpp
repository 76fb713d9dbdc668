#ifndef MWAREADER_CORRELATORCONTEXT_HPP
#define MWAREADER_CORRELATORCONTEXT_HPP

#include "mwareader/ContextConfig.hpp"
#include "mwareader/Geometry.hpp"
#include "mwareader/GpuboxCatalog.hpp"
#include "mwareader/LegacyConversion.hpp"
#include "mwareader/Metadata.hpp"
#include "mwareader/Timestep.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mwareader
{

/**
 * @brief      Observation metadata plus a set of correlator files
 *
 * @details    The context is immutable once constructed. Reads open the
 *             backing file, read one HDU and return a new buffer, so
 *             reads may run concurrently from several threads. With a
 *             cfitsio that is not reentrant the file access itself is
 *             serialised (see FitsFile).
 */
class CorrelatorContext
{
  public:
    explicit CorrelatorContext(ContextConfig const& config);
    CorrelatorContext(std::string const& metafits_file,
                      std::vector<std::string> const& gpubox_files);
    ~CorrelatorContext();

    Metadata const& metadata() const;
    std::shared_ptr<Metadata const> shared_metadata() const;
    MWAVersion version() const;
    CorrelatorGeometry const& geometry() const;
    GpuboxCatalog const& catalog() const;

    /**
     * @brief      Union of the metafits timesteps and the timesteps
     *             found in the data files, sorted by time
     */
    std::vector<Timestep> const& timesteps() const;

    /**
     * @brief      Indices into timesteps() with at least one HDU
     */
    std::vector<std::size_t> const& provided_timestep_indices() const;

    /**
     * @brief      Indices into metadata().coarse_chans with at least
     *             one HDU
     */
    std::vector<std::size_t> const& provided_coarse_chan_indices() const;

    /**
     * @brief      Indices into timesteps() where every provided coarse
     *             channel has data
     */
    std::vector<std::size_t> const& common_timestep_indices() const;

    /**
     * @brief      Common timesteps at or after the metafits good time
     */
    std::vector<std::size_t> const& common_good_timestep_indices() const;

    std::uint64_t common_start_unix_time_ms() const;
    std::uint64_t common_end_unix_time_ms() const;
    std::uint64_t common_start_gps_time_ms() const;
    std::uint64_t common_end_gps_time_ms() const;
    std::uint64_t common_duration_ms() const;

    /**
     * @brief      Read one timestep and coarse channel in
     *             [baseline][fine chan][pol][real, imag] order
     *
     * @details    Throws DataError.
     */
    std::vector<float> read_by_baseline(std::size_t timestep_index,
                                        std::size_t coarse_chan_index) const;

    /**
     * @brief      Read one timestep and coarse channel in
     *             [fine chan][baseline][pol][real, imag] order
     *
     * @details    Throws DataError.
     */
    std::vector<float> read_by_frequency(std::size_t timestep_index,
                                         std::size_t coarse_chan_index) const;

    /**
     * @brief      Read the weights of one timestep and coarse channel in
     *             [baseline][pol] order
     *
     * @details    Legacy correlator files carry no weights, so every
     *             weight is reported as 1. Throws DataError.
     */
    std::vector<float>
    read_weights_by_baseline(std::size_t timestep_index,
                             std::size_t coarse_chan_index) const;

    std::string to_string() const;

  private:
    HduLocation const& locate(std::size_t timestep_index,
                              std::size_t coarse_chan_index) const;
    std::vector<float> read_hdu(HduLocation const& location,
                                int hdu_offset,
                                std::size_t expected_floats) const;
    void index_timesteps();

    std::shared_ptr<Metadata const> _metadata;
    CorrelatorGeometry _geometry;
    GpuboxCatalog _catalog;
    std::vector<LegacyConversionBaseline> _conversion_table;
    std::vector<Timestep> _timesteps;
    std::vector<std::size_t> _provided_timestep_indices;
    std::vector<std::size_t> _provided_coarse_chan_indices;
    std::vector<std::size_t> _common_timestep_indices;
    std::vector<std::size_t> _common_good_timestep_indices;
    std::uint64_t _common_start_unix_time_ms;
    std::uint64_t _common_end_unix_time_ms;
};

} // namespace mwareader

#endif // MWAREADER_CORRELATORCONTEXT_HPP
