#ifndef MWAREADER_GEOMETRY_HPP
#define MWAREADER_GEOMETRY_HPP

#include "mwareader/MWAVersion.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace mwareader
{

struct Metadata;

/**
 * @brief      Axis order of the visibilities inside a correlator HDU
 */
enum class HduAxisOrder {
    FrequencyBaseline, // Legacy: [fine chan][baseline][pol][re,im]
    BaselineFrequency  // MWAX:   [baseline][fine chan][pol][re,im]
};

/**
 * @brief      Sizes of one timestep x coarse channel unit of
 *             correlator data
 */
struct CorrelatorGeometry {
    HduAxisOrder hdu_axis_order = HduAxisOrder::BaselineFrequency;
    std::size_t num_baselines             = 0;
    std::size_t num_fine_chans_per_coarse = 0;
    std::size_t num_visibility_pols       = 0;
    std::size_t floats_per_baseline_fine_chan = 0;
    std::size_t num_timestep_coarse_chan_floats        = 0;
    std::size_t num_timestep_coarse_chan_bytes         = 0;
    std::size_t num_timestep_coarse_chan_weight_floats = 0;
    long expected_naxis1 = 0;
    long expected_naxis2 = 0;
    int first_data_hdu   = 1;
    int hdu_step         = 1; // MWAX files interleave data and weights
    bool has_weights_hdus = false;

    std::string to_string() const;
};

/**
 * @brief      Layout of a voltage file
 *
 * @details    A file is [header][delay block][data blocks]. Legacy
 *             files have neither a header nor a delay block.
 */
struct VoltageGeometry {
    std::size_t sample_size_bytes                  = 0;
    std::size_t num_fine_chans_per_coarse          = 0;
    std::size_t num_samples_per_rf_chain_per_block = 0;
    std::size_t num_samples_per_voltage_block      = 0;
    std::size_t voltage_block_size_bytes           = 0;
    std::size_t num_voltage_blocks_per_timestep    = 0;
    std::size_t num_voltage_blocks_per_second      = 0;
    std::uint64_t timestep_duration_ms             = 0;
    std::size_t header_size_bytes                  = 0;
    std::size_t delay_block_size_bytes             = 0;
    std::size_t data_offset_bytes                  = 0;
    std::size_t timestep_data_size_bytes           = 0;
    std::size_t second_data_size_bytes             = 0;
    std::size_t expected_file_size_bytes           = 0;

    std::string to_string() const;
};

/**
 * @brief      Compute the correlator HDU geometry
 *
 * @param      metadata  Observation metadata
 * @param      version   A correlator instrument version
 */
CorrelatorGeometry compute_correlator_geometry(Metadata const& metadata,
                                               MWAVersion version);

/**
 * @brief      Compute the voltage file geometry
 *
 * @param      metadata  Observation metadata
 * @param      version   A voltage instrument version
 */
VoltageGeometry compute_voltage_geometry(Metadata const& metadata,
                                         MWAVersion version);

} // namespace mwareader

#endif // MWAREADER_GEOMETRY_HPP
