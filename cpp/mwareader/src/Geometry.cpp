#include "mwareader/Geometry.hpp"

#include "mwareader/Metadata.hpp"
#include "mwareader/mwareader_constants.hpp"

#include <sstream>

namespace mwareader
{

CorrelatorGeometry compute_correlator_geometry(Metadata const& metadata,
                                               MWAVersion version)
{
    CorrelatorGeometry geometry;
    geometry.num_baselines             = metadata.num_baselines;
    geometry.num_fine_chans_per_coarse = metadata.num_corr_fine_chans_per_coarse;
    geometry.num_visibility_pols       = metadata.num_visibility_pols;
    geometry.floats_per_baseline_fine_chan = geometry.num_visibility_pols * 2;
    geometry.num_timestep_coarse_chan_floats =
        geometry.num_baselines * geometry.num_fine_chans_per_coarse *
        geometry.floats_per_baseline_fine_chan;
    geometry.num_timestep_coarse_chan_bytes =
        geometry.num_timestep_coarse_chan_floats * sizeof(float);
    geometry.num_timestep_coarse_chan_weight_floats =
        geometry.num_baselines * geometry.num_visibility_pols;
    geometry.first_data_hdu = 1;

    if(is_legacy(version)) {
        geometry.hdu_axis_order  = HduAxisOrder::FrequencyBaseline;
        geometry.expected_naxis1 = static_cast<long>(
            geometry.num_baselines * geometry.floats_per_baseline_fine_chan);
        geometry.expected_naxis2 =
            static_cast<long>(geometry.num_fine_chans_per_coarse);
        geometry.hdu_step         = 1;
        geometry.has_weights_hdus = false;
    } else {
        geometry.hdu_axis_order  = HduAxisOrder::BaselineFrequency;
        geometry.expected_naxis1 =
            static_cast<long>(geometry.num_fine_chans_per_coarse *
                              geometry.floats_per_baseline_fine_chan);
        geometry.expected_naxis2 = static_cast<long>(geometry.num_baselines);
        geometry.hdu_step         = 2;
        geometry.has_weights_hdus = true;
    }
    return geometry;
}

VoltageGeometry compute_voltage_geometry(Metadata const& metadata,
                                         MWAVersion version)
{
    VoltageGeometry geometry;
    if(is_legacy(version)) {
        geometry.sample_size_bytes = LEGACY_VCS_SAMPLE_SIZE_BYTES;
        geometry.num_fine_chans_per_coarse =
            metadata.coarse_chan_width_hz / LEGACY_VCS_FINE_CHAN_WIDTH_HZ;
        geometry.num_samples_per_rf_chain_per_block =
            LEGACY_VCS_SAMPLES_PER_RF_CHAIN_PER_BLOCK;
        geometry.num_voltage_blocks_per_timestep =
            LEGACY_VCS_BLOCKS_PER_TIMESTEP;
        geometry.timestep_duration_ms = LEGACY_VCS_TIMESTEP_DURATION_MS;
        geometry.header_size_bytes    = 0;
    } else {
        geometry.sample_size_bytes         = MWAX_VCS_SAMPLE_SIZE_BYTES;
        geometry.num_fine_chans_per_coarse = 1;
        geometry.num_samples_per_rf_chain_per_block =
            MWAX_VCS_SAMPLES_PER_RF_CHAIN_PER_BLOCK;
        geometry.num_voltage_blocks_per_timestep =
            MWAX_VCS_BLOCKS_PER_TIMESTEP;
        geometry.timestep_duration_ms = MWAX_VCS_TIMESTEP_DURATION_MS;
        geometry.header_size_bytes    = MWAX_VCS_HEADER_SIZE_BYTES;
    }
    geometry.num_voltage_blocks_per_second =
        geometry.num_voltage_blocks_per_timestep * 1000 /
        geometry.timestep_duration_ms;
    geometry.num_samples_per_voltage_block =
        geometry.num_samples_per_rf_chain_per_block * metadata.num_rf_inputs *
        geometry.num_fine_chans_per_coarse;
    geometry.voltage_block_size_bytes =
        geometry.sample_size_bytes * geometry.num_samples_per_voltage_block;
    // The MWAX delay block is the same size as a data block
    geometry.delay_block_size_bytes =
        is_legacy(version) ? 0 : geometry.voltage_block_size_bytes;
    geometry.data_offset_bytes =
        geometry.header_size_bytes + geometry.delay_block_size_bytes;
    geometry.timestep_data_size_bytes =
        geometry.num_voltage_blocks_per_timestep *
        geometry.voltage_block_size_bytes;
    geometry.second_data_size_bytes = geometry.num_voltage_blocks_per_second *
                                      geometry.voltage_block_size_bytes;
    geometry.expected_file_size_bytes =
        geometry.data_offset_bytes + geometry.timestep_data_size_bytes;
    return geometry;
}

std::string CorrelatorGeometry::to_string() const
{
    std::ostringstream oss;
    oss << "CorrelatorGeometry:\n"
        << "  axis order: "
        << (hdu_axis_order == HduAxisOrder::FrequencyBaseline
                ? "frequency, baseline"
                : "baseline, frequency")
        << "\n"
        << "  baselines: " << num_baselines << "\n"
        << "  fine channels per coarse: " << num_fine_chans_per_coarse << "\n"
        << "  visibility pols: " << num_visibility_pols << "\n"
        << "  floats per HDU: " << num_timestep_coarse_chan_floats << "\n"
        << "  weight floats per HDU: " << num_timestep_coarse_chan_weight_floats
        << "\n"
        << "  NAXIS1 x NAXIS2: " << expected_naxis1 << " x " << expected_naxis2
        << "\n";
    return oss.str();
}

std::string VoltageGeometry::to_string() const
{
    std::ostringstream oss;
    oss << "VoltageGeometry:\n"
        << "  sample size (bytes): " << sample_size_bytes << "\n"
        << "  fine channels per coarse: " << num_fine_chans_per_coarse << "\n"
        << "  samples per voltage block: " << num_samples_per_voltage_block
        << "\n"
        << "  voltage block size (bytes): " << voltage_block_size_bytes << "\n"
        << "  blocks per timestep: " << num_voltage_blocks_per_timestep << "\n"
        << "  blocks per second: " << num_voltage_blocks_per_second << "\n"
        << "  header size (bytes): " << header_size_bytes << "\n"
        << "  delay block size (bytes): " << delay_block_size_bytes << "\n"
        << "  expected file size (bytes): " << expected_file_size_bytes
        << "\n";
    return oss.str();
}

} // namespace mwareader
