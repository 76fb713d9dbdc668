#include "mwareader/test/GeometryTester.hpp"

#include "mwareader/Baseline.hpp"

namespace mwareader
{
namespace test
{

GeometryTester::GeometryTester(): ::testing::Test()
{
}

GeometryTester::~GeometryTester()
{
}

void GeometryTester::SetUp()
{
    _metadata.num_rf_inputs        = 256;
    _metadata.num_ants             = 128;
    _metadata.num_baselines        = baseline_count(128);
    _metadata.num_visibility_pols  = 4;
    _metadata.coarse_chan_width_hz = 1280000;
    _metadata.num_corr_fine_chans_per_coarse = 32;
}

void GeometryTester::TearDown()
{
}

TEST_F(GeometryTester, test_mwax_correlator_geometry)
{
    auto const geometry =
        compute_correlator_geometry(_metadata, MWAVersion::CorrMWAXv2);
    ASSERT_EQ(geometry.hdu_axis_order, HduAxisOrder::BaselineFrequency);
    ASSERT_EQ(geometry.num_timestep_coarse_chan_floats, 8256u * 32u * 4u * 2u);
    ASSERT_EQ(geometry.num_timestep_coarse_chan_bytes,
              geometry.num_timestep_coarse_chan_floats * sizeof(float));
    ASSERT_EQ(geometry.num_timestep_coarse_chan_weight_floats, 8256u * 4u);
    ASSERT_EQ(geometry.expected_naxis1, 32 * 8);
    ASSERT_EQ(geometry.expected_naxis2, 8256);
    ASSERT_EQ(geometry.first_data_hdu, 1);
    ASSERT_EQ(geometry.hdu_step, 2);
    ASSERT_TRUE(geometry.has_weights_hdus);
}

TEST_F(GeometryTester, test_legacy_correlator_geometry)
{
    _metadata.num_corr_fine_chans_per_coarse = 128;
    auto const geometry =
        compute_correlator_geometry(_metadata, MWAVersion::CorrLegacy);
    ASSERT_EQ(geometry.hdu_axis_order, HduAxisOrder::FrequencyBaseline);
    ASSERT_EQ(geometry.num_timestep_coarse_chan_floats,
              8256u * 128u * 4u * 2u);
    ASSERT_EQ(geometry.expected_naxis1, 8256 * 8);
    ASSERT_EQ(geometry.expected_naxis2, 128);
    ASSERT_EQ(geometry.hdu_step, 1);
    ASSERT_FALSE(geometry.has_weights_hdus);
}

TEST_F(GeometryTester, test_legacy_voltage_geometry)
{
    auto const geometry =
        compute_voltage_geometry(_metadata, MWAVersion::VCSLegacyRecombined);
    ASSERT_EQ(geometry.sample_size_bytes, 1u);
    ASSERT_EQ(geometry.num_fine_chans_per_coarse, 128u);
    ASSERT_EQ(geometry.num_samples_per_voltage_block, 10000u * 256u * 128u);
    ASSERT_EQ(geometry.voltage_block_size_bytes, 327680000u);
    ASSERT_EQ(geometry.num_voltage_blocks_per_timestep, 1u);
    ASSERT_EQ(geometry.num_voltage_blocks_per_second, 1u);
    ASSERT_EQ(geometry.timestep_duration_ms, 1000u);
    ASSERT_EQ(geometry.header_size_bytes, 0u);
    ASSERT_EQ(geometry.delay_block_size_bytes, 0u);
    ASSERT_EQ(geometry.data_offset_bytes, 0u);
    ASSERT_EQ(geometry.second_data_size_bytes, 327680000u);
    ASSERT_EQ(geometry.expected_file_size_bytes, 327680000u);
}

TEST_F(GeometryTester, test_mwax_voltage_geometry)
{
    auto const geometry =
        compute_voltage_geometry(_metadata, MWAVersion::VCSMWAXv2);
    ASSERT_EQ(geometry.sample_size_bytes, 2u);
    ASSERT_EQ(geometry.num_fine_chans_per_coarse, 1u);
    ASSERT_EQ(geometry.num_samples_per_voltage_block, 64000u * 256u);
    ASSERT_EQ(geometry.voltage_block_size_bytes, 32768000u);
    ASSERT_EQ(geometry.num_voltage_blocks_per_timestep, 160u);
    ASSERT_EQ(geometry.num_voltage_blocks_per_second, 20u);
    ASSERT_EQ(geometry.timestep_duration_ms, 8000u);
    ASSERT_EQ(geometry.header_size_bytes, 4096u);
    ASSERT_EQ(geometry.delay_block_size_bytes, 32768000u);
    ASSERT_EQ(geometry.data_offset_bytes, 4096u + 32768000u);
    ASSERT_EQ(geometry.timestep_data_size_bytes, 160u * 32768000u);
    ASSERT_EQ(geometry.second_data_size_bytes, 20u * 32768000u);
    ASSERT_EQ(geometry.expected_file_size_bytes, 5275652096ull);
}

TEST_F(GeometryTester, test_voltage_geometry_scales_with_inputs)
{
    _metadata.num_rf_inputs = 2;
    auto const mwax =
        compute_voltage_geometry(_metadata, MWAVersion::VCSMWAXv2);
    ASSERT_EQ(mwax.voltage_block_size_bytes, 256000u);
    ASSERT_EQ(mwax.expected_file_size_bytes, 4096u + 161u * 256000u);
    auto const legacy =
        compute_voltage_geometry(_metadata, MWAVersion::VCSLegacyRecombined);
    ASSERT_EQ(legacy.expected_file_size_bytes, 2560000u);
}

} // namespace test
} // namespace mwareader
