#include "mwareader/test/RFInputTester.hpp"

#include "mwareader/Errors.hpp"
#include "mwareader/mwareader_constants.hpp"

namespace mwareader
{
namespace test
{

RFInputTester::RFInputTester(): ::testing::Test()
{
}

RFInputTester::~RFInputTester()
{
}

void RFInputTester::SetUp()
{
}

void RFInputTester::TearDown()
{
}

TEST_F(RFInputTester, test_vcs_order)
{
    ASSERT_EQ(vcs_order(0), 0u);
    ASSERT_EQ(vcs_order(1), 4u);
    ASSERT_EQ(vcs_order(16), 1u);
    ASSERT_EQ(vcs_order(63), 63u);
    ASSERT_EQ(vcs_order(64), 64u);
    ASSERT_EQ(vcs_order(255), 255u);
}

TEST_F(RFInputTester, test_subfile_order)
{
    ASSERT_EQ(subfile_order(0, Pol::X), 0u);
    ASSERT_EQ(subfile_order(0, Pol::Y), 1u);
    ASSERT_EQ(subfile_order(127, Pol::Y), 255u);
}

TEST_F(RFInputTester, test_parse_pol)
{
    ASSERT_EQ(parse_pol("X"), Pol::X);
    ASSERT_EQ(parse_pol("Y "), Pol::Y);
    try {
        parse_pol("Z");
        FAIL() << "Expected a MetadataError";
    } catch(MetadataError const& error) {
        ASSERT_EQ(error.kind(), MetadataError::Kind::Malformed);
    }
}

TEST_F(RFInputTester, test_electrical_length)
{
    ASSERT_DOUBLE_EQ(electrical_length("EL_98.5", COAX_V_FACTOR), 98.5);
    ASSERT_DOUBLE_EQ(electrical_length("100", COAX_V_FACTOR),
                     100.0 * COAX_V_FACTOR);
    ASSERT_THROW(electrical_length("EL_", COAX_V_FACTOR), MetadataError);
    ASSERT_THROW(electrical_length("12m", COAX_V_FACTOR), MetadataError);
}

TEST_F(RFInputTester, test_link_signal_chain_corrections)
{
    std::vector<SignalChainCorrection> corrections(2);
    corrections[0].receiver_type    = "RG6_90";
    corrections[0].whitening_filter = false;
    corrections[1].receiver_type    = "RG6_90";
    corrections[1].whitening_filter = true;

    std::vector<RFInput> rf_inputs(3);
    rf_inputs[0].flavour              = "rg6_90";
    rf_inputs[0].has_whitening_filter = true;
    rf_inputs[1].flavour              = "NI";
    rf_inputs[1].has_whitening_filter = false;

    link_signal_chain_corrections(rf_inputs, corrections);
    ASSERT_EQ(rf_inputs[0].signal_chain_correction_index, 1u);
    ASSERT_FALSE(rf_inputs[1].signal_chain_correction_index.has_value());
    ASSERT_FALSE(rf_inputs[2].signal_chain_correction_index.has_value());
}

} // namespace test
} // namespace mwareader
