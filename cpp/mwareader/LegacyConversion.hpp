#ifndef MWAREADER_LEGACYCONVERSION_HPP
#define MWAREADER_LEGACYCONVERSION_HPP

#include "mwareader/RFInput.hpp"

#include <cstddef>
#include <vector>

namespace mwareader
{

/**
 * @brief      Where to find the four polarisations of one output baseline
 *             inside a legacy correlator HDU
 *
 * @details    Indexes are float offsets from the start of a fine channel.
 *             The imaginary part sits at index + 1.
 */
struct LegacyConversionBaseline {
    std::size_t baseline = 0;
    std::size_t ant1     = 0;
    std::size_t ant2     = 0;
    std::size_t xx_index = 0;
    bool xx_conjugate    = false;
    std::size_t xy_index = 0;
    bool xy_conjugate    = false;
    std::size_t yx_index = 0;
    bool yx_conjugate    = false;
    std::size_t yy_index = 0;
    bool yy_conjugate    = false;
};

/**
 * @brief      Undo the input ordering applied by the legacy fine PFB
 *
 * @details    Bit order abcdefgh becomes abghcdef.
 */
std::size_t fine_pfb_reorder(std::size_t input);

/**
 * @brief      Build the legacy to triangular baseline conversion table
 *
 * @param      rf_inputs  The metafits rf inputs (must be 256 of them)
 *
 * @return     One entry per baseline of the 128 tile array
 */
std::vector<LegacyConversionBaseline>
generate_conversion_table(std::vector<RFInput> const& rf_inputs);

/**
 * @brief      Reorder one legacy HDU into [baseline][fine chan][pol] order
 *
 * @param      table           Output of generate_conversion_table
 * @param      input           HDU contents in [fine chan][legacy baseline] order
 * @param      output          Destination, at least as large as input
 * @param      num_fine_chans  Fine channels per coarse channel
 */
void convert_legacy_hdu_to_baseline_order(
    std::vector<LegacyConversionBaseline> const& table,
    std::vector<float> const& input,
    float* output,
    std::size_t num_fine_chans);

/**
 * @brief      Reorder one legacy HDU into [fine chan][baseline][pol] order
 */
void convert_legacy_hdu_to_frequency_order(
    std::vector<LegacyConversionBaseline> const& table,
    std::vector<float> const& input,
    float* output,
    std::size_t num_fine_chans);

/**
 * @brief      Transpose one MWAX HDU from [baseline][fine chan][pol] into
 *             [fine chan][baseline][pol] order
 *
 * @param      input                 HDU contents
 * @param      output                Destination, at least as large as input
 * @param      num_baselines         Baselines in the HDU
 * @param      num_fine_chans        Fine channels per coarse channel
 * @param      floats_per_baseline_fine_chan  Floats per visibility set
 */
void convert_mwax_hdu_to_frequency_order(
    std::vector<float> const& input,
    float* output,
    std::size_t num_baselines,
    std::size_t num_fine_chans,
    std::size_t floats_per_baseline_fine_chan);

} // namespace mwareader

#endif // MWAREADER_LEGACYCONVERSION_HPP
