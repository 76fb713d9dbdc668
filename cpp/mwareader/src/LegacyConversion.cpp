#include "mwareader/LegacyConversion.hpp"

#include "mwareader/Baseline.hpp"
#include "mwareader/Errors.hpp"
#include "mwareader/mwareader_constants.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>

namespace mwareader
{
namespace
{

constexpr std::size_t legacy_num_tiles = LEGACY_NUM_RF_INPUTS / 2;
constexpr std::size_t floats_per_visibility_set = 8;

/**
 * Matrix of legacy complex indexes, one cell per rf input pair in
 * MWAX order. Negative cells hold the conjugate of the transposed cell.
 */
std::vector<int> generate_full_matrix(std::vector<std::size_t> const& mwax_order)
{
    std::vector<int> matrix(LEGACY_NUM_RF_INPUTS * LEGACY_NUM_RF_INPUTS, -1);
    int source_index = 0;
    for(std::size_t col_order = 0; col_order < LEGACY_NUM_RF_INPUTS;
        col_order += 2) {
        std::size_t const col_a = mwax_order[fine_pfb_reorder(col_order)];
        std::size_t const col_b = mwax_order[fine_pfb_reorder(col_order + 1)];
        for(std::size_t row_order = 0; row_order <= col_order;
            row_order += 2) {
            std::size_t const row1st = mwax_order[fine_pfb_reorder(row_order)];
            std::size_t const row2nd =
                mwax_order[fine_pfb_reorder(row_order + 1)];

            matrix[(row1st << 8) | col_a] = source_index++;
            // The old correlator emits a redundant product on the diagonal
            if(col_order != row_order) {
                matrix[(row2nd << 8) | col_a] = source_index;
            }
            ++source_index;
            matrix[(row1st << 8) | col_b] = source_index++;
            matrix[(row2nd << 8) | col_b] = source_index++;
        }
    }

    for(std::size_t row = 0; row < LEGACY_NUM_RF_INPUTS; ++row) {
        for(std::size_t col = 0; col < LEGACY_NUM_RF_INPUTS; ++col) {
            if(matrix[(row << 8) | col] == -1) {
                matrix[(row << 8) | col] = -matrix[(col << 8) | row];
            }
        }
    }
    return matrix;
}

void copy_visibility(std::vector<float> const& input,
                     std::size_t source,
                     std::size_t index,
                     bool conjugate,
                     float* destination)
{
    destination[0] = input[source + index];
    float const imag = input[source + index + 1];
    // Every imaginary is conjugated again to land in the upper triangle
    destination[1] = conjugate ? imag : -imag;
}

void convert_legacy_hdu(std::vector<LegacyConversionBaseline> const& table,
                        std::vector<float> const& input,
                        float* output,
                        std::size_t num_fine_chans,
                        bool baseline_order)
{
    std::size_t const floats_per_fine_chan =
        table.size() * floats_per_visibility_set;
    if(input.size() < num_fine_chans * floats_per_fine_chan) {
        throw DataError(DataError::Kind::SizeMismatch,
                        "Legacy HDU holds " + std::to_string(input.size()) +
                            " floats, expected " +
                            std::to_string(num_fine_chans *
                                           floats_per_fine_chan));
    }
    std::size_t const floats_per_baseline =
        floats_per_visibility_set * num_fine_chans;

    for(std::size_t fine_chan = 0; fine_chan < num_fine_chans; ++fine_chan) {
        std::size_t const source = fine_chan * floats_per_fine_chan;
        for(std::size_t bl = 0; bl < table.size(); ++bl) {
            auto const& entry = table[bl];
            std::size_t const destination =
                baseline_order
                    ? bl * floats_per_baseline +
                          fine_chan * floats_per_visibility_set
                    : source + bl * floats_per_visibility_set;
            float* out = output + destination;
            copy_visibility(input, source, entry.xx_index, entry.xx_conjugate,
                            out);
            copy_visibility(input, source, entry.xy_index, entry.xy_conjugate,
                            out + 2);
            copy_visibility(input, source, entry.yx_index, entry.yx_conjugate,
                            out + 4);
            copy_visibility(input, source, entry.yy_index, entry.yy_conjugate,
                            out + 6);
        }
    }
}

} // namespace

std::size_t fine_pfb_reorder(std::size_t input)
{
    return (input & 0xc0) | ((input & 0x03) << 4) | ((input & 0x3c) >> 2);
}

std::vector<LegacyConversionBaseline>
generate_conversion_table(std::vector<RFInput> const& rf_inputs)
{
    if(rf_inputs.size() != LEGACY_NUM_RF_INPUTS) {
        throw ContextError(ContextError::Kind::UnsupportedLayout,
                           "Legacy correlator data requires " +
                               std::to_string(LEGACY_NUM_RF_INPUTS) +
                               " rf inputs, the metafits lists " +
                               std::to_string(rf_inputs.size()));
    }

    std::vector<std::pair<std::size_t, std::size_t>> input_order;
    input_order.reserve(rf_inputs.size());
    for(auto const& rf: rf_inputs) {
        input_order.emplace_back(rf.input, rf.subfile_order);
    }
    std::sort(input_order.begin(), input_order.end());
    std::vector<std::size_t> mwax_order;
    mwax_order.reserve(input_order.size());
    for(auto const& entry: input_order) {
        if(entry.second >= LEGACY_NUM_RF_INPUTS) {
            throw ContextError(ContextError::Kind::UnsupportedLayout,
                               "rf input " + std::to_string(entry.first) +
                                   " has an out of range subfile order");
        }
        mwax_order.push_back(entry.second);
    }

    std::vector<int> const matrix = generate_full_matrix(mwax_order);

    std::vector<LegacyConversionBaseline> table;
    table.reserve(baseline_count(legacy_num_tiles));
    std::size_t baseline = 0;
    for(std::size_t row_tile = 0; row_tile < legacy_num_tiles; ++row_tile) {
        for(std::size_t col_tile = row_tile; col_tile < legacy_num_tiles;
            ++col_tile) {
            // Doubled to index floats rather than complex pairs
            int const xx = matrix[(row_tile * 2) << 8 | (col_tile * 2)] * 2;
            int const xy = matrix[(row_tile * 2) << 8 | (col_tile * 2 + 1)] * 2;
            int const yx = matrix[(row_tile * 2 + 1) << 8 | (col_tile * 2)] * 2;
            int const yy =
                matrix[(row_tile * 2 + 1) << 8 | (col_tile * 2 + 1)] * 2;

            LegacyConversionBaseline entry;
            entry.baseline     = baseline++;
            entry.ant1         = row_tile;
            entry.ant2         = col_tile;
            entry.xx_index     = static_cast<std::size_t>(std::abs(xx));
            entry.xx_conjugate = xx < 0;
            entry.xy_index     = static_cast<std::size_t>(std::abs(xy));
            entry.xy_conjugate = xy < 0;
            entry.yx_index     = static_cast<std::size_t>(std::abs(yx));
            entry.yx_conjugate = yx < 0;
            entry.yy_index     = static_cast<std::size_t>(std::abs(yy));
            entry.yy_conjugate = yy < 0;
            table.push_back(entry);
        }
    }
    BOOST_LOG_TRIVIAL(debug) << "Generated legacy conversion table with "
                             << table.size() << " baselines";
    return table;
}

void convert_legacy_hdu_to_baseline_order(
    std::vector<LegacyConversionBaseline> const& table,
    std::vector<float> const& input,
    float* output,
    std::size_t num_fine_chans)
{
    convert_legacy_hdu(table, input, output, num_fine_chans, true);
}

void convert_legacy_hdu_to_frequency_order(
    std::vector<LegacyConversionBaseline> const& table,
    std::vector<float> const& input,
    float* output,
    std::size_t num_fine_chans)
{
    convert_legacy_hdu(table, input, output, num_fine_chans, false);
}

void convert_mwax_hdu_to_frequency_order(
    std::vector<float> const& input,
    float* output,
    std::size_t num_baselines,
    std::size_t num_fine_chans,
    std::size_t floats_per_baseline_fine_chan)
{
    std::size_t const expected =
        num_baselines * num_fine_chans * floats_per_baseline_fine_chan;
    if(input.size() < expected) {
        throw DataError(DataError::Kind::SizeMismatch,
                        "MWAX HDU holds " + std::to_string(input.size()) +
                            " floats, expected " + std::to_string(expected));
    }
    for(std::size_t bl = 0; bl < num_baselines; ++bl) {
        for(std::size_t fine_chan = 0; fine_chan < num_fine_chans;
            ++fine_chan) {
            std::size_t const source =
                (bl * num_fine_chans + fine_chan) *
                floats_per_baseline_fine_chan;
            std::size_t const destination =
                (fine_chan * num_baselines + bl) *
                floats_per_baseline_fine_chan;
            std::copy_n(input.begin() + source,
                        floats_per_baseline_fine_chan,
                        output + destination);
        }
    }
}

} // namespace mwareader
