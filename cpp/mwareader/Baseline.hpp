#ifndef MWAREADER_BASELINE_HPP
#define MWAREADER_BASELINE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mwareader
{

/**
 * @brief      A pair of antennas, including the self pairs
 */
struct Baseline {
    std::size_t ant1_index = 0;
    std::size_t ant2_index = 0;
};

/**
 * @brief      A polarisation product of the correlator, e.g. "XY"
 */
struct VisibilityPol {
    std::string polarisation;
};

/**
 * @brief      Number of baselines (autos plus crosses) for n antennas
 */
std::size_t baseline_count(std::size_t num_antennas);

/**
 * @brief      All baselines in correlator order: (0,0), (0,1) ... (n-1,n-1)
 */
std::vector<Baseline> populate_baselines(std::size_t num_antennas);

/**
 * @brief      The antenna pair of a baseline index
 */
std::optional<std::pair<std::size_t, std::size_t>>
antennas_from_baseline(std::size_t baseline, std::size_t num_antennas);

/**
 * @brief      The baseline index of an antenna pair (ant1 <= ant2)
 */
std::optional<std::size_t> baseline_from_antennas(std::size_t ant1,
                                                  std::size_t ant2,
                                                  std::size_t num_antennas);

/**
 * @brief      XX, XY, YX and YY
 */
std::vector<VisibilityPol> populate_visibility_pols();

} // namespace mwareader

#endif // MWAREADER_BASELINE_HPP
