#include "mwareader/Baseline.hpp"

namespace mwareader
{

std::size_t baseline_count(std::size_t num_antennas)
{
    return num_antennas * (num_antennas + 1) / 2;
}

std::vector<Baseline> populate_baselines(std::size_t num_antennas)
{
    std::vector<Baseline> baselines;
    baselines.reserve(baseline_count(num_antennas));
    for(std::size_t ant1 = 0; ant1 < num_antennas; ++ant1) {
        for(std::size_t ant2 = ant1; ant2 < num_antennas; ++ant2) {
            baselines.push_back({ant1, ant2});
        }
    }
    return baselines;
}

std::optional<std::pair<std::size_t, std::size_t>>
antennas_from_baseline(std::size_t baseline, std::size_t num_antennas)
{
    std::size_t first = 0;
    for(std::size_t ant1 = 0; ant1 < num_antennas; ++ant1) {
        std::size_t const row = num_antennas - ant1;
        if(baseline < first + row) {
            return std::make_pair(ant1, ant1 + (baseline - first));
        }
        first += row;
    }
    return std::nullopt;
}

std::optional<std::size_t> baseline_from_antennas(std::size_t ant1,
                                                  std::size_t ant2,
                                                  std::size_t num_antennas)
{
    if(ant1 > ant2 || ant2 >= num_antennas) {
        return std::nullopt;
    }
    // Baselines before row ant1: n + (n-1) + ... + (n-ant1+1)
    std::size_t const first =
        ant1 * num_antennas - (ant1 * (ant1 - 1)) / 2;
    return first + (ant2 - ant1);
}

std::vector<VisibilityPol> populate_visibility_pols()
{
    return {{"XX"}, {"XY"}, {"YX"}, {"YY"}};
}

} // namespace mwareader
