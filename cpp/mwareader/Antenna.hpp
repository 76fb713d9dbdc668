#ifndef MWAREADER_ANTENNA_HPP
#define MWAREADER_ANTENNA_HPP

#include "mwareader/RFInput.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace mwareader
{

/**
 * @brief      An antenna (tile) and its two polarised inputs
 *
 * @details    rfinput_x and rfinput_y index into the rf_inputs of the
 *             owning Metadata, which are sorted by subfile order.
 */
struct Antenna {
    std::size_t ant       = 0;
    std::size_t tile_id   = 0;
    std::string tile_name;
    std::size_t rfinput_x = 0;
    std::size_t rfinput_y = 0;
    double electrical_length_m = 0.0;
    double north_m  = 0.0;
    double east_m   = 0.0;
    double height_m = 0.0;
};

/**
 * @brief      Pair up the inputs of each antenna
 *
 * @param      rf_inputs  Inputs sorted by subfile order, so that each
 *                        antenna's X input is directly followed by its
 *                        Y input.
 */
std::vector<Antenna> populate_antennas(std::vector<RFInput> const& rf_inputs);

} // namespace mwareader

#endif // MWAREADER_ANTENNA_HPP
