#include "mwareader/Antenna.hpp"

#include "mwareader/Errors.hpp"

namespace mwareader
{

std::vector<Antenna> populate_antennas(std::vector<RFInput> const& rf_inputs)
{
    if(rf_inputs.size() % 2 != 0) {
        throw MetadataError(MetadataError::Kind::InconsistentCounts,
                            "Odd number of rf inputs (" +
                                std::to_string(rf_inputs.size()) +
                                "), every antenna needs an X and a Y input");
    }
    std::vector<Antenna> antennas;
    antennas.reserve(rf_inputs.size() / 2);
    for(std::size_t ii = 0; ii < rf_inputs.size(); ii += 2) {
        RFInput const& x = rf_inputs[ii];
        RFInput const& y = rf_inputs[ii + 1];
        if(x.pol != Pol::X || y.pol != Pol::Y || x.antenna != y.antenna ||
           x.tile_id != y.tile_id) {
            throw MetadataError(
                MetadataError::Kind::InconsistentCounts,
                "rf inputs " + std::to_string(x.input) + " and " +
                    std::to_string(y.input) +
                    " do not form an X/Y pair of the same antenna");
        }
        Antenna antenna;
        antenna.ant                 = x.antenna;
        antenna.tile_id             = x.tile_id;
        antenna.tile_name           = x.tile_name;
        antenna.rfinput_x           = ii;
        antenna.rfinput_y           = ii + 1;
        antenna.electrical_length_m = x.electrical_length_m;
        antenna.north_m             = x.north_m;
        antenna.east_m              = x.east_m;
        antenna.height_m            = x.height_m;
        antennas.push_back(antenna);
    }
    return antennas;
}

} // namespace mwareader
