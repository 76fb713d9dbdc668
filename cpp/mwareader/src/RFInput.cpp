#include "mwareader/RFInput.hpp"

#include "mwareader/Errors.hpp"
#include "mwareader/FitsFile.hpp"
#include "mwareader/mwareader_constants.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/log/trivial.hpp>

#include <stdexcept>

namespace mwareader
{

std::string to_string(Pol pol)
{
    return pol == Pol::X ? "X" : "Y";
}

std::size_t vcs_order(std::size_t input)
{
    return (input & 0xC0) | ((input & 0x30) >> 4) | ((input & 0x0F) << 2);
}

std::size_t subfile_order(std::size_t antenna, Pol pol)
{
    return (antenna << 1) + (pol == Pol::Y ? 1 : 0);
}

Pol parse_pol(std::string const& value)
{
    std::string const pol = boost::algorithm::trim_copy(value);
    if(pol == "X") {
        return Pol::X;
    }
    if(pol == "Y") {
        return Pol::Y;
    }
    throw MetadataError(MetadataError::Kind::Malformed,
                        "Invalid polarisation '" + value +
                            "' in TILEDATA table, expected X or Y");
}

double electrical_length(std::string const& length, double coax_v_factor)
{
    std::string value = boost::algorithm::trim_copy(length);
    bool const is_electrical = boost::algorithm::starts_with(value, "EL_");
    if(is_electrical) {
        value = value.substr(3);
    }
    double metres = 0.0;
    try {
        std::size_t parsed = 0;
        metres             = std::stod(value, &parsed);
        if(parsed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch(std::logic_error const&) {
        throw MetadataError(MetadataError::Kind::Malformed,
                            "Unable to parse cable length '" + length + "'");
    }
    return is_electrical ? metres : metres * coax_v_factor;
}

std::vector<RFInput> read_rf_inputs(FitsFile& metafits,
                                    std::size_t num_rf_inputs,
                                    double coax_v_factor)
{
    long const nrows = metafits.num_rows();
    if(nrows < 0 || static_cast<std::size_t>(nrows) != num_rf_inputs) {
        throw MetadataError(MetadataError::Kind::InconsistentCounts,
                            "TILEDATA has " + std::to_string(nrows) +
                                " rows but NINPUTS is " +
                                std::to_string(num_rf_inputs));
    }
    bool const has_flavours  = metafits.has_column("Flavors");
    bool const has_whitening = metafits.has_column("Whitening_Filter");

    std::vector<RFInput> rf_inputs;
    rf_inputs.reserve(num_rf_inputs);
    for(long row = 0; row < nrows; ++row) {
        RFInput rf;
        rf.input     = metafits.read_cell<int>("Input", row);
        rf.antenna   = metafits.read_cell<int>("Antenna", row);
        rf.tile_id   = metafits.read_cell<int>("Tile", row);
        rf.tile_name = boost::algorithm::trim_copy(
            metafits.read_cell<std::string>("TileName", row));
        rf.pol = parse_pol(metafits.read_cell<std::string>("Pol", row));
        rf.electrical_length_m = electrical_length(
            metafits.read_cell<std::string>("Length", row), coax_v_factor);
        rf.north_m  = metafits.read_cell<double>("North", row);
        rf.east_m   = metafits.read_cell<double>("East", row);
        rf.height_m = metafits.read_cell<double>("Height", row);
        rf.flagged  = metafits.read_cell<int>("Flag", row) == 1;
        rf.digital_gains =
            metafits.read_cell_array<int>("Gains", row, NUM_DIPOLE_GAINS);
        rf.dipole_delays =
            metafits.read_cell_array<int>("Delays", row, NUM_DIPOLE_DELAYS);
        rf.receiver_number      = metafits.read_cell<int>("Rx", row);
        rf.receiver_slot_number = metafits.read_cell<int>("Slot", row);
        if(has_flavours) {
            rf.flavour = boost::algorithm::trim_copy(
                metafits.read_cell<std::string>("Flavors", row));
        }
        if(has_whitening) {
            rf.has_whitening_filter =
                metafits.read_cell<int>("Whitening_Filter", row) != 0;
        }
        rf.vcs_order     = vcs_order(rf.input);
        rf.subfile_order = subfile_order(rf.antenna, rf.pol);
        rf_inputs.push_back(std::move(rf));
    }
    return rf_inputs;
}

std::vector<SignalChainCorrection>
read_signal_chain_corrections(FitsFile& metafits)
{
    std::vector<SignalChainCorrection> corrections;
    if(!metafits.move_to_named_hdu("SIGCHAINDATA")) {
        BOOST_LOG_TRIVIAL(debug) << "No SIGCHAINDATA table in metafits";
        return corrections;
    }
    long const nrows = metafits.num_rows();
    for(long row = 0; row < nrows; ++row) {
        SignalChainCorrection correction;
        correction.receiver_type = boost::algorithm::trim_copy(
            metafits.read_cell<std::string>("Receiver_type", row));
        correction.whitening_filter =
            metafits.read_cell<int>("Whitening_filter", row) != 0;
        correction.corrections = metafits.read_cell_array<double>(
            "Corrections", row, MAX_RECEIVER_CHANNELS);
        corrections.push_back(std::move(correction));
    }
    BOOST_LOG_TRIVIAL(debug) << "Read " << corrections.size()
                             << " signal chain corrections";
    return corrections;
}

void link_signal_chain_corrections(
    std::vector<RFInput>& rf_inputs,
    std::vector<SignalChainCorrection> const& corrections)
{
    for(auto& rf: rf_inputs) {
        rf.signal_chain_correction_index.reset();
        if(!rf.flavour || !rf.has_whitening_filter) {
            continue;
        }
        for(std::size_t ii = 0; ii < corrections.size(); ++ii) {
            if(boost::algorithm::iequals(corrections[ii].receiver_type,
                                         *rf.flavour) &&
               corrections[ii].whitening_filter == *rf.has_whitening_filter) {
                rf.signal_chain_correction_index = ii;
                break;
            }
        }
    }
}

} // namespace mwareader
