#ifndef MWAREADER_RFINPUT_HPP
#define MWAREADER_RFINPUT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mwareader
{

class FitsFile;

enum class Pol { X, Y };

std::string to_string(Pol pol);

/**
 * @brief      Receiver-specific correction for one receiver flavour
 */
struct SignalChainCorrection {
    std::string receiver_type;       // Receiver flavour, e.g. "RRI"
    bool whitening_filter = false;   // Whether the whitening filter was in
    std::vector<double> corrections; // One value per receiver channel
};

/**
 * @brief      One row of the metafits TILEDATA table: a single
 *             polarisation of one antenna and its signal chain.
 */
struct RFInput {
    std::size_t input        = 0;   // Order in the metafits table
    std::size_t antenna      = 0;   // Antenna number
    std::size_t tile_id      = 0;   // Numeric tile id
    std::string tile_name;          // Tile name, e.g. "Tile011"
    Pol pol                  = Pol::X;
    double electrical_length_m = 0.0;
    double north_m           = 0.0;
    double east_m            = 0.0;
    double height_m          = 0.0;
    std::size_t vcs_order    = 0;   // Position in legacy VCS data
    std::size_t subfile_order = 0;  // Position in MWAX data
    bool flagged             = false;
    std::vector<int> digital_gains; // Per receiver channel
    std::vector<int> dipole_delays; // Beamformer delays, one per dipole
    std::size_t receiver_number      = 0;
    std::size_t receiver_slot_number = 0;
    std::optional<std::string> flavour;
    std::optional<bool> has_whitening_filter;
    std::optional<std::size_t> signal_chain_correction_index;
};

/**
 * @brief      Position of an input within legacy (recombined) VCS data
 */
std::size_t vcs_order(std::size_t input);

/**
 * @brief      Position of an input within MWAX data
 */
std::size_t subfile_order(std::size_t antenna, Pol pol);

/**
 * @brief      Parse the Pol column of the TILEDATA table
 */
Pol parse_pol(std::string const& value);

/**
 * @brief      Electrical length from the Length column of TILEDATA
 *
 * @details    Lengths prefixed with "EL_" are already electrical
 *             lengths. Any other value is a physical cable length and
 *             is scaled by the coax velocity factor.
 */
double electrical_length(std::string const& length, double coax_v_factor);

/**
 * @brief      Read every row of the TILEDATA table
 *
 * @param      metafits       A metafits file with TILEDATA as the current HDU
 * @param      num_rf_inputs  The NINPUTS value of the primary HDU
 * @param      coax_v_factor  Velocity factor for physical cable lengths
 *
 * @return     The inputs in table order
 */
std::vector<RFInput> read_rf_inputs(FitsFile& metafits,
                                    std::size_t num_rf_inputs,
                                    double coax_v_factor);

/**
 * @brief      Read the optional SIGCHAINDATA table
 *
 * @return     The corrections, or an empty vector when the table is absent
 */
std::vector<SignalChainCorrection>
read_signal_chain_corrections(FitsFile& metafits);

/**
 * @brief      Point each input at the correction matching its receiver
 *             flavour and whitening filter setting
 */
void link_signal_chain_corrections(
    std::vector<RFInput>& rf_inputs,
    std::vector<SignalChainCorrection> const& corrections);

} // namespace mwareader

#endif // MWAREADER_RFINPUT_HPP
