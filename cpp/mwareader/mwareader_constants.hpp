#ifndef MWAREADER_CONSTANTS_HPP
#define MWAREADER_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>

/**
 * FIXED PARAMETERS FOR MWAREADER
 *
 * The values below describe the MWA receiver hardware and the on-disk
 * layout of the two instrument generations ("legacy" and "MWAX").
 * They are not tunable: changing any of them breaks compatibility with
 * real observation data.
 */

/**
 * Library semantic version
 */
#define MWAREADER_VERSION_MAJOR 1
#define MWAREADER_VERSION_MINOR 0
#define MWAREADER_VERSION_PATCH 0

namespace mwareader
{

/**
 * Location of the centre of the MWA
 */
constexpr double MWA_LATITUDE_RADIANS  = -0.4660608448386394;
constexpr double MWA_LONGITUDE_RADIANS = 2.0362898668561042;
constexpr double MWA_ALTITUDE_METRES   = 377.827;

/**
 * Velocity factor of RG-6 like coax, used to derive the electrical
 * length of an rf input when the metafits gives a physical length.
 */
constexpr double COAX_V_FACTOR = 1.204;

// Every MWA antenna has an X and a Y dipole
constexpr std::size_t NUM_ANTENNA_POLS = 2;

// XX, XY, YX, YY
constexpr std::size_t NUM_VISIBILITY_POLS = 4;

// Receivers have 256 channels of 1.28 MHz
constexpr std::size_t MAX_RECEIVER_CHANNELS = 256;

// Length of the Gains and Delays arrays in the TILEDATA table
constexpr std::size_t NUM_DIPOLE_GAINS  = 24;
constexpr std::size_t NUM_DIPOLE_DELAYS = 16;

/**
 * The legacy correlator always produced 128 tiles worth of
 * visibilities, so its conversion table needs exactly 256 rf inputs.
 */
constexpr std::size_t LEGACY_NUM_RF_INPUTS = 256;

/**
 * Legacy receiver channels above this number appear in reversed
 * order in the correlator output.
 */
constexpr std::size_t LEGACY_REVERSE_CHANNEL_THRESHOLD = 128;

/**
 * Voltage capture layout
 *
 * Legacy recombined files hold one second of data as a single block of
 * 10000 samples x 128 fine channels x rf inputs, one byte per sample
 * (4 bit real, 4 bit imaginary).
 *
 * MWAX subfiles hold 8 seconds of data in 160 blocks of 64000 samples
 * per rf input, two bytes per sample (8 bit real, 8 bit imaginary),
 * after a 4096 byte ASCII header and one delay block.
 */
constexpr std::size_t LEGACY_VCS_SAMPLES_PER_RF_CHAIN_PER_BLOCK = 10000;
constexpr std::size_t LEGACY_VCS_SAMPLE_SIZE_BYTES              = 1;
constexpr std::size_t LEGACY_VCS_FINE_CHAN_WIDTH_HZ             = 10000;
constexpr std::size_t LEGACY_VCS_BLOCKS_PER_TIMESTEP            = 1;
constexpr std::size_t LEGACY_VCS_TIMESTEP_DURATION_MS           = 1000;

constexpr std::size_t MWAX_VCS_SAMPLES_PER_RF_CHAIN_PER_BLOCK = 64000;
constexpr std::size_t MWAX_VCS_SAMPLE_SIZE_BYTES              = 2;
constexpr std::size_t MWAX_VCS_BLOCKS_PER_TIMESTEP            = 160;
constexpr std::size_t MWAX_VCS_TIMESTEP_DURATION_MS           = 8000;
constexpr std::size_t MWAX_VCS_HEADER_SIZE_BYTES              = 4096;

// Value of the CORR_VER key in MWAX correlator files
constexpr long MWAX_CORR_VER = 2;

} // namespace mwareader

#endif // MWAREADER_CONSTANTS_HPP
