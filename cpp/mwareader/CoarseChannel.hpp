#ifndef MWAREADER_COARSECHANNEL_HPP
#define MWAREADER_COARSECHANNEL_HPP

#include "mwareader/MWAVersion.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mwareader
{

/**
 * @brief      One coarse channel of the observation
 *
 * @details    gpubox_number is the channel identifier found in data
 *             file names: the receiver channel for MWAX and voltage
 *             data, and the correlator channel plus one for legacy
 *             correlator data.
 */
struct CoarseChannel {
    std::size_t corr_chan_number = 0;
    std::size_t rec_chan_number  = 0;
    std::size_t gpubox_number    = 0;
    std::uint32_t chan_width_hz  = 0;
    std::uint32_t chan_start_hz  = 0;
    std::uint32_t chan_centre_hz = 0;
    std::uint32_t chan_end_hz    = 0;
};

/**
 * @brief      Parse the metafits CHANNELS value, e.g. "133,134,135"
 */
std::vector<std::size_t> parse_channel_list(std::string const& channels);

/**
 * @brief      Build the coarse channel list for an instrument version
 *
 * @param      version          The instrument version of the data
 * @param      receiver_chans   Receiver channel numbers in metafits order
 * @param      chan_width_hz    The width of one coarse channel
 *
 * @return     Channels sorted by receiver channel number
 */
std::vector<CoarseChannel>
populate_coarse_channels(MWAVersion version,
                         std::vector<std::size_t> const& receiver_chans,
                         std::uint32_t chan_width_hz);

} // namespace mwareader

#endif // MWAREADER_COARSECHANNEL_HPP
