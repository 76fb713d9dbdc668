#include "mwareader/CoarseChannel.hpp"

#include "mwareader/Errors.hpp"
#include "mwareader/mwareader_constants.hpp"

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace mwareader
{

std::vector<std::size_t> parse_channel_list(std::string const& channels)
{
    std::string cleaned = channels;
    boost::algorithm::erase_all(cleaned, "'");
    boost::algorithm::erase_all(cleaned, "&");
    std::vector<std::string> tokens;
    boost::algorithm::split(tokens, cleaned, boost::is_any_of(","));

    std::vector<std::size_t> receiver_chans;
    for(auto& token: tokens) {
        boost::algorithm::trim(token);
        if(token.empty()) {
            continue;
        }
        try {
            std::size_t parsed = 0;
            unsigned long value = std::stoul(token, &parsed);
            if(parsed != token.size() || value >= MAX_RECEIVER_CHANNELS) {
                throw std::invalid_argument(token);
            }
            receiver_chans.push_back(value);
        } catch(std::logic_error const&) {
            throw MetadataError(MetadataError::Kind::Malformed,
                                "Invalid receiver channel '" + token +
                                    "' in CHANNELS");
        }
    }
    if(receiver_chans.empty()) {
        throw MetadataError(MetadataError::Kind::Malformed,
                            "CHANNELS lists no coarse channels");
    }
    return receiver_chans;
}

std::vector<CoarseChannel>
populate_coarse_channels(MWAVersion version,
                         std::vector<std::size_t> const& receiver_chans,
                         std::uint32_t chan_width_hz)
{
    bool const legacy_correlator = version == MWAVersion::CorrLegacy ||
                                   version == MWAVersion::CorrOldLegacy;
    std::size_t const num_chans = receiver_chans.size();
    std::optional<std::size_t> first_reversed;

    std::vector<CoarseChannel> coarse_chans;
    coarse_chans.reserve(num_chans);
    for(std::size_t ii = 0; ii < num_chans; ++ii) {
        CoarseChannel chan;
        chan.rec_chan_number  = receiver_chans[ii];
        chan.corr_chan_number = ii;
        chan.gpubox_number    = chan.rec_chan_number;
        if(legacy_correlator) {
            // Channels above 128 come out of the legacy correlator in
            // reverse order
            if(chan.rec_chan_number > LEGACY_REVERSE_CHANNEL_THRESHOLD) {
                if(!first_reversed) {
                    first_reversed = ii;
                }
                chan.corr_chan_number =
                    (num_chans - 1) - (ii - *first_reversed);
            }
            chan.gpubox_number = chan.corr_chan_number + 1;
        }
        chan.chan_width_hz = chan_width_hz;
        chan.chan_centre_hz =
            static_cast<std::uint32_t>(chan.rec_chan_number) * chan_width_hz;
        chan.chan_start_hz = chan.chan_centre_hz - chan_width_hz / 2;
        chan.chan_end_hz   = chan.chan_centre_hz + chan_width_hz / 2;
        coarse_chans.push_back(chan);
    }
    std::sort(coarse_chans.begin(),
              coarse_chans.end(),
              [](CoarseChannel const& a, CoarseChannel const& b) {
                  return a.rec_chan_number < b.rec_chan_number;
              });
    return coarse_chans;
}

} // namespace mwareader
