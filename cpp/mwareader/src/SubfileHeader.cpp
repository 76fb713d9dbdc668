#include "mwareader/SubfileHeader.hpp"

#include "mwareader/Header.hpp"

#include <sstream>

namespace mwareader
{

void read_subfile_header(psrdada_cpp::RawBytes& raw_header,
                         SubfileHeader& header)
{
    Header parser(raw_header);
    header.hdr_size =
        parser.get_or_default<decltype(header.hdr_size)>("HDR_SIZE", 0);
    header.obs_id = parser.get_or_default<decltype(header.obs_id)>("OBS_ID", 0);
    header.subobs_id =
        parser.get_or_default<decltype(header.subobs_id)>("SUBOBS_ID", 0);
    header.coarse_channel =
        parser.get_or_default<decltype(header.coarse_channel)>(
            "COARSE_CHANNEL", 0);
    header.ninputs =
        parser.get_or_default<decltype(header.ninputs)>("NINPUTS", 0);
    header.ntimesamples =
        parser.get_or_default<decltype(header.ntimesamples)>("NTIMESAMPLES",
                                                             0);
    header.nbit = parser.get_or_default<decltype(header.nbit)>("NBIT", 0);
    header.mode =
        parser.get_or_default<decltype(header.mode)>("MODE", std::string());
}

std::string SubfileHeader::to_string() const
{
    std::ostringstream oss;
    oss << "SubfileHeader:\n"
        << "  hdr_size: " << hdr_size << "\n"
        << "  obs_id: " << obs_id << "\n"
        << "  subobs_id: " << subobs_id << "\n"
        << "  coarse_channel: " << coarse_channel << "\n"
        << "  ninputs: " << ninputs << "\n"
        << "  ntimesamples: " << ntimesamples << "\n"
        << "  nbit: " << nbit << "\n"
        << "  mode: " << mode << "\n";
    return oss.str();
}

} // namespace mwareader
