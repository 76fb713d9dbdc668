#ifndef MWAREADER_SUBFILEHEADER_HPP
#define MWAREADER_SUBFILEHEADER_HPP

#include "psrdada_cpp/raw_bytes.hpp"

#include <cstddef>
#include <string>

namespace mwareader
{

/**
 * Keys of the DADA header at the start of an MWAX voltage subfile.
 * Keys that are absent from the header are left at zero (or empty).
 */
struct SubfileHeader {
    std::size_t hdr_size       = 0; // Size of the header in bytes
    std::size_t obs_id         = 0; // Observation id
    std::size_t subobs_id      = 0; // GPS second the subfile starts at
    std::size_t coarse_channel = 0; // Receiver channel number
    std::size_t ninputs        = 0; // Number of rf inputs
    std::size_t ntimesamples   = 0; // Samples per rf input per block
    std::size_t nbit           = 0; // Bits per real or imaginary value
    std::string mode;               // e.g. MWAX_VCS
    std::string to_string() const;
};

/**
 * @brief Parse the header of an MWAX voltage subfile
 *
 * @param raw_header A RawBytes object containing the DADA header
 * @param header A SubfileHeader instance
 */
void read_subfile_header(psrdada_cpp::RawBytes& raw_header,
                         SubfileHeader& header);

} // namespace mwareader

#endif // MWAREADER_SUBFILEHEADER_HPP
