#ifndef MWAREADER_MWAVERSION_HPP
#define MWAREADER_MWAVERSION_HPP

#include <optional>
#include <ostream>
#include <string>

namespace mwareader
{

/**
 * @brief      The instrument generation and data kind an observation
 *             was recorded with.
 */
enum class MWAVersion {
    CorrOldLegacy,       // Legacy correlator, gpubox files without batch numbers
    CorrLegacy,          // Legacy correlator
    CorrMWAXv2,          // MWAX correlator
    VCSLegacyRecombined, // Legacy VCS after recombining
    VCSMWAXv2            // MWAX VCS subfiles
};

std::string to_string(MWAVersion version);
std::ostream& operator<<(std::ostream& stream, MWAVersion version);

bool is_correlator(MWAVersion version);
bool is_voltage(MWAVersion version);
bool is_legacy(MWAVersion version);

/**
 * @brief      Determine the instrument version from the metafits MODE
 *
 * @param      mode  The value of the MODE key, e.g. "MWAX_CORRELATOR"
 *
 * @return     The version, or nothing if the mode does not produce
 *             data this library can read.
 */
std::optional<MWAVersion> version_from_mode(std::string const& mode);

/**
 * @brief      Semantic version of this library
 */
int version_major();
int version_minor();
int version_patch();
std::string version_string();

} // namespace mwareader

#endif // MWAREADER_MWAVERSION_HPP
