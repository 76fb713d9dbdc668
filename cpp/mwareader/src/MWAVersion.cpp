#include "mwareader/MWAVersion.hpp"

#include "mwareader/mwareader_constants.hpp"

#include <boost/algorithm/string.hpp>
#include <sstream>

namespace mwareader
{

std::string to_string(MWAVersion version)
{
    switch(version) {
    case MWAVersion::CorrOldLegacy:
        return "Correlator v1 old Legacy (no file indices)";
    case MWAVersion::CorrLegacy:
        return "Correlator v1 Legacy";
    case MWAVersion::CorrMWAXv2:
        return "Correlator v2 MWAX";
    case MWAVersion::VCSLegacyRecombined:
        return "VCS Legacy Recombined";
    case MWAVersion::VCSMWAXv2:
        return "VCS MWAX v2";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& stream, MWAVersion version)
{
    stream << to_string(version);
    return stream;
}

bool is_correlator(MWAVersion version)
{
    return version == MWAVersion::CorrOldLegacy ||
           version == MWAVersion::CorrLegacy ||
           version == MWAVersion::CorrMWAXv2;
}

bool is_voltage(MWAVersion version)
{
    return !is_correlator(version);
}

bool is_legacy(MWAVersion version)
{
    return version == MWAVersion::CorrOldLegacy ||
           version == MWAVersion::CorrLegacy ||
           version == MWAVersion::VCSLegacyRecombined;
}

std::optional<MWAVersion> version_from_mode(std::string const& mode)
{
    std::string const key = boost::algorithm::to_upper_copy(
        boost::algorithm::trim_copy(mode));
    if(key == "MWAX_CORRELATOR" || key == "MWAX_CORR_BF") {
        return MWAVersion::CorrMWAXv2;
    }
    if(key == "MWAX_VCS" || key == "MWAX_BUFFER") {
        return MWAVersion::VCSMWAXv2;
    }
    if(key == "VOLTAGE_START" || key == "VOLTAGE_BUFFER" ||
       key == "VOLTAGE_STOP") {
        return MWAVersion::VCSLegacyRecombined;
    }
    if(key == "HW_LFILES" || key == "HW_LFILES_NOMENTOK") {
        return MWAVersion::CorrLegacy;
    }
    return std::nullopt;
}

int version_major()
{
    return MWAREADER_VERSION_MAJOR;
}

int version_minor()
{
    return MWAREADER_VERSION_MINOR;
}

int version_patch()
{
    return MWAREADER_VERSION_PATCH;
}

std::string version_string()
{
    std::ostringstream oss;
    oss << version_major() << "." << version_minor() << "."
        << version_patch();
    return oss.str();
}

} // namespace mwareader
