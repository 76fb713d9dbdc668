#include "mwareader/FileIdentity.hpp"

#include "mwareader/Errors.hpp"

#include <boost/log/trivial.hpp>

#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

namespace mwareader
{
namespace
{

// <obsid>_<yyyymmdd><hhmmss>_ch<chan>_<batch>.fits
std::regex const mwax_correlator_regex(
    R"((\d{10})_\d{8}.?\d{6}_ch(\d{3})_(\d{3})\.fits)");

// <obsid>_<yyyymmddhhmmss>_gpubox<chan>_<batch>.fits
std::regex const legacy_correlator_regex(
    R"((\d{10})_\d{14}_gpubox(\d{2})_(\d{2})\.fits)");

// <obsid>_<yyyymmddhhmmss>_gpubox<chan>.fits
std::regex const old_legacy_correlator_regex(
    R"((\d{10})_\d{14}_gpubox(\d{2})\.fits)");

// <obsid>_<gpstime>_<chan>.sub
std::regex const mwax_voltage_regex(R"((\d{10})_(\d{10})_(\d{1,3})\.sub)");

// <obsid>_<gpstime>_ch<chan>.dat
std::regex const legacy_voltage_regex(
    R"((\d{10})_(\d{10})_ch(\d{1,3})\.dat)");

} // namespace

std::string to_string(FileKind kind)
{
    return kind == FileKind::Correlator ? "correlator" : "voltage";
}

std::optional<FileIdentity> parse_filename(std::string const& path)
{
    std::string const name = fs::path(path).filename().string();
    std::smatch match;
    FileIdentity identity;
    identity.path = path;

    if(std::regex_match(name, match, mwax_correlator_regex)) {
        identity.kind               = FileKind::Correlator;
        identity.version            = MWAVersion::CorrMWAXv2;
        identity.obs_id             = std::stoul(match[1].str());
        identity.channel_identifier = std::stoul(match[2].str());
        identity.batch_number       = std::stoul(match[3].str());
    } else if(std::regex_match(name, match, legacy_correlator_regex)) {
        identity.kind               = FileKind::Correlator;
        identity.version            = MWAVersion::CorrLegacy;
        identity.obs_id             = std::stoul(match[1].str());
        identity.channel_identifier = std::stoul(match[2].str());
        identity.batch_number       = std::stoul(match[3].str());
    } else if(std::regex_match(name, match, old_legacy_correlator_regex)) {
        identity.kind               = FileKind::Correlator;
        identity.version            = MWAVersion::CorrOldLegacy;
        identity.obs_id             = std::stoul(match[1].str());
        identity.channel_identifier = std::stoul(match[2].str());
        identity.batch_number       = 0;
    } else if(std::regex_match(name, match, mwax_voltage_regex)) {
        identity.kind               = FileKind::Voltage;
        identity.version            = MWAVersion::VCSMWAXv2;
        identity.obs_id             = std::stoul(match[1].str());
        identity.gps_time           = std::stoull(match[2].str());
        identity.channel_identifier = std::stoul(match[3].str());
    } else if(std::regex_match(name, match, legacy_voltage_regex)) {
        identity.kind               = FileKind::Voltage;
        identity.version            = MWAVersion::VCSLegacyRecombined;
        identity.obs_id             = std::stoul(match[1].str());
        identity.gps_time           = std::stoull(match[2].str());
        identity.channel_identifier = std::stoul(match[3].str());
    } else {
        return std::nullopt;
    }
    return identity;
}

std::vector<FileIdentity> identify_files(std::vector<std::string> const& paths)
{
    std::vector<FileIdentity> files;
    files.reserve(paths.size());
    for(auto const& path: paths) {
        auto identity = parse_filename(path);
        if(!identity) {
            throw CatalogError(CatalogError::Kind::UnrecognisedFilename,
                               "Unable to determine the kind of file " +
                                   path);
        }
        BOOST_LOG_TRIVIAL(debug)
            << "Recognised " << path << " as a " << to_string(identity->kind)
            << " file (" << to_string(identity->version) << ")";
        files.push_back(std::move(*identity));
    }
    return files;
}

FileKind common_file_kind(std::vector<FileIdentity> const& files)
{
    FileKind const kind = files.front().kind;
    for(auto const& file: files) {
        if(file.kind != kind) {
            throw CatalogError(CatalogError::Kind::MixedFileKinds,
                               files.front().path + " is a " +
                                   to_string(kind) + " file but " +
                                   file.path + " is a " +
                                   to_string(file.kind) + " file");
        }
    }
    return kind;
}

MWAVersion common_version(std::vector<FileIdentity> const& files)
{
    MWAVersion const version = files.front().version;
    for(auto const& file: files) {
        if(file.version != version) {
            throw ContextError(ContextError::Kind::VersionConflict,
                               files.front().path + " is " +
                                   to_string(version) + " data but " +
                                   file.path + " is " +
                                   to_string(file.version) + " data");
        }
    }
    return version;
}

MWAVersion resolve_file_version(std::vector<FileIdentity> const& files,
                                FileKind kind,
                                std::optional<MWAVersion> const& requested)
{
    if(files.empty()) {
        throw ContextError(ContextError::Kind::NoCompatibleFiles,
                           "No " + to_string(kind) + " data files supplied");
    }
    if(common_file_kind(files) != kind) {
        throw ContextError(ContextError::Kind::NoCompatibleFiles,
                           "None of the " + std::to_string(files.size()) +
                               " supplied files are " + to_string(kind) +
                               " files");
    }
    MWAVersion const version = common_version(files);
    if(requested && *requested != version) {
        throw CatalogError(CatalogError::Kind::VersionMismatch,
                           "Requested " + to_string(*requested) +
                               " but the data files are " +
                               to_string(version));
    }
    BOOST_LOG_TRIVIAL(debug) << "Data files are " << to_string(version);
    return version;
}

} // namespace mwareader
