#include "mwareader/VoltageCatalog.hpp"

#include "mwareader/ContextConfig.hpp"
#include "mwareader/Errors.hpp"
#include "mwareader/Metadata.hpp"
#include "mwareader/SubfileHeader.hpp"

#include "psrdada_cpp/raw_bytes.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

namespace mwareader
{
namespace
{

std::size_t file_size(std::string const& path)
{
    std::error_code ec;
    std::uintmax_t const size = fs::file_size(path, ec);
    if(ec) {
        throw CatalogError(CatalogError::Kind::FileAccess,
                           "Unable to determine the size of " + path + ": " +
                               ec.message());
    }
    return static_cast<std::size_t>(size);
}

void check_subfile_header(FileIdentity const& file,
                          Metadata const& metadata,
                          std::size_t header_size)
{
    std::ifstream stream(file.path, std::ifstream::binary);
    if(!stream.is_open()) {
        throw CatalogError(CatalogError::Kind::FileAccess,
                           "Unable to open " + file.path);
    }
    // One extra byte keeps the header null terminated
    std::vector<char> header_bytes(header_size + 1, '\0');
    stream.read(header_bytes.data(), header_size);
    if(static_cast<std::size_t>(stream.gcount()) != header_size) {
        throw CatalogError(CatalogError::Kind::BadFileContent,
                           file.path + " is too short to hold a " +
                               std::to_string(header_size) +
                               " byte header");
    }
    psrdada_cpp::RawBytes block(header_bytes.data(),
                                header_size,
                                header_size,
                                false);
    SubfileHeader header;
    try {
        read_subfile_header(block, header);
    } catch(std::runtime_error const& error) {
        throw CatalogError(CatalogError::Kind::BadFileContent,
                           file.path + ": " + error.what());
    }
    BOOST_LOG_TRIVIAL(debug) << file.path << " " << header.to_string();

    auto mismatch = [&](char const* key, std::size_t found,
                        std::size_t expected) {
        if(found != 0 && found != expected) {
            BOOST_LOG_TRIVIAL(warning)
                << file.path << " header " << key << " is " << found
                << ", expected " << expected;
            throw CatalogError(CatalogError::Kind::BadFileContent,
                               file.path + " header " + key + " is " +
                                   std::to_string(found) + " but expected " +
                                   std::to_string(expected));
        }
    };
    mismatch("OBS_ID", header.obs_id, metadata.obs_id);
    mismatch("SUBOBS_ID", header.subobs_id, file.gps_time);
    mismatch("COARSE_CHANNEL", header.coarse_channel, file.channel_identifier);
    mismatch("NINPUTS", header.ninputs, metadata.num_rf_inputs);
}

} // namespace

std::vector<VoltageBatch>
group_voltage_batches(std::vector<FileIdentity> const& files,
                      std::uint64_t timestep_duration_ms)
{
    std::map<std::uint64_t, VoltageBatch> grouped;
    for(auto const& file: files) {
        auto& batch    = grouped[file.gps_time];
        batch.gps_time = file.gps_time;
        for(auto const& other: batch.files) {
            if(other.channel_identifier == file.channel_identifier) {
                throw CatalogError(CatalogError::Kind::DuplicateFile,
                                   other.path + " and " + file.path +
                                       " are the same GPS time and channel");
            }
        }
        batch.files.push_back(file);
    }

    std::uint64_t const step_s = timestep_duration_ms / 1000;
    std::vector<VoltageBatch> batches;
    for(auto& entry: grouped) {
        VoltageBatch& batch = entry.second;
        std::sort(batch.files.begin(),
                  batch.files.end(),
                  [](FileIdentity const& a, FileIdentity const& b) {
                      return a.channel_identifier < b.channel_identifier;
                  });
        if(!batches.empty()) {
            VoltageBatch const& previous = batches.back();
            if(batch.gps_time != previous.gps_time + step_s) {
                throw CatalogError(
                    CatalogError::Kind::MissingFiles,
                    "Voltage files for GPS time " +
                        std::to_string(previous.gps_time + step_s) +
                        " are missing");
            }
            VoltageBatch const& first = batches.front();
            bool same_channels = batch.files.size() == first.files.size();
            for(std::size_t ii = 0; same_channels && ii < batch.files.size();
                ++ii) {
                same_channels = batch.files[ii].channel_identifier ==
                                first.files[ii].channel_identifier;
            }
            if(!same_channels) {
                throw CatalogError(
                    CatalogError::Kind::MissingFiles,
                    "GPS time " + std::to_string(batch.gps_time) +
                        " does not have the same channels as GPS time " +
                        std::to_string(first.gps_time));
            }
        }
        batches.push_back(std::move(batch));
    }
    return batches;
}

VoltageCatalog build_voltage_catalog(std::vector<FileIdentity> const& files,
                                     Metadata const& metadata,
                                     VoltageGeometry const& geometry,
                                     ContextConfig const& config)
{
    VoltageCatalog catalog;
    catalog.version = files.front().version;

    std::set<std::size_t> known_channels;
    for(auto const& chan: metadata.coarse_chans) {
        known_channels.insert(chan.rec_chan_number);
    }
    for(auto const& file: files) {
        if(file.obs_id != metadata.obs_id) {
            throw CatalogError(CatalogError::Kind::ObsidMismatch,
                               file.path + " is not part of observation " +
                                   std::to_string(metadata.obs_id));
        }
        if(known_channels.count(file.channel_identifier) == 0) {
            throw CatalogError(CatalogError::Kind::BadFileContent,
                               file.path + " is for receiver channel " +
                                   std::to_string(file.channel_identifier) +
                                   " which the metafits does not list");
        }
    }

    catalog.batches =
        group_voltage_batches(files, geometry.timestep_duration_ms);

    for(auto const& batch: catalog.batches) {
        for(auto const& file: batch.files) {
            std::size_t const size = file_size(file.path);
            if(config.check_file_sizes() &&
               size != geometry.expected_file_size_bytes) {
                throw CatalogError(file.path + " is not a complete " +
                                       to_string(file.version) + " file",
                                   geometry.expected_file_size_bytes,
                                   size);
            }
            if(catalog.file_size_bytes == 0) {
                catalog.file_size_bytes = size;
            } else if(size != catalog.file_size_bytes) {
                throw CatalogError(file.path + " differs in size from " +
                                       catalog.batches.front().files.front().path,
                                   catalog.file_size_bytes,
                                   size);
            }
            if(config.validate_subfile_headers() &&
               geometry.header_size_bytes > 0) {
                check_subfile_header(file, metadata,
                                     geometry.header_size_bytes);
            }
            catalog.time_map[batch.gps_time * 1000][file.channel_identifier] =
                file.path;
        }
    }
    BOOST_LOG_TRIVIAL(debug) << "Voltage catalog: " << catalog.batches.size()
                             << " GPS time batches of "
                             << catalog.batches.front().files.size()
                             << " files";
    return catalog;
}

} // namespace mwareader
