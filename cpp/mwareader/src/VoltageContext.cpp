#include "mwareader/VoltageContext.hpp"

#include "mwareader/Errors.hpp"
#include "mwareader/FileIdentity.hpp"
#include "mwareader/MultiFileReader.hpp"

#include <boost/log/trivial.hpp>

#include <map>
#include <sstream>

namespace mwareader
{

VoltageContext::VoltageContext(ContextConfig const& config)
{
    auto const files = identify_files(config.data_files());
    MWAVersion const version =
        resolve_file_version(files, FileKind::Voltage, config.version());
    _metadata = std::make_shared<Metadata>(
        load_metadata(config.metafits_file(), version));
    _geometry = compute_voltage_geometry(*_metadata, version);
    BOOST_LOG_TRIVIAL(debug) << _geometry.to_string();
    _catalog = build_voltage_catalog(files, *_metadata, _geometry, config);
    index_timesteps();

    BOOST_LOG_TRIVIAL(info)
        << "Opened " << mwareader::to_string(version)
        << " voltage observation " << _metadata->obs_id << " with "
        << files.size() << " files: "
        << _provided_timestep_indices.size() << " of " << _timesteps.size()
        << " timesteps and " << _provided_coarse_chan_indices.size()
        << " of " << _metadata->num_coarse_chans
        << " coarse channels provided";
}

VoltageContext::VoltageContext(std::string const& metafits_file,
                               std::vector<std::string> const& voltage_files)
    : VoltageContext([&]() {
          ContextConfig config;
          config.metafits_file(metafits_file);
          config.data_files(voltage_files);
          return config;
      }())
{
}

VoltageContext::~VoltageContext()
{
}

void VoltageContext::index_timesteps()
{
    Metadata const& md = *_metadata;

    std::map<std::uint64_t, Timestep> all_timesteps;
    for(auto const& timestep: md.timesteps) {
        all_timesteps[timestep.gps_time_ms] = timestep;
    }
    for(auto const& entry: _catalog.time_map) {
        if(all_timesteps.count(entry.first) == 0) {
            BOOST_LOG_TRIVIAL(debug)
                << "Voltage file at GPS time " << entry.first
                << " ms lies outside the scheduled observation";
            all_timesteps[entry.first] = Timestep{
                gps_to_unix_time_ms(entry.first,
                                    md.sched_start_gps_time_ms,
                                    md.sched_start_unix_time_ms),
                entry.first};
        }
    }
    for(auto const& entry: all_timesteps) {
        _timesteps.push_back(entry.second);
    }

    for(std::size_t cc = 0; cc < md.coarse_chans.size(); ++cc) {
        std::size_t const channel = md.coarse_chans[cc].rec_chan_number;
        if(_catalog.time_map.begin()->second.count(channel) != 0) {
            _provided_coarse_chan_indices.push_back(cc);
        }
    }

    for(std::size_t ts = 0; ts < _timesteps.size(); ++ts) {
        auto const it = _catalog.time_map.find(_timesteps[ts].gps_time_ms);
        if(it == _catalog.time_map.end()) {
            continue;
        }
        _provided_timestep_indices.push_back(ts);
        if(it->second.size() == _provided_coarse_chan_indices.size()) {
            _common_timestep_indices.push_back(ts);
        }
    }
}

Metadata const& VoltageContext::metadata() const
{
    return *_metadata;
}

std::shared_ptr<Metadata const> VoltageContext::shared_metadata() const
{
    return _metadata;
}

MWAVersion VoltageContext::version() const
{
    return _catalog.version;
}

VoltageGeometry const& VoltageContext::geometry() const
{
    return _geometry;
}

VoltageCatalog const& VoltageContext::catalog() const
{
    return _catalog;
}

std::vector<Timestep> const& VoltageContext::timesteps() const
{
    return _timesteps;
}

std::vector<std::size_t> const&
VoltageContext::provided_timestep_indices() const
{
    return _provided_timestep_indices;
}

std::vector<std::size_t> const&
VoltageContext::provided_coarse_chan_indices() const
{
    return _provided_coarse_chan_indices;
}

std::vector<std::size_t> const&
VoltageContext::common_timestep_indices() const
{
    return _common_timestep_indices;
}

std::uint64_t VoltageContext::start_gps_time_ms() const
{
    return _catalog.time_map.begin()->first;
}

std::uint64_t VoltageContext::end_gps_time_ms() const
{
    return _catalog.time_map.rbegin()->first + _geometry.timestep_duration_ms;
}

std::size_t
VoltageContext::check_coarse_chan_index(std::size_t coarse_chan_index) const
{
    if(coarse_chan_index >= _metadata->coarse_chans.size()) {
        throw DataError(DataError::Kind::InvalidCoarseChannelIndex,
                        "Coarse channel index " +
                            std::to_string(coarse_chan_index) +
                            " is out of range (" +
                            std::to_string(_metadata->coarse_chans.size()) +
                            " coarse channels)");
    }
    return _metadata->coarse_chans[coarse_chan_index].rec_chan_number;
}

std::vector<std::int8_t>
VoltageContext::read_file(std::size_t timestep_index,
                          std::size_t coarse_chan_index) const
{
    if(timestep_index >= _timesteps.size()) {
        throw DataError(DataError::Kind::InvalidTimestepIndex,
                        "Timestep index " + std::to_string(timestep_index) +
                            " is out of range (" +
                            std::to_string(_timesteps.size()) +
                            " timesteps)");
    }
    std::size_t const channel = check_coarse_chan_index(coarse_chan_index);
    auto const by_time =
        _catalog.time_map.find(_timesteps[timestep_index].gps_time_ms);
    if(by_time == _catalog.time_map.end() ||
       by_time->second.count(channel) == 0) {
        throw DataError(DataError::Kind::NoDataForTimestepCoarseChannel,
                        "No data for timestep index " +
                            std::to_string(timestep_index) +
                            " and coarse channel index " +
                            std::to_string(coarse_chan_index));
    }

    MultiFileReader reader({by_time->second.at(channel)},
                           _geometry.data_offset_bytes,
                           _geometry.timestep_data_size_bytes);
    std::vector<std::int8_t> buffer(_geometry.timestep_data_size_bytes);
    reader.read(reinterpret_cast<char*>(buffer.data()), buffer.size());
    return buffer;
}

std::vector<std::int8_t>
VoltageContext::read_second(std::uint64_t gps_second_start,
                            std::size_t num_seconds,
                            std::size_t coarse_chan_index) const
{
    std::size_t const channel = check_coarse_chan_index(coarse_chan_index);
    std::uint64_t const first_second = start_gps_time_ms() / 1000;
    std::uint64_t const end_second   = end_gps_time_ms() / 1000;
    if(num_seconds == 0 || gps_second_start < first_second ||
       gps_second_start >= end_second ||
       num_seconds > end_second - gps_second_start) {
        throw DataError(DataError::Kind::InvalidGpsSecond,
                        std::to_string(num_seconds) +
                            " seconds from GPS second " +
                            std::to_string(gps_second_start) +
                            " are not within the data span " +
                            std::to_string(first_second) + " to " +
                            std::to_string(end_second));
    }

    // Files that cover the requested seconds, in time order
    std::uint64_t const file_seconds = _geometry.timestep_duration_ms / 1000;
    std::uint64_t const first_file =
        first_second +
        (gps_second_start - first_second) / file_seconds * file_seconds;
    std::uint64_t const last_second = gps_second_start + num_seconds - 1;
    std::vector<std::string> files;
    for(std::uint64_t file_start = first_file; file_start <= last_second;
        file_start += file_seconds) {
        auto const by_time = _catalog.time_map.find(file_start * 1000);
        if(by_time == _catalog.time_map.end() ||
           by_time->second.count(channel) == 0) {
            throw DataError(DataError::Kind::NoDataForTimestepCoarseChannel,
                            "No data for GPS second " +
                                std::to_string(file_start) +
                                " and coarse channel index " +
                                std::to_string(coarse_chan_index));
        }
        files.push_back(by_time->second.at(channel));
    }

    MultiFileReader reader(files,
                           _geometry.data_offset_bytes,
                           _geometry.timestep_data_size_bytes);
    reader.seekg((gps_second_start - first_file) *
                 _geometry.second_data_size_bytes);
    std::vector<std::int8_t> buffer(num_seconds *
                                    _geometry.second_data_size_bytes);
    reader.read(reinterpret_cast<char*>(buffer.data()), buffer.size());
    return buffer;
}

std::string VoltageContext::to_string() const
{
    std::ostringstream oss;
    oss << "VoltageContext:\n"
        << "  Version: " << mwareader::to_string(version()) << "\n"
        << "  Batches: " << _catalog.batches.size() << "\n"
        << "  Timesteps: " << _timesteps.size() << " ("
        << _provided_timestep_indices.size() << " provided, "
        << _common_timestep_indices.size() << " common)\n"
        << "  Coarse channels: " << _metadata->num_coarse_chans << " ("
        << _provided_coarse_chan_indices.size() << " provided)\n"
        << "  Data span (GPS ms): " << start_gps_time_ms() << " to "
        << end_gps_time_ms() << "\n"
        << _geometry.to_string() << _metadata->to_string();
    return oss.str();
}

} // namespace mwareader
