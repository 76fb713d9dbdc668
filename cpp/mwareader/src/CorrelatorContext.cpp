#include "mwareader/CorrelatorContext.hpp"

#include "mwareader/Errors.hpp"
#include "mwareader/FileIdentity.hpp"
#include "mwareader/FitsFile.hpp"

#include <boost/log/trivial.hpp>

#include <map>
#include <sstream>

namespace mwareader
{

CorrelatorContext::CorrelatorContext(ContextConfig const& config)
    : _common_start_unix_time_ms(0), _common_end_unix_time_ms(0)
{
    if(!cfitsio_is_reentrant()) {
        BOOST_LOG_TRIVIAL(warning)
            << "cfitsio was built without --enable-reentrant, concurrent "
               "reads will be serialised";
    }
    auto const files = identify_files(config.data_files());
    MWAVersion const version =
        resolve_file_version(files, FileKind::Correlator, config.version());
    _metadata = std::make_shared<Metadata>(
        load_metadata(config.metafits_file(), version));
    _geometry = compute_correlator_geometry(*_metadata, version);
    BOOST_LOG_TRIVIAL(debug) << _geometry.to_string();
    if(is_legacy(version)) {
        _conversion_table = generate_conversion_table(_metadata->rf_inputs);
    }
    _catalog = build_gpubox_catalog(files, *_metadata, _geometry);
    index_timesteps();

    BOOST_LOG_TRIVIAL(info)
        << "Opened " << mwareader::to_string(version)
        << " correlator observation " << _metadata->obs_id << " with "
        << files.size() << " files: "
        << _provided_timestep_indices.size() << " of " << _timesteps.size()
        << " timesteps and " << _provided_coarse_chan_indices.size()
        << " of " << _metadata->num_coarse_chans
        << " coarse channels provided";
}

CorrelatorContext::CorrelatorContext(
    std::string const& metafits_file,
    std::vector<std::string> const& gpubox_files)
    : CorrelatorContext([&]() {
          ContextConfig config;
          config.metafits_file(metafits_file);
          config.data_files(gpubox_files);
          return config;
      }())
{
}

CorrelatorContext::~CorrelatorContext()
{
}

void CorrelatorContext::index_timesteps()
{
    Metadata const& md = *_metadata;

    std::map<std::uint64_t, Timestep> all_timesteps;
    for(auto const& timestep: md.timesteps) {
        all_timesteps[timestep.unix_time_ms] = timestep;
    }
    for(auto const& entry: _catalog.time_map) {
        if(all_timesteps.count(entry.first) == 0) {
            BOOST_LOG_TRIVIAL(debug)
                << "Data at UNIX time " << entry.first
                << " ms lies outside the scheduled observation";
            all_timesteps[entry.first] = Timestep{
                entry.first,
                unix_to_gps_time_ms(entry.first,
                                    md.sched_start_gps_time_ms,
                                    md.sched_start_unix_time_ms)};
        }
    }
    for(auto const& entry: all_timesteps) {
        _timesteps.push_back(entry.second);
    }

    for(std::size_t cc = 0; cc < md.coarse_chans.size(); ++cc) {
        std::size_t const channel = md.coarse_chans[cc].gpubox_number;
        for(auto const& entry: _catalog.time_map) {
            if(entry.second.count(channel) != 0) {
                _provided_coarse_chan_indices.push_back(cc);
                break;
            }
        }
    }

    for(std::size_t ts = 0; ts < _timesteps.size(); ++ts) {
        auto const it = _catalog.time_map.find(_timesteps[ts].unix_time_ms);
        if(it == _catalog.time_map.end()) {
            continue;
        }
        _provided_timestep_indices.push_back(ts);
        if(it->second.size() == _provided_coarse_chan_indices.size()) {
            _common_timestep_indices.push_back(ts);
            if(_timesteps[ts].unix_time_ms >= md.good_time_unix_ms) {
                _common_good_timestep_indices.push_back(ts);
            }
        }
    }

    // Fall back to the provided span when no timestep has every channel
    std::vector<std::size_t> const& span =
        _common_timestep_indices.empty() ? _provided_timestep_indices
                                         : _common_timestep_indices;
    if(_common_timestep_indices.empty()) {
        BOOST_LOG_TRIVIAL(warning)
            << "No timestep has data for every provided coarse channel";
    }
    _common_start_unix_time_ms = _timesteps[span.front()].unix_time_ms;
    _common_end_unix_time_ms =
        _timesteps[span.back()].unix_time_ms + md.corr_int_time_ms;
}

Metadata const& CorrelatorContext::metadata() const
{
    return *_metadata;
}

std::shared_ptr<Metadata const> CorrelatorContext::shared_metadata() const
{
    return _metadata;
}

MWAVersion CorrelatorContext::version() const
{
    return _catalog.version;
}

CorrelatorGeometry const& CorrelatorContext::geometry() const
{
    return _geometry;
}

GpuboxCatalog const& CorrelatorContext::catalog() const
{
    return _catalog;
}

std::vector<Timestep> const& CorrelatorContext::timesteps() const
{
    return _timesteps;
}

std::vector<std::size_t> const&
CorrelatorContext::provided_timestep_indices() const
{
    return _provided_timestep_indices;
}

std::vector<std::size_t> const&
CorrelatorContext::provided_coarse_chan_indices() const
{
    return _provided_coarse_chan_indices;
}

std::vector<std::size_t> const&
CorrelatorContext::common_timestep_indices() const
{
    return _common_timestep_indices;
}

std::vector<std::size_t> const&
CorrelatorContext::common_good_timestep_indices() const
{
    return _common_good_timestep_indices;
}

std::uint64_t CorrelatorContext::common_start_unix_time_ms() const
{
    return _common_start_unix_time_ms;
}

std::uint64_t CorrelatorContext::common_end_unix_time_ms() const
{
    return _common_end_unix_time_ms;
}

std::uint64_t CorrelatorContext::common_start_gps_time_ms() const
{
    return unix_to_gps_time_ms(_common_start_unix_time_ms,
                               _metadata->sched_start_gps_time_ms,
                               _metadata->sched_start_unix_time_ms);
}

std::uint64_t CorrelatorContext::common_end_gps_time_ms() const
{
    return unix_to_gps_time_ms(_common_end_unix_time_ms,
                               _metadata->sched_start_gps_time_ms,
                               _metadata->sched_start_unix_time_ms);
}

std::uint64_t CorrelatorContext::common_duration_ms() const
{
    return _common_end_unix_time_ms - _common_start_unix_time_ms;
}

HduLocation const&
CorrelatorContext::locate(std::size_t timestep_index,
                          std::size_t coarse_chan_index) const
{
    if(timestep_index >= _timesteps.size()) {
        throw DataError(DataError::Kind::InvalidTimestepIndex,
                        "Timestep index " + std::to_string(timestep_index) +
                            " is out of range (" +
                            std::to_string(_timesteps.size()) +
                            " timesteps)");
    }
    if(coarse_chan_index >= _metadata->coarse_chans.size()) {
        throw DataError(DataError::Kind::InvalidCoarseChannelIndex,
                        "Coarse channel index " +
                            std::to_string(coarse_chan_index) +
                            " is out of range (" +
                            std::to_string(_metadata->coarse_chans.size()) +
                            " coarse channels)");
    }
    std::uint64_t const time = _timesteps[timestep_index].unix_time_ms;
    std::size_t const channel =
        _metadata->coarse_chans[coarse_chan_index].gpubox_number;
    auto const by_time = _catalog.time_map.find(time);
    if(by_time != _catalog.time_map.end()) {
        auto const by_chan = by_time->second.find(channel);
        if(by_chan != by_time->second.end()) {
            return by_chan->second;
        }
    }
    throw DataError(DataError::Kind::NoDataForTimestepCoarseChannel,
                    "No data for timestep index " +
                        std::to_string(timestep_index) +
                        " and coarse channel index " +
                        std::to_string(coarse_chan_index));
}

std::vector<float> CorrelatorContext::read_hdu(HduLocation const& location,
                                               int hdu_offset,
                                               std::size_t expected_floats) const
{
    std::vector<float> data;
    try {
        FitsFile fits(location.path);
        fits.move_to_hdu(location.hdu_index + hdu_offset);
        data = fits.read_image_floats();
    } catch(FitsError const& error) {
        throw DataError(DataError::Kind::FileAccess,
                        "Reading HDU " +
                            std::to_string(location.hdu_index + hdu_offset) +
                            " of " + location.path + ": " + error.what());
    }
    if(data.size() != expected_floats) {
        throw DataError(DataError::Kind::SizeMismatch,
                        "HDU " +
                            std::to_string(location.hdu_index + hdu_offset) +
                            " of " + location.path + " holds " +
                            std::to_string(data.size()) +
                            " floats, expected " +
                            std::to_string(expected_floats));
    }
    return data;
}

std::vector<float>
CorrelatorContext::read_by_baseline(std::size_t timestep_index,
                                    std::size_t coarse_chan_index) const
{
    HduLocation const& location = locate(timestep_index, coarse_chan_index);
    std::vector<float> data =
        read_hdu(location, 0, _geometry.num_timestep_coarse_chan_floats);
    if(_geometry.hdu_axis_order == HduAxisOrder::BaselineFrequency) {
        return data;
    }
    std::vector<float> output(data.size());
    convert_legacy_hdu_to_baseline_order(_conversion_table,
                                         data,
                                         output.data(),
                                         _geometry.num_fine_chans_per_coarse);
    return output;
}

std::vector<float>
CorrelatorContext::read_by_frequency(std::size_t timestep_index,
                                     std::size_t coarse_chan_index) const
{
    HduLocation const& location = locate(timestep_index, coarse_chan_index);
    std::vector<float> data =
        read_hdu(location, 0, _geometry.num_timestep_coarse_chan_floats);
    std::vector<float> output(data.size());
    if(_geometry.hdu_axis_order == HduAxisOrder::BaselineFrequency) {
        convert_mwax_hdu_to_frequency_order(
            data,
            output.data(),
            _geometry.num_baselines,
            _geometry.num_fine_chans_per_coarse,
            _geometry.floats_per_baseline_fine_chan);
    } else {
        convert_legacy_hdu_to_frequency_order(
            _conversion_table,
            data,
            output.data(),
            _geometry.num_fine_chans_per_coarse);
    }
    return output;
}

std::vector<float>
CorrelatorContext::read_weights_by_baseline(std::size_t timestep_index,
                                            std::size_t coarse_chan_index) const
{
    HduLocation const& location = locate(timestep_index, coarse_chan_index);
    if(!_geometry.has_weights_hdus) {
        return std::vector<float>(
            _geometry.num_timestep_coarse_chan_weight_floats, 1.0f);
    }
    return read_hdu(location, 1,
                    _geometry.num_timestep_coarse_chan_weight_floats);
}

std::string CorrelatorContext::to_string() const
{
    std::ostringstream oss;
    oss << "CorrelatorContext:\n"
        << "  Version: " << mwareader::to_string(version()) << "\n"
        << "  Batches: " << _catalog.batches.size() << "\n"
        << "  Timesteps: " << _timesteps.size() << " ("
        << _provided_timestep_indices.size() << " provided, "
        << _common_timestep_indices.size() << " common, "
        << _common_good_timestep_indices.size() << " common good)\n"
        << "  Coarse channels: " << _metadata->num_coarse_chans << " ("
        << _provided_coarse_chan_indices.size() << " provided)\n"
        << "  Common start (UNIX ms): " << _common_start_unix_time_ms << "\n"
        << "  Common end (UNIX ms): " << _common_end_unix_time_ms << "\n"
        << _geometry.to_string() << _metadata->to_string();
    return oss.str();
}

} // namespace mwareader
