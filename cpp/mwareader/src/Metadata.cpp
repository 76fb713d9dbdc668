#include "mwareader/Metadata.hpp"

#include "mwareader/Errors.hpp"
#include "mwareader/FitsFile.hpp"
#include "mwareader/mwareader_constants.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/trivial.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numbers>
#include <set>
#include <sstream>
#include <stdexcept>

namespace mwareader
{
namespace
{

double to_radians(double degrees)
{
    return degrees * std::numbers::pi / 180.0;
}

std::uint64_t seconds_to_ms(double seconds)
{
    return static_cast<std::uint64_t>(std::llround(seconds * 1000.0));
}

std::vector<std::size_t> parse_number_list(std::string const& key,
                                           std::string const& value)
{
    std::string cleaned = value;
    boost::algorithm::erase_all(cleaned, "'");
    boost::algorithm::erase_all(cleaned, "&");
    std::vector<std::string> tokens;
    boost::algorithm::split(tokens, cleaned, boost::is_any_of(","));
    std::vector<std::size_t> numbers;
    for(auto& token: tokens) {
        boost::algorithm::trim(token);
        if(token.empty()) {
            continue;
        }
        try {
            numbers.push_back(std::stoul(token));
        } catch(std::logic_error const&) {
            throw MetadataError(MetadataError::Kind::Malformed,
                                "Invalid value '" + token + "' in " + key);
        }
    }
    return numbers;
}

} // namespace

void read_metafits(std::string const& filename, Metadata& metadata)
{
    BOOST_LOG_TRIVIAL(debug) << "Reading metafits file " << filename;
    metadata.metafits_filename     = filename;
    metadata.mwa_latitude_radians  = MWA_LATITUDE_RADIANS;
    metadata.mwa_longitude_radians = MWA_LONGITUDE_RADIANS;
    metadata.mwa_altitude_metres   = MWA_ALTITUDE_METRES;
    metadata.coax_v_factor         = COAX_V_FACTOR;
    metadata.num_ant_pols          = NUM_ANTENNA_POLS;

    std::string date_obs;
    std::vector<RFInput> rf_inputs;
    try {
        FitsFile metafits(filename);
        metafits.move_to_hdu(0);

        metadata.obs_id =
            static_cast<std::uint32_t>(metafits.read_key<long>("GPSTIME"));
        metadata.quack_time_duration_ms =
            seconds_to_ms(metafits.read_key<double>("QUACKTIM"));
        metadata.good_time_unix_ms =
            seconds_to_ms(metafits.read_key<double>("GOODTIME"));
        metadata.num_rf_inputs =
            static_cast<std::size_t>(metafits.read_key<long>("NINPUTS"));
        metadata.centre_freq_hz = static_cast<std::uint32_t>(
            std::llround(metafits.read_key<double>("FREQCENT") * 1e6));
        date_obs                 = metafits.read_key<std::string>("DATE-OBS");
        metadata.sched_start_mjd = metafits.read_key<double>("MJD");
        metadata.sched_duration_ms =
            seconds_to_ms(metafits.read_key<double>("EXPOSURE"));
        metadata.corr_int_time_ms =
            seconds_to_ms(metafits.read_key<double>("INTTIME"));

        metadata.ra_tile_pointing_degrees  = metafits.read_key<double>("RA");
        metadata.dec_tile_pointing_degrees = metafits.read_key<double>("DEC");
        metadata.ra_phase_center_degrees =
            metafits.read_optional_key<double>("RAPHASE");
        metadata.dec_phase_center_degrees =
            metafits.read_optional_key<double>("DECPHASE");
        metadata.az_deg  = metafits.read_key<double>("AZIMUTH");
        metadata.alt_deg = metafits.read_key<double>("ALTITUDE");
        metadata.sun_alt_deg          = metafits.read_key<double>("SUN-ALT");
        metadata.sun_distance_deg     = metafits.read_key<double>("SUN-DIST");
        metadata.moon_distance_deg    = metafits.read_key<double>("MOONDIST");
        metadata.jupiter_distance_deg = metafits.read_key<double>("JUP-DIST");
        metadata.lst_deg              = metafits.read_key<double>("LST");
        metadata.hour_angle_string    = metafits.read_key<std::string>("HA");

        metadata.grid_name   = metafits.read_key<std::string>("GRIDNAME");
        metadata.grid_number = metafits.read_key<int>("GRIDNUM");
        metadata.creator     = metafits.read_key<std::string>("CREATOR");
        metadata.project_id  = metafits.read_key<std::string>("PROJECT");
        metadata.obs_name    = metafits.read_key<std::string>("FILENAME");
        metadata.mode        = metafits.read_key<std::string>("MODE");
        metadata.calibrator  = metafits.read_optional_key<bool>("CALIBRAT");
        metadata.calibrator_source =
            metafits.read_optional_key<std::string>("CALIBSRC");

        metadata.corr_fine_chan_width_hz = static_cast<std::uint32_t>(
            std::llround(metafits.read_key<double>("FINECHAN") * 1000.0));
        metadata.obs_bandwidth_hz = static_cast<std::uint32_t>(
            std::llround(metafits.read_key<double>("BANDWDTH") * 1e6));
        metadata.metafits_coarse_chan_numbers =
            parse_channel_list(metafits.read_long_string_key("CHANNELS"));
        metadata.receivers = parse_number_list(
            "RECVRS", metafits.read_long_string_key("RECVRS"));
        metadata.delays = parse_number_list(
            "DELAYS", metafits.read_long_string_key("DELAYS"));
        metadata.global_analogue_attenuation_db =
            metafits.read_key<double>("ATTEN_DB");

        metafits.move_to_hdu(1);
        rf_inputs = read_rf_inputs(metafits,
                                   metadata.num_rf_inputs,
                                   metadata.coax_v_factor);
        metadata.signal_chain_corrections =
            read_signal_chain_corrections(metafits);
    } catch(FitsError const& error) {
        throw MetadataError(MetadataError::Kind::Malformed, error.what());
    }

    try {
        metadata.sched_start_utc =
            boost::posix_time::from_iso_extended_string(date_obs);
    } catch(std::exception const& error) {
        throw MetadataError(MetadataError::Kind::Malformed,
                            "Unable to parse DATE-OBS '" + date_obs +
                                "': " + error.what());
    }
    if(metadata.sched_start_utc.is_not_a_date_time()) {
        throw MetadataError(MetadataError::Kind::Malformed,
                            "Unable to parse DATE-OBS '" + date_obs + "'");
    }

    // Derived times
    metadata.sched_start_gps_time_ms =
        static_cast<std::uint64_t>(metadata.obs_id) * 1000;
    metadata.sched_end_gps_time_ms =
        metadata.sched_start_gps_time_ms + metadata.sched_duration_ms;
    metadata.sched_start_unix_time_ms =
        metadata.good_time_unix_ms - metadata.quack_time_duration_ms;
    metadata.sched_end_unix_time_ms =
        metadata.sched_start_unix_time_ms + metadata.sched_duration_ms;
    metadata.sched_end_utc =
        metadata.sched_start_utc +
        boost::posix_time::milliseconds(
            static_cast<long>(metadata.sched_duration_ms));
    metadata.sched_end_mjd =
        metadata.sched_start_mjd +
        static_cast<double>(metadata.sched_duration_ms) / 1000.0 / 86400.0;
    metadata.good_time_gps_ms =
        unix_to_gps_time_ms(metadata.good_time_unix_ms,
                            metadata.sched_start_gps_time_ms,
                            metadata.sched_start_unix_time_ms);

    // Derived pointing
    metadata.za_deg  = 90.0 - metadata.alt_deg;
    metadata.az_rad  = to_radians(metadata.az_deg);
    metadata.alt_rad = to_radians(metadata.alt_deg);
    metadata.za_rad  = to_radians(metadata.za_deg);
    metadata.lst_rad = to_radians(metadata.lst_deg);

    // Frequencies
    metadata.num_coarse_chans = metadata.metafits_coarse_chan_numbers.size();
    metadata.coarse_chan_width_hz = static_cast<std::uint32_t>(
        metadata.obs_bandwidth_hz / metadata.num_coarse_chans);
    if(metadata.corr_fine_chan_width_hz == 0) {
        throw MetadataError(MetadataError::Kind::Malformed,
                            "FINECHAN must be greater than zero");
    }
    metadata.num_corr_fine_chans_per_coarse =
        metadata.coarse_chan_width_hz / metadata.corr_fine_chan_width_hz;
    if(!std::is_sorted(metadata.metafits_coarse_chan_numbers.begin(),
                       metadata.metafits_coarse_chan_numbers.end())) {
        BOOST_LOG_TRIVIAL(warning)
            << "CHANNELS in " << filename << " is not in ascending order";
    }

    // Inputs are stored in subfile order so that antenna pairs and the
    // MWAX data order line up
    std::stable_sort(rf_inputs.begin(),
                     rf_inputs.end(),
                     [](RFInput const& a, RFInput const& b) {
                         return a.subfile_order < b.subfile_order;
                     });
    link_signal_chain_corrections(rf_inputs,
                                  metadata.signal_chain_corrections);
    metadata.rf_inputs = std::move(rf_inputs);
    metadata.antennas  = populate_antennas(metadata.rf_inputs);
    metadata.num_ants  = metadata.antennas.size();
    metadata.baselines = populate_baselines(metadata.num_ants);
    metadata.num_baselines   = metadata.baselines.size();
    metadata.visibility_pols = populate_visibility_pols();
    metadata.num_visibility_pols = metadata.visibility_pols.size();
}

void apply_version(Metadata& metadata, MWAVersion version)
{
    metadata.mwa_version  = version;
    metadata.coarse_chans = populate_coarse_channels(
        version,
        metadata.metafits_coarse_chan_numbers,
        metadata.coarse_chan_width_hz);
    metadata.num_coarse_chans = metadata.coarse_chans.size();

    switch(version) {
    case MWAVersion::CorrOldLegacy:
    case MWAVersion::CorrLegacy:
    case MWAVersion::CorrMWAXv2:
        metadata.timestep_duration_ms           = metadata.corr_int_time_ms;
        metadata.volt_fine_chan_width_hz        = 0;
        metadata.num_volt_fine_chans_per_coarse = 0;
        break;
    case MWAVersion::VCSLegacyRecombined:
        metadata.timestep_duration_ms = LEGACY_VCS_TIMESTEP_DURATION_MS;
        metadata.volt_fine_chan_width_hz = LEGACY_VCS_FINE_CHAN_WIDTH_HZ;
        metadata.num_volt_fine_chans_per_coarse =
            metadata.coarse_chan_width_hz / LEGACY_VCS_FINE_CHAN_WIDTH_HZ;
        break;
    case MWAVersion::VCSMWAXv2:
        metadata.timestep_duration_ms    = MWAX_VCS_TIMESTEP_DURATION_MS;
        metadata.volt_fine_chan_width_hz = metadata.coarse_chan_width_hz;
        metadata.num_volt_fine_chans_per_coarse = 1;
        break;
    }

    metadata.timesteps = populate_timesteps(metadata.sched_start_gps_time_ms,
                                            metadata.sched_end_gps_time_ms,
                                            metadata.timestep_duration_ms,
                                            metadata.sched_start_gps_time_ms,
                                            metadata.sched_start_unix_time_ms);
    metadata.num_timesteps = metadata.timesteps.size();
    BOOST_LOG_TRIVIAL(debug)
        << "Metadata for " << metadata.obs_id << " configured as "
        << to_string(version) << ": " << metadata.num_coarse_chans
        << " coarse channels, " << metadata.num_timesteps << " timesteps";
}

void validate_metadata(Metadata const& metadata)
{
    auto fail = [](std::string const& message) {
        throw MetadataError(MetadataError::Kind::InconsistentCounts, message);
    };
    if(metadata.rf_inputs.size() != metadata.num_rf_inputs) {
        fail("NINPUTS is " + std::to_string(metadata.num_rf_inputs) +
             " but " + std::to_string(metadata.rf_inputs.size()) +
             " rf inputs were read");
    }
    if(metadata.num_ants * metadata.num_ant_pols != metadata.num_rf_inputs ||
       metadata.antennas.size() != metadata.num_ants) {
        fail(std::to_string(metadata.num_ants) + " antennas do not match " +
             std::to_string(metadata.num_rf_inputs) + " rf inputs");
    }
    if(metadata.num_baselines != baseline_count(metadata.num_ants) ||
       metadata.baselines.size() != metadata.num_baselines) {
        fail(std::to_string(metadata.num_baselines) +
             " baselines do not match " + std::to_string(metadata.num_ants) +
             " antennas");
    }
    if(metadata.num_visibility_pols != NUM_VISIBILITY_POLS ||
       metadata.visibility_pols.size() != metadata.num_visibility_pols) {
        fail("Expected " + std::to_string(NUM_VISIBILITY_POLS) +
             " visibility polarisations");
    }
    std::set<std::size_t> unique_chans(
        metadata.metafits_coarse_chan_numbers.begin(),
        metadata.metafits_coarse_chan_numbers.end());
    if(unique_chans.size() != metadata.metafits_coarse_chan_numbers.size()) {
        fail("CHANNELS lists a receiver channel more than once");
    }
    if(static_cast<std::uint64_t>(metadata.coarse_chan_width_hz) *
           metadata.metafits_coarse_chan_numbers.size() !=
       metadata.obs_bandwidth_hz) {
        fail("BANDWDTH of " + std::to_string(metadata.obs_bandwidth_hz) +
             " Hz is not a whole multiple of " +
             std::to_string(metadata.metafits_coarse_chan_numbers.size()) +
             " coarse channels");
    }
    if(metadata.num_corr_fine_chans_per_coarse *
           metadata.corr_fine_chan_width_hz !=
       metadata.coarse_chan_width_hz) {
        fail("FINECHAN of " + std::to_string(metadata.corr_fine_chan_width_hz) +
             " Hz does not divide the coarse channel width of " +
             std::to_string(metadata.coarse_chan_width_hz) + " Hz");
    }
    if(metadata.mwa_version) {
        if(metadata.coarse_chans.size() != metadata.num_coarse_chans ||
           metadata.num_coarse_chans !=
               metadata.metafits_coarse_chan_numbers.size()) {
            fail("Coarse channel list does not match CHANNELS");
        }
        if(metadata.timesteps.size() != metadata.num_timesteps) {
            fail("Timestep list does not match the timestep count");
        }
    }
}

Metadata load_metadata(std::string const& filename,
                       std::optional<MWAVersion> version)
{
    Metadata metadata;
    read_metafits(filename, metadata);
    if(!version) {
        version = version_from_mode(metadata.mode);
        if(!version) {
            throw MetadataError(MetadataError::Kind::UnknownVersion,
                                "Cannot determine the instrument version "
                                "from MODE '" +
                                    metadata.mode + "' in " + filename);
        }
        BOOST_LOG_TRIVIAL(debug) << "Inferred " << to_string(*version)
                                 << " from MODE " << metadata.mode;
    }
    apply_version(metadata, *version);
    validate_metadata(metadata);
    return metadata;
}

std::string Metadata::to_string() const
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    oss << "Metadata:\n"
        << "  metafits: " << metafits_filename << "\n"
        << "  obs_id: " << obs_id << "\n"
        << "  version: "
        << (mwa_version ? mwareader::to_string(*mwa_version)
                        : std::string("unset"))
        << "\n"
        << "  scheduled start (UTC): "
        << boost::posix_time::to_iso_extended_string(sched_start_utc) << "\n"
        << "  scheduled end (UTC): "
        << boost::posix_time::to_iso_extended_string(sched_end_utc) << "\n"
        << "  scheduled start (GPS ms): " << sched_start_gps_time_ms << "\n"
        << "  scheduled end (GPS ms): " << sched_end_gps_time_ms << "\n"
        << "  scheduled start (UNIX ms): " << sched_start_unix_time_ms
        << "\n"
        << "  scheduled duration (ms): " << sched_duration_ms << "\n"
        << "  quack time (ms): " << quack_time_duration_ms << "\n"
        << "  good time (UNIX ms): " << good_time_unix_ms << "\n"
        << "  RA tile pointing (deg): " << ra_tile_pointing_degrees << "\n"
        << "  DEC tile pointing (deg): " << dec_tile_pointing_degrees << "\n";
    if(ra_phase_center_degrees && dec_phase_center_degrees) {
        oss << "  RA phase centre (deg): " << *ra_phase_center_degrees << "\n"
            << "  DEC phase centre (deg): " << *dec_phase_center_degrees
            << "\n";
    }
    oss << "  azimuth (deg): " << az_deg << "\n"
        << "  altitude (deg): " << alt_deg << "\n"
        << "  zenith angle (deg): " << za_deg << "\n"
        << "  LST (deg): " << lst_deg << "\n"
        << "  hour angle: " << hour_angle_string << "\n"
        << "  grid: " << grid_name << " (" << grid_number << ")\n"
        << "  creator: " << creator << "\n"
        << "  project: " << project_id << "\n"
        << "  observation name: " << obs_name << "\n"
        << "  mode: " << mode << "\n"
        << "  antennas: " << num_ants << "\n"
        << "  rf inputs: " << num_rf_inputs << "\n"
        << "  baselines: " << num_baselines << "\n"
        << "  visibility pols: " << num_visibility_pols << "\n"
        << "  coarse channels: " << num_coarse_chans << "\n"
        << "  coarse channel width (Hz): " << coarse_chan_width_hz << "\n"
        << "  observation bandwidth (Hz): " << obs_bandwidth_hz << "\n"
        << "  centre frequency (Hz): " << centre_freq_hz << "\n"
        << "  correlator fine channel width (Hz): " << corr_fine_chan_width_hz
        << "\n"
        << "  correlator integration time (ms): " << corr_int_time_ms << "\n"
        << "  timesteps: " << num_timesteps << "\n"
        << "  timestep duration (ms): " << timestep_duration_ms << "\n"
        << "  signal chain corrections: " << signal_chain_corrections.size()
        << "\n";
    return oss.str();
}

} // namespace mwareader
