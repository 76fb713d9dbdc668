#ifndef MWAREADER_METADATA_HPP
#define MWAREADER_METADATA_HPP

#include "mwareader/Antenna.hpp"
#include "mwareader/Baseline.hpp"
#include "mwareader/CoarseChannel.hpp"
#include "mwareader/MWAVersion.hpp"
#include "mwareader/RFInput.hpp"
#include "mwareader/Timestep.hpp"

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mwareader
{

/**
 * @brief      Everything the metafits file says about an observation
 *
 * @details    The version dependent members (mwa_version, coarse_chans,
 *             timesteps and the voltage fine channel layout) are only
 *             filled in by apply_version().
 */
struct Metadata {
    std::string metafits_filename;
    std::uint32_t obs_id = 0;
    std::optional<MWAVersion> mwa_version;

    // Array location
    double mwa_latitude_radians  = 0.0;
    double mwa_longitude_radians = 0.0;
    double mwa_altitude_metres   = 0.0;
    double coax_v_factor         = 0.0;

    // Scheduled times
    std::uint64_t sched_start_gps_time_ms  = 0;
    std::uint64_t sched_end_gps_time_ms    = 0;
    std::uint64_t sched_start_unix_time_ms = 0;
    std::uint64_t sched_end_unix_time_ms   = 0;
    std::uint64_t sched_duration_ms        = 0;
    boost::posix_time::ptime sched_start_utc;
    boost::posix_time::ptime sched_end_utc;
    double sched_start_mjd = 0.0;
    double sched_end_mjd   = 0.0;
    std::uint64_t quack_time_duration_ms = 0;
    std::uint64_t good_time_unix_ms      = 0;
    std::uint64_t good_time_gps_ms       = 0;

    // Pointing
    double ra_tile_pointing_degrees  = 0.0;
    double dec_tile_pointing_degrees = 0.0;
    std::optional<double> ra_phase_center_degrees;
    std::optional<double> dec_phase_center_degrees;
    double az_deg = 0.0;
    double alt_deg = 0.0;
    double za_deg = 0.0;
    double az_rad = 0.0;
    double alt_rad = 0.0;
    double za_rad = 0.0;
    double sun_alt_deg      = 0.0;
    double sun_distance_deg = 0.0;
    double moon_distance_deg    = 0.0;
    double jupiter_distance_deg = 0.0;
    double lst_deg = 0.0;
    double lst_rad = 0.0;
    std::string hour_angle_string;

    // Scheduling
    std::string grid_name;
    int grid_number = 0;
    std::string creator;
    std::string project_id;
    std::string obs_name;
    std::string mode;
    std::optional<bool> calibrator;
    std::optional<std::string> calibrator_source;

    // Receivers and beamformer
    std::vector<std::size_t> receivers;
    std::vector<std::size_t> delays;
    double global_analogue_attenuation_db = 0.0;

    // Correlator settings
    std::uint64_t corr_int_time_ms              = 0;
    std::uint32_t corr_fine_chan_width_hz       = 0;
    std::size_t num_corr_fine_chans_per_coarse  = 0;

    // Voltage settings
    std::uint32_t volt_fine_chan_width_hz       = 0;
    std::size_t num_volt_fine_chans_per_coarse  = 0;

    // Frequencies
    std::vector<std::size_t> metafits_coarse_chan_numbers;
    std::uint32_t centre_freq_hz       = 0;
    std::uint32_t obs_bandwidth_hz     = 0;
    std::uint32_t coarse_chan_width_hz = 0;
    std::size_t num_coarse_chans       = 0;
    std::vector<CoarseChannel> coarse_chans;

    // Timesteps described by the metafits for this version
    std::uint64_t timestep_duration_ms = 0;
    std::size_t num_timesteps          = 0;
    std::vector<Timestep> timesteps;

    // Antennas, inputs and correlation products
    std::size_t num_ants      = 0;
    std::vector<Antenna> antennas;
    std::size_t num_rf_inputs = 0;
    std::vector<RFInput> rf_inputs;
    std::size_t num_ant_pols  = 0;
    std::size_t num_baselines = 0;
    std::vector<Baseline> baselines;
    std::size_t num_visibility_pols = 0;
    std::vector<VisibilityPol> visibility_pols;
    std::vector<SignalChainCorrection> signal_chain_corrections;

    std::string to_string() const;
};

/**
 * @brief      Parse a metafits file
 *
 * @param      filename  Path to the metafits file
 * @param      metadata  A Metadata instance to populate
 *
 * @details    Fills in everything that does not depend on the
 *             instrument version. Throws MetadataError.
 */
void read_metafits(std::string const& filename, Metadata& metadata);

/**
 * @brief      Fill in the version dependent members
 *
 * @details    Coarse channel numbering, the metafits timestep list
 *             and the voltage fine channel layout all depend on which
 *             instrument recorded the data.
 */
void apply_version(Metadata& metadata, MWAVersion version);

/**
 * @brief      Check that all derived counts agree
 *
 * @details    Throws MetadataError::InconsistentCounts on failure.
 */
void validate_metadata(Metadata const& metadata);

/**
 * @brief      Read, version and validate a metafits file in one step
 *
 * @param      filename  Path to the metafits file
 * @param      version   The instrument version, or nothing to infer it
 *                       from the MODE key
 */
Metadata load_metadata(std::string const& filename,
                       std::optional<MWAVersion> version = std::nullopt);

} // namespace mwareader

#endif // MWAREADER_METADATA_HPP
