#ifndef MWAREADER_TIMESTEP_HPP
#define MWAREADER_TIMESTEP_HPP

#include <cstdint>
#include <vector>

namespace mwareader
{

struct Timestep {
    std::uint64_t unix_time_ms = 0;
    std::uint64_t gps_time_ms  = 0;
};

/**
 * @brief      Convert between GPS and UNIX time using the scheduled
 *             start of the observation as the reference pair
 */
std::uint64_t gps_to_unix_time_ms(std::uint64_t gps_time_ms,
                                  std::uint64_t sched_start_gps_time_ms,
                                  std::uint64_t sched_start_unix_time_ms);
std::uint64_t unix_to_gps_time_ms(std::uint64_t unix_time_ms,
                                  std::uint64_t sched_start_gps_time_ms,
                                  std::uint64_t sched_start_unix_time_ms);

/**
 * @brief      Timesteps from start (inclusive) to end (exclusive)
 */
std::vector<Timestep>
populate_timesteps(std::uint64_t start_gps_time_ms,
                   std::uint64_t end_gps_time_ms,
                   std::uint64_t interval_ms,
                   std::uint64_t sched_start_gps_time_ms,
                   std::uint64_t sched_start_unix_time_ms);

} // namespace mwareader

#endif // MWAREADER_TIMESTEP_HPP
