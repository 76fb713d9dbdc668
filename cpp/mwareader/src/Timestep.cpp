#include "mwareader/Timestep.hpp"

namespace mwareader
{

std::uint64_t gps_to_unix_time_ms(std::uint64_t gps_time_ms,
                                  std::uint64_t sched_start_gps_time_ms,
                                  std::uint64_t sched_start_unix_time_ms)
{
    return sched_start_unix_time_ms + gps_time_ms - sched_start_gps_time_ms;
}

std::uint64_t unix_to_gps_time_ms(std::uint64_t unix_time_ms,
                                  std::uint64_t sched_start_gps_time_ms,
                                  std::uint64_t sched_start_unix_time_ms)
{
    return sched_start_gps_time_ms + unix_time_ms - sched_start_unix_time_ms;
}

std::vector<Timestep>
populate_timesteps(std::uint64_t start_gps_time_ms,
                   std::uint64_t end_gps_time_ms,
                   std::uint64_t interval_ms,
                   std::uint64_t sched_start_gps_time_ms,
                   std::uint64_t sched_start_unix_time_ms)
{
    std::vector<Timestep> timesteps;
    if(interval_ms == 0) {
        return timesteps;
    }
    for(std::uint64_t gps = start_gps_time_ms; gps < end_gps_time_ms;
        gps += interval_ms) {
        timesteps.push_back({gps_to_unix_time_ms(gps,
                                                 sched_start_gps_time_ms,
                                                 sched_start_unix_time_ms),
                             gps});
    }
    return timesteps;
}

} // namespace mwareader
