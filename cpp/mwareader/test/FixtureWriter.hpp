#ifndef MWAREADER_TEST_FIXTUREWRITER_HPP
#define MWAREADER_TEST_FIXTUREWRITER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mwareader
{
namespace test
{

/**
 * @brief      A scratch directory removed on destruction
 */
class TemporaryDirectory
{
  public:
    TemporaryDirectory();
    ~TemporaryDirectory();
    TemporaryDirectory(TemporaryDirectory const&) = delete;

    std::filesystem::path const& path() const;
    std::string file(std::string const& name) const;

  private:
    std::filesystem::path _path;
};

/**
 * Observation 1244973688 starts at UNIX time 1560938470
 */
constexpr std::uint32_t test_obs_id        = 1244973688;
constexpr std::uint64_t test_start_unix_s  = 1560938470;

struct MetafitsOptions {
    std::uint32_t obs_id = test_obs_id;
    std::string mode     = "MWAX_CORRELATOR";
    std::size_t num_tiles = 128;
    std::optional<long> ninputs; // Overrides 2 x num_tiles in the header
    std::vector<std::size_t> channels = {109, 110, 111, 112, 113, 114,
                                         115, 116, 117, 118, 119, 120,
                                         121, 122, 123, 124, 125, 126,
                                         127, 128, 129, 130, 131, 132};
    double bandwidth_mhz = 30.72;
    double finechan_khz  = 640.0;
    double inttime_s     = 2.0;
    double exposure_s    = 8.0;
    double quack_s       = 2.0;
    std::string date_obs = "2019-06-24T10:01:10";
    bool phase_centre    = true;
    bool calibrator      = true;
    bool signal_chain    = false;
    std::string bad_pol; // Written as the Pol of the first row when set
};

/**
 * @brief      Write a metafits file with a TILEDATA table
 *
 * @details    Row r of TILEDATA has Input r and belongs to antenna
 *             num_tiles - 1 - r / 2, so rows are in reverse antenna order.
 *             Antenna 0 has an electrical length of EL_100.5, every other
 *             antenna a physical length of 100 m.
 */
void write_metafits(std::string const& path, MetafitsOptions const& options);

struct GpuboxHdu {
    std::uint64_t unix_time_ms = 0;
    std::vector<float> data;
    std::vector<float> weights; // Written after the data HDU when not empty
};

struct GpuboxOptions {
    std::optional<long> obs_id = static_cast<long>(test_obs_id);
    std::optional<long> corr_ver = 2;
    long naxis1 = 0;
    long naxis2 = 0;
    long weights_naxis1 = 0;
    long weights_naxis2 = 0;
    std::vector<GpuboxHdu> hdus;
};

/**
 * @brief      Write a gpubox correlator file
 */
void write_gpubox(std::string const& path, GpuboxOptions const& options);

/**
 * @brief      Deterministic pseudo-visibilities for an HDU
 */
std::vector<float> make_visibilities(std::size_t count, float seed);

/**
 * @brief      A DADA style header as written at the front of an MWAX subfile
 */
std::string make_subfile_header(std::uint64_t obs_id,
                                std::uint64_t subobs_id,
                                std::size_t coarse_channel,
                                std::size_t ninputs);

/**
 * @brief      Create a sparse file of the given size
 *
 * @param      header  Written at offset zero (may be empty)
 * @param      chunks  Pairs of (offset, bytes) written into the file
 */
void write_sparse_file(
    std::string const& path,
    std::size_t size,
    std::string const& header,
    std::vector<std::pair<std::size_t, std::vector<std::int8_t>>> const&
        chunks);

/**
 * @brief      Deterministic pseudo-voltages
 */
std::vector<std::int8_t> make_voltages(std::size_t count, int seed);

} // namespace test
} // namespace mwareader

#endif // MWAREADER_TEST_FIXTUREWRITER_HPP
