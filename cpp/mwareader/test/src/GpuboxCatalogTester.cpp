#include "mwareader/test/GpuboxCatalogTester.hpp"

#include "mwareader/Errors.hpp"

#include <cstdio>

namespace mwareader
{
namespace test
{
namespace
{

std::uint64_t const start_ms = test_start_unix_s * 1000;

GpuboxOptions small_file(std::vector<std::uint64_t> const& times)
{
    GpuboxOptions options;
    options.naxis1         = 16;
    options.naxis2         = 10;
    options.weights_naxis1 = 4;
    options.weights_naxis2 = 10;
    for(auto time: times) {
        options.hdus.push_back({time, make_visibilities(160, 1.0f),
                                std::vector<float>(40, 1.0f)});
    }
    return options;
}

std::string mwax_name(std::size_t chan, std::size_t batch)
{
    char name[64];
    std::snprintf(name, sizeof(name),
                  "1244973688_20190624100110_ch%03zu_%03zu.fits", chan, batch);
    return name;
}

} // namespace

GpuboxCatalogTester::GpuboxCatalogTester(): ::testing::Test()
{
}

GpuboxCatalogTester::~GpuboxCatalogTester()
{
}

void GpuboxCatalogTester::SetUp()
{
    _metafits = _dir.file("1244973688.metafits");
    MetafitsOptions options;
    options.num_tiles = 4;
    write_metafits(_metafits, options);
    _metadata = load_metadata(_metafits);
    _geometry = compute_correlator_geometry(_metadata, MWAVersion::CorrMWAXv2);
}

void GpuboxCatalogTester::TearDown()
{
}

void GpuboxCatalogTester::write_file(std::string const& name,
                                     GpuboxOptions options)
{
    write_gpubox(_dir.file(name), options);
}

GpuboxCatalog
GpuboxCatalogTester::build(std::vector<std::string> const& names)
{
    std::vector<std::string> paths;
    for(auto const& name: names) {
        paths.push_back(_dir.file(name));
    }
    return build_gpubox_catalog(identify_files(paths), _metadata, _geometry);
}

TEST_F(GpuboxCatalogTester, test_small_geometry)
{
    ASSERT_EQ(_metadata.num_baselines, 10u);
    ASSERT_EQ(_geometry.expected_naxis1, 16);
    ASSERT_EQ(_geometry.expected_naxis2, 10);
    ASSERT_EQ(_geometry.num_timestep_coarse_chan_weight_floats, 40u);
}

TEST_F(GpuboxCatalogTester, test_catalog)
{
    write_file(mwax_name(117, 0), small_file({start_ms, start_ms + 2000}));
    write_file(mwax_name(118, 0), small_file({start_ms + 2000}));
    write_file(mwax_name(117, 1), small_file({start_ms + 4000}));
    write_file(mwax_name(118, 1), small_file({start_ms + 4000}));

    GpuboxCatalog const catalog = build({mwax_name(118, 1), mwax_name(117, 0),
                                         mwax_name(118, 0), mwax_name(117, 1)});
    ASSERT_EQ(catalog.version, MWAVersion::CorrMWAXv2);
    ASSERT_EQ(catalog.batches.size(), 2u);
    ASSERT_EQ(catalog.batches[0].batch_number, 0u);
    ASSERT_EQ(catalog.batches[0].files[0].channel_identifier, 117u);
    ASSERT_EQ(catalog.batches[0].files[1].channel_identifier, 118u);
    ASSERT_EQ(catalog.time_map.size(), 3u);
    ASSERT_EQ(catalog.time_map.at(start_ms).size(), 1u);
    ASSERT_EQ(catalog.time_map.at(start_ms + 2000).size(), 2u);

    HduLocation const& second =
        catalog.time_map.at(start_ms + 2000).at(117);
    ASSERT_EQ(second.path, _dir.file(mwax_name(117, 0)));
    // Data and weights alternate after the primary HDU
    ASSERT_EQ(second.hdu_index, 3);
}

TEST_F(GpuboxCatalogTester, test_duplicate_file)
{
    std::vector<FileIdentity> files(2);
    files[0].path = "a";
    files[1].path = "b";
    files[0].channel_identifier = files[1].channel_identifier = 117;
    try {
        group_gpubox_batches(files);
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::DuplicateFile);
    }
}

TEST_F(GpuboxCatalogTester, test_duplicate_timestep)
{
    write_file(mwax_name(117, 0), small_file({start_ms}));
    write_file(mwax_name(117, 1), small_file({start_ms}));
    write_file(mwax_name(118, 0), small_file({start_ms + 2000}));
    write_file(mwax_name(118, 1), small_file({start_ms + 4000}));
    try {
        build({mwax_name(117, 0), mwax_name(117, 1), mwax_name(118, 0),
               mwax_name(118, 1)});
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::DuplicateFile);
    }
}

TEST_F(GpuboxCatalogTester, test_missing_batch)
{
    write_file(mwax_name(117, 0), small_file({start_ms}));
    write_file(mwax_name(117, 2), small_file({start_ms + 2000}));
    try {
        build({mwax_name(117, 0), mwax_name(117, 2)});
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::MissingFiles);
    }
}

TEST_F(GpuboxCatalogTester, test_uneven_batches)
{
    write_file(mwax_name(117, 0), small_file({start_ms}));
    write_file(mwax_name(118, 0), small_file({start_ms}));
    write_file(mwax_name(117, 1), small_file({start_ms + 2000}));
    try {
        build({mwax_name(117, 0), mwax_name(118, 0), mwax_name(117, 1)});
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::MissingFiles);
    }
}

TEST_F(GpuboxCatalogTester, test_obsid_in_filename)
{
    std::string const name = "1244973689_20190624100110_ch117_000.fits";
    write_file(name, small_file({start_ms}));
    try {
        build({name});
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::ObsidMismatch);
    }
}

TEST_F(GpuboxCatalogTester, test_obsid_in_header)
{
    GpuboxOptions options = small_file({start_ms});
    options.obs_id        = 1244973689;
    write_file(mwax_name(117, 0), options);
    try {
        build({mwax_name(117, 0)});
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::ObsidMismatch);
    }
}

TEST_F(GpuboxCatalogTester, test_missing_corr_ver)
{
    GpuboxOptions options = small_file({start_ms});
    options.corr_ver.reset();
    write_file(mwax_name(117, 0), options);
    try {
        build({mwax_name(117, 0)});
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::VersionMismatch);
    }
}

TEST_F(GpuboxCatalogTester, test_unexpected_axes)
{
    GpuboxOptions options = small_file({});
    options.naxis1        = 8;
    options.hdus.push_back({start_ms, make_visibilities(80, 1.0f),
                            std::vector<float>(40, 1.0f)});
    write_file(mwax_name(117, 0), options);
    try {
        build({mwax_name(117, 0)});
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::UnexpectedFileSize);
        ASSERT_EQ(error.expected_size(), 160u);
        ASSERT_EQ(error.actual_size(), 80u);
    }
}

TEST_F(GpuboxCatalogTester, test_unexpected_weights)
{
    GpuboxOptions options = small_file({});
    options.weights_naxis2 = 5;
    options.hdus.push_back({start_ms, make_visibilities(160, 1.0f),
                            std::vector<float>(20, 1.0f)});
    write_file(mwax_name(117, 0), options);
    try {
        build({mwax_name(117, 0)});
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::UnexpectedFileSize);
        ASSERT_EQ(error.expected_size(), 40u);
        ASSERT_EQ(error.actual_size(), 20u);
    }
}

TEST_F(GpuboxCatalogTester, test_channel_not_in_metafits)
{
    write_file(mwax_name(140, 0), small_file({start_ms}));
    try {
        build({mwax_name(140, 0)});
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::BadFileContent);
    }
}

TEST_F(GpuboxCatalogTester, test_no_data_hdus)
{
    write_file(mwax_name(117, 0), small_file({}));
    try {
        build({mwax_name(117, 0)});
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::BadFileContent);
    }
}

TEST_F(GpuboxCatalogTester, test_unreadable_file)
{
    try {
        build({mwax_name(117, 0)});
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::FileAccess);
    }
}

} // namespace test
} // namespace mwareader
