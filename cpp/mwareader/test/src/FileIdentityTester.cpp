#include "mwareader/test/FileIdentityTester.hpp"

#include "mwareader/Errors.hpp"

namespace mwareader
{
namespace test
{

FileIdentityTester::FileIdentityTester(): ::testing::Test()
{
}

FileIdentityTester::~FileIdentityTester()
{
}

void FileIdentityTester::SetUp()
{
}

void FileIdentityTester::TearDown()
{
}

TEST_F(FileIdentityTester, test_mwax_correlator_name)
{
    auto const id =
        parse_filename("/data/1244973688_20190619100110_ch117_001.fits");
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(id->path, "/data/1244973688_20190619100110_ch117_001.fits");
    ASSERT_EQ(id->kind, FileKind::Correlator);
    ASSERT_EQ(id->version, MWAVersion::CorrMWAXv2);
    ASSERT_EQ(id->obs_id, 1244973688u);
    ASSERT_EQ(id->channel_identifier, 117u);
    ASSERT_EQ(id->batch_number, 1u);

    auto const separated =
        parse_filename("1244973688_20190619-100110_ch009_000.fits");
    ASSERT_TRUE(separated.has_value());
    ASSERT_EQ(separated->channel_identifier, 9u);
}

TEST_F(FileIdentityTester, test_legacy_correlator_names)
{
    auto const legacy =
        parse_filename("1101503312_20141201210818_gpubox01_00.fits");
    ASSERT_TRUE(legacy.has_value());
    ASSERT_EQ(legacy->version, MWAVersion::CorrLegacy);
    ASSERT_EQ(legacy->channel_identifier, 1u);
    ASSERT_EQ(legacy->batch_number, 0u);

    auto const old_legacy =
        parse_filename("1065880128_20131015134930_gpubox20.fits");
    ASSERT_TRUE(old_legacy.has_value());
    ASSERT_EQ(old_legacy->version, MWAVersion::CorrOldLegacy);
    ASSERT_EQ(old_legacy->channel_identifier, 20u);
    ASSERT_EQ(old_legacy->batch_number, 0u);
}

TEST_F(FileIdentityTester, test_voltage_names)
{
    auto const mwax = parse_filename("1101503312_1101503320_123.sub");
    ASSERT_TRUE(mwax.has_value());
    ASSERT_EQ(mwax->kind, FileKind::Voltage);
    ASSERT_EQ(mwax->version, MWAVersion::VCSMWAXv2);
    ASSERT_EQ(mwax->obs_id, 1101503312u);
    ASSERT_EQ(mwax->gps_time, 1101503320u);
    ASSERT_EQ(mwax->channel_identifier, 123u);

    auto const legacy = parse_filename("1101503312_1101503313_ch9.dat");
    ASSERT_TRUE(legacy.has_value());
    ASSERT_EQ(legacy->version, MWAVersion::VCSLegacyRecombined);
    ASSERT_EQ(legacy->gps_time, 1101503313u);
    ASSERT_EQ(legacy->channel_identifier, 9u);
}

TEST_F(FileIdentityTester, test_unrecognised_names)
{
    ASSERT_FALSE(parse_filename("1244973688.metafits").has_value());
    ASSERT_FALSE(
        parse_filename("124497368_20190619100110_ch117_000.fits").has_value());
    ASSERT_FALSE(
        parse_filename("1244973688_20190619100110_ch117_000.fit").has_value());
    ASSERT_FALSE(parse_filename("1101503312_1101503312_ch123.sub").has_value());
    try {
        identify_files({"1101503312_1101503312_123.sub", "notes.txt"});
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::UnrecognisedFilename);
    }
}

TEST_F(FileIdentityTester, test_mixed_kinds)
{
    auto const files = identify_files({"1244973688_20190619100110_ch117_000.fits",
                                       "1244973688_1244973688_117.sub"});
    try {
        common_file_kind(files);
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::MixedFileKinds);
    }
}

TEST_F(FileIdentityTester, test_version_conflict)
{
    auto const files =
        identify_files({"1101503312_20141201210818_gpubox01_00.fits",
                        "1101503312_20141201210818_gpubox02.fits"});
    ASSERT_EQ(common_file_kind(files), FileKind::Correlator);
    try {
        common_version(files);
        FAIL() << "Expected a ContextError";
    } catch(ContextError const& error) {
        ASSERT_EQ(error.kind(), ContextError::Kind::VersionConflict);
    }
}

TEST_F(FileIdentityTester, test_resolve_file_version)
{
    auto const files =
        identify_files({"1101503312_1101503312_ch9.dat",
                        "1101503312_1101503313_ch9.dat"});
    ASSERT_EQ(resolve_file_version(files, FileKind::Voltage, std::nullopt),
              MWAVersion::VCSLegacyRecombined);
    ASSERT_EQ(resolve_file_version(files,
                                   FileKind::Voltage,
                                   MWAVersion::VCSLegacyRecombined),
              MWAVersion::VCSLegacyRecombined);
    try {
        resolve_file_version(files, FileKind::Voltage, MWAVersion::VCSMWAXv2);
        FAIL() << "Expected a CatalogError";
    } catch(CatalogError const& error) {
        ASSERT_EQ(error.kind(), CatalogError::Kind::VersionMismatch);
    }
    try {
        resolve_file_version(files, FileKind::Correlator, std::nullopt);
        FAIL() << "Expected a ContextError";
    } catch(ContextError const& error) {
        ASSERT_EQ(error.kind(), ContextError::Kind::NoCompatibleFiles);
    }
    ASSERT_THROW(resolve_file_version({}, FileKind::Voltage, std::nullopt),
                 ContextError);
}

} // namespace test
} // namespace mwareader
