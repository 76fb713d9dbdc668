#ifndef MWAREADER_TEST_LEGACYCONVERSIONTESTER_HPP
#define MWAREADER_TEST_LEGACYCONVERSIONTESTER_HPP

#include "mwareader/LegacyConversion.hpp"
#include "mwareader/test/FixtureWriter.hpp"

#include <gtest/gtest.h>
#include <string>

namespace mwareader
{
namespace test
{

class LegacyConversionTester: public ::testing::Test
{
  protected:
    void SetUp() override;
    void TearDown() override;

    TemporaryDirectory _dir;
    std::string _metafits;

  public:
    LegacyConversionTester();
    ~LegacyConversionTester();
};

} // namespace test
} // namespace mwareader

#endif // MWAREADER_TEST_LEGACYCONVERSIONTESTER_HPP
