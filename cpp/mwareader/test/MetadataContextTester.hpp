#ifndef MWAREADER_TEST_METADATACONTEXTTESTER_HPP
#define MWAREADER_TEST_METADATACONTEXTTESTER_HPP

#include "mwareader/MetadataContext.hpp"
#include "mwareader/test/FixtureWriter.hpp"

#include <gtest/gtest.h>
#include <string>

namespace mwareader
{
namespace test
{

class MetadataContextTester: public ::testing::Test
{
  protected:
    void SetUp() override;
    void TearDown() override;

    TemporaryDirectory _dir;
    std::string _metafits;

  public:
    MetadataContextTester();
    ~MetadataContextTester();
};

} // namespace test
} // namespace mwareader

#endif // MWAREADER_TEST_METADATACONTEXTTESTER_HPP
