#ifndef MWAREADER_TEST_MULTIFILEREADERTESTER_HPP
#define MWAREADER_TEST_MULTIFILEREADERTESTER_HPP

#include "mwareader/MultiFileReader.hpp"
#include "mwareader/test/FixtureWriter.hpp"

#include <gtest/gtest.h>

namespace mwareader
{
namespace test
{

class MultiFileReaderTester: public ::testing::Test
{
  protected:
    void SetUp() override;
    void TearDown() override;

    TemporaryDirectory _dir;

  public:
    MultiFileReaderTester();
    ~MultiFileReaderTester();
};

} // namespace test
} // namespace mwareader

#endif // MWAREADER_TEST_MULTIFILEREADERTESTER_HPP
