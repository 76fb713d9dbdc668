#ifndef MWAREADER_TEST_VOLTAGECATALOGTESTER_HPP
#define MWAREADER_TEST_VOLTAGECATALOGTESTER_HPP

#include "mwareader/VoltageCatalog.hpp"
#include "mwareader/test/FixtureWriter.hpp"

#include <gtest/gtest.h>

namespace mwareader
{
namespace test
{

class VoltageCatalogTester: public ::testing::Test
{
  protected:
    void SetUp() override;
    void TearDown() override;

    TemporaryDirectory _dir;

  public:
    VoltageCatalogTester();
    ~VoltageCatalogTester();
};

} // namespace test
} // namespace mwareader

#endif // MWAREADER_TEST_VOLTAGECATALOGTESTER_HPP
