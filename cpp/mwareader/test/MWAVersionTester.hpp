#ifndef MWAREADER_TEST_MWAVERSIONTESTER_HPP
#define MWAREADER_TEST_MWAVERSIONTESTER_HPP

#include "mwareader/MWAVersion.hpp"

#include <gtest/gtest.h>

namespace mwareader
{
namespace test
{

class MWAVersionTester: public ::testing::Test
{
  protected:
    void SetUp() override;
    void TearDown() override;

  public:
    MWAVersionTester();
    ~MWAVersionTester();
};

} // namespace test
} // namespace mwareader

#endif // MWAREADER_TEST_MWAVERSIONTESTER_HPP
