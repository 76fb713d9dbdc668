#ifndef MWAREADER_TEST_SUBFILEHEADERTESTER_HPP
#define MWAREADER_TEST_SUBFILEHEADERTESTER_HPP

#include "mwareader/SubfileHeader.hpp"

#include <gtest/gtest.h>

namespace mwareader
{
namespace test
{

class SubfileHeaderTester: public ::testing::Test
{
  protected:
    void SetUp() override;
    void TearDown() override;

  public:
    SubfileHeaderTester();
    ~SubfileHeaderTester();
};

} // namespace test
} // namespace mwareader

#endif // MWAREADER_TEST_SUBFILEHEADERTESTER_HPP
