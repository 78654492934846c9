/**
 * @copyright Copyright The HearthKernel Contributors
 */

#include "once.hpp"

#include <gtest/gtest.h>

namespace {

struct Counter {
  explicit Counter(int start) : value(start) {}
  int value;
};

using CounterSingleton = OnceSingleton<Counter>;

class OnceSingletonTest : public ::testing::Test {
 protected:
  void TearDown() override { CounterSingleton::Destroy(); }
};

}  // namespace

TEST_F(OnceSingletonTest, CreateMakesInstanceReady) {
  EXPECT_FALSE(CounterSingleton::IsReady());
  ASSERT_TRUE(CounterSingleton::Create(5).has_value());
  EXPECT_TRUE(CounterSingleton::IsReady());
  EXPECT_EQ(CounterSingleton::Instance().value, 5);
}

TEST_F(OnceSingletonTest, SecondCreateIsRejected) {
  ASSERT_TRUE(CounterSingleton::Create(1).has_value());
  auto again = CounterSingleton::Create(2);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, ErrorCode::kAlreadyInitialized);
  // 原实例不变
  EXPECT_EQ(CounterSingleton::Instance().value, 1);
}

TEST_F(OnceSingletonTest, DestroyAllowsRecreate) {
  ASSERT_TRUE(CounterSingleton::Create(1).has_value());
  CounterSingleton::Destroy();
  EXPECT_FALSE(CounterSingleton::IsReady());
  ASSERT_TRUE(CounterSingleton::Create(3).has_value());
  EXPECT_EQ(CounterSingleton::Instance().value, 3);
}
