#include <gtest/gtest.h>

#include "enginebridge/utils/env.hpp"

#include "support/env_guard.hpp"

using enginebridge::utils::read_env;
using enginebridge::utils::read_env_or;

namespace ebt = enginebridge::testing;

TEST(UtilsEnvTest, ReturnsNulloptWhenUnset) {
  ebt::EnvVarGuard guard("ENGINEBRIDGE_TEST_ENV_UNSET", std::nullopt);
  EXPECT_FALSE(read_env("ENGINEBRIDGE_TEST_ENV_UNSET").has_value());
}

TEST(UtilsEnvTest, TrimsWhitespaceFromValues) {
  ebt::EnvVarGuard guard("ENGINEBRIDGE_TEST_ENV_TRIM", std::string("  value \n"));
  auto value = read_env("ENGINEBRIDGE_TEST_ENV_TRIM");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "value");
}

TEST(UtilsEnvTest, WhitespaceOnlyIsEmpty) {
  ebt::EnvVarGuard guard("ENGINEBRIDGE_TEST_ENV_BLANK", std::string("   "));
  auto value = read_env("ENGINEBRIDGE_TEST_ENV_BLANK");
  ASSERT_TRUE(value.has_value());
  EXPECT_TRUE(value->empty());
}

TEST(UtilsEnvTest, ReadEnvOrFallsBackWhenAbsent) {
  ebt::EnvVarGuard guard("ENGINEBRIDGE_TEST_ENV_OR", std::nullopt);
  EXPECT_EQ(read_env_or("ENGINEBRIDGE_TEST_ENV_OR", "fallback"), "fallback");
}
