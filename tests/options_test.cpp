#include <gtest/gtest.h>

#include "enginebridge/options.hpp"

#include "support/env_guard.hpp"

using namespace enginebridge;
namespace ebt = enginebridge::testing;

namespace {

class OptionsTest : public ::testing::Test {
protected:
  ebt::EnvVarGuard base_{"ENGINEBRIDGE_BASE_URL", std::nullopt};
  ebt::EnvVarGuard socket_{"ENGINEBRIDGE_SOCKET_URL", std::nullopt};
  ebt::EnvVarGuard origin_{"ENGINEBRIDGE_ORIGIN", std::nullopt};
  ebt::EnvVarGuard log_{"ENGINEBRIDGE_LOG", std::nullopt};
};

}  // namespace

TEST_F(OptionsTest, DefaultsPointAtHostedBackend) {
  BridgeOptions options = apply_environment(BridgeOptions{});
  EXPECT_EQ(options.base_url, "https://api.enginelabs.ai");
  EXPECT_EQ(options.socket_base_url, "wss://api.enginelabs.ai");
  EXPECT_EQ(options.origin, "https://cto.new");
  EXPECT_EQ(options.log_level, LogLevel::Off);
}

TEST_F(OptionsTest, EnvironmentOverridesDefaults) {
  ebt::EnvVarGuard base("ENGINEBRIDGE_BASE_URL", std::string("http://localhost:8080/"));
  ebt::EnvVarGuard socket("ENGINEBRIDGE_SOCKET_URL", std::string("wss://localhost:8443"));
  ebt::EnvVarGuard origin("ENGINEBRIDGE_ORIGIN", std::string("https://example.test"));
  ebt::EnvVarGuard log("ENGINEBRIDGE_LOG", std::string("debug"));

  BridgeOptions options = apply_environment(BridgeOptions{});
  EXPECT_EQ(options.base_url, "http://localhost:8080");
  EXPECT_EQ(options.socket_base_url, "wss://localhost:8443");
  EXPECT_EQ(options.origin, "https://example.test");
  EXPECT_EQ(options.log_level, LogLevel::Debug);
}

TEST_F(OptionsTest, ExplicitValuesWinOverEnvironment) {
  ebt::EnvVarGuard base("ENGINEBRIDGE_BASE_URL", std::string("http://ignored"));
  ebt::EnvVarGuard log("ENGINEBRIDGE_LOG", std::string("debug"));

  BridgeOptions options;
  options.base_url = "https://staging.enginelabs.ai//";
  options.log_level = LogLevel::Warn;

  BridgeOptions applied = apply_environment(options);
  EXPECT_EQ(applied.base_url, "https://staging.enginelabs.ai");
  EXPECT_EQ(applied.log_level, LogLevel::Warn);
}

TEST_F(OptionsTest, UnknownLogLevelStaysOff) {
  ebt::EnvVarGuard log("ENGINEBRIDGE_LOG", std::string("verbose"));
  EXPECT_EQ(apply_environment(BridgeOptions{}).log_level, LogLevel::Off);
}
