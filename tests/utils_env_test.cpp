#include <gtest/gtest.h>

#include "ollama/utils/env.hpp"

#include "support/env_guard.hpp"

using ollama::utils::read_env;
using ollama::utils::read_environment;

namespace testing_utils = ollama::testing;

TEST(UtilsEnvTest, ReturnsNulloptWhenUnset) {
  testing_utils::EnvVarGuard guard("OLLAMA_CPP_TEST_ENV_UNSET", std::nullopt);
  EXPECT_FALSE(read_env("OLLAMA_CPP_TEST_ENV_UNSET").has_value());
}

TEST(UtilsEnvTest, TrimsWhitespaceAndIgnoresBlankValues) {
  testing_utils::EnvVarGuard trimmed("OLLAMA_CPP_TEST_ENV_TRIM", std::string("  value  "));
  testing_utils::EnvVarGuard blank("OLLAMA_CPP_TEST_ENV_BLANK", std::string(" \t "));
  EXPECT_EQ(read_env("OLLAMA_CPP_TEST_ENV_TRIM"), "value");
  EXPECT_FALSE(read_env("OLLAMA_CPP_TEST_ENV_BLANK").has_value());
}

TEST(UtilsEnvTest, CollectsClientSettings) {
  testing_utils::CleanOllamaEnvironment clean;
  testing_utils::EnvVarGuard host("OLLAMA_HOST", std::string("0.0.0.0"));
  testing_utils::EnvVarGuard keep_alive("OLLAMA_KEEP_ALIVE", std::string("24h"));

  auto settings = read_environment();
  EXPECT_EQ(settings.host, "0.0.0.0");
  EXPECT_EQ(settings.keep_alive, "24h");
  EXPECT_FALSE(settings.api_key.has_value());
  EXPECT_FALSE(settings.log_level.has_value());
}
