#include <gtest/gtest.h>

#include "ollama/error.hpp"
#include "ollama/keep_alive.hpp"

#include <chrono>

using ollama::KeepAlive;
using json = nlohmann::json;

TEST(KeepAliveTest, ZeroSecondsNormalizesToNone) {
  EXPECT_EQ(KeepAlive::seconds(0), KeepAlive::none());
  EXPECT_EQ(KeepAlive::seconds(0).kind(), KeepAlive::Kind::None);
  EXPECT_EQ(KeepAlive::seconds(0).to_json(), KeepAlive::none().to_json());
  EXPECT_EQ(*KeepAlive::none().to_json(), json(0));
}

TEST(KeepAliveTest, NegativeSecondsNormalizeToForever) {
  EXPECT_EQ(KeepAlive::seconds(-5), KeepAlive::forever());
  EXPECT_EQ(KeepAlive::seconds(-5).to_json(), KeepAlive::forever().to_json());
  EXPECT_EQ(*KeepAlive::forever().to_json(), json(-1));
}

TEST(KeepAliveTest, DefaultIsOmittedAndSecondsAreNumeric) {
  EXPECT_TRUE(KeepAlive().is_default());
  EXPECT_FALSE(KeepAlive().to_json().has_value());

  auto five_minutes = KeepAlive::from(std::chrono::minutes(5));
  EXPECT_EQ(five_minutes.kind(), KeepAlive::Kind::Seconds);
  EXPECT_EQ(five_minutes.seconds_value(), 300);
  EXPECT_EQ(*five_minutes.to_json(), json(300));
  EXPECT_NE(five_minutes, KeepAlive::seconds(301));
}

TEST(KeepAliveTest, ParsesServiceDurationStrings) {
  EXPECT_EQ(KeepAlive::parse("300"), KeepAlive::seconds(300));
  EXPECT_EQ(KeepAlive::parse("45s"), KeepAlive::seconds(45));
  EXPECT_EQ(KeepAlive::parse("5m"), KeepAlive::seconds(300));
  EXPECT_EQ(KeepAlive::parse("1h30m"), KeepAlive::seconds(5400));
  EXPECT_EQ(KeepAlive::parse("1.5h"), KeepAlive::seconds(5400));
  EXPECT_EQ(KeepAlive::parse(" 0 "), KeepAlive::none());
  EXPECT_EQ(KeepAlive::parse("-1"), KeepAlive::forever());
  EXPECT_EQ(KeepAlive::parse("-10m"), KeepAlive::forever());
  EXPECT_EQ(KeepAlive::parse("250ms"), KeepAlive::seconds(1));
}

TEST(KeepAliveTest, RejectsMalformedDurations) {
  EXPECT_THROW(KeepAlive::parse(""), ollama::LocalValidationError);
  EXPECT_THROW(KeepAlive::parse("soon"), ollama::LocalValidationError);
  EXPECT_THROW(KeepAlive::parse("5 minutes"), ollama::LocalValidationError);
  EXPECT_THROW(KeepAlive::parse("1.2.3s"), ollama::LocalValidationError);
  EXPECT_THROW(KeepAlive::parse("5d"), ollama::LocalValidationError);
}

TEST(KeepAliveTest, RejectsDurationsBeyondSecondsRange) {
  EXPECT_THROW(KeepAlive::parse("99999999999999999999h"), ollama::LocalValidationError);
  EXPECT_THROW(KeepAlive::parse("-99999999999999999999h"), ollama::LocalValidationError);
  EXPECT_EQ(KeepAlive::parse("876000h"), KeepAlive::seconds(876000LL * 3600));
}
