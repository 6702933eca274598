#include <cstdlib>

#include <gtest/gtest.h>

#include "ladder/config.hpp"
#include "ladder/errors.hpp"

namespace {

class ConfigEnvTest : public ::testing::Test {
 protected:
  void SetUp() override { Clear(); }
  void TearDown() override { Clear(); }

  static void Clear() {
    for (const char* key : {"DB_HOST", "DB_PORT", "DB_USER", "DB_PASSWORD", "DB_NAME", "LOG_LEVEL",
                            "SEASON_TRANSITION_INTERVAL_SECONDS", "REPLAY_LOCK_TIMEOUT_SECONDS"}) {
      unsetenv(key);
    }
  }

  static void ExpectInvalid() {
    try {
      ladder::LoadConfigFromEnv();
      FAIL() << "잘못된 설정이 통과됨";
    } catch (const ladder::LadderException& ex) {
      EXPECT_EQ(ex.code, ladder::LadderErrorCode::kInvalidConfig);
    }
  }
};

TEST_F(ConfigEnvTest, UsesDefaultsWhenUnset) {
  auto cfg = ladder::LoadConfigFromEnv();
  EXPECT_EQ(cfg.db_host, "mariadb");
  EXPECT_EQ(cfg.db_port, 3306);
  EXPECT_EQ(cfg.db_user, "app");
  EXPECT_EQ(cfg.db_name, "app_db");
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_EQ(cfg.season_transition_interval_seconds, 86400u);
  EXPECT_EQ(cfg.replay_lock_timeout_seconds, 10u);
}

TEST_F(ConfigEnvTest, ReadsOverrides) {
  setenv("DB_HOST", "127.0.0.1", 1);
  setenv("DB_PORT", "3307", 1);
  setenv("LOG_LEVEL", "debug", 1);
  setenv("SEASON_TRANSITION_INTERVAL_SECONDS", "60", 1);
  auto cfg = ladder::LoadConfigFromEnv();
  EXPECT_EQ(cfg.db_host, "127.0.0.1");
  EXPECT_EQ(cfg.db_port, 3307);
  EXPECT_EQ(cfg.log_level, "debug");
  EXPECT_EQ(cfg.season_transition_interval_seconds, 60u);
  auto db = cfg.ToDbConfig();
  EXPECT_EQ(db.host, "127.0.0.1");
  EXPECT_EQ(db.port, 3307);
}

TEST_F(ConfigEnvTest, RejectsMalformedPort) {
  setenv("DB_PORT", "33o6", 1);
  ExpectInvalid();
  setenv("DB_PORT", "70000", 1);
  ExpectInvalid();
}

TEST_F(ConfigEnvTest, RejectsZeroTransitionInterval) {
  setenv("SEASON_TRANSITION_INTERVAL_SECONDS", "0", 1);
  ExpectInvalid();
}

TEST_F(ConfigEnvTest, RejectsUnknownLogLevel) {
  setenv("LOG_LEVEL", "verbose", 1);
  ExpectInvalid();
}

}  // namespace
