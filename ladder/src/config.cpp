/*
 * 설명: 환경변수에서 래더 설정을 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/config_test.cpp
 */
#include "ladder/config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "ladder/errors.hpp"
#include "ladder/observability.hpp"

namespace ladder {
namespace {
std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

unsigned long ParseUnsigned(const char* key, const std::string& text, unsigned long max_value) {
  try {
    std::size_t consumed = 0;
    unsigned long value = std::stoul(text, &consumed);
    if (consumed != text.size() || text[0] == '-' || value > max_value) {
      throw std::out_of_range(text);
    }
    return value;
  } catch (const std::logic_error&) {
    throw LadderException(LadderErrorCode::kInvalidConfig, std::string(key) + " 값이 올바르지 않음: " + text);
  }
}
}  // namespace

LadderConfig LoadConfigFromEnv() {
  LadderConfig cfg;
  cfg.db_host = GetEnv("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(
      ParseUnsigned("DB_PORT", GetEnv("DB_PORT", "3306"), std::numeric_limits<unsigned short>::max()));
  cfg.db_user = GetEnv("DB_USER", "app");
  cfg.db_password = GetEnv("DB_PASSWORD", "app_pass");
  cfg.db_name = GetEnv("DB_NAME", "app_db");
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  ParseLogLevel(cfg.log_level);
  cfg.season_transition_interval_seconds =
      ParseUnsigned("SEASON_TRANSITION_INTERVAL_SECONDS", GetEnv("SEASON_TRANSITION_INTERVAL_SECONDS", "86400"),
                    std::numeric_limits<unsigned int>::max());
  if (cfg.season_transition_interval_seconds == 0) {
    throw LadderException(LadderErrorCode::kInvalidConfig, "SEASON_TRANSITION_INTERVAL_SECONDS는 0보다 커야 함");
  }
  cfg.replay_lock_timeout_seconds = ParseUnsigned(
      "REPLAY_LOCK_TIMEOUT_SECONDS", GetEnv("REPLAY_LOCK_TIMEOUT_SECONDS", "10"), std::numeric_limits<int>::max());
  return cfg;
}

}  // namespace ladder
