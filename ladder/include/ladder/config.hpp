/*
 * 설명: 래더 프로세스 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

#include "ladder/db_client.hpp"

namespace ladder {

struct LadderConfig {
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::size_t season_transition_interval_seconds;
  std::size_t replay_lock_timeout_seconds;

  DbConfig ToDbConfig() const { return DbConfig{db_host, db_port, db_user, db_password, db_name}; }
};

// 숫자 형식이 잘못되었거나 범위를 벗어나면 LadderException(kInvalidConfig).
LadderConfig LoadConfigFromEnv();

}  // namespace ladder
