/*
 * 설명: 구조화 JSON 로그와 래더 작업 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace ladder {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

const char* ToString(LogLevel level);
// debug/info/warn/error 외의 값은 LadderException(kInvalidConfig).
LogLevel ParseLogLevel(const std::string& text);

struct LogContext {
  std::string trace_id;
  std::string name;
  LogLevel level{LogLevel::kInfo};
  long latency_ms{0};
  nlohmann::json fields;
};

struct MetricsSnapshot {
  std::uint64_t matches_recorded{0};
  std::uint64_t season_transitions{0};
  std::uint64_t seasons_activated{0};
  std::uint64_t replays_completed{0};
  std::uint64_t replay_failures{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cout);

  std::string NextTraceId();
  void IncrementMatchRecorded();
  void IncrementSeasonTransition(bool activated);
  void IncrementReplay(bool succeeded);
  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::ostream& out_;
  mutable std::mutex out_mutex_;
  std::atomic<std::uint64_t> matches_recorded_{0};
  std::atomic<std::uint64_t> season_transitions_{0};
  std::atomic<std::uint64_t> seasons_activated_{0};
  std::atomic<std::uint64_t> replays_completed_{0};
  std::atomic<std::uint64_t> replay_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace ladder
