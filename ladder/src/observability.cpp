/*
 * 설명: 구조화 로그 출력과 작업 카운터를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/observability_test.cpp
 */
#include "ladder/observability.hpp"

#include <chrono>
#include <sstream>

#include "ladder/errors.hpp"

namespace ladder {

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

LogLevel ParseLogLevel(const std::string& text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "info") {
    return LogLevel::kInfo;
  }
  if (text == "warn") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  throw LadderException(LadderErrorCode::kInvalidConfig, "알 수 없는 로그 레벨: " + text);
}

Observability::Observability(LogLevel min_level, std::ostream& out) : min_level_(min_level), out_(out) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementMatchRecorded() { matches_recorded_.fetch_add(1); }

void Observability::IncrementSeasonTransition(bool activated) {
  season_transitions_.fetch_add(1);
  if (activated) {
    seasons_activated_.fetch_add(1);
  }
}

void Observability::IncrementReplay(bool succeeded) {
  if (succeeded) {
    replays_completed_.fetch_add(1);
  } else {
    replay_failures_.fetch_add(1);
  }
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.matches_recorded = matches_recorded_.load();
  snapshot.season_transitions = season_transitions_.load();
  snapshot.seasons_activated = seasons_activated_.load();
  snapshot.replays_completed = replays_completed_.load();
  snapshot.replay_failures = replay_failures_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = ToString(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (!ctx.fields.is_null()) {
    log_json["fields"] = ctx.fields;
  }
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << log_json.dump() << std::endl;
}

}  // namespace ladder
