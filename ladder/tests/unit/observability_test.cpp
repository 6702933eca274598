#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "ladder/observability.hpp"

namespace {

TEST(ObservabilityTest, WritesOneJsonObjectPerLine) {
  std::ostringstream out;
  ladder::Observability observability(ladder::LogLevel::kInfo, out);

  ladder::LogContext ctx;
  ctx.trace_id = observability.NextTraceId();
  ctx.name = "season_transition";
  ctx.latency_ms = 7;
  ctx.fields = {{"status", "activated"}, {"playersReset", 3}};
  observability.Log(ctx);

  auto line = nlohmann::json::parse(out.str());
  EXPECT_EQ(line["level"], "info");
  EXPECT_EQ(line["eventName"], "season_transition");
  EXPECT_EQ(line["traceId"], ctx.trace_id);
  EXPECT_EQ(line["latencyMs"], 7);
  EXPECT_EQ(line["fields"]["playersReset"], 3);
}

TEST(ObservabilityTest, DropsLinesBelowConfiguredLevel) {
  std::ostringstream out;
  ladder::Observability observability(ladder::LogLevel::kWarn, out);

  ladder::LogContext info_ctx;
  info_ctx.name = "match_recorded";
  observability.Log(info_ctx);
  EXPECT_TRUE(out.str().empty());

  ladder::LogContext error_ctx;
  error_ctx.name = "rating_history_replay_failed";
  error_ctx.level = ladder::LogLevel::kError;
  observability.Log(error_ctx);
  auto line = nlohmann::json::parse(out.str());
  EXPECT_EQ(line["level"], "error");
  EXPECT_FALSE(line.contains("fields"));
}

TEST(ObservabilityTest, CountsLadderOperations) {
  std::ostringstream out;
  ladder::Observability observability(ladder::LogLevel::kInfo, out);
  observability.IncrementMatchRecorded();
  observability.IncrementMatchRecorded();
  observability.IncrementSeasonTransition(false);
  observability.IncrementSeasonTransition(true);
  observability.IncrementReplay(true);
  observability.IncrementReplay(false);

  auto snapshot = observability.Snapshot();
  EXPECT_EQ(snapshot.matches_recorded, 2u);
  EXPECT_EQ(snapshot.season_transitions, 2u);
  EXPECT_EQ(snapshot.seasons_activated, 1u);
  EXPECT_EQ(snapshot.replays_completed, 1u);
  EXPECT_EQ(snapshot.replay_failures, 1u);
}

TEST(ObservabilityTest, TraceIdsAreUnique) {
  ladder::Observability observability;
  EXPECT_NE(observability.NextTraceId(), observability.NextTraceId());
  EXPECT_EQ(ladder::ParseLogLevel("warn"), ladder::LogLevel::kWarn);
}

}  // namespace
