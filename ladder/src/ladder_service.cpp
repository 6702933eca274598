/*
 * 설명: 실시간 매치 반영, 시즌 전이, 재계산 작업을 트랜잭션과 배타 잠금으로 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/ladder_service_it_test.cpp, ladder/tests/it/season_transition_it_test.cpp,
 *         ladder/tests/it/replay_it_test.cpp
 */
#include "ladder/ladder_service.hpp"

#include <mutex>
#include <sstream>
#include <unordered_set>

#include "ladder/errors.hpp"
#include "ladder/replay.hpp"

namespace ladder {
namespace {
constexpr const char* kReplayLockName = "ladder_replay";

long ElapsedMs(std::chrono::steady_clock::time_point start) {
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

std::unordered_set<int> SeasonIds(const std::vector<Season>& seasons) {
  std::unordered_set<int> ids;
  for (const auto& season : seasons) {
    ids.insert(season.id);
  }
  return ids;
}

nlohmann::json ToJson(const SeasonCounters& counters) {
  return nlohmann::json{{"rating", counters.rating},
                        {"wins", counters.wins},
                        {"losses", counters.losses},
                        {"bonusGiven", counters.bonus_given},
                        {"bonusTaken", counters.bonus_taken}};
}
}  // namespace

LadderService::LadderService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Observability> observability,
                             std::chrono::seconds replay_lock_timeout)
    : db_client_(std::move(db_client)), observability_(std::move(observability)),
      players_(std::make_shared<PlayerStore>(db_client_)), seasons_(std::make_shared<SeasonRepository>(db_client_)),
      matches_(std::make_shared<MatchRepository>(db_client_)), derived_(std::make_shared<DerivedRepository>(db_client_)),
      replay_lock_timeout_(replay_lock_timeout) {}

int LadderService::RegisterPlayer(const std::string& name) { return players_->Create(name); }

int LadderService::CreateSeason(const Date& start_date, const std::optional<Date>& end_date) {
  if (end_date && *end_date < start_date) {
    throw LadderException(LadderErrorCode::kConfigurationInconsistency,
                          "시즌 종료일이 시작일보다 빠름: " + FormatDate(start_date) + " ~ " + FormatDate(*end_date));
  }
  return seasons_->Create(start_date, end_date);
}

RecordedMatch LadderService::RecordMatch(const NewMatch& match) {
  if (match.winner_id == match.loser_id) {
    throw LadderException(LadderErrorCode::kInvalidMatch, "자기 자신과의 매치는 기록할 수 없음");
  }
  auto start = std::chrono::steady_clock::now();
  std::shared_lock<std::shared_mutex> guard(exclusion_);

  RecordedMatch recorded;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    auto season = seasons_->FindInTx(conn, match.season_id, RowLock::kShare);
    if (!season) {
      throw LadderException(LadderErrorCode::kUnknownReference,
                            "알 수 없는 시즌: " + std::to_string(match.season_id));
    }
    if (!season->active) {
      throw LadderException(LadderErrorCode::kSeasonNotActive,
                            "활성 시즌이 아님: " + std::to_string(match.season_id));
    }
    if (!season->Contains(match.played_on)) {
      throw LadderException(LadderErrorCode::kInvalidMatch,
                            "매치 날짜 " + FormatDate(match.played_on) + "가 시즌 " + std::to_string(season->id) +
                                " 기간(" + FormatDate(season->start_date) + " ~ " +
                                (season->end_date ? FormatDate(*season->end_date) : std::string("미정")) + ") 밖임");
    }

    // 플레이어 행을 먼저 잠가야 같은 플레이어의 매치 순번이 반영 순서와 일치한다.
    auto current = players_->LockPairInTx(conn, match.winner_id, match.loser_id);
    EnsureChronology(conn, match.winner_id, match.played_on);
    EnsureChronology(conn, match.loser_id, match.played_on);

    std::int64_t match_id = matches_->AppendInTx(conn, match);
    MatchOutcome outcome =
        ApplyMatch(current[match.winner_id].counters, current[match.loser_id].counters, match.qualifiers);
    players_->SaveCountersInTx(conn, match.winner_id, outcome.winner);
    players_->SaveCountersInTx(conn, match.loser_id, outcome.loser);
    derived_->InsertHistoryInTx(conn, {RatingHistoryEntry{match_id, match.winner_id, outcome.winner.rating},
                                       RatingHistoryEntry{match_id, match.loser_id, outcome.loser.rating}});

    recorded.match = MatchRecord{match_id,         match.winner_id, match.loser_id,
                                 match.season_id, match.played_on, match.qualifiers};
    recorded.winner = outcome.winner;
    recorded.loser = outcome.loser;
    return true;
  });

  observability_->IncrementMatchRecorded();
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.name = "match_recorded";
  ctx.latency_ms = ElapsedMs(start);
  ctx.fields = {{"matchId", recorded.match.id},
                {"seasonId", match.season_id},
                {"winnerId", match.winner_id},
                {"loserId", match.loser_id},
                {"winnerRating", recorded.winner.rating},
                {"loserRating", recorded.loser.rating}};
  observability_->Log(ctx);
  return recorded;
}

void LadderService::EnsureChronology(MYSQL* conn, int player_id, const Date& played_on) const {
  auto latest = matches_->LatestDateForPlayerInTx(conn, player_id);
  if (latest && played_on < *latest) {
    throw LadderException(LadderErrorCode::kOrderingAmbiguity,
                          "플레이어 " + std::to_string(player_id) + "의 최근 매치(" + FormatDate(*latest) +
                              ")보다 이른 날짜: " + FormatDate(played_on));
  }
}

SeasonTransitionResult LadderService::RunSeasonTransition() { return RunSeasonTransition(TodayUtc()); }

SeasonTransitionResult LadderService::RunSeasonTransition(const Date& today) {
  auto start = std::chrono::steady_clock::now();
  std::string trace_id = observability_->NextTraceId();
  std::shared_lock<std::shared_mutex> guard(exclusion_);

  SeasonTransitionResult result;
  try {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      result = SeasonTransitionResult{};
      auto seasons = seasons_->ListInTx(conn, RowLock::kExclusive);
      SeasonTransitionPlan plan = PlanSeasonTransition(seasons, today);
      for (int season_id : plan.expire_ids) {
        seasons_->SetActiveInTx(conn, season_id, false);
      }
      if (plan.activate_id) {
        seasons_->SetActiveInTx(conn, *plan.activate_id, true);
      }
      if (plan.reset_players) {
        result.players_reset = players_->ResetAllInTx(conn);
      }
      result.status = plan.status;
      result.expired_ids = plan.expire_ids;
      result.activated_id = plan.activate_id;
      return true;
    });
  } catch (const LadderException& ex) {
    LogContext ctx{trace_id, "season_transition_failed", LogLevel::kError, ElapsedMs(start),
                   nlohmann::json{{"today", FormatDate(today)}, {"code", ToString(ex.code)}, {"error", ex.what()}}};
    observability_->Log(ctx);
    throw;
  } catch (const DbException& ex) {
    LogContext ctx{trace_id, "season_transition_failed", LogLevel::kError, ElapsedMs(start),
                   nlohmann::json{{"today", FormatDate(today)}, {"dbCode", ex.code}, {"error", ex.what()}}};
    observability_->Log(ctx);
    throw;
  }

  observability_->IncrementSeasonTransition(result.activated_id.has_value());
  LogContext ctx;
  ctx.trace_id = trace_id;
  ctx.name = "season_transition";
  ctx.latency_ms = ElapsedMs(start);
  ctx.fields = {{"today", FormatDate(today)},
                {"status", ToString(result.status)},
                {"expired", result.expired_ids},
                {"playersReset", result.players_reset}};
  if (result.activated_id) {
    ctx.fields["activated"] = *result.activated_id;
  }
  if (result.status == TransitionStatus::kNoSeasonInWindow) {
    ctx.level = LogLevel::kError;
    ctx.fields["code"] = ToString(LadderErrorCode::kConfigurationInconsistency);
  }
  observability_->Log(ctx);
  return result;
}

ReplayResult LadderService::ReplayRatingHistory() {
  return RunReplay("rating_history_replay", [this](MYSQL* conn) {
    auto records = matches_->ListInTx(conn, MatchFilter{}, RowLock::kShare);
    ValidateReferences(records, SeasonIds(seasons_->ListInTx(conn, RowLock::kNone)), players_->ListIdsInTx(conn));
    auto history = BuildRatingHistory(records);

    ReplayResult result;
    result.matches_scanned = records.size();
    result.rows_deleted = derived_->DeleteAllHistoryInTx(conn);
    derived_->InsertHistoryInTx(conn, history);
    result.rows_written = history.size();
    return result;
  });
}

ReplayResult LadderService::ReplaySeasonSnapshots() {
  return RunReplay("season_snapshot_replay", [this](MYSQL* conn) {
    auto records = matches_->ListInTx(conn, MatchFilter{}, RowLock::kShare);
    ValidateReferences(records, SeasonIds(seasons_->ListInTx(conn, RowLock::kNone)), players_->ListIdsInTx(conn));
    auto snapshots = BuildSeasonSnapshots(records);

    ReplayResult result;
    result.matches_scanned = records.size();
    result.rows_deleted = derived_->DeleteAllSnapshotsInTx(conn);
    derived_->InsertSnapshotsInTx(conn, snapshots);
    result.rows_written = snapshots.size();
    return result;
  });
}

ReplayResult LadderService::RunReplay(const std::string& name,
                                      const std::function<ReplayResult(MYSQL*)>& body) {
  auto start = std::chrono::steady_clock::now();
  std::string trace_id = observability_->NextTraceId();
  std::unique_lock<std::shared_mutex> guard(exclusion_);

  ReplayResult result;
  try {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      AcquireReplayLock(conn);
      result = body(conn);
      return true;
    });
  } catch (const LadderException& ex) {
    observability_->IncrementReplay(false);
    observability_->Log(LogContext{trace_id, name + "_failed", LogLevel::kError, ElapsedMs(start),
                                   nlohmann::json{{"code", ToString(ex.code)}, {"error", ex.what()}}});
    throw;
  } catch (const DbException& ex) {
    observability_->IncrementReplay(false);
    observability_->Log(LogContext{
        trace_id, name + "_failed", LogLevel::kError, ElapsedMs(start),
        nlohmann::json{{"code", ToString(LadderErrorCode::kPartialReplayFailure)}, {"dbCode", ex.code},
                       {"error", ex.what()}}});
    throw LadderException(LadderErrorCode::kPartialReplayFailure, name + " 롤백됨: " + ex.what());
  }

  observability_->IncrementReplay(true);
  observability_->Log(LogContext{trace_id, name, LogLevel::kInfo, ElapsedMs(start),
                                 nlohmann::json{{"matchesScanned", result.matches_scanned},
                                                {"rowsDeleted", result.rows_deleted},
                                                {"rowsWritten", result.rows_written}}});
  return result;
}

// GET_LOCK은 세션 단위 잠금이므로 트랜잭션 커밋 후 연결이 닫힐 때 해제된다.
void LadderService::AcquireReplayLock(MYSQL* conn) const {
  std::ostringstream oss;
  oss << "SELECT GET_LOCK('" << kReplayLockName << "', " << replay_lock_timeout_.count() << ");";
  bool acquired = false;
  db_client_->ForEachRow(conn, oss.str(), "재계산 잠금 획득 실패",
                         [&](MYSQL_ROW row) { acquired = row[0] && std::string(row[0]) == "1"; });
  if (!acquired) {
    throw LadderException(LadderErrorCode::kReplayBusy, "다른 재계산 작업이 실행 중");
  }
}

std::vector<MatchRecord> LadderService::ListMatches(const MatchFilter& filter) const {
  if (filter.from && filter.until && *filter.until < *filter.from) {
    return {};
  }
  return matches_->List(filter);
}

std::vector<CounterDrift> LadderService::AuditActiveSeason() {
  auto start = std::chrono::steady_clock::now();
  std::shared_lock<std::shared_mutex> guard(exclusion_);

  std::vector<CounterDrift> drifts;
  std::optional<int> audited_season;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    drifts.clear();
    audited_season.reset();
    for (const auto& season : seasons_->ListInTx(conn, RowLock::kShare)) {
      if (season.active) {
        audited_season = season.id;
        break;
      }
    }
    if (!audited_season) {
      return false;
    }
    auto replayed = ReplayFinalCounters(matches_->ListInTx(conn, MatchFilter{}, RowLock::kShare), *audited_season);
    for (const auto& player : players_->ListInTx(conn, RowLock::kShare)) {
      auto it = replayed.find(player.id);
      SeasonCounters expected = it == replayed.end() ? SeasonCounters{} : it->second;
      if (player.counters != expected) {
        drifts.push_back(CounterDrift{player.id, player.counters, expected});
      }
    }
    return false;
  });

  nlohmann::json drift_json = nlohmann::json::array();
  for (const auto& drift : drifts) {
    drift_json.push_back({{"playerId", drift.player_id}, {"live", ToJson(drift.live)}, {"replayed", ToJson(drift.replayed)}});
  }
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.name = "active_season_audit";
  ctx.level = drifts.empty() ? LogLevel::kInfo : LogLevel::kWarn;
  ctx.latency_ms = ElapsedMs(start);
  ctx.fields = {{"drifts", drift_json}};
  if (audited_season) {
    ctx.fields["seasonId"] = *audited_season;
  }
  observability_->Log(ctx);
  return drifts;
}

}  // namespace ladder
