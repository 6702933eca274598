/*
 * 설명: 시즌 경계 초기화를 연대기만으로 재현하는 재계산 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/replay_test.cpp, ladder/tests/it/replay_it_test.cpp
 */
#include "ladder/replay.hpp"

#include <utility>

#include "ladder/errors.hpp"
#include "ladder/match_order.hpp"
#include "ladder/rating.hpp"

namespace ladder {

MatchOutcome ApplyMatch(const SeasonCounters& winner, const SeasonCounters& loser, const MatchQualifiers& qualifiers) {
  RatingPair next = Rate(winner.rating, loser.rating);
  MatchOutcome outcome{winner, loser};
  outcome.winner.rating = next.winner;
  outcome.loser.rating = next.loser;
  outcome.winner.wins += 1;
  outcome.loser.losses += 1;
  if (qualifiers.shutout) {
    outcome.winner.bonus_given += 1;
    outcome.loser.bonus_taken += 1;
  }
  return outcome;
}

SeasonCounters& SeasonTracker::Enter(int player_id, int season_id) {
  auto it = players_.find(player_id);
  if (it == players_.end()) {
    it = players_.emplace(player_id, Tracked{season_id, SeasonCounters{}}).first;
  } else if (it->second.season_id != season_id) {
    it->second = Tracked{season_id, SeasonCounters{}};
  }
  return it->second.counters;
}

MatchOutcome SeasonTracker::Apply(const MatchRecord& match) {
  if (match.winner_id == match.loser_id) {
    throw LadderException(LadderErrorCode::kInvalidMatch,
                          "승자와 패자가 같은 매치: #" + std::to_string(match.id));
  }
  SeasonCounters& winner = Enter(match.winner_id, match.season_id);
  SeasonCounters& loser = Enter(match.loser_id, match.season_id);
  MatchOutcome outcome = ApplyMatch(winner, loser, match.qualifiers);
  winner = outcome.winner;
  loser = outcome.loser;
  return outcome;
}

std::optional<SeasonCounters> SeasonTracker::Find(int player_id) const {
  auto it = players_.find(player_id);
  if (it == players_.end()) {
    return std::nullopt;
  }
  return it->second.counters;
}

std::optional<int> SeasonTracker::LastSeason(int player_id) const {
  auto it = players_.find(player_id);
  if (it == players_.end()) {
    return std::nullopt;
  }
  return it->second.season_id;
}

std::vector<RatingHistoryEntry> BuildRatingHistory(std::vector<MatchRecord> matches) {
  SortChronologically(matches);
  SeasonTracker tracker;
  std::vector<RatingHistoryEntry> history;
  history.reserve(matches.size() * 2);
  for (const auto& match : matches) {
    MatchOutcome outcome = tracker.Apply(match);
    history.push_back(RatingHistoryEntry{match.id, match.winner_id, outcome.winner.rating});
    history.push_back(RatingHistoryEntry{match.id, match.loser_id, outcome.loser.rating});
  }
  return history;
}

std::vector<SeasonSnapshot> BuildSeasonSnapshots(std::vector<MatchRecord> matches) {
  SortChronologically(matches);
  SeasonTracker tracker;
  std::map<std::pair<int, int>, SeasonSnapshot> latest;
  auto record = [&latest](int season_id, int player_id, const SeasonCounters& counters) {
    latest[{season_id, player_id}] =
        SeasonSnapshot{season_id, player_id, counters.rating, counters.wins, counters.losses};
  };
  for (const auto& match : matches) {
    MatchOutcome outcome = tracker.Apply(match);
    record(match.season_id, match.winner_id, outcome.winner);
    record(match.season_id, match.loser_id, outcome.loser);
  }
  std::vector<SeasonSnapshot> snapshots;
  snapshots.reserve(latest.size());
  for (auto& entry : latest) {
    snapshots.push_back(entry.second);
  }
  return snapshots;
}

std::map<int, SeasonCounters> ReplayFinalCounters(std::vector<MatchRecord> matches, int season_id) {
  SortChronologically(matches);
  SeasonTracker tracker;
  std::unordered_set<int> seen;
  for (const auto& match : matches) {
    tracker.Apply(match);
    seen.insert(match.winner_id);
    seen.insert(match.loser_id);
  }
  std::map<int, SeasonCounters> result;
  for (int player_id : seen) {
    if (tracker.LastSeason(player_id) == season_id) {
      result[player_id] = *tracker.Find(player_id);
    }
  }
  return result;
}

void ValidateReferences(const std::vector<MatchRecord>& matches, const std::unordered_set<int>& season_ids,
                        const std::unordered_set<int>& player_ids) {
  for (const auto& match : matches) {
    if (season_ids.count(match.season_id) == 0) {
      throw LadderException(LadderErrorCode::kUnknownReference, "매치 #" + std::to_string(match.id) +
                                                                    "가 알 수 없는 시즌을 참조함: " +
                                                                    std::to_string(match.season_id));
    }
    if (player_ids.count(match.winner_id) == 0 || player_ids.count(match.loser_id) == 0) {
      throw LadderException(LadderErrorCode::kUnknownReference,
                            "매치 #" + std::to_string(match.id) + "가 알 수 없는 플레이어를 참조함");
    }
  }
}

}  // namespace ladder
