/*
 * 설명: 매치 로그만으로 레이팅 이력과 시즌 스냅샷을 재구성하는 순수 계산부.
 *       실시간 경로(LadderService::RecordMatch)와 같은 ApplyMatch 규칙을 공유한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/replay_test.cpp, ladder/tests/it/replay_it_test.cpp
 */
#pragma once

#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ladder/types.hpp"

namespace ladder {

struct MatchOutcome {
  SeasonCounters winner;
  SeasonCounters loser;
};

// 한 매치를 두 참가자의 현재 카운터에 적용한다. 보너스 플래그는 레이팅 계산과 독립적이다.
MatchOutcome ApplyMatch(const SeasonCounters& winner, const SeasonCounters& loser, const MatchQualifiers& qualifiers);

// 플레이어별 (마지막으로 본 시즌, 현재 카운터)를 추적한다.
class SeasonTracker {
 public:
  MatchOutcome Apply(const MatchRecord& match);
  std::optional<SeasonCounters> Find(int player_id) const;
  std::optional<int> LastSeason(int player_id) const;

 private:
  struct Tracked {
    int season_id;
    SeasonCounters counters;
  };

  SeasonCounters& Enter(int player_id, int season_id);

  std::unordered_map<int, Tracked> players_;
};

// 입력 순서와 무관하게 (날짜, 순번)으로 정렬해 계산한다.
std::vector<RatingHistoryEntry> BuildRatingHistory(std::vector<MatchRecord> matches);
std::vector<SeasonSnapshot> BuildSeasonSnapshots(std::vector<MatchRecord> matches);

// 전체 로그를 재생한 뒤 마지막 시즌이 season_id인 플레이어의 카운터를 돌려준다.
std::map<int, SeasonCounters> ReplayFinalCounters(std::vector<MatchRecord> matches, int season_id);

// 알 수 없는 시즌/플레이어를 참조하는 기록이 있으면 LadderException(kUnknownReference).
void ValidateReferences(const std::vector<MatchRecord>& matches, const std::unordered_set<int>& season_ids,
                        const std::unordered_set<int>& player_ids);

}  // namespace ladder
