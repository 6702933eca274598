/*
 * 설명: 매치 기록(실시간 경로), 시즌 전이, 파생 테이블 재계산을 트랜잭션 단위로 묶는 진입점.
 *       재계산 두 종류는 서로, 그리고 실시간 경로와 배타적으로 실행된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/ladder_service_it_test.cpp, ladder/tests/it/season_transition_it_test.cpp,
 *         ladder/tests/it/replay_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "ladder/date.hpp"
#include "ladder/db_client.hpp"
#include "ladder/derived_repository.hpp"
#include "ladder/match_repository.hpp"
#include "ladder/observability.hpp"
#include "ladder/player_store.hpp"
#include "ladder/season_repository.hpp"
#include "ladder/season_state.hpp"
#include "ladder/types.hpp"

namespace ladder {

struct RecordedMatch {
  MatchRecord match;
  SeasonCounters winner;
  SeasonCounters loser;
};

struct SeasonTransitionResult {
  TransitionStatus status{TransitionStatus::kUnchanged};
  std::vector<int> expired_ids;
  std::optional<int> activated_id;
  std::size_t players_reset{0};
};

struct ReplayResult {
  std::size_t matches_scanned{0};
  std::size_t rows_deleted{0};
  std::size_t rows_written{0};
};

struct CounterDrift {
  int player_id;
  SeasonCounters live;
  SeasonCounters replayed;
};

class LadderService {
 public:
  LadderService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Observability> observability,
                std::chrono::seconds replay_lock_timeout = std::chrono::seconds(10));

  int RegisterPlayer(const std::string& name);
  int CreateSeason(const Date& start_date, const std::optional<Date>& end_date);

  // 매치 저장, 두 플레이어 카운터 갱신, 레이팅 이력 2행 추가를 하나의 트랜잭션으로 수행한다.
  RecordedMatch RecordMatch(const NewMatch& match);

  SeasonTransitionResult RunSeasonTransition();
  SeasonTransitionResult RunSeasonTransition(const Date& today);

  // 기존 파생 행을 지우고 매치 로그로부터 다시 만든다. 실패 시 파생 테이블은 그대로 남는다.
  ReplayResult ReplayRatingHistory();
  ReplayResult ReplaySeasonSnapshots();

  std::vector<MatchRecord> ListMatches(const MatchFilter& filter) const;

  // 활성 시즌을 메모리에서 재생해 실시간 카운터와 다른 플레이어를 돌려준다. 읽기 전용.
  std::vector<CounterDrift> AuditActiveSeason();

  std::shared_ptr<PlayerStore> GetPlayerStore() { return players_; }
  std::shared_ptr<SeasonRepository> GetSeasonRepository() { return seasons_; }
  std::shared_ptr<MatchRepository> GetMatchRepository() { return matches_; }
  std::shared_ptr<DerivedRepository> GetDerivedRepository() { return derived_; }

 private:
  ReplayResult RunReplay(const std::string& name, const std::function<ReplayResult(MYSQL*)>& body);
  void AcquireReplayLock(MYSQL* conn) const;
  void EnsureChronology(MYSQL* conn, int player_id, const Date& played_on) const;

  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<PlayerStore> players_;
  std::shared_ptr<SeasonRepository> seasons_;
  std::shared_ptr<MatchRepository> matches_;
  std::shared_ptr<DerivedRepository> derived_;
  std::chrono::seconds replay_lock_timeout_;
  std::shared_mutex exclusion_;
};

}  // namespace ladder
