/*
 * 설명: 플레이어별 현재 시즌 카운터(레이팅, 승/패, 보너스)를 MariaDB에 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/ladder_service_it_test.cpp, ladder/tests/it/season_transition_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <mariadb/mysql.h>

#include "ladder/db_client.hpp"
#include "ladder/types.hpp"

namespace ladder {

class PlayerStore {
 public:
  explicit PlayerStore(std::shared_ptr<MariaDbClient> db_client);

  int Create(const std::string& name);
  int CreateInTx(MYSQL* conn, const std::string& name);

  std::optional<Player> Find(int player_id) const;
  std::vector<Player> ListAll() const;
  std::vector<Player> ListInTx(MYSQL* conn, RowLock lock) const;
  std::unordered_set<int> ListIdsInTx(MYSQL* conn) const;

  // 두 플레이어 행을 FOR UPDATE로 잠그고 읽는다. 누락 시 LadderException(kUnknownReference).
  std::unordered_map<int, Player> LockPairInTx(MYSQL* conn, int first_id, int second_id) const;
  void SaveCountersInTx(MYSQL* conn, int player_id, const SeasonCounters& counters) const;
  // 모든 플레이어의 시즌 카운터를 기본값으로 되돌리고 영향받은 행 수를 반환한다.
  std::size_t ResetAllInTx(MYSQL* conn) const;

 private:
  Player BuildPlayer(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace ladder
