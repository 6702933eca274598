/*
 * 설명: 추가 전용 매치 로그를 MariaDB에 저장하고 (날짜, 순번) 순으로 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/ladder_service_it_test.cpp, ladder/tests/it/replay_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <mariadb/mysql.h>

#include "ladder/date.hpp"
#include "ladder/db_client.hpp"
#include "ladder/types.hpp"

namespace ladder {

// 날짜 범위는 양 끝을 포함한다.
struct MatchFilter {
  std::optional<int> season_id;
  std::optional<Date> from;
  std::optional<Date> until;
};

class MatchRepository {
 public:
  explicit MatchRepository(std::shared_ptr<MariaDbClient> db_client);

  std::int64_t AppendInTx(MYSQL* conn, const NewMatch& match) const;

  std::vector<MatchRecord> List(const MatchFilter& filter) const;
  std::vector<MatchRecord> ListInTx(MYSQL* conn, const MatchFilter& filter, RowLock lock) const;
  std::optional<Date> LatestDateForPlayerInTx(MYSQL* conn, int player_id) const;
  std::size_t Count() const;

 private:
  MatchRecord BuildRecord(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace ladder
