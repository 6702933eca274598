/*
 * 설명: 시즌 기간과 active 플래그를 MariaDB에 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/season_transition_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <mariadb/mysql.h>

#include "ladder/date.hpp"
#include "ladder/db_client.hpp"
#include "ladder/types.hpp"

namespace ladder {

class SeasonRepository {
 public:
  explicit SeasonRepository(std::shared_ptr<MariaDbClient> db_client);

  int Create(const Date& start_date, const std::optional<Date>& end_date, bool active = false);

  std::optional<Season> Find(int season_id) const;
  std::optional<Season> FindActive() const;
  std::vector<Season> ListAll() const;

  std::optional<Season> FindInTx(MYSQL* conn, int season_id, RowLock lock) const;
  std::vector<Season> ListInTx(MYSQL* conn, RowLock lock) const;
  void SetActiveInTx(MYSQL* conn, int season_id, bool active) const;

 private:
  Season BuildSeason(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace ladder
