/*
 * 설명: 재생성 가능한 파생 테이블(rating_history, season_snapshots)을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/replay_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <mariadb/mysql.h>

#include "ladder/db_client.hpp"
#include "ladder/types.hpp"

namespace ladder {

class DerivedRepository {
 public:
  explicit DerivedRepository(std::shared_ptr<MariaDbClient> db_client);

  void InsertHistoryInTx(MYSQL* conn, const std::vector<RatingHistoryEntry>& entries) const;
  std::size_t DeleteAllHistoryInTx(MYSQL* conn) const;
  void DeleteAllHistory() const;
  std::vector<RatingHistoryEntry> ListHistory() const;
  std::optional<RatingHistoryEntry> FindHistory(std::int64_t match_id, int player_id) const;

  void InsertSnapshotsInTx(MYSQL* conn, const std::vector<SeasonSnapshot>& snapshots) const;
  std::size_t DeleteAllSnapshotsInTx(MYSQL* conn) const;
  std::vector<SeasonSnapshot> ListSnapshots() const;
  std::optional<SeasonSnapshot> FindSnapshot(int season_id, int player_id) const;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace ladder
