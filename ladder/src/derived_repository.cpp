/*
 * 설명: 레이팅 이력/시즌 스냅샷의 일괄 삽입, 삭제, 조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/replay_it_test.cpp
 */
#include "ladder/derived_repository.hpp"

#include <algorithm>
#include <sstream>
#include <string>

namespace ladder {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
std::int64_t ToInt64(const char* value) { return value ? std::stoll(value) : 0; }

// 한 INSERT 문에 담는 최대 행 수.
constexpr std::size_t kInsertBatch = 500;

RatingHistoryEntry BuildHistory(MYSQL_ROW row) {
  return RatingHistoryEntry{ToInt64(row[0]), ToInt(row[1]), ToInt(row[2])};
}

SeasonSnapshot BuildSnapshot(MYSQL_ROW row) {
  return SeasonSnapshot{ToInt(row[0]), ToInt(row[1]), ToInt(row[2]), ToInt(row[3]), ToInt(row[4])};
}
}  // namespace

DerivedRepository::DerivedRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void DerivedRepository::InsertHistoryInTx(MYSQL* conn, const std::vector<RatingHistoryEntry>& entries) const {
  for (std::size_t begin = 0; begin < entries.size(); begin += kInsertBatch) {
    std::ostringstream oss;
    oss << "INSERT INTO rating_history(match_id, player_id, rating) VALUES ";
    std::size_t end = std::min(entries.size(), begin + kInsertBatch);
    for (std::size_t i = begin; i < end; ++i) {
      if (i > begin) {
        oss << ", ";
      }
      oss << "(" << entries[i].match_id << ", " << entries[i].player_id << ", " << entries[i].rating << ")";
    }
    oss << ";";
    db_client_->Execute(conn, oss.str(), "레이팅 이력 저장 실패");
  }
}

std::size_t DerivedRepository::DeleteAllHistoryInTx(MYSQL* conn) const {
  db_client_->Execute(conn, "DELETE FROM rating_history;", "레이팅 이력 삭제 실패");
  return static_cast<std::size_t>(mysql_affected_rows(conn));
}

void DerivedRepository::DeleteAllHistory() const {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    DeleteAllHistoryInTx(conn);
    return true;
  });
}

std::vector<RatingHistoryEntry> DerivedRepository::ListHistory() const {
  std::vector<RatingHistoryEntry> entries;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    entries.clear();
    db_client_->ForEachRow(conn, "SELECT match_id, player_id, rating FROM rating_history ORDER BY match_id, player_id;",
                           "레이팅 이력 조회 실패", [&](MYSQL_ROW row) { entries.push_back(BuildHistory(row)); });
  });
  return entries;
}

std::optional<RatingHistoryEntry> DerivedRepository::FindHistory(std::int64_t match_id, int player_id) const {
  std::optional<RatingHistoryEntry> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT match_id, player_id, rating FROM rating_history WHERE match_id=" << match_id
        << " AND player_id=" << player_id << ";";
    db_client_->ForEachRow(conn, oss.str(), "레이팅 이력 조회 실패", [&](MYSQL_ROW row) { result = BuildHistory(row); });
  });
  return result;
}

void DerivedRepository::InsertSnapshotsInTx(MYSQL* conn, const std::vector<SeasonSnapshot>& snapshots) const {
  for (std::size_t begin = 0; begin < snapshots.size(); begin += kInsertBatch) {
    std::ostringstream oss;
    oss << "INSERT INTO season_snapshots(season_id, player_id, rating, win_count, loss_count) VALUES ";
    std::size_t end = std::min(snapshots.size(), begin + kInsertBatch);
    for (std::size_t i = begin; i < end; ++i) {
      const auto& s = snapshots[i];
      if (i > begin) {
        oss << ", ";
      }
      oss << "(" << s.season_id << ", " << s.player_id << ", " << s.rating << ", " << s.wins << ", " << s.losses
          << ")";
    }
    oss << " ON DUPLICATE KEY UPDATE rating=VALUES(rating), win_count=VALUES(win_count), "
           "loss_count=VALUES(loss_count);";
    db_client_->Execute(conn, oss.str(), "시즌 스냅샷 저장 실패");
  }
}

std::size_t DerivedRepository::DeleteAllSnapshotsInTx(MYSQL* conn) const {
  db_client_->Execute(conn, "DELETE FROM season_snapshots;", "시즌 스냅샷 삭제 실패");
  return static_cast<std::size_t>(mysql_affected_rows(conn));
}

std::vector<SeasonSnapshot> DerivedRepository::ListSnapshots() const {
  std::vector<SeasonSnapshot> snapshots;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    snapshots.clear();
    db_client_->ForEachRow(conn,
                           "SELECT season_id, player_id, rating, win_count, loss_count FROM season_snapshots "
                           "ORDER BY season_id, player_id;",
                           "시즌 스냅샷 조회 실패", [&](MYSQL_ROW row) { snapshots.push_back(BuildSnapshot(row)); });
  });
  return snapshots;
}

std::optional<SeasonSnapshot> DerivedRepository::FindSnapshot(int season_id, int player_id) const {
  std::optional<SeasonSnapshot> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT season_id, player_id, rating, win_count, loss_count FROM season_snapshots WHERE season_id="
        << season_id << " AND player_id=" << player_id << ";";
    db_client_->ForEachRow(conn, oss.str(), "시즌 스냅샷 조회 실패", [&](MYSQL_ROW row) { result = BuildSnapshot(row); });
  });
  return result;
}

}  // namespace ladder
