/*
 * 설명: 시즌 조회/생성/활성 플래그 갱신을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/season_transition_it_test.cpp
 */
#include "ladder/season_repository.hpp"

#include <sstream>

namespace ladder {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }

const char* const kSeasonColumns = "SELECT id, start_date, end_date, active FROM seasons";
}  // namespace

SeasonRepository::SeasonRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

int SeasonRepository::Create(const Date& start_date, const std::optional<Date>& end_date, bool active) {
  int season_id = 0;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO seasons(start_date, end_date, active) VALUES ('" << FormatDate(start_date) << "', ";
    if (end_date) {
      oss << "'" << FormatDate(*end_date) << "'";
    } else {
      oss << "NULL";
    }
    oss << ", " << (active ? 1 : 0) << ");";
    db_client_->Execute(conn, oss.str(), "시즌 생성 실패");
    season_id = static_cast<int>(mysql_insert_id(conn));
    return true;
  });
  return season_id;
}

std::optional<Season> SeasonRepository::Find(int season_id) const {
  std::optional<Season> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) { result = FindInTx(conn, season_id, RowLock::kNone); });
  return result;
}

std::optional<Season> SeasonRepository::FindActive() const {
  std::optional<Season> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::string sql = std::string(kSeasonColumns) + " WHERE active=1 ORDER BY id ASC LIMIT 1;";
    db_client_->ForEachRow(conn, sql, "활성 시즌 조회 실패", [&](MYSQL_ROW row) { result = BuildSeason(row); });
  });
  return result;
}

std::vector<Season> SeasonRepository::ListAll() const {
  std::vector<Season> seasons;
  db_client_->WithConnectionRetry([&](MYSQL* conn) { seasons = ListInTx(conn, RowLock::kNone); });
  return seasons;
}

std::optional<Season> SeasonRepository::FindInTx(MYSQL* conn, int season_id, RowLock lock) const {
  std::optional<Season> result;
  std::ostringstream oss;
  oss << kSeasonColumns << " WHERE id=" << season_id << LockClause(lock) << ";";
  db_client_->ForEachRow(conn, oss.str(), "시즌 조회 실패", [&](MYSQL_ROW row) { result = BuildSeason(row); });
  return result;
}

std::vector<Season> SeasonRepository::ListInTx(MYSQL* conn, RowLock lock) const {
  std::vector<Season> seasons;
  std::ostringstream oss;
  oss << kSeasonColumns << " ORDER BY start_date ASC, id ASC" << LockClause(lock) << ";";
  db_client_->ForEachRow(conn, oss.str(), "시즌 목록 조회 실패",
                         [&](MYSQL_ROW row) { seasons.push_back(BuildSeason(row)); });
  return seasons;
}

void SeasonRepository::SetActiveInTx(MYSQL* conn, int season_id, bool active) const {
  std::ostringstream oss;
  oss << "UPDATE seasons SET active=" << (active ? 1 : 0) << " WHERE id=" << season_id << ";";
  db_client_->Execute(conn, oss.str(), "시즌 활성 상태 갱신 실패");
}

Season SeasonRepository::BuildSeason(MYSQL_ROW row) const {
  Season season;
  season.id = ToInt(row[0]);
  season.start_date = ParseDate(row[1] ? row[1] : "");
  if (row[2]) {
    season.end_date = ParseDate(row[2]);
  }
  season.active = ToInt(row[3]) != 0;
  return season;
}

}  // namespace ladder
