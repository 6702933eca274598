/*
 * 설명: 매치 로그 추가와 필터 조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/ladder_service_it_test.cpp, ladder/tests/it/replay_it_test.cpp
 */
#include "ladder/match_repository.hpp"

#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "ladder/errors.hpp"

namespace ladder {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
std::int64_t ToInt64(const char* value) { return value ? std::stoll(value) : 0; }
}  // namespace

MatchRepository::MatchRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

std::int64_t MatchRepository::AppendInTx(MYSQL* conn, const NewMatch& match) const {
  nlohmann::json qualifiers = match.qualifiers;
  std::ostringstream oss;
  oss << "INSERT INTO matches(winner_id, loser_id, season_id, played_on, qualifiers) VALUES (" << match.winner_id
      << ", " << match.loser_id << ", " << match.season_id << ", '" << FormatDate(match.played_on) << "', '"
      << db_client_->Escape(conn, qualifiers.dump()) << "');";
  db_client_->Execute(conn, oss.str(), "매치 저장 실패");
  return static_cast<std::int64_t>(mysql_insert_id(conn));
}

std::vector<MatchRecord> MatchRepository::List(const MatchFilter& filter) const {
  std::vector<MatchRecord> records;
  db_client_->WithConnectionRetry([&](MYSQL* conn) { records = ListInTx(conn, filter, RowLock::kNone); });
  return records;
}

std::vector<MatchRecord> MatchRepository::ListInTx(MYSQL* conn, const MatchFilter& filter, RowLock lock) const {
  std::ostringstream oss;
  oss << "SELECT id, winner_id, loser_id, season_id, played_on, qualifiers FROM matches WHERE 1=1";
  if (filter.season_id) {
    oss << " AND season_id=" << *filter.season_id;
  }
  if (filter.from) {
    oss << " AND played_on >= '" << FormatDate(*filter.from) << "'";
  }
  if (filter.until) {
    oss << " AND played_on <= '" << FormatDate(*filter.until) << "'";
  }
  oss << " ORDER BY played_on ASC, id ASC" << LockClause(lock) << ";";

  std::vector<MatchRecord> records;
  db_client_->ForEachRow(conn, oss.str(), "매치 로그 조회 실패",
                         [&](MYSQL_ROW row) { records.push_back(BuildRecord(row)); });
  return records;
}

std::optional<Date> MatchRepository::LatestDateForPlayerInTx(MYSQL* conn, int player_id) const {
  std::optional<Date> latest;
  std::ostringstream oss;
  oss << "SELECT MAX(played_on) FROM matches WHERE winner_id=" << player_id << " OR loser_id=" << player_id << ";";
  db_client_->ForEachRow(conn, oss.str(), "최근 매치 날짜 조회 실패", [&](MYSQL_ROW row) {
    if (row[0]) {
      latest = ParseDate(row[0]);
    }
  });
  return latest;
}

std::size_t MatchRepository::Count() const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->ForEachRow(conn, "SELECT COUNT(*) FROM matches;", "매치 카운트 실패", [&](MYSQL_ROW row) {
      if (row[0]) {
        count = static_cast<std::size_t>(std::stoull(row[0]));
      }
    });
  });
  return count;
}

MatchRecord MatchRepository::BuildRecord(MYSQL_ROW row) const {
  MatchRecord record;
  record.id = ToInt64(row[0]);
  record.winner_id = ToInt(row[1]);
  record.loser_id = ToInt(row[2]);
  record.season_id = ToInt(row[3]);
  record.played_on = ParseDate(row[4] ? row[4] : "");
  try {
    record.qualifiers = nlohmann::json::parse(row[5] ? row[5] : "{}").get<MatchQualifiers>();
  } catch (const nlohmann::json::exception& ex) {
    throw LadderException(LadderErrorCode::kInvalidMatch,
                          "매치 #" + std::to_string(record.id) + " 부가 플래그 해석 실패: " + ex.what());
  }
  return record;
}

}  // namespace ladder
