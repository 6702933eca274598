/*
 * 설명: 플레이어 카운터 조회/잠금/갱신/일괄 초기화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/ladder_service_it_test.cpp, ladder/tests/it/season_transition_it_test.cpp
 */
#include "ladder/player_store.hpp"

#include <sstream>

#include "ladder/errors.hpp"

namespace ladder {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }

const char* const kPlayerColumns =
    "SELECT id, name, rating, win_count, loss_count, bonus_given_count, bonus_taken_count FROM players";
}  // namespace

PlayerStore::PlayerStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

int PlayerStore::Create(const std::string& name) {
  int player_id = 0;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    player_id = CreateInTx(conn, name);
    return true;
  });
  return player_id;
}

int PlayerStore::CreateInTx(MYSQL* conn, const std::string& name) {
  std::ostringstream oss;
  oss << "INSERT INTO players(name, rating, win_count, loss_count, bonus_given_count, bonus_taken_count) VALUES ('"
      << db_client_->Escape(conn, name) << "', " << kInitialRating << ", 0, 0, 0, 0);";
  db_client_->Execute(conn, oss.str(), "플레이어 생성 실패");
  return static_cast<int>(mysql_insert_id(conn));
}

std::optional<Player> PlayerStore::Find(int player_id) const {
  std::optional<Player> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << kPlayerColumns << " WHERE id=" << player_id << ";";
    db_client_->ForEachRow(conn, oss.str(), "플레이어 조회 실패", [&](MYSQL_ROW row) { result = BuildPlayer(row); });
  });
  return result;
}

std::vector<Player> PlayerStore::ListAll() const {
  std::vector<Player> players;
  db_client_->WithConnectionRetry([&](MYSQL* conn) { players = ListInTx(conn, RowLock::kNone); });
  return players;
}

std::vector<Player> PlayerStore::ListInTx(MYSQL* conn, RowLock lock) const {
  std::vector<Player> players;
  std::ostringstream oss;
  oss << kPlayerColumns << " ORDER BY id ASC" << LockClause(lock) << ";";
  db_client_->ForEachRow(conn, oss.str(), "플레이어 목록 조회 실패",
                         [&](MYSQL_ROW row) { players.push_back(BuildPlayer(row)); });
  return players;
}

std::unordered_set<int> PlayerStore::ListIdsInTx(MYSQL* conn) const {
  std::unordered_set<int> ids;
  db_client_->ForEachRow(conn, "SELECT id FROM players;", "플레이어 ID 조회 실패",
                         [&](MYSQL_ROW row) { ids.insert(ToInt(row[0])); });
  return ids;
}

std::unordered_map<int, Player> PlayerStore::LockPairInTx(MYSQL* conn, int first_id, int second_id) const {
  std::ostringstream oss;
  oss << kPlayerColumns << " WHERE id IN (" << first_id << "," << second_id << ") ORDER BY id FOR UPDATE;";
  std::unordered_map<int, Player> current;
  db_client_->ForEachRow(conn, oss.str(), "플레이어 잠금 조회 실패", [&](MYSQL_ROW row) {
    Player player = BuildPlayer(row);
    current[player.id] = player;
  });
  if (current.count(first_id) == 0 || current.count(second_id) == 0) {
    throw LadderException(LadderErrorCode::kUnknownReference,
                          "플레이어 조회 중 누락: " + std::to_string(first_id) + ", " + std::to_string(second_id));
  }
  return current;
}

void PlayerStore::SaveCountersInTx(MYSQL* conn, int player_id, const SeasonCounters& counters) const {
  std::ostringstream oss;
  oss << "UPDATE players SET rating=" << counters.rating << ", win_count=" << counters.wins
      << ", loss_count=" << counters.losses << ", bonus_given_count=" << counters.bonus_given
      << ", bonus_taken_count=" << counters.bonus_taken << " WHERE id=" << player_id << ";";
  db_client_->Execute(conn, oss.str(), "플레이어 카운터 갱신 실패");
}

std::size_t PlayerStore::ResetAllInTx(MYSQL* conn) const {
  std::ostringstream oss;
  oss << "UPDATE players SET rating=" << kInitialRating
      << ", win_count=0, loss_count=0, bonus_given_count=0, bonus_taken_count=0;";
  db_client_->Execute(conn, oss.str(), "플레이어 시즌 초기화 실패");
  return static_cast<std::size_t>(mysql_affected_rows(conn));
}

Player PlayerStore::BuildPlayer(MYSQL_ROW row) const {
  Player player;
  player.id = ToInt(row[0]);
  player.name = row[1] ? row[1] : "";
  player.counters = SeasonCounters{ToInt(row[2]), ToInt(row[3]), ToInt(row[4]), ToInt(row[5]), ToInt(row[6])};
  return player;
}

}  // namespace ladder
