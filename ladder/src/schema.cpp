/*
 * 설명: players/seasons/matches와 파생 테이블(rating_history, season_snapshots) DDL.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "ladder/schema.hpp"

namespace ladder {
namespace {
const char* const kSchema[] = {
    "CREATE TABLE IF NOT EXISTS players ("
    " id INT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
    " name VARCHAR(64) NOT NULL,"
    " rating INT NOT NULL DEFAULT 1000,"
    " win_count INT NOT NULL DEFAULT 0,"
    " loss_count INT NOT NULL DEFAULT 0,"
    " bonus_given_count INT NOT NULL DEFAULT 0,"
    " bonus_taken_count INT NOT NULL DEFAULT 0"
    ") ENGINE=InnoDB;",

    "CREATE TABLE IF NOT EXISTS seasons ("
    " id INT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
    " start_date DATE NOT NULL,"
    " end_date DATE NULL,"
    " active TINYINT(1) NOT NULL DEFAULT 0"
    ") ENGINE=InnoDB;",

    "CREATE TABLE IF NOT EXISTS matches ("
    " id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
    " winner_id INT NOT NULL,"
    " loser_id INT NOT NULL,"
    " season_id INT NOT NULL,"
    " played_on DATE NOT NULL,"
    " qualifiers TEXT NOT NULL,"
    " created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
    " KEY idx_matches_order (played_on, id),"
    " KEY idx_matches_season (season_id, played_on, id),"
    " KEY idx_matches_winner (winner_id, played_on),"
    " KEY idx_matches_loser (loser_id, played_on),"
    " CONSTRAINT fk_matches_winner FOREIGN KEY (winner_id) REFERENCES players(id),"
    " CONSTRAINT fk_matches_loser FOREIGN KEY (loser_id) REFERENCES players(id),"
    " CONSTRAINT fk_matches_season FOREIGN KEY (season_id) REFERENCES seasons(id)"
    ") ENGINE=InnoDB;",

    "CREATE TABLE IF NOT EXISTS rating_history ("
    " match_id BIGINT NOT NULL,"
    " player_id INT NOT NULL,"
    " rating INT NOT NULL,"
    " PRIMARY KEY (match_id, player_id),"
    " KEY idx_history_player (player_id, match_id),"
    " CONSTRAINT fk_history_match FOREIGN KEY (match_id) REFERENCES matches(id),"
    " CONSTRAINT fk_history_player FOREIGN KEY (player_id) REFERENCES players(id)"
    ") ENGINE=InnoDB;",

    "CREATE TABLE IF NOT EXISTS season_snapshots ("
    " season_id INT NOT NULL,"
    " player_id INT NOT NULL,"
    " rating INT NOT NULL,"
    " win_count INT NOT NULL,"
    " loss_count INT NOT NULL,"
    " PRIMARY KEY (season_id, player_id),"
    " CONSTRAINT fk_snapshot_season FOREIGN KEY (season_id) REFERENCES seasons(id),"
    " CONSTRAINT fk_snapshot_player FOREIGN KEY (player_id) REFERENCES players(id)"
    ") ENGINE=InnoDB;",
};

// 외래 키 의존 순서의 역순.
const char* const kClear[] = {
    "DELETE FROM rating_history;", "DELETE FROM season_snapshots;", "DELETE FROM matches;",
    "DELETE FROM players;",        "DELETE FROM seasons;",
};
}  // namespace

void EnsureSchema(const MariaDbClient& db_client) {
  db_client.WithConnectionRetry([&](MYSQL* conn) {
    for (const char* ddl : kSchema) {
      db_client.Execute(conn, ddl, "스키마 생성 실패");
    }
  });
}

void ClearAll(const MariaDbClient& db_client) {
  db_client.ExecuteTransactionWithRetry([&](MYSQL* conn) {
    for (const char* sql : kClear) {
      db_client.Execute(conn, sql, "테이블 비우기 실패");
    }
    return true;
  });
}

}  // namespace ladder
