#include <cstdlib>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <mariadb/mysql.h>

#include "ladder/errors.hpp"
#include "ladder/ladder_service.hpp"
#include "ladder/schema.hpp"

namespace {

ladder::DbConfig TestDbConfig() {
  ladder::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "app_db";
  return cfg;
}

MYSQL* OpenRawConnection(const ladder::DbConfig& cfg) {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    return nullptr;
  }
  if (!mysql_real_connect(conn, cfg.host.c_str(), cfg.user.c_str(), cfg.password.c_str(), cfg.database.c_str(), cfg.port,
                          nullptr, 0)) {
    mysql_close(conn);
    return nullptr;
  }
  return conn;
}

// 파생 테이블 INSERT를 서버 측에서 실패시켜 삭제 이후 단계의 롤백을 확인한다.
constexpr const char* kFailingTriggers[] = {"ladder_it_fail_history", "ladder_it_fail_snapshots"};

void DropFailingTriggers(MYSQL* conn) {
  for (const char* name : kFailingTriggers) {
    std::string sql = std::string("DROP TRIGGER IF EXISTS ") + name + ";";
    mysql_query(conn, sql.c_str());
  }
}

struct LiveState {
  ladder::SeasonCounters alpha;
  ladder::SeasonCounters beta;
};

class ReplayItTest : public ::testing::Test {
 protected:
  void SetUp() override {
    db_client_ = std::make_shared<ladder::MariaDbClient>(TestDbConfig());
    ladder::EnsureSchema(*db_client_);
    ladder::ClearAll(*db_client_);
    observability_ = std::make_shared<ladder::Observability>(ladder::LogLevel::kInfo, log_);
    service_ = std::make_shared<ladder::LadderService>(db_client_, observability_, std::chrono::seconds(1));
    derived_ = service_->GetDerivedRepository();
    today_ = ladder::TodayUtc();
    MYSQL* raw = OpenRawConnection(TestDbConfig());
    ASSERT_NE(raw, nullptr);
    DropFailingTriggers(raw);
    mysql_close(raw);
  }

  void TearDown() override {
    MYSQL* raw = OpenRawConnection(TestDbConfig());
    if (raw) {
      DropFailingTriggers(raw);
      mysql_close(raw);
    }
  }

  void InstallFailingTrigger(const std::string& name, const std::string& table) {
    MYSQL* raw = OpenRawConnection(TestDbConfig());
    ASSERT_NE(raw, nullptr);
    std::string sql = "CREATE TRIGGER " + name + " BEFORE INSERT ON " + table +
                      " FOR EACH ROW SIGNAL SQLSTATE '45000' SET MESSAGE_TEXT = 'derived insert refused';";
    int rc = mysql_query(raw, sql.c_str());
    std::string error = rc != 0 ? mysql_error(raw) : "";
    mysql_close(raw);
    ASSERT_EQ(rc, 0) << error;
  }

  void ExpectPartialReplayFailure(const std::function<void()>& replay) {
    try {
      replay();
      FAIL() << "재계산 실패가 전파되지 않음";
    } catch (const ladder::LadderException& ex) {
      EXPECT_EQ(ex.code, ladder::LadderErrorCode::kPartialReplayFailure) << ex.what();
    }
  }

  // 시즌 1에 A가 B를 두 번 이기고, 시즌 전이(초기화) 후 시즌 2에 한 번 더 이긴다.
  void PlayTwoSeasons() {
    ladder::Date season_one_start = ladder::AddDays(today_, -30);
    season_one_ = service_->GetSeasonRepository()->Create(season_one_start, ladder::AddDays(today_, -1), true);
    season_two_ = service_->CreateSeason(today_, std::nullopt);
    alpha_ = service_->RegisterPlayer("alpha");
    beta_ = service_->RegisterPlayer("beta");

    match_ids_.push_back(Play(season_one_, ladder::AddDays(season_one_start, 1)));
    match_ids_.push_back(Play(season_one_, ladder::AddDays(season_one_start, 2)));
    season_one_state_ = Current();

    auto transition = service_->RunSeasonTransition(today_);
    ASSERT_EQ(transition.status, ladder::TransitionStatus::kActivated);

    match_ids_.push_back(Play(season_two_, ladder::AddDays(today_, 1)));
    season_two_state_ = Current();
  }

  std::int64_t Play(int season_id, ladder::Date day) {
    ladder::NewMatch match;
    match.winner_id = alpha_;
    match.loser_id = beta_;
    match.season_id = season_id;
    match.played_on = day;
    auto recorded = service_->RecordMatch(match);
    live_ratings_.push_back({recorded.winner.rating, recorded.loser.rating});
    return recorded.match.id;
  }

  LiveState Current() const {
    return LiveState{service_->GetPlayerStore()->Find(alpha_)->counters,
                     service_->GetPlayerStore()->Find(beta_)->counters};
  }

  void ExpectSnapshot(int season_id, int player_id, const ladder::SeasonCounters& counters) {
    auto snapshot = derived_->FindSnapshot(season_id, player_id);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->rating, counters.rating);
    EXPECT_EQ(snapshot->wins, counters.wins);
    EXPECT_EQ(snapshot->losses, counters.losses);
  }

  std::ostringstream log_;
  std::shared_ptr<ladder::MariaDbClient> db_client_;
  std::shared_ptr<ladder::Observability> observability_;
  std::shared_ptr<ladder::LadderService> service_;
  std::shared_ptr<ladder::DerivedRepository> derived_;
  ladder::Date today_;
  int season_one_{0};
  int season_two_{0};
  int alpha_{0};
  int beta_{0};
  std::vector<std::int64_t> match_ids_;
  std::vector<std::pair<int, int>> live_ratings_;
  LiveState season_one_state_;
  LiveState season_two_state_;
};

TEST_F(ReplayItTest, RatingHistoryRebuiltFromMatchLog) {
  PlayTwoSeasons();
  derived_->DeleteAllHistory();
  ASSERT_TRUE(derived_->ListHistory().empty());

  auto result = service_->ReplayRatingHistory();

  EXPECT_EQ(result.matches_scanned, 3u);
  EXPECT_EQ(result.rows_written, 6u);
  EXPECT_EQ(derived_->ListHistory().size(), 6u);
  for (std::size_t i = 0; i < match_ids_.size(); ++i) {
    auto winner = derived_->FindHistory(match_ids_[i], alpha_);
    auto loser = derived_->FindHistory(match_ids_[i], beta_);
    ASSERT_TRUE(winner.has_value());
    ASSERT_TRUE(loser.has_value());
    EXPECT_EQ(winner->rating, live_ratings_[i].first);
    EXPECT_EQ(loser->rating, live_ratings_[i].second);
  }
  EXPECT_EQ(live_ratings_[2], (std::pair<int, int>{1016, 984}));
}

TEST_F(ReplayItTest, RatingHistoryReplayMatchesLiveRowsAndIsIdempotent) {
  PlayTwoSeasons();
  auto live = derived_->ListHistory();

  service_->ReplayRatingHistory();
  auto first = derived_->ListHistory();
  auto second_result = service_->ReplayRatingHistory();
  auto second = derived_->ListHistory();

  EXPECT_EQ(first, live);
  EXPECT_EQ(second, first);
  EXPECT_EQ(second_result.rows_deleted, 6u);
  EXPECT_EQ(observability_->Snapshot().replays_completed, 2u);
}

TEST_F(ReplayItTest, SeasonSnapshotsHoldLastStatePerSeason) {
  PlayTwoSeasons();

  auto result = service_->ReplaySeasonSnapshots();

  EXPECT_EQ(result.rows_written, 4u);
  EXPECT_EQ(derived_->ListSnapshots().size(), 4u);
  ExpectSnapshot(season_one_, alpha_, season_one_state_.alpha);
  ExpectSnapshot(season_one_, beta_, season_one_state_.beta);
  ExpectSnapshot(season_two_, alpha_, season_two_state_.alpha);
  ExpectSnapshot(season_two_, beta_, season_two_state_.beta);
  EXPECT_EQ(season_one_state_.alpha.wins, 2);
  EXPECT_EQ(season_one_state_.beta.losses, 2);
}

TEST_F(ReplayItTest, SeasonSnapshotReplayIsIdempotent) {
  PlayTwoSeasons();
  service_->ReplaySeasonSnapshots();
  auto first = derived_->ListSnapshots();
  service_->ReplaySeasonSnapshots();
  EXPECT_EQ(derived_->ListSnapshots(), first);
  EXPECT_FALSE(derived_->FindSnapshot(season_one_ + 1000, alpha_).has_value());
}

TEST_F(ReplayItTest, UnknownSeasonAbortsReplayAndKeepsExistingRows) {
  PlayTwoSeasons();
  auto live = derived_->ListHistory();

  MYSQL* raw = OpenRawConnection(TestDbConfig());
  ASSERT_NE(raw, nullptr);
  ASSERT_EQ(mysql_query(raw, "SET FOREIGN_KEY_CHECKS=0;"), 0);
  std::ostringstream insert;
  insert << "INSERT INTO matches(winner_id, loser_id, season_id, played_on, qualifiers) VALUES (" << alpha_ << ", "
         << beta_ << ", 999999, '" << ladder::FormatDate(ladder::AddDays(today_, 2)) << "', '{}');";
  ASSERT_EQ(mysql_query(raw, insert.str().c_str()), 0);
  mysql_close(raw);

  try {
    service_->ReplayRatingHistory();
    FAIL() << "알 수 없는 시즌 참조가 통과됨";
  } catch (const ladder::LadderException& ex) {
    EXPECT_EQ(ex.code, ladder::LadderErrorCode::kUnknownReference);
  }
  EXPECT_EQ(derived_->ListHistory(), live);
  EXPECT_EQ(observability_->Snapshot().replay_failures, 1u);

  MYSQL* cleanup = OpenRawConnection(TestDbConfig());
  ASSERT_NE(cleanup, nullptr);
  mysql_query(cleanup, "DELETE FROM matches WHERE season_id=999999;");
  mysql_close(cleanup);
}

TEST_F(ReplayItTest, StorageFailureIsReportedAsPartialReplayFailure) {
  PlayTwoSeasons();
  service_->ReplaySeasonSnapshots();
  auto before = derived_->ListSnapshots();

  db_client_->SetTransientInjector([](std::size_t) { return true; });
  try {
    service_->ReplaySeasonSnapshots();
    FAIL() << "저장소 오류가 전파되지 않음";
  } catch (const ladder::LadderException& ex) {
    EXPECT_EQ(ex.code, ladder::LadderErrorCode::kPartialReplayFailure);
  }
  db_client_->SetTransientInjector(nullptr);
  EXPECT_EQ(derived_->ListSnapshots(), before);
}

TEST_F(ReplayItTest, HistoryInsertFailureAfterDeleteRestoresPreviousRows) {
  PlayTwoSeasons();
  auto before = derived_->ListHistory();
  ASSERT_EQ(before.size(), 6u);
  InstallFailingTrigger(kFailingTriggers[0], "rating_history");

  ExpectPartialReplayFailure([this]() { service_->ReplayRatingHistory(); });

  EXPECT_EQ(derived_->ListHistory(), before);
  EXPECT_EQ(observability_->Snapshot().replay_failures, 1u);
  EXPECT_NE(log_.str().find("rating_history_replay_failed"), std::string::npos);
}

TEST_F(ReplayItTest, SnapshotInsertFailureAfterDeleteRestoresPreviousRows) {
  PlayTwoSeasons();
  service_->ReplaySeasonSnapshots();
  auto before = derived_->ListSnapshots();
  ASSERT_EQ(before.size(), 4u);
  InstallFailingTrigger(kFailingTriggers[1], "season_snapshots");

  ExpectPartialReplayFailure([this]() { service_->ReplaySeasonSnapshots(); });

  EXPECT_EQ(derived_->ListSnapshots(), before);
}

TEST_F(ReplayItTest, ReplayRefusesToRunWhileAnotherHoldsTheLock) {
  PlayTwoSeasons();
  MYSQL* holder = OpenRawConnection(TestDbConfig());
  ASSERT_NE(holder, nullptr);
  ASSERT_EQ(mysql_query(holder, "SELECT GET_LOCK('ladder_replay', 0);"), 0);
  MYSQL_RES* res = mysql_store_result(holder);
  ASSERT_NE(res, nullptr);
  mysql_free_result(res);

  try {
    service_->ReplayRatingHistory();
    FAIL() << "재계산 잠금이 무시됨";
  } catch (const ladder::LadderException& ex) {
    EXPECT_EQ(ex.code, ladder::LadderErrorCode::kReplayBusy);
  }
  mysql_close(holder);
  EXPECT_NO_THROW(service_->ReplayRatingHistory());
}

TEST_F(ReplayItTest, AuditDetectsTamperedCounters) {
  PlayTwoSeasons();
  EXPECT_TRUE(service_->AuditActiveSeason().empty());

  MYSQL* raw = OpenRawConnection(TestDbConfig());
  ASSERT_NE(raw, nullptr);
  std::ostringstream update;
  update << "UPDATE players SET rating=1200 WHERE id=" << beta_ << ";";
  ASSERT_EQ(mysql_query(raw, update.str().c_str()), 0);
  mysql_close(raw);

  auto drifts = service_->AuditActiveSeason();
  ASSERT_EQ(drifts.size(), 1u);
  EXPECT_EQ(drifts[0].player_id, beta_);
  EXPECT_EQ(drifts[0].live.rating, 1200);
  EXPECT_EQ(drifts[0].replayed.rating, season_two_state_.beta.rating);
}

}  // namespace
