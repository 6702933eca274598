#include <chrono>
#include <cstdlib>
#include <thread>

#include <gtest/gtest.h>

#include "ladder/app.hpp"
#include "ladder/date.hpp"
#include "ladder/schema.hpp"

namespace {

ladder::LadderConfig TestLadderConfig() {
  ladder::LadderConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.db_host = host ? host : "127.0.0.1";
  cfg.db_port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.db_user = user ? user : "app";
  cfg.db_password = pass ? pass : "app_pass";
  cfg.db_name = name ? name : "app_db";
  cfg.log_level = "warn";
  cfg.season_transition_interval_seconds = 3600;
  cfg.replay_lock_timeout_seconds = 1;
  return cfg;
}

class LadderAppItTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ladder::MariaDbClient client(TestLadderConfig().ToDbConfig());
    ladder::EnsureSchema(client);
    ladder::ClearAll(client);
  }
};

TEST_F(LadderAppItTest, RunActivatesSeasonOnStartupAndStops) {
  ladder::LadderApp app(TestLadderConfig());
  int season = app.GetService()->CreateSeason(ladder::TodayUtc(), std::nullopt);

  std::thread runner([&app]() { app.Run(); });

  bool activated = false;
  for (int i = 0; i < 100 && !activated; ++i) {
    auto current = app.GetService()->GetSeasonRepository()->Find(season);
    activated = current && current->active;
    if (!activated) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  }

  app.Stop();
  runner.join();
  EXPECT_TRUE(activated);
  EXPECT_EQ(app.GetObservability()->Snapshot().seasons_activated, 1u);
}

TEST_F(LadderAppItTest, RunJobDispatchesByName) {
  ladder::LadderApp app(TestLadderConfig());
  app.GetService()->CreateSeason(ladder::TodayUtc(), std::nullopt);

  EXPECT_EQ(app.RunJob("transition"), 0);
  EXPECT_EQ(app.RunJob("replay-history"), 0);
  EXPECT_EQ(app.RunJob("replay-snapshots"), 0);
  EXPECT_EQ(app.RunJob("audit"), 0);
  EXPECT_EQ(app.RunJob("bogus"), 2);
  EXPECT_EQ(app.GetObservability()->Snapshot().replays_completed, 2u);
}

}  // namespace
