/*
 * 설명: 시즌 전이 스케줄 루프와 일회성 재계산 작업 실행을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/ladder_app_it_test.cpp
 */
#include "ladder/app.hpp"

#include <chrono>
#include <csignal>
#include <iostream>

#include "ladder/errors.hpp"
#include "ladder/schema.hpp"

namespace ladder {

LadderApp::LadderApp(const LadderConfig& config)
    : config_(config), ioc_(1), transition_timer_(ioc_), signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  db_client_ = std::make_shared<MariaDbClient>(config.ToDbConfig());
  service_ = std::make_shared<LadderService>(db_client_, observability_,
                                             std::chrono::seconds(config.replay_lock_timeout_seconds));
}

LadderApp::~LadderApp() { Stop(); }

void LadderApp::Run() {
  EnsureSchema(*db_client_);
  running_ = true;
  signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    observability_->Log(LogContext{observability_->NextTraceId(), "shutdown_signal", LogLevel::kInfo, 0,
                                   nlohmann::json{{"signal", signal_number}}});
    Stop();
  });
  ScheduleTransition(std::chrono::seconds(0));
  observability_->Log(LogContext{observability_->NextTraceId(), "ladder_started", LogLevel::kInfo, 0,
                                 nlohmann::json{{"intervalSeconds", config_.season_transition_interval_seconds}}});
  ioc_.run();
}

void LadderApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  // io_context::stop은 다른 스레드에서 호출해도 안전하며 대기 중인 타이머/시그널 핸들러는 버려진다.
  ioc_.stop();
}

void LadderApp::ScheduleTransition(std::chrono::seconds delay) {
  transition_timer_.expires_after(delay);
  transition_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || !running_) {
      return;
    }
    RunTransitionOnce();
    ScheduleTransition(std::chrono::seconds(config_.season_transition_interval_seconds));
  });
}

// 실패는 LadderService가 이미 error 레벨로 기록했으므로 다음 주기에 다시 시도한다.
void LadderApp::RunTransitionOnce() {
  try {
    service_->RunSeasonTransition();
  } catch (const LadderException& ex) {
    observability_->Log(LogContext{observability_->NextTraceId(), "season_transition_job_failed", LogLevel::kError, 0,
                                   nlohmann::json{{"code", ToString(ex.code)}, {"error", ex.what()}}});
  } catch (const DbException& ex) {
    observability_->Log(LogContext{observability_->NextTraceId(), "season_transition_job_failed", LogLevel::kError, 0,
                                   nlohmann::json{{"dbCode", ex.code}, {"error", ex.what()}}});
  }
}

int LadderApp::RunJob(const std::string& job) {
  EnsureSchema(*db_client_);
  if (job == "transition") {
    service_->RunSeasonTransition();
    return 0;
  }
  if (job == "replay-history") {
    service_->ReplayRatingHistory();
    return 0;
  }
  if (job == "replay-snapshots") {
    service_->ReplaySeasonSnapshots();
    return 0;
  }
  if (job == "audit") {
    return service_->AuditActiveSeason().empty() ? 0 : 3;
  }
  std::cerr << "알 수 없는 작업: " << job << "\n";
  return 2;
}

}  // namespace ladder
