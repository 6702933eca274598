/*
 * 설명: 래더 프로세스 수명주기와 주기적 시즌 전이 타이머를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/ladder_app_it_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "ladder/config.hpp"
#include "ladder/db_client.hpp"
#include "ladder/ladder_service.hpp"
#include "ladder/observability.hpp"

namespace ladder {

class LadderApp {
 public:
  explicit LadderApp(const LadderConfig& config);
  ~LadderApp();

  // 즉시 한 번, 이후 설정 주기마다 시즌 전이를 실행한다. SIGINT/SIGTERM 또는 Stop()까지 블록한다.
  void Run();
  void Stop();

  // transition | replay-history | replay-snapshots | audit 중 하나를 실행하고 종료 코드를 반환한다.
  int RunJob(const std::string& job);

  boost::asio::io_context& GetContext() { return ioc_; }
  std::shared_ptr<LadderService> GetService() { return service_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void ScheduleTransition(std::chrono::seconds delay);
  void RunTransitionOnce();

  LadderConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::steady_timer transition_timer_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<LadderService> service_;
  std::atomic<bool> running_{false};
};

}  // namespace ladder
