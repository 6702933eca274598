/*
 * 설명: 시즌 만료 → 활성화 순서의 전이 계획을 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/season_state_test.cpp
 */
#include "ladder/season_state.hpp"

#include <sstream>

#include "ladder/errors.hpp"

namespace ladder {
namespace {
std::string JoinIds(const std::vector<int>& ids) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) {
      oss << ",";
    }
    oss << ids[i];
  }
  return oss.str();
}
}  // namespace

const char* ToString(TransitionStatus status) {
  switch (status) {
    case TransitionStatus::kUnchanged:
      return "unchanged";
    case TransitionStatus::kActivated:
      return "activated";
    case TransitionStatus::kNoSeasonInWindow:
      return "no_season_in_window";
  }
  return "unknown";
}

SeasonPhase PhaseOn(const Season& season, const Date& today) {
  if (season.HasEndedBefore(today)) {
    return SeasonPhase::kExpired;
  }
  if (today < season.start_date) {
    return SeasonPhase::kPending;
  }
  return SeasonPhase::kActive;
}

SeasonTransitionPlan PlanSeasonTransition(const std::vector<Season>& seasons, const Date& today) {
  SeasonTransitionPlan plan;
  std::vector<int> still_active;
  std::vector<int> in_window;
  for (const auto& season : seasons) {
    switch (PhaseOn(season, today)) {
      case SeasonPhase::kExpired:
        if (season.active) {
          plan.expire_ids.push_back(season.id);
        }
        break;
      case SeasonPhase::kActive:
        in_window.push_back(season.id);
        if (season.active) {
          still_active.push_back(season.id);
        }
        break;
      case SeasonPhase::kPending:
        // 시작 전인데 active인 시즌은 아래 모순 검사에서 걸러진다.
        if (season.active) {
          still_active.push_back(season.id);
        }
        break;
    }
  }

  if (in_window.size() > 1) {
    throw LadderException(LadderErrorCode::kConfigurationInconsistency,
                          FormatDate(today) + "를 포함하는 시즌이 여러 개: " + JoinIds(in_window));
  }
  if (still_active.size() > 1) {
    throw LadderException(LadderErrorCode::kConfigurationInconsistency,
                          "활성 시즌이 여러 개: " + JoinIds(still_active));
  }
  if (in_window.empty()) {
    if (!still_active.empty()) {
      throw LadderException(LadderErrorCode::kConfigurationInconsistency,
                            "활성 시즌 " + JoinIds(still_active) + "의 기간이 " + FormatDate(today) + "를 포함하지 않음");
    }
    plan.status = TransitionStatus::kNoSeasonInWindow;
    return plan;
  }

  int current = in_window.front();
  if (!still_active.empty() && still_active.front() != current) {
    throw LadderException(LadderErrorCode::kConfigurationInconsistency,
                          "활성 시즌 " + JoinIds(still_active) + "과 기간상 현재 시즌 " + std::to_string(current) +
                              "이 다름");
  }
  if (!still_active.empty()) {
    plan.status = TransitionStatus::kUnchanged;
    return plan;
  }
  plan.activate_id = current;
  plan.reset_players = true;
  plan.status = TransitionStatus::kActivated;
  return plan;
}

}  // namespace ladder
