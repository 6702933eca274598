/*
 * 설명: 시즌 활성화/만료 전이를 계산하는 순수 상태 기계.
 *       실제 반영(트랜잭션, 플레이어 초기화)은 LadderService::RunSeasonTransition이 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/season_state_test.cpp, ladder/tests/it/season_transition_it_test.cpp
 */
#pragma once

#include <optional>
#include <vector>

#include "ladder/date.hpp"
#include "ladder/types.hpp"

namespace ladder {

enum class SeasonPhase { kPending, kActive, kExpired };

enum class TransitionStatus {
  kUnchanged,
  kActivated,
  kNoSeasonInWindow,
};

const char* ToString(TransitionStatus status);

struct SeasonTransitionPlan {
  std::vector<int> expire_ids;
  std::optional<int> activate_id;
  bool reset_players{false};
  TransitionStatus status{TransitionStatus::kUnchanged};
};

// active 플래그가 아닌 날짜 창 기준의 단계. 이미 종료된 시즌은 kExpired로 본다.
SeasonPhase PhaseOn(const Season& season, const Date& today);

// 오늘을 포함하는 시즌이 둘 이상이거나 활성 시즌이 모순되면 LadderException(kConfigurationInconsistency).
SeasonTransitionPlan PlanSeasonTransition(const std::vector<Season>& seasons, const Date& today);

}  // namespace ladder
