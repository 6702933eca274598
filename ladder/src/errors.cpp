/*
 * 설명: 도메인 오류 코드의 로그용 문자열을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "ladder/errors.hpp"

namespace ladder {

const char* ToString(LadderErrorCode code) {
  switch (code) {
    case LadderErrorCode::kConfigurationInconsistency:
      return "configuration_inconsistency";
    case LadderErrorCode::kOrderingAmbiguity:
      return "ordering_ambiguity";
    case LadderErrorCode::kPartialReplayFailure:
      return "partial_replay_failure";
    case LadderErrorCode::kUnknownReference:
      return "unknown_reference";
    case LadderErrorCode::kSeasonNotActive:
      return "season_not_active";
    case LadderErrorCode::kInvalidMatch:
      return "invalid_match";
    case LadderErrorCode::kInvalidConfig:
      return "invalid_config";
    case LadderErrorCode::kReplayBusy:
      return "replay_busy";
  }
  return "unknown";
}

}  // namespace ladder
