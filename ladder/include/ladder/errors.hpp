/*
 * 설명: 레이팅/시즌 도메인 오류 코드와 예외 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <stdexcept>
#include <string>

namespace ladder {

enum class LadderErrorCode {
  kConfigurationInconsistency,
  kOrderingAmbiguity,
  kPartialReplayFailure,
  kUnknownReference,
  kSeasonNotActive,
  kInvalidMatch,
  kInvalidConfig,
  kReplayBusy,
};

const char* ToString(LadderErrorCode code);

class LadderException : public std::runtime_error {
 public:
  LadderException(LadderErrorCode code, const std::string& message)
      : std::runtime_error(message), code(code) {}
  LadderErrorCode code;
};

}  // namespace ladder
