/*
 * 설명: 매치 부가 플래그의 JSON 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "ladder/types.hpp"

namespace ladder {

void to_json(nlohmann::json& j, const MatchQualifiers& qualifiers) { j = nlohmann::json{{"shutout", qualifiers.shutout}}; }

void from_json(const nlohmann::json& j, MatchQualifiers& qualifiers) {
  qualifiers.shutout = j.value("shutout", false);
}

}  // namespace ladder
