/*
 * 설명: 매치 로그 정렬과 순서 모호성 검사를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/match_order_test.cpp
 */
#include "ladder/match_order.hpp"

#include <algorithm>

#include "ladder/errors.hpp"

namespace ladder {

bool ChronologicalLess(const MatchRecord& a, const MatchRecord& b) {
  if (a.played_on != b.played_on) {
    return a.played_on < b.played_on;
  }
  return a.id < b.id;
}

void SortChronologically(std::vector<MatchRecord>& matches) {
  std::stable_sort(matches.begin(), matches.end(), ChronologicalLess);
  auto duplicate = std::adjacent_find(matches.begin(), matches.end(), [](const MatchRecord& a, const MatchRecord& b) {
    return a.played_on == b.played_on && a.id == b.id;
  });
  if (duplicate != matches.end()) {
    throw LadderException(LadderErrorCode::kOrderingAmbiguity,
                          "같은 날짜와 순번을 가진 매치가 중복됨: " + FormatDate(duplicate->played_on) + " #" +
                              std::to_string(duplicate->id));
  }
}

}  // namespace ladder
