/*
 * 설명: 매치 로그의 결정적 정렬 기준 (날짜, 삽입 순번)을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/match_order_test.cpp
 */
#pragma once

#include <vector>

#include "ladder/types.hpp"

namespace ladder {

bool ChronologicalLess(const MatchRecord& a, const MatchRecord& b);

// 정렬 후 (날짜, 순번)이 같은 두 기록이 있으면 LadderException(kOrderingAmbiguity)을 던진다.
void SortChronologically(std::vector<MatchRecord>& matches);

}  // namespace ladder
