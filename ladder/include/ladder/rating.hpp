/*
 * 설명: 1:1 승패 결과에 대한 Elo 레이팅 갱신 함수를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/rating_update_test.cpp
 */
#pragma once

namespace ladder {

// 실시간 경로와 재계산 경로가 반드시 같은 값을 써야 하므로 설정으로 노출하지 않는다.
constexpr int kInitialRating = 1000;
constexpr int kKFactor = 32;

struct RatingPair {
  int winner;
  int loser;
};

double ExpectedScore(int rating, int opponent_rating);

// 반올림은 std::round(0.5는 0에서 먼 쪽)로 고정한다.
RatingPair Rate(int winner_rating, int loser_rating);

}  // namespace ladder
