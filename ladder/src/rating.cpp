/*
 * 설명: Elo 기대 승률과 레이팅 갱신을 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/rating_update_test.cpp
 */
#include "ladder/rating.hpp"

#include <cmath>

namespace ladder {
namespace {
int ApplyElo(int rating, double expected, double score) {
  double delta = static_cast<double>(kKFactor) * (score - expected);
  return static_cast<int>(std::round(static_cast<double>(rating) + delta));
}
}  // namespace

double ExpectedScore(int rating, int opponent_rating) {
  double exponent = static_cast<double>(opponent_rating - rating) / 400.0;
  return 1.0 / (1.0 + std::pow(10.0, exponent));
}

RatingPair Rate(int winner_rating, int loser_rating) {
  double expected_winner = ExpectedScore(winner_rating, loser_rating);
  double expected_loser = 1.0 - expected_winner;
  return RatingPair{ApplyElo(winner_rating, expected_winner, 1.0), ApplyElo(loser_rating, expected_loser, 0.0)};
}

}  // namespace ladder
