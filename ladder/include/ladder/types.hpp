/*
 * 설명: 플레이어, 시즌, 매치 기록과 파생 테이블 행 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "ladder/date.hpp"
#include "ladder/rating.hpp"

namespace ladder {

// 시즌 주기마다 초기화되는 비정규화 카운터.
struct SeasonCounters {
  int rating{kInitialRating};
  int wins{0};
  int losses{0};
  int bonus_given{0};
  int bonus_taken{0};

  friend bool operator==(const SeasonCounters& a, const SeasonCounters& b) {
    return a.rating == b.rating && a.wins == b.wins && a.losses == b.losses && a.bonus_given == b.bonus_given &&
           a.bonus_taken == b.bonus_taken;
  }
  friend bool operator!=(const SeasonCounters& a, const SeasonCounters& b) { return !(a == b); }
};

struct Player {
  int id{0};
  std::string name;
  SeasonCounters counters;
};

struct Season {
  int id{0};
  Date start_date;
  std::optional<Date> end_date;
  bool active{false};

  bool Contains(const Date& day) const { return start_date <= day && (!end_date || *end_date >= day); }
  bool HasEndedBefore(const Date& day) const { return end_date && *end_date < day; }
};

// 레이팅에는 영향을 주지 않는 부가 결과 플래그.
struct MatchQualifiers {
  bool shutout{false};
};

void to_json(nlohmann::json& j, const MatchQualifiers& qualifiers);
void from_json(const nlohmann::json& j, MatchQualifiers& qualifiers);

struct NewMatch {
  int winner_id{0};
  int loser_id{0};
  int season_id{0};
  Date played_on;
  MatchQualifiers qualifiers;
};

// id는 matches 테이블의 AUTO_INCREMENT 값이며 같은 날짜 안의 삽입 순서를 나타낸다.
struct MatchRecord {
  std::int64_t id{0};
  int winner_id{0};
  int loser_id{0};
  int season_id{0};
  Date played_on;
  MatchQualifiers qualifiers;
};

struct RatingHistoryEntry {
  std::int64_t match_id{0};
  int player_id{0};
  int rating{0};

  friend bool operator==(const RatingHistoryEntry& a, const RatingHistoryEntry& b) {
    return a.match_id == b.match_id && a.player_id == b.player_id && a.rating == b.rating;
  }
};

struct SeasonSnapshot {
  int season_id{0};
  int player_id{0};
  int rating{0};
  int wins{0};
  int losses{0};

  friend bool operator==(const SeasonSnapshot& a, const SeasonSnapshot& b) {
    return a.season_id == b.season_id && a.player_id == b.player_id && a.rating == b.rating && a.wins == b.wins &&
           a.losses == b.losses;
  }
};

}  // namespace ladder
