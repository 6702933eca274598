/*
 * 설명: Boost.Date_Time 기반 날짜 파싱/포맷과 일 단위 연산을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/date_test.cpp
 */
#include "ladder/date.hpp"

#include <cctype>
#include <stdexcept>

#include "ladder/errors.hpp"

namespace ladder {
namespace {
// from_simple_string은 "2024-Jan-05", "2024/1/5" 같은 변형도 받으므로 모양을 먼저 고정한다.
bool IsIsoDateShape(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 4 || i == 7) {
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  return true;
}
}  // namespace

Date AddDays(const Date& date, long days) { return date + boost::gregorian::date_duration(days); }

Date TodayUtc() { return boost::gregorian::day_clock::universal_day(); }

Date ParseDate(const std::string& text) {
  if (!IsIsoDateShape(text)) {
    throw LadderException(LadderErrorCode::kInvalidMatch, "날짜 형식 오류: " + text);
  }
  try {
    return boost::gregorian::from_simple_string(text);
  } catch (const std::out_of_range& ex) {
    // bad_year, bad_month, bad_day_of_month 모두 std::out_of_range 파생이다.
    throw LadderException(LadderErrorCode::kInvalidMatch, "존재하지 않는 날짜: " + text + " (" + ex.what() + ")");
  }
}

std::string FormatDate(const Date& date) { return boost::gregorian::to_iso_extended_string(date); }

}  // namespace ladder
