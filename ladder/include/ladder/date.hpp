/*
 * 설명: 시즌/매치에 쓰이는 달력 날짜 타입과 변환 함수를 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/unit/date_test.cpp
 */
#pragma once

#include <string>

#include <boost/date_time/gregorian/gregorian.hpp>

namespace ladder {

// 그레고리력 하루. 시각/시간대 정보는 없다.
using Date = boost::gregorian::date;

Date AddDays(const Date& date, long days);
Date TodayUtc();
// YYYY-MM-DD 형식만 허용하며 실패 시 LadderException(kInvalidMatch)을 던진다.
Date ParseDate(const std::string& text);
std::string FormatDate(const Date& date);

}  // namespace ladder
