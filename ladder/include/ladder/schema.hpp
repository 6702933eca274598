/*
 * 설명: 래더 테이블 생성과 테스트용 전체 삭제를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/ladder_service_it_test.cpp, ladder/tests/it/replay_it_test.cpp
 */
#pragma once

#include "ladder/db_client.hpp"

namespace ladder {

void EnsureSchema(const MariaDbClient& db_client);
void ClearAll(const MariaDbClient& db_client);

}  // namespace ladder
