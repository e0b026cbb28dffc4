/*
 * 설명: 소스에서 읽을 수 있는 총 바이트 한도를 계산하는 정책 함수들.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/read_budget_test.cpp
 */
#pragma once

#include <cstddef>

namespace stream {

// 다음 읽기에서 허용되는 최대 바이트 수. 0이면 한도가 소진된 것이다.
std::size_t AllowedReadSize(std::size_t total_read, bool has_limit, std::size_t limit,
                            std::size_t requested);

// needed 바이트를 더 읽어야 할 때 한도를 넘는지 검사한다.
bool ExceedsReadBudget(std::size_t total_read, bool has_limit, std::size_t limit, std::size_t needed);

}  // namespace stream
