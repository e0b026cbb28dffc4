/*
 * 설명: 읽기 한도 정책을 구현한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/read_budget_test.cpp
 */
#include "stream/read_budget.hpp"

namespace stream {

std::size_t AllowedReadSize(std::size_t total_read, bool has_limit, std::size_t limit,
                            std::size_t requested) {
    if (!has_limit) {
        return requested;
    }
    if (total_read >= limit) {
        return 0;
    }
    std::size_t remaining = limit - total_read;
    return requested < remaining ? requested : remaining;
}

bool ExceedsReadBudget(std::size_t total_read, bool has_limit, std::size_t limit, std::size_t needed) {
    if (!has_limit) {
        return false;
    }
    if (total_read > limit) {
        return true;
    }
    return needed > limit - total_read;
}

}  // namespace stream
