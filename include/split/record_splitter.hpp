/*
 * 설명: 설정된 구분자로 리더의 입력을 레코드 단위로 나누어 출력 스트림에 한 줄씩 쓴다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/record_splitter_test.cpp
 */
#pragma once

#include <cstddef>
#include <ostream>

#include "stream/buffered_reader.hpp"
#include "utils/config.hpp"

namespace split {

struct SplitSummary {
    std::size_t records;
    std::size_t bytes;

    SplitSummary() : records(0), bytes(0) {}
};

// 구분자가 더 이상 나오지 않으면 남은 바이트를 마지막 레코드로 내보낸다.
SplitSummary SplitRecords(stream::BufferedReader &reader, const config::SplitSettings &settings,
                          std::ostream &out);

}  // namespace split
