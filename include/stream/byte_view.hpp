/*
 * 설명: 핸들러 호출 동안에만 유효한 읽기 전용 바이트 구간을 표현한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/buffered_reader_test.cpp, tests/unit/memory_reader_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace stream {

// 핸들러가 반환된 뒤에는 버퍼가 이동하거나 재사용될 수 있으므로 보관하면 안 된다.
struct ByteView {
    const unsigned char *data;
    std::size_t size;

    ByteView() : data(NULL), size(0) {}
    ByteView(const unsigned char *bytes, std::size_t length) : data(bytes), size(length) {}

    bool empty() const { return size == 0; }
    std::string ToString() const {
        if (size == 0) {
            return std::string();
        }
        return std::string(reinterpret_cast<const char *>(data), size);
    }
};

}  // namespace stream
