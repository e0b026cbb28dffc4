/*
 * 설명: 리더가 던지는 오류 종류와 예외 타입을 정의한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/buffered_reader_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>

namespace stream {

enum class StreamErrorKind { kDelimitersNotFound = 0, kReadSizeLimitReached = 1, kNoMoreData = 2 };

class StreamError : public std::runtime_error {
   public:
    explicit StreamError(StreamErrorKind kind);
    StreamError(StreamErrorKind kind, const std::string &detail);

    StreamErrorKind Kind() const { return kind_; }

   private:
    StreamErrorKind kind_;
};

std::string StreamErrorKindToString(StreamErrorKind kind);

}  // namespace stream
