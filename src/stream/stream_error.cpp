/*
 * 설명: 스트림 오류 종류를 사람이 읽을 수 있는 메시지로 바꾼다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/buffered_reader_test.cpp
 */
#include "stream/stream_error.hpp"

namespace stream {

StreamError::StreamError(StreamErrorKind kind)
    : std::runtime_error(StreamErrorKindToString(kind)), kind_(kind) {}

StreamError::StreamError(StreamErrorKind kind, const std::string &detail)
    : std::runtime_error(StreamErrorKindToString(kind) + ": " + detail), kind_(kind) {}

std::string StreamErrorKindToString(StreamErrorKind kind) {
    switch (kind) {
        case StreamErrorKind::kDelimitersNotFound:
            return "구분자를 찾지 못함";
        case StreamErrorKind::kReadSizeLimitReached:
            return "읽기 한도 초과";
        case StreamErrorKind::kNoMoreData:
            return "데이터 부족";
    }
    return "알 수 없는 스트림 오류";
}

}  // namespace stream
