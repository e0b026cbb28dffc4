/*
 * 설명: 메모리 리더의 읽기 연산을 구현한다. 전체 데이터가 이미 있으므로 탐색은 한 번으로 끝난다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/memory_reader_test.cpp
 */
#include "stream/memory_reader.hpp"

namespace stream {

const std::size_t MemoryReader::kNoDelimiter;

MemoryReader::MemoryReader(const void *data, std::size_t size)
    : data_(static_cast<const unsigned char *>(data)), size_(size), position_(0) {}

std::string MemoryReader::ReadString(std::size_t size) {
    return ReadData(size, [](ByteView view) { return view.ToString(); });
}

std::string MemoryReader::ReadUpTo(const std::vector<std::string> &delimiters, DelimiterMatchingMode mode,
                                   bool include_delimiter, std::string *delimiter) {
    return ReadData(delimiters, mode, include_delimiter,
                    [delimiter](ByteView view, const std::string &matched) -> std::string {
                        if (delimiter != NULL) {
                            *delimiter = matched;
                        }
                        return view.ToString();
                    });
}

std::string MemoryReader::ReadToEnd() {
    return ReadUpTo(std::vector<std::string>(), DelimiterMatchingMode::kEarliestWins, false);
}

ByteView MemoryReader::TakeExact(std::size_t size) {
    if (size > Remaining()) {
        throw StreamError(StreamErrorKind::kNoMoreData);
    }
    ByteView view(data_ + position_, size);
    position_ += size;
    return view;
}

ByteView MemoryReader::TakeUpTo(const std::vector<std::string> &delimiters, DelimiterMatchingMode mode,
                                bool include_delimiter, std::size_t &delimiter_index) {
    const unsigned char *start = data_ + position_;
    DelimiterMatcher matcher(delimiters, mode);
    DelimiterMatch match;

    if (!matcher.Empty()) {
        matcher.Scan(start, Remaining(), 0);
    }
    if (!matcher.BestMatch(match)) {
        if (!delimiters.empty()) {
            throw StreamError(StreamErrorKind::kDelimitersNotFound);
        }
        delimiter_index = kNoDelimiter;
        ByteView rest(start, Remaining());
        position_ = size_;
        return rest;
    }

    delimiter_index = match.delimiter_index;
    std::size_t consumed = match.offset + match.delimiter_length;
    position_ += consumed;
    return ByteView(start, include_delimiter ? consumed : match.offset);
}

}  // namespace stream
