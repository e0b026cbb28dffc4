/*
 * 설명: 호출자가 가진 메모리 위에서 BufferedReader와 같은 읽기 연산을 복사 없이 제공한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/memory_reader_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "stream/byte_view.hpp"
#include "stream/delimiter_matcher.hpp"
#include "stream/stream_error.hpp"

namespace stream {

class MemoryReader {
   public:
    // data는 리더보다 오래 살아 있어야 한다.
    MemoryReader(const void *data, std::size_t size);

    template <typename Handler>
    auto ReadData(std::size_t size, Handler handler) -> decltype(handler(ByteView())) {
        ByteView view = TakeExact(size);
        return handler(view);
    }

    template <typename Handler>
    auto ReadData(const std::vector<std::string> &delimiters, DelimiterMatchingMode mode,
                  bool include_delimiter, Handler handler)
        -> decltype(handler(ByteView(), std::string())) {
        std::size_t delimiter_index = kNoDelimiter;
        ByteView view = TakeUpTo(delimiters, mode, include_delimiter, delimiter_index);
        if (delimiter_index == kNoDelimiter) {
            return handler(view, std::string());
        }
        return handler(view, delimiters[delimiter_index]);
    }

    std::string ReadString(std::size_t size);
    std::string ReadUpTo(const std::vector<std::string> &delimiters, DelimiterMatchingMode mode,
                         bool include_delimiter, std::string *delimiter = NULL);
    std::string ReadToEnd();

    std::size_t CurrentReadPosition() const { return position_; }
    std::size_t Remaining() const { return size_ - position_; }

   private:
    static const std::size_t kNoDelimiter = static_cast<std::size_t>(-1);

    ByteView TakeExact(std::size_t size);
    ByteView TakeUpTo(const std::vector<std::string> &delimiters, DelimiterMatchingMode mode,
                      bool include_delimiter, std::size_t &delimiter_index);

    const unsigned char *data_;
    std::size_t size_;
    std::size_t position_;
};

}  // namespace stream
