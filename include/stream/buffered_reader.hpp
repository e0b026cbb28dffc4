/*
 * 설명: 바이트 소스 위에서 정확한 크기 읽기와 다중 구분자까지 읽기를 제공하는 버퍼 리더.
 *       결과는 핸들러에 빌려주는 ByteView로만 전달하며, 핸들러의 반환값을 그대로 돌려준다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/buffered_reader_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstring>
#include <string>
#include <vector>

#include "stream/byte_source.hpp"
#include "stream/byte_view.hpp"
#include "stream/delimiter_matcher.hpp"
#include "stream/growable_buffer.hpp"
#include "stream/stream_error.hpp"

class Logger;

namespace stream {

/*
 * 단일 스레드 전용. 소스는 참조만 하므로 리더보다 오래 살아 있어야 한다.
 * 핸들러에 전달된 ByteView는 다음 호출에서 무효가 될 수 있다.
 */
class BufferedReader {
   public:
    BufferedReader(ByteSource &source, std::size_t buffer_size, std::size_t buffer_size_increment);

    void SetReadSizeLimit(std::size_t limit);
    void ClearReadSizeLimit();
    bool HasReadSizeLimit() const { return has_read_size_limit_; }
    std::size_t ReadSizeLimit() const { return read_size_limit_; }

    void SetLogger(Logger *logger) { logger_ = logger; }

    // 정확히 size 바이트를 읽는다. 실패 시 StreamError(kReadSizeLimitReached / kNoMoreData).
    template <typename Handler>
    auto ReadData(std::size_t size, Handler handler) -> decltype(handler(ByteView())) {
        ByteView view = ReadExactView(size);
        return handler(view);
    }

    /*
     * 구분자 중 하나가 처음 나타나는 곳까지 읽는다. 구분자는 항상 소비되며,
     * include_delimiter가 false면 핸들러에 넘기는 구간에서만 빠진다.
     * 구분자 목록이 비어 있으면 데이터 끝까지 모두 읽고 빈 구분자를 넘긴다.
     */
    template <typename Handler>
    auto ReadData(const std::vector<std::string> &delimiters, DelimiterMatchingMode mode,
                  bool include_delimiter, Handler handler)
        -> decltype(handler(ByteView(), std::string())) {
        std::size_t delimiter_index = kNoDelimiter;
        ByteView view = ReadUpToView(delimiters, mode, include_delimiter, delimiter_index);
        if (delimiter_index == kNoDelimiter) {
            return handler(view, std::string());
        }
        return handler(view, delimiters[delimiter_index]);
    }

    std::string ReadString(std::size_t size);
    std::string ReadUpTo(const std::vector<std::string> &delimiters, DelimiterMatchingMode mode,
                         bool include_delimiter, std::string *delimiter = NULL);
    std::string ReadToEnd();

    // 다음 sizeof(T) 바이트를 그대로 복사한다. 바이트 순서 변환은 하지 않는다.
    template <typename T>
    T ReadValue() {
        T value;
        ReadData(sizeof(T), [&value](ByteView view) { std::memcpy(&value, view.data, view.size); });
        return value;
    }

    std::size_t CurrentReadPosition() const { return current_read_position_; }
    std::size_t TotalReadBytes() const { return total_read_bytes_; }
    std::size_t BufferCapacity() const { return buffer_.Capacity(); }
    std::size_t BufferedSize() const { return buffer_.Size(); }
    std::size_t DefaultBufferSize() const { return buffer_.DefaultCapacity(); }
    std::size_t BufferSizeIncrement() const { return buffer_size_increment_; }

   private:
    static const std::size_t kNoDelimiter = static_cast<std::size_t>(-1);

    BufferedReader(const BufferedReader &);
    BufferedReader &operator=(const BufferedReader &);

    ByteView ReadExactView(std::size_t size);
    ByteView ReadUpToView(const std::vector<std::string> &delimiters, DelimiterMatchingMode mode,
                          bool include_delimiter, std::size_t &delimiter_index);
    bool FillForScan();
    std::size_t PullFromSource(std::size_t max_length);
    ByteView Take(std::size_t returned, std::size_t consumed);
    void LogResize(ResizeAction action, std::size_t requested);

    ByteSource &source_;
    GrowableBuffer buffer_;
    std::size_t buffer_size_increment_;
    std::size_t current_read_position_;
    std::size_t total_read_bytes_;
    bool has_read_size_limit_;
    std::size_t read_size_limit_;
    Logger *logger_;
};

}  // namespace stream
