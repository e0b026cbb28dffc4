/*
 * 설명: 버퍼 리더의 정확한 크기 읽기, 구분자 탐색 루프, 읽기 한도 처리를 구현한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/buffered_reader_test.cpp
 */
#include "stream/buffered_reader.hpp"

#include <sstream>
#include <stdexcept>

#include "stream/read_budget.hpp"
#include "utils/logger.hpp"

namespace stream {

const std::size_t BufferedReader::kNoDelimiter;

BufferedReader::BufferedReader(ByteSource &source, std::size_t buffer_size, std::size_t buffer_size_increment)
    : source_(source),
      buffer_(buffer_size),
      buffer_size_increment_(buffer_size_increment),
      current_read_position_(0),
      total_read_bytes_(0),
      has_read_size_limit_(false),
      read_size_limit_(0),
      logger_(NULL) {
    if (buffer_size_increment == 0) {
        throw std::invalid_argument("버퍼 증가 크기는 0보다 커야 함");
    }
}

void BufferedReader::SetReadSizeLimit(std::size_t limit) {
    has_read_size_limit_ = true;
    read_size_limit_ = limit;
}

void BufferedReader::ClearReadSizeLimit() {
    has_read_size_limit_ = false;
    read_size_limit_ = 0;
}

std::string BufferedReader::ReadString(std::size_t size) {
    return ReadData(size, [](ByteView view) { return view.ToString(); });
}

std::string BufferedReader::ReadUpTo(const std::vector<std::string> &delimiters, DelimiterMatchingMode mode,
                                     bool include_delimiter, std::string *delimiter) {
    return ReadData(delimiters, mode, include_delimiter,
                    [delimiter](ByteView view, const std::string &matched) -> std::string {
                        if (delimiter != NULL) {
                            *delimiter = matched;
                        }
                        return view.ToString();
                    });
}

std::string BufferedReader::ReadToEnd() {
    return ReadUpTo(std::vector<std::string>(), DelimiterMatchingMode::kEarliestWins, false);
}

ByteView BufferedReader::ReadExactView(std::size_t size) {
    LogResize(buffer_.Reserve(size), size);

    while (buffer_.Size() < size) {
        std::size_t missing = size - buffer_.Size();
        if (ExceedsReadBudget(total_read_bytes_, has_read_size_limit_, read_size_limit_, missing)) {
            if (logger_ != NULL) {
                std::ostringstream oss;
                oss << "읽기 한도 초과: 필요 " << missing << "바이트, 누적 " << total_read_bytes_ << "/"
                    << read_size_limit_;
                logger_->Log(config::LogLevel::kWarn, oss.str());
            }
            throw StreamError(StreamErrorKind::kReadSizeLimitReached);
        }

        // 한도 안에서라면 필요한 것보다 더 읽어 두어도 된다.
        std::size_t to_read =
            AllowedReadSize(total_read_bytes_, has_read_size_limit_, read_size_limit_, buffer_.WritableSize());
        if (PullFromSource(to_read) == 0) {
            throw StreamError(StreamErrorKind::kNoMoreData);
        }
    }

    return Take(size, size);
}

ByteView BufferedReader::ReadUpToView(const std::vector<std::string> &delimiters, DelimiterMatchingMode mode,
                                      bool include_delimiter, std::size_t &delimiter_index) {
    DelimiterMatcher matcher(delimiters, mode);
    DelimiterMatch match;
    std::size_t search_offset = 0;

    while (true) {
        if (!matcher.Empty()) {
            matcher.Scan(buffer_.Data(), buffer_.Size(), search_offset);
            if (matcher.DefinitiveMatch(buffer_.Data(), buffer_.Size(), match)) {
                break;
            }
            // 이 위치 이전에서는 아직 확인하지 못한 구분자가 시작될 수 없다.
            search_offset = buffer_.Size() >= matcher.MaxLength() ? buffer_.Size() - matcher.MaxLength() + 1 : 0;
        }
        if (!FillForScan()) {
            if (!matcher.BestMatch(match)) {
                if (!delimiters.empty()) {
                    if (logger_ != NULL && logger_->IsEnabled(config::LogLevel::kDebug)) {
                        std::ostringstream oss;
                        oss << "구분자 " << delimiters.size() << "개를 " << buffer_.Size()
                            << "바이트 안에서 찾지 못함";
                        logger_->Log(config::LogLevel::kDebug, oss.str());
                    }
                    throw StreamError(StreamErrorKind::kDelimitersNotFound);
                }
                delimiter_index = kNoDelimiter;
                return Take(buffer_.Size(), buffer_.Size());
            }
            break;
        }
    }

    delimiter_index = match.delimiter_index;
    std::size_t consumed = match.offset + match.delimiter_length;
    return Take(include_delimiter ? consumed : match.offset, consumed);
}

bool BufferedReader::FillForScan() {
    if (buffer_.WritableSize() == 0) {
        LogResize(buffer_.MakeRoom(buffer_size_increment_), buffer_.Size() + buffer_size_increment_);
    }

    std::size_t to_read =
        AllowedReadSize(total_read_bytes_, has_read_size_limit_, read_size_limit_, buffer_.WritableSize());
    if (to_read == 0) {
        // 마지막 조각을 비우는 정상 종료에서도 여기에 온다.
        if (logger_ != NULL) {
            logger_->Log(config::LogLevel::kDebug, "읽기 한도 도달로 구분자 탐색 중단");
        }
        return false;
    }
    return PullFromSource(to_read) > 0;
}

std::size_t BufferedReader::PullFromSource(std::size_t max_length) {
    std::size_t count = source_.Read(buffer_.WritePtr(), max_length);
    if (count > max_length) {
        throw std::runtime_error("바이트 소스가 요청보다 많이 반환함");
    }
    buffer_.CommitWrite(count);
    total_read_bytes_ += count;
    return count;
}

ByteView BufferedReader::Take(std::size_t returned, std::size_t consumed) {
    ByteView view(buffer_.Data(), returned);
    buffer_.Consume(consumed);
    current_read_position_ += consumed;
    return view;
}

void BufferedReader::LogResize(ResizeAction action, std::size_t requested) {
    if (action == ResizeAction::kNone || logger_ == NULL || !logger_->IsEnabled(config::LogLevel::kDebug)) {
        return;
    }
    std::ostringstream oss;
    oss << "버퍼 " << ResizeActionToString(action) << ": 요청 " << requested << ", 용량 " << buffer_.Capacity();
    logger_->Log(config::LogLevel::kDebug, oss.str());
}

}  // namespace stream
