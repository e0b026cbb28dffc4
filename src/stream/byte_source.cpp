/*
 * 설명: 메모리 버퍼와 POSIX 파일 디스크립터를 바이트 소스로 감싼다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/byte_source_test.cpp
 */
#include "stream/byte_source.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace stream {

MemoryByteSource::MemoryByteSource(const std::string &data, std::size_t max_chunk)
    : data_(data), max_chunk_(max_chunk), offset_(0), read_calls_(0) {}

std::size_t MemoryByteSource::Read(unsigned char *buffer, std::size_t max_length) {
    ++read_calls_;
    if (offset_ >= data_.size() || max_length == 0) {
        return 0;
    }
    std::size_t count = data_.size() - offset_;
    if (count > max_length) {
        count = max_length;
    }
    if (max_chunk_ > 0 && count > max_chunk_) {
        count = max_chunk_;
    }
    std::memcpy(buffer, data_.data() + offset_, count);
    offset_ += count;
    return count;
}

FdByteSource::FdByteSource(int fd, bool close_on_destroy) : fd_(fd), close_on_destroy_(close_on_destroy) {}

FdByteSource::~FdByteSource() {
    if (close_on_destroy_ && fd_ >= 0) {
        ::close(fd_);
    }
}

std::size_t FdByteSource::Read(unsigned char *buffer, std::size_t max_length) {
    while (true) {
        ssize_t n = ::read(fd_, buffer, max_length);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        throw std::runtime_error(std::string("read 실패: ") + std::strerror(errno));
    }
}

bool OpenInputFile(const std::string &path, int &fd, std::string &error) {
    if (path == "-") {
        fd = STDIN_FILENO;
        return true;
    }
    fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        error = path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

}  // namespace stream
