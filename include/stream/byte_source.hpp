/*
 * 설명: 리더가 데이터를 당겨오는 바이트 소스 인터페이스와 메모리/파일 디스크립터 구현을 정의한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/byte_source_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace stream {

class ByteSource {
   public:
    virtual ~ByteSource() {}

    /*
     * buffer에 최대 max_length 바이트를 채우고 실제로 읽은 바이트 수를 반환한다.
     * 0은 데이터의 끝을 뜻하며, 오류는 예외로 전달한다.
     */
    virtual std::size_t Read(unsigned char *buffer, std::size_t max_length) = 0;
};

// 메모리에 있는 바이트를 돌려준다. max_chunk가 0이 아니면 한 번에 그 이하만 준다.
class MemoryByteSource : public ByteSource {
   public:
    explicit MemoryByteSource(const std::string &data, std::size_t max_chunk = 0);

    std::size_t Read(unsigned char *buffer, std::size_t max_length);

    std::size_t read_calls() const { return read_calls_; }
    std::size_t offset() const { return offset_; }

   private:
    std::string data_;
    std::size_t max_chunk_;
    std::size_t offset_;
    std::size_t read_calls_;
};

class FdByteSource : public ByteSource {
   public:
    // close_on_destroy가 false면 fd를 빌려 쓰기만 하고 닫지 않는다.
    explicit FdByteSource(int fd, bool close_on_destroy = false);
    ~FdByteSource();

    std::size_t Read(unsigned char *buffer, std::size_t max_length);

    int fd() const { return fd_; }

   private:
    FdByteSource(const FdByteSource &);
    FdByteSource &operator=(const FdByteSource &);

    int fd_;
    bool close_on_destroy_;
};

// 읽기 전용으로 파일을 연다. "-"는 표준 입력을 뜻한다.
bool OpenInputFile(const std::string &path, int &fd, std::string &error);

}  // namespace stream
