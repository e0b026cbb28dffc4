/*
 * 설명: 메모리/파일 디스크립터 바이트 소스의 조각 크기, 끝 표시, 오류 전달을 확인한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: 이 파일 자체
 */
#include "stream/byte_source.hpp"

#include <unistd.h>

#include <cassert>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "stream/buffered_reader.hpp"

void TestMemorySourceChunks() {
    stream::MemoryByteSource source("abcdef", 4);
    unsigned char buffer[16];
    assert(source.Read(buffer, sizeof(buffer)) == 4);
    assert(std::string(reinterpret_cast<char *>(buffer), 4) == "abcd");
    assert(source.Read(buffer, 1) == 1);
    assert(buffer[0] == 'e');
    assert(source.Read(buffer, 0) == 0);
    assert(source.Read(buffer, sizeof(buffer)) == 1);
    assert(source.Read(buffer, sizeof(buffer)) == 0);
    assert(source.read_calls() == 5);
    assert(source.offset() == 6);
}

void TestPipeSource() {
    int fds[2];
    int rc = ::pipe(fds);
    assert(rc == 0);
    const std::string payload = "first\nsecond";
    ssize_t written = ::write(fds[1], payload.data(), payload.size());
    assert(written == static_cast<ssize_t>(payload.size()));
    ::close(fds[1]);

    stream::FdByteSource source(fds[0], true);
    stream::BufferedReader reader(source, 4, 4);
    std::vector<std::string> newline(1, "\n");
    assert(reader.ReadUpTo(newline, stream::DelimiterMatchingMode::kEarliestWins, false) == "first");
    assert(reader.ReadToEnd() == "second");
}

void TestOpenInputFile() {
    const std::string path = "byte_source_test_input.txt";
    std::ofstream file(path.c_str());
    file << "line-1\r\nline-2";
    file.close();

    int fd = -1;
    std::string error;
    assert(stream::OpenInputFile(path, fd, error));
    assert(fd >= 0);
    {
        stream::FdByteSource source(fd, true);
        stream::BufferedReader reader(source, 8, 8);
        std::vector<std::string> crlf(1, "\r\n");
        assert(reader.ReadUpTo(crlf, stream::DelimiterMatchingMode::kEarliestWins, true) == "line-1\r\n");
        assert(reader.ReadString(6) == "line-2");
    }
    std::remove(path.c_str());

    assert(!stream::OpenInputFile("byte_source_test_missing.txt", fd, error));
    assert(!error.empty());

    assert(stream::OpenInputFile("-", fd, error));
    assert(fd == STDIN_FILENO);
}

void TestReadErrorFromDescriptor() {
    stream::FdByteSource source(-1);
    unsigned char buffer[4];
    bool thrown = false;
    try {
        source.Read(buffer, sizeof(buffer));
    } catch (const std::runtime_error &) {
        thrown = true;
    }
    assert(thrown);

    stream::BufferedReader reader(source, 4, 4);
    thrown = false;
    try {
        reader.ReadString(1);
    } catch (const stream::StreamError &) {
        assert(false && "descriptor errors must propagate unchanged");
    } catch (const std::runtime_error &) {
        thrown = true;
    }
    assert(thrown);
    assert(reader.TotalReadBytes() == 0);
}

int main() {
    TestMemorySourceChunks();
    TestPipeSource();
    TestOpenInputFile();
    TestReadErrorFromDescriptor();
    return 0;
}
