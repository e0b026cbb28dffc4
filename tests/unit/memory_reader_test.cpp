/*
 * 설명: 메모리 리더가 복사 없이 호출자 메모리를 빌려주고 버퍼 리더와 같은 결과를 내는지 확인한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: 이 파일 자체
 */
#include "stream/memory_reader.hpp"

#include <cassert>
#include <string>
#include <vector>

#include "stream/buffered_reader.hpp"

namespace {
std::vector<std::string> List(const char *a, const char *b = NULL) {
    std::vector<std::string> out;
    out.push_back(a);
    if (b != NULL) {
        out.push_back(b);
    }
    return out;
}
}  // namespace

void TestViewsPointIntoCallerMemory() {
    const std::string data = "key=value;next";
    stream::MemoryReader reader(data.data(), data.size());

    const unsigned char *first = NULL;
    reader.ReadData(3, [&first](stream::ByteView view) { first = view.data; });
    assert(first == reinterpret_cast<const unsigned char *>(data.data()));

    const unsigned char *second = NULL;
    std::string delimiter = reader.ReadData(
        List(";"), stream::DelimiterMatchingMode::kEarliestWins, false,
        [&second](stream::ByteView view, const std::string &matched) -> std::string {
            second = view.data;
            assert(view.ToString() == "=value");
            return matched;
        });
    assert(delimiter == ";");
    assert(second == reinterpret_cast<const unsigned char *>(data.data()) + 3);
    assert(reader.CurrentReadPosition() == 10);
    assert(reader.Remaining() == 4);
}

void TestMatchesBufferedReader() {
    const std::string data = "xxABCyy--rest";
    stream::MemoryReader memory(data.data(), data.size());
    stream::MemoryByteSource source(data, 1);
    stream::BufferedReader buffered(source, 2, 2);

    std::string memory_delimiter;
    std::string buffered_delimiter;
    assert(memory.ReadUpTo(List("AB", "ABC"), stream::DelimiterMatchingMode::kLongestAtTie, true,
                           &memory_delimiter) ==
           buffered.ReadUpTo(List("AB", "ABC"), stream::DelimiterMatchingMode::kLongestAtTie, true,
                             &buffered_delimiter));
    assert(memory_delimiter == "ABC");
    assert(buffered_delimiter == "ABC");
    assert(memory.ReadString(2) == buffered.ReadString(2));
    assert(memory.ReadUpTo(List("--"), stream::DelimiterMatchingMode::kShortestAtTie, false) ==
           buffered.ReadUpTo(List("--"), stream::DelimiterMatchingMode::kShortestAtTie, false));
    assert(memory.ReadToEnd() == "rest");
    assert(buffered.ReadToEnd() == "rest");
    assert(memory.CurrentReadPosition() == buffered.CurrentReadPosition());
}

void TestErrors() {
    const std::string data = "short";
    stream::MemoryReader reader(data.data(), data.size());

    bool thrown = false;
    try {
        reader.ReadString(6);
    } catch (const stream::StreamError &ex) {
        thrown = ex.Kind() == stream::StreamErrorKind::kNoMoreData;
    }
    assert(thrown);
    assert(reader.CurrentReadPosition() == 0);

    thrown = false;
    try {
        reader.ReadUpTo(List("\n"), stream::DelimiterMatchingMode::kEarliestWins, false);
    } catch (const stream::StreamError &ex) {
        thrown = ex.Kind() == stream::StreamErrorKind::kDelimitersNotFound;
    }
    assert(thrown);
    assert(reader.ReadToEnd() == "short");
    assert(reader.Remaining() == 0);
    assert(reader.ReadToEnd().empty());
}

int main() {
    TestViewsPointIntoCallerMemory();
    TestMatchesBufferedReader();
    TestErrors();
    return 0;
}
