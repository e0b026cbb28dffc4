/*
 * 설명: 설정된 구분자로 입력이 레코드 단위로 나뉘고 꼬리 데이터도 출력되는지 확인한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: 이 파일 자체
 */
#include "split/record_splitter.hpp"

#include <cassert>
#include <sstream>
#include <string>

#include "stream/byte_source.hpp"

void TestSplitsMixedLineEndings() {
    config::SplitSettings settings;
    settings.delimiters.clear();
    settings.delimiters.push_back("\r\n");
    settings.delimiters.push_back("\n");

    stream::MemoryByteSource source("alpha\r\nbeta\n\ngamma", 3);
    stream::BufferedReader reader(source, 4, 4);
    std::ostringstream out;
    split::SplitSummary summary = split::SplitRecords(reader, settings, out);

    assert(out.str() == "alpha\nbeta\n\ngamma\n");
    assert(summary.records == 4);
    assert(summary.bytes == 14);
}

void TestIncludeDelimiterAndNoTail() {
    config::SplitSettings settings;
    settings.delimiters.clear();
    settings.delimiters.push_back(";");
    settings.include_delimiter = true;

    stream::MemoryByteSource source("a;bb;");
    stream::BufferedReader reader(source, 16, 4);
    std::ostringstream out;
    split::SplitSummary summary = split::SplitRecords(reader, settings, out);

    assert(out.str() == "a;\nbb;\n");
    assert(summary.records == 2);
    assert(summary.bytes == 5);
}

void TestEmptyDelimiterListEmitsWholeInput() {
    config::SplitSettings settings;
    settings.delimiters.clear();

    stream::MemoryByteSource source("one record", 1);
    stream::BufferedReader reader(source, 2, 2);
    std::ostringstream out;
    split::SplitSummary summary = split::SplitRecords(reader, settings, out);

    assert(out.str() == "one record\n");
    assert(summary.records == 1);
}

void TestReadLimitTruncatesInput() {
    config::SplitSettings settings;

    stream::MemoryByteSource source("1\n22\n333\n");
    stream::BufferedReader reader(source, 16, 4);
    reader.SetReadSizeLimit(6);
    std::ostringstream out;
    split::SplitSummary summary = split::SplitRecords(reader, settings, out);

    assert(out.str() == "1\n22\n3\n");
    assert(summary.records == 3);
    assert(reader.TotalReadBytes() == 6);
}

int main() {
    TestSplitsMixedLineEndings();
    TestIncludeDelimiterAndNoTail();
    TestEmptyDelimiterListEmitsWholeInput();
    TestReadLimitTruncatesInput();
    return 0;
}
