/*
 * 설명: 구분자 기반 레코드 분할 루프를 구현한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/record_splitter_test.cpp
 */
#include "split/record_splitter.hpp"

#include <string>
#include <vector>

namespace split {

namespace {
void WriteRecord(std::ostream &out, const stream::ByteView &view, SplitSummary &summary) {
    if (view.size > 0) {
        out.write(reinterpret_cast<const char *>(view.data), static_cast<std::streamsize>(view.size));
    }
    out.put('\n');
    ++summary.records;
    summary.bytes += view.size;
}
}  // namespace

SplitSummary SplitRecords(stream::BufferedReader &reader, const config::SplitSettings &settings,
                          std::ostream &out) {
    SplitSummary summary;

    if (!settings.delimiters.empty()) {
        while (true) {
            try {
                reader.ReadData(settings.delimiters, settings.matching_mode, settings.include_delimiter,
                                [&out, &summary](stream::ByteView view, const std::string &) {
                                    WriteRecord(out, view, summary);
                                });
            } catch (const stream::StreamError &ex) {
                if (ex.Kind() != stream::StreamErrorKind::kDelimitersNotFound) {
                    throw;
                }
                break;
            }
        }
    }

    // 마지막 구분자 뒤에 남은 꼬리를 처리한다.
    reader.ReadData(std::vector<std::string>(), settings.matching_mode, false,
                    [&out, &summary](stream::ByteView view, const std::string &) {
                        if (!view.empty()) {
                            WriteRecord(out, view, summary);
                        }
                    });
    return summary;
}

}  // namespace split
