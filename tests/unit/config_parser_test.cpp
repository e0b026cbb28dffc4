/*
 * 설명: INI 설정 파서가 기본값과 사용자 지정 값, 구분자 이스케이프를 올바르게 해석하는지 확인한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: 이 파일 자체
 */
#include "utils/config.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

void TestDefaultsWhenFileMissing() {
    config::Settings settings;
    std::string error;
    bool ok = config::LoadFromFile("does_not_exist.ini", settings, error);
    assert(ok);
    assert(error.empty());
    assert(settings.stream.buffer_size == 4096);
    assert(settings.stream.buffer_size_increment == 1024);
    assert(!settings.stream.has_read_size_limit);
    assert(settings.split.delimiters.size() == 1);
    assert(settings.split.delimiters[0] == "\n");
    assert(settings.split.matching_mode == stream::DelimiterMatchingMode::kEarliestWins);
    assert(!settings.split.include_delimiter);
    assert(settings.log_level == config::LogLevel::kInfo);
    assert(settings.log_file.empty());
}

void TestParseCustomValues() {
    const std::string path = "sample_config.ini";
    std::ofstream file(path.c_str());
    file << "# comment\n";
    file << "[stream]\n";
    file << "buffer_size=256\n";
    file << "buffer_size_increment = 64\n";
    file << "read_size_limit=0\n";
    file << "[split]\n";
    file << "delimiters=\\r\\n,\\n,\\x00,a\\,b\n";
    file << "matching_mode=Longest\n";
    file << "include_delimiter=yes\n";
    file << "[logging]\n";
    file << "level=warn\n";
    file << "file=logs/stream.log\n";
    file.close();

    config::Settings settings;
    std::string error;
    bool ok = config::LoadFromFile(path, settings, error);
    assert(ok);
    assert(error.empty());
    assert(settings.stream.buffer_size == 256);
    assert(settings.stream.buffer_size_increment == 64);
    assert(settings.stream.has_read_size_limit);
    assert(settings.stream.read_size_limit == 0);
    assert(settings.split.delimiters.size() == 4);
    assert(settings.split.delimiters[0] == "\r\n");
    assert(settings.split.delimiters[1] == "\n");
    assert(settings.split.delimiters[2] == std::string(1, '\0'));
    assert(settings.split.delimiters[3] == "a,b");
    assert(settings.split.matching_mode == stream::DelimiterMatchingMode::kLongestAtTie);
    assert(settings.split.include_delimiter);
    assert(settings.log_level == config::LogLevel::kWarn);
    assert(settings.log_file == "logs/stream.log");

    std::remove(path.c_str());
}

void TestRejectInvalid() {
    const char *bad_lines[] = {
        "[stream]\nbuffer_size=0\n",
        "[stream]\nbuffer_size=-4\n",
        "[stream]\nbuffer_size_increment=abc\n",
        "[stream]\nbuffer_size=99999999999999999999\n",
        "[stream]\nread_size_limit=184467440737095516160\n",
        "[split]\ndelimiters=a,,b\n",
        "[split]\ndelimiters=\\q\n",
        "[split]\ndelimiters=\\x4\n",
        "[split]\nmatching_mode=first\n",
        "[split]\ninclude_delimiter=maybe\n",
        "[logging]\nlevel=verbose\n",
        "[server]\nname=x\n",
        "buffer_size=1\n",
        "[stream\n",
    };
    const std::string path = "bad_config.ini";

    for (std::size_t i = 0; i < sizeof(bad_lines) / sizeof(bad_lines[0]); ++i) {
        std::ofstream file(path.c_str());
        file << bad_lines[i];
        file.close();

        config::Settings settings;
        std::string error;
        bool ok = config::LoadFromFile(path, settings, error);
        assert(!ok);
        assert(!error.empty());
    }

    std::remove(path.c_str());
}

void TestParseDelimiterList() {
    std::vector<std::string> out;
    std::string error;
    assert(config::ParseDelimiterList("\\t,--,\\\\", out, error));
    assert(out.size() == 3);
    assert(out[0] == "\t");
    assert(out[1] == "--");
    assert(out[2] == "\\");

    assert(!config::ParseDelimiterList("", out, error));
    assert(!config::ParseDelimiterList("abc\\", out, error));
    assert(out.size() == 3);
}

int main() {
    TestDefaultsWhenFileMissing();
    TestParseCustomValues();
    TestRejectInvalid();
    TestParseDelimiterList();
    return 0;
}
