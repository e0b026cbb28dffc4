/*
 * 설명: INI 설정 파일을 로드해 리더 버퍼/분할/로그 설정 구조체를 생성한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_parser_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "stream/delimiter_matcher.hpp"

namespace config {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

struct StreamSettings {
    std::size_t buffer_size;
    std::size_t buffer_size_increment;
    bool has_read_size_limit;
    std::size_t read_size_limit;

    StreamSettings();
};

struct SplitSettings {
    std::vector<std::string> delimiters;
    stream::DelimiterMatchingMode matching_mode;
    bool include_delimiter;

    SplitSettings();
};

struct Settings {
    StreamSettings stream;
    SplitSettings split;
    LogLevel log_level;
    std::string log_file;

    Settings();
};

bool LoadFromFile(const std::string &path, Settings &out, std::string &error);
std::string LogLevelToString(LogLevel level);

// 쉼표로 구분된 구분자 목록. \r \n \t \\ \, \xHH 이스케이프를 해석한다.
bool ParseDelimiterList(const std::string &raw, std::vector<std::string> &out, std::string &error);

}  // namespace config
