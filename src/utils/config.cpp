/*
 * 설명: INI 파일을 파싱해 리더/분할/로그 설정을 생성하고 검증한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_parser_test.cpp
 */
#include "utils/config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace {
bool StartsWith(const std::string &text, char c) { return !text.empty() && text[0] == c; }

std::string Trim(const std::string &text) {
    std::size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

std::string ToLower(const std::string &text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool ParseLogLevel(const std::string &raw, config::LogLevel &out) {
    const std::string lowered = ToLower(raw);
    if (lowered == "debug") {
        out = config::LogLevel::kDebug;
        return true;
    }
    if (lowered == "info") {
        out = config::LogLevel::kInfo;
        return true;
    }
    if (lowered == "warn") {
        out = config::LogLevel::kWarn;
        return true;
    }
    if (lowered == "error") {
        out = config::LogLevel::kError;
        return true;
    }
    return false;
}

bool ParseNumber(const std::string &raw, std::size_t &out) {
    if (raw.empty() || !std::isdigit(static_cast<unsigned char>(raw[0]))) {
        return false;
    }
    char *end = NULL;
    errno = 0;
    unsigned long long value = std::strtoull(raw.c_str(), &end, 10);
    if (end == NULL || *end != '\0' || errno == ERANGE) {
        return false;
    }
    if (value > std::numeric_limits<std::size_t>::max()) {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

bool ParseBool(const std::string &raw, bool &out) {
    const std::string lowered = ToLower(raw);
    if (lowered == "true" || lowered == "yes" || lowered == "1") {
        out = true;
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "0") {
        out = false;
        return true;
    }
    return false;
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

std::string LineError(const std::string &what, std::size_t line_no) {
    std::ostringstream oss;
    oss << what << " (" << line_no << ")";
    return oss.str();
}
}  // namespace

namespace config {

StreamSettings::StreamSettings()
    : buffer_size(4096), buffer_size_increment(1024), has_read_size_limit(false), read_size_limit(0) {}

SplitSettings::SplitSettings()
    : delimiters(1, "\n"), matching_mode(stream::DelimiterMatchingMode::kEarliestWins), include_delimiter(false) {}

Settings::Settings() : log_level(LogLevel::kInfo) {}

bool LoadFromFile(const std::string &path, Settings &out, std::string &error) {
    out = Settings();

    if (path.empty()) {
        return true;
    }

    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        return true;
    }

    std::string section;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        std::string trimmed = Trim(line);
        if (trimmed.empty() || StartsWith(trimmed, '#') || StartsWith(trimmed, ';')) {
            continue;
        }

        if (StartsWith(trimmed, '[')) {
            if (trimmed.size() < 3 || trimmed[trimmed.size() - 1] != ']') {
                error = LineError("잘못된 섹션 선언", line_no);
                return false;
            }
            section = ToLower(trimmed.substr(1, trimmed.size() - 2));
            continue;
        }

        std::size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos) {
            error = LineError("키=값 형식 오류", line_no);
            return false;
        }

        std::string key = ToLower(Trim(trimmed.substr(0, eq_pos)));
        std::string value = Trim(trimmed.substr(eq_pos + 1));
        if (section.empty()) {
            error = LineError("섹션 없음", line_no);
            return false;
        }

        if (section == "stream" && key == "buffer_size") {
            std::size_t number = 0;
            if (!ParseNumber(value, number) || number == 0) {
                error = LineError("stream.buffer_size 오류", line_no);
                return false;
            }
            out.stream.buffer_size = number;
        } else if (section == "stream" && key == "buffer_size_increment") {
            std::size_t number = 0;
            if (!ParseNumber(value, number) || number == 0) {
                error = LineError("stream.buffer_size_increment 오류", line_no);
                return false;
            }
            out.stream.buffer_size_increment = number;
        } else if (section == "stream" && key == "read_size_limit") {
            std::size_t number = 0;
            if (!ParseNumber(value, number)) {
                error = LineError("stream.read_size_limit 오류", line_no);
                return false;
            }
            out.stream.has_read_size_limit = true;
            out.stream.read_size_limit = number;
        } else if (section == "split" && key == "delimiters") {
            std::vector<std::string> delimiters;
            std::string detail;
            if (!ParseDelimiterList(value, delimiters, detail)) {
                error = LineError("split.delimiters 오류: " + detail, line_no);
                return false;
            }
            out.split.delimiters = delimiters;
        } else if (section == "split" && key == "matching_mode") {
            stream::DelimiterMatchingMode mode;
            if (!stream::ParseDelimiterMatchingMode(ToLower(value), mode)) {
                error = LineError("split.matching_mode 오류", line_no);
                return false;
            }
            out.split.matching_mode = mode;
        } else if (section == "split" && key == "include_delimiter") {
            bool flag = false;
            if (!ParseBool(value, flag)) {
                error = LineError("split.include_delimiter 오류", line_no);
                return false;
            }
            out.split.include_delimiter = flag;
        } else if (section == "logging" && key == "level") {
            LogLevel parsed;
            if (!ParseLogLevel(value, parsed)) {
                error = LineError("logging.level 오류", line_no);
                return false;
            }
            out.log_level = parsed;
        } else if (section == "logging" && key == "file") {
            out.log_file = value;
        } else {
            error = LineError("알 수 없는 섹션/키", line_no);
            return false;
        }
    }

    return true;
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "debug";
        case LogLevel::kInfo:
            return "info";
        case LogLevel::kWarn:
            return "warn";
        case LogLevel::kError:
            return "error";
    }
    return "info";
}

bool ParseDelimiterList(const std::string &raw, std::vector<std::string> &out, std::string &error) {
    std::vector<std::string> parsed;
    std::string current;

    for (std::size_t i = 0; i <= raw.size(); ++i) {
        if (i == raw.size() || raw[i] == ',') {
            if (current.empty()) {
                error = "빈 구분자";
                return false;
            }
            parsed.push_back(current);
            current.clear();
            continue;
        }
        if (raw[i] != '\\') {
            current += raw[i];
            continue;
        }
        if (i + 1 >= raw.size()) {
            error = "끝나지 않은 이스케이프";
            return false;
        }
        char next = raw[++i];
        switch (next) {
            case 'r':
                current += '\r';
                break;
            case 'n':
                current += '\n';
                break;
            case 't':
                current += '\t';
                break;
            case '\\':
            case ',':
                current += next;
                break;
            case 'x': {
                if (i + 2 >= raw.size() || HexValue(raw[i + 1]) < 0 || HexValue(raw[i + 2]) < 0) {
                    error = "잘못된 \\x 이스케이프";
                    return false;
                }
                current += static_cast<char>(HexValue(raw[i + 1]) * 16 + HexValue(raw[i + 2]));
                i += 2;
                break;
            }
            default:
                error = std::string("알 수 없는 이스케이프 \\") + next;
                return false;
        }
    }

    out = parsed;
    return true;
}

}  // namespace config
