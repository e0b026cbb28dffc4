/*
 * 설명: simple-stream 실행 진입점으로 설정 파일을 반영해 입력을 레코드로 분할한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/record_splitter_test.cpp, tests/unit/config_parser_test.cpp
 */
#include <iostream>
#include <sstream>
#include <string>

#include "split/record_splitter.hpp"
#include "stream/buffered_reader.hpp"
#include "stream/byte_source.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

int main(int argc, char *argv[]) {
    if (argc != 2 && argc != 3) {
        std::cerr << "사용법: ./simple-stream <input_path|-> [config_path]\n";
        return 1;
    }

    std::string input_path = argv[1];
    std::string config_path = argc == 3 ? argv[2] : "config/simple-stream.ini";

    config::Settings settings;
    std::string error;
    if (!config::LoadFromFile(config_path, settings, error)) {
        std::cerr << "설정 파일 오류: " << error << "\n";
        return 1;
    }

    Logger logger;
    logger.SetLevel(settings.log_level);
    if (!logger.SetOutput(settings.log_file)) {
        std::cerr << "로그 파일 열기 실패: " << settings.log_file << "\n";
        return 1;
    }

    int fd = -1;
    if (!stream::OpenInputFile(input_path, fd, error)) {
        logger.Log(config::LogLevel::kError, "입력 열기 실패: " + error);
        return 1;
    }

    try {
        stream::FdByteSource source(fd, input_path != "-");
        stream::BufferedReader reader(source, settings.stream.buffer_size, settings.stream.buffer_size_increment);
        reader.SetLogger(&logger);
        if (settings.stream.has_read_size_limit) {
            reader.SetReadSizeLimit(settings.stream.read_size_limit);
        }

        split::SplitSummary summary = split::SplitRecords(reader, settings.split, std::cout);
        std::cout.flush();

        std::ostringstream oss;
        oss << "레코드 " << summary.records << "개, " << summary.bytes << "바이트, 소스에서 "
            << reader.TotalReadBytes() << "바이트 읽음";
        logger.Log(config::LogLevel::kInfo, oss.str());
    } catch (const std::exception &ex) {
        logger.Log(config::LogLevel::kError, std::string("스트림 오류: ") + ex.what());
        return 1;
    }

    return 0;
}
