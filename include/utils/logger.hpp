/*
 * 설명: 로그 레벨과 출력 경로를 제어하는 단순 로거를 제공한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/logger_test.cpp
 */
#pragma once

#include <fstream>
#include <string>

#include "utils/config.hpp"

class Logger {
   public:
    Logger();

    void SetLevel(config::LogLevel level);
    // 빈 경로나 "-"는 표준 오류로 보낸다. 파일을 열지 못하면 false.
    bool SetOutput(const std::string &path);
    void Log(config::LogLevel level, const std::string &message);

    // 메시지 조립 비용을 피하려는 호출자가 먼저 확인한다.
    bool IsEnabled(config::LogLevel level) const;
    config::LogLevel level() const { return level_; }

   private:
    config::LogLevel level_;
    std::string path_;
    std::ofstream file_;

    void WriteLine(const std::string &line);
};
