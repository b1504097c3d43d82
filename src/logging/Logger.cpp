//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger state and sinks. The library stays quiet (WARN and above) until a host raises the level.
//==========================================================================================================

#include "logging/Logger.h"

#include <errno.h>
#include <time.h>

#include <cctype>
#include <chrono>
#include <cstring>
#include <iostream>

LogLevel Logger::sLogLevel = LogLevel::LOG_WARN_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {
bool envFlag(const char* name, const char* fallback) {
    const std::string v = GetEnvOrDefault(name, fallback);
    return v == "1" || v == "true" || v == "TRUE";
}

const char* labelColor(const char* level) {
    if (::strcmp(level, "ERROR") == 0 || ::strcmp(level, "FATAL") == 0) return "\033[38;5;88m";
    if (::strcmp(level, "WARN") == 0) return "\033[33m";
    return "\033[35m";
}

std::string wallClock() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::localtime_r(&secs, &tm);
    return std::format("{:02}:{:02}:{:02}.{:03}", tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
}
} // namespace

LogLevel Logger::levelFromString(const std::string& lvl, LogLevel fallback) {
    std::string s;
    for (char c : lvl) {
        s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO") return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
    return fallback;
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    static const bool color = envFlag("STDIOMCP_LOG_COLOR", "1");
    static const bool toStdout = envFlag("STDIOMCP_LOG_STDOUT", "0");

    const std::string body = std::format("{} {}:{}: {}\n", wallClock(), file, line, msg);
    std::lock_guard<std::mutex> lock(sLogMutex);
    std::ostream& console = toStdout ? std::cout : std::cerr;
    if (color) {
        console << "[" << labelColor(level) << level << "\033[0m] " << body;
    } else {
        console << "[" << level << "] " << body;
    }
    console.flush();
    if (sLogFile.is_open()) {
        sLogFile << "[" << level << "] " << body;
        sLogFile.flush();
    }
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << " msg="
                  << ::strerror(errno) << ")" << std::endl;
        return;
    }
    sLogFile << "\n=== stdiomcp log opened at " << wallClock() << " ===\n";
    sLogFile.flush();
}

void Logger::configureFromEnvironment(LogLevel defaultLevel) {
    const std::string lvl = GetEnvOrDefault("STDIOMCP_LOG_LEVEL", "");
    setLogLevel(lvl.empty() ? defaultLevel : levelFromString(lvl, defaultLevel));
    const std::string file = GetEnvOrDefault("STDIOMCP_LOG_FILE", "");
    if (!file.empty()) {
        setLogFile(file);
    }
}
