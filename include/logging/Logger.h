//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logging with level filtering, optional file sink and console routing.
//==========================================================================================================
#pragma once

#include <cstdlib>
#include <format>
#include <fstream>
#include <mutex>
#include <string>

#include "env/EnvVars.h"

enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

//==========================================================================================================
// Logger
// Purpose: Formats "[LEVEL] hh:mm:ss.mmm file:line: message" lines to stderr (or stdout with
//          STDIOMCP_LOG_STDOUT=1) and to an optional append-mode log file.
// Notes:
//   - STDIOMCP_LOG_COLOR=0 disables ANSI colour on the level label.
//   - Use the LOG_* macros; they skip argument formatting below the current level.
//==========================================================================================================
class Logger {
public:
    // Case-insensitive DEBUG/INFO/WARN(ING)/ERROR/FATAL; anything else maps to fallback.
    static LogLevel levelFromString(const std::string& lvl, LogLevel fallback = LogLevel::LOG_INFO_LEVEL);

    template <typename... Args>
    static void logf(const char* level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            buffer = std::format("Format error: {} (format: {})", e.what(), fmt);
        }
        log(level, buffer, file, line);
    }

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line);

    static void setLogLevel(LogLevel level) { sLogLevel = level; }

    // Appends to filePath from now on; a failure to open is reported on stderr and otherwise ignored.
    static void setLogFile(const std::string& filePath);

    //==========================================================================================================
    // configureFromEnvironment
    // Purpose: Applies STDIOMCP_LOG_LEVEL and STDIOMCP_LOG_FILE when present.
    // Args:
    //   defaultLevel: Level used when STDIOMCP_LOG_LEVEL is unset or unrecognized.
    //==========================================================================================================
    static void configureFromEnvironment(LogLevel defaultLevel);

    static LogLevel sLogLevel;

private:
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
