// src/common/utils/logger/Logger.hpp
#pragma once

#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <memory>
#include <functional>
#include <string>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>

#ifndef OBJFETCH_COMPILE_LOG_LEVEL
    #ifdef NDEBUG
        #define OBJFETCH_COMPILE_LOG_LEVEL 3  // Release: ERROR 이상만
    #else
        #define OBJFETCH_COMPILE_LOG_LEVEL 0  // Debug: 모든 로그
    #endif
#endif

namespace objfetch::utils {

enum class LogLevel : int {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4,
    NONE = 5
};

/**
 * @brief 로그 라인 수신 콜백
 *
 * 포맷이 끝난 한 줄(개행 제외)을 받는다. 콘솔/파일 출력과 별개로 호출된다.
 */
using LogSink = std::function<void(LogLevel, const std::string&)>;

class Logger {
private:
    inline static std::unique_ptr<Logger> instance = nullptr;
    inline static std::mutex instance_mutex;

    LogLevel min_level = static_cast<LogLevel>(OBJFETCH_COMPILE_LOG_LEVEL);
    std::mutex log_mutex;
    std::ofstream file;
    bool console_enabled = true;
    bool console_stderr_only = false;
    bool file_enabled = false;
    LogSink sink;

    Logger() = default;

    static const char* LogLevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKN ";
        }
    }

    static std::string GetTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

public:
    static Logger& Instance() {
        std::lock_guard<std::mutex> lock(instance_mutex);
        if (!instance) {
            instance.reset(new Logger());
        }
        return *instance;
    }

    static LogLevel ParseLevel(const char* str) {
        if (!str) return LogLevel::INFO;

        std::string level_str(str);
        if (level_str == "DEBUG" || level_str == "0") return LogLevel::DEBUG;
        if (level_str == "INFO"  || level_str == "1") return LogLevel::INFO;
        if (level_str == "WARN"  || level_str == "2") return LogLevel::WARN;
        if (level_str == "ERROR" || level_str == "3") return LogLevel::ERROR;
        if (level_str == "FATAL" || level_str == "4") return LogLevel::FATAL;
        if (level_str == "NONE"  || level_str == "5") return LogLevel::NONE;

        return LogLevel::INFO;
    }

    /**
     * @brief 로거 초기화
     *
     * 런타임 레벨은 OBJFETCH_LOG_LEVEL, 없으면 LOG_LEVEL 환경변수에서 읽는다.
     * 컴파일 레벨보다 낮게 요청하면 컴파일 레벨을 사용한다.
     *
     * @param log_file 로그 파일 경로 (nullptr 또는 빈 문자열이면 파일 출력 안 함)
     * @param enable_console 콘솔 출력 여부
     */
    void Initialize(const char* log_file = nullptr, bool enable_console = true) {
        std::lock_guard<std::mutex> lock(log_mutex);

        console_enabled = enable_console;

        if (log_file && log_file[0] != '\0') {
            if (file.is_open()) {
                file.close();
            }
            file.open(log_file, std::ios::app);
            file_enabled = file.is_open();
            if (!file_enabled) {
                std::cerr << "[Logger] Failed to open log file: " << log_file << std::endl;
            }
        }

        const char* runtime_level = std::getenv("OBJFETCH_LOG_LEVEL");
        if (!runtime_level) {
            runtime_level = std::getenv("LOG_LEVEL");
        }

        min_level = static_cast<LogLevel>(OBJFETCH_COMPILE_LOG_LEVEL);
        if (runtime_level) {
            LogLevel requested_level = ParseLevel(runtime_level);
            if (static_cast<int>(requested_level) >= OBJFETCH_COMPILE_LOG_LEVEL) {
                min_level = requested_level;
            }
        }
    }

    void SetLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(log_mutex);
        if (static_cast<int>(level) < OBJFETCH_COMPILE_LOG_LEVEL) {
            level = static_cast<LogLevel>(OBJFETCH_COMPILE_LOG_LEVEL);
        }
        min_level = level;
    }

    LogLevel GetLevel() {
        std::lock_guard<std::mutex> lock(log_mutex);
        return min_level;
    }

    void SetConsoleEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(log_mutex);
        console_enabled = enabled;
    }

    // stdout 을 데이터 출력에 쓰는 경우 콘솔 로그를 모두 stderr 로
    void SetConsoleStderrOnly(bool enabled) {
        std::lock_guard<std::mutex> lock(log_mutex);
        console_stderr_only = enabled;
    }

    /**
     * @brief 추가 출력 대상 등록 (빈 함수면 해제)
     */
    void SetSink(LogSink new_sink) {
        std::lock_guard<std::mutex> lock(log_mutex);
        sink = std::move(new_sink);
    }

    void Log(LogLevel level, const char* category, const char* message) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (static_cast<int>(level) < static_cast<int>(min_level)) return;

        std::string log_line = GetTimestamp() + " [" + LogLevelToString(level) + "] " +
                               "[" + category + "] " + message;

        if (console_enabled) {
            if (console_stderr_only || level >= LogLevel::ERROR) {
                std::cerr << log_line << '\n';
            } else {
                std::cout << log_line << '\n';
            }
        }

        if (file_enabled && file.is_open()) {
            file << log_line << '\n';
            if (level >= LogLevel::ERROR) {
                file.flush();
            }
        }

        if (sink) {
            sink(level, log_line);
        }
    }

    void Logf(LogLevel level, const char* category, const char* format, ...) {
        char buffer[4096];
        va_list args;
        va_start(args, format);
        std::vsnprintf(buffer, sizeof(buffer), format, args);
        va_end(args);

        Log(level, category, buffer);
    }

    ~Logger() {
        if (file.is_open()) {
            file.close();
        }
    }
};

} // namespace objfetch::utils

// ========================================
// 컴파일 타임 로그 제거 매크로
// ========================================

#define LOG_IMPL(level, cat, msg) \
    objfetch::utils::Logger::Instance().Log(objfetch::utils::LogLevel::level, cat, msg)

#define LOG_IMPLF(level, cat, fmt, ...) \
    objfetch::utils::Logger::Instance().Logf(objfetch::utils::LogLevel::level, cat, fmt, ##__VA_ARGS__)

#if OBJFETCH_COMPILE_LOG_LEVEL <= 0
    #define LOG_DEBUG(cat, msg) LOG_IMPL(DEBUG, cat, msg)
    #define LOG_DEBUGF(cat, fmt, ...) LOG_IMPLF(DEBUG, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_DEBUG(cat, msg) ((void)0)
    #define LOG_DEBUGF(cat, fmt, ...) ((void)0)
#endif

#if OBJFETCH_COMPILE_LOG_LEVEL <= 1
    #define LOG_INFO(cat, msg) LOG_IMPL(INFO, cat, msg)
    #define LOG_INFOF(cat, fmt, ...) LOG_IMPLF(INFO, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_INFO(cat, msg) ((void)0)
    #define LOG_INFOF(cat, fmt, ...) ((void)0)
#endif

#if OBJFETCH_COMPILE_LOG_LEVEL <= 2
    #define LOG_WARN(cat, msg) LOG_IMPL(WARN, cat, msg)
    #define LOG_WARNF(cat, fmt, ...) LOG_IMPLF(WARN, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_WARN(cat, msg) ((void)0)
    #define LOG_WARNF(cat, fmt, ...) ((void)0)
#endif

#if OBJFETCH_COMPILE_LOG_LEVEL <= 3
    #define LOG_ERROR(cat, msg) LOG_IMPL(ERROR, cat, msg)
    #define LOG_ERRORF(cat, fmt, ...) LOG_IMPLF(ERROR, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_ERROR(cat, msg) ((void)0)
    #define LOG_ERRORF(cat, fmt, ...) ((void)0)
#endif

#if OBJFETCH_COMPILE_LOG_LEVEL <= 4
    #define LOG_FATAL(cat, msg) LOG_IMPL(FATAL, cat, msg)
    #define LOG_FATALF(cat, fmt, ...) LOG_IMPLF(FATAL, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_FATAL(cat, msg) ((void)0)
    #define LOG_FATALF(cat, fmt, ...) ((void)0)
#endif
