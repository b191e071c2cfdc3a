/**
 * @file Logging.h
 * @brief Logging utilities
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

#ifndef SPOOLBRIDGE_ENABLE_LOGGING
#define SPOOLBRIDGE_ENABLE_LOGGING 1
#endif

#define LOG_DEBUG(fmt, ...) Logger::log(Logger::Level::Debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  Logger::log(Logger::Level::Info, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  Logger::log(Logger::Level::Warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) Logger::log(Logger::Level::Error, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

class Logger {
public:
    enum class Level : uint8_t {
        Debug = 0,
        Info,
        Warn,
        Error,
        Off
    };

    // ANSI color codes
    static constexpr const char* COLOR_RESET   = "\033[0m";
    static constexpr const char* COLOR_RED     = "\033[31m";
    static constexpr const char* COLOR_YELLOW  = "\033[33m";
    static constexpr const char* COLOR_GREEN   = "\033[32m";
    static constexpr const char* COLOR_CYAN    = "\033[36m";
    static constexpr const char* COLOR_GRAY    = "\033[90m";

    /**
     * @brief Set the minimum level that is printed
     *
     * @param level Messages below this level are discarded
     */
    static void setLevel(Level level) {
        threshold() = level;
    }

    static Level getLevel() {
        return threshold();
    }

    /**
     * @brief Parse a level name ("debug", "info", "warn", "error", "off")
     *
     * @param name Level name, case-sensitive lower case
     * @param fallback Returned when the name is unknown
     * @return Level Parsed level
     */
    static Level parseLevel(const char* name, Level fallback) {
        if (name == nullptr) {
            return fallback;
        }
        if (std::strcmp(name, "debug") == 0) return Level::Debug;
        if (std::strcmp(name, "info") == 0)  return Level::Info;
        if (std::strcmp(name, "warn") == 0)  return Level::Warn;
        if (std::strcmp(name, "error") == 0) return Level::Error;
        if (std::strcmp(name, "off") == 0)   return Level::Off;
        return fallback;
    }

    static void log(Level level, const char* file, int line, const char* fmt, ...) {
#if SPOOLBRIDGE_ENABLE_LOGGING
        if (level < threshold()) {
            return;
        }

        const char* color = COLOR_RESET;
        const char* tag = "INFO";
        switch (level) {
            case Level::Debug:
                color = COLOR_CYAN;
                tag = "DEBUG";
                break;
            case Level::Info:
                color = COLOR_GREEN;
                tag = "INFO";
                break;
            case Level::Warn:
                color = COLOR_YELLOW;
                tag = "WARN";
                break;
            case Level::Error:
                color = COLOR_RED;
                tag = "ERROR";
                break;
            default:
                return;
        }

        // Strip the directory part, the full path only adds noise
        const char* base = std::strrchr(file, '/');
        base = (base != nullptr) ? base + 1 : file;

        std::fprintf(stderr, "%s[%s]%s %s[%s:%d]%s ",
                     color, tag, COLOR_RESET,
                     COLOR_GRAY, base, line, COLOR_RESET);

        va_list args;
        va_start(args, fmt);
        std::vfprintf(stderr, fmt, args);
        va_end(args);

        std::fprintf(stderr, "\n");
#else
        (void)level;
        (void)file;
        (void)line;
        (void)fmt;
#endif
    }

private:
    static Level& threshold() {
        static Level current = Level::Info;
        return current;
    }
};
