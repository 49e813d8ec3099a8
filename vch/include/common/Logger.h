// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-VCH-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of VCH (Validator Conformance Harness).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: https://github.com/newmassrael/validator-conformance-harness/blob/main/LICENSE

#pragma once

#include "common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace VCH {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * All harness logging goes through this facade. Logs are written to the
 * error stream only: standard output is reserved for the report stream.
 *
 * 1. Default mode: Uses built-in backend (spdlog if available, DefaultBackend otherwise)
 * 2. Custom mode: Users inject their own ILoggerBackend implementation
 *
 * Thread-safe: backend selection is guarded by a mutex, and both built-in
 * backends serialize their own output.
 *
 * @code
 * VCH::Logger::initialize();
 * LOG_INFO("Starting {} implementations", count);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     *
     * Replaces the current backend with a user-provided implementation.
     *
     * @param backend User's logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stderr, no file)
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     *
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const std::string &message, const std::source_location &loc);
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace VCH

// std::format based logging macros with source_location capture
#define LOG_TRACE(...) VCH::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) VCH::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) VCH::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) VCH::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) VCH::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
