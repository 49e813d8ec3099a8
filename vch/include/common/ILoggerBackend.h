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

#include <optional>
#include <source_location>
#include <string>

namespace VCH {

/**
 * @brief Log level enumeration
 *
 * Matches common logging frameworks (spdlog, glog, etc.)
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
 *
 * Accepts the same spellings as the SPDLOG_LEVEL environment variable,
 * case-insensitively ("warning" and "err" are aliases).
 *
 * @return Parsed level, or nullopt for an unknown name
 */
std::optional<LogLevel> parseLogLevel(const std::string &name);

/**
 * @brief Logger backend interface for dependency injection
 *
 * Users can implement this interface to route harness logs into their own
 * logging system without a compile-time dependency on spdlog.
 *
 * Example: Custom logger integration
 * @code
 * class MyCompanyLogger : public VCH::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message,
 *              const std::source_location &loc) override {
 *         myCompanyLoggingSystem->write(level, message, loc.file_name(), loc.line());
 *     }
 *
 *     void setLevel(LogLevel level) override {
 *         myCompanyLoggingSystem->setMinLevel(level);
 *     }
 *
 *     void flush() override {
 *         myCompanyLoggingSystem->flush();
 *     }
 * };
 *
 * // In main():
 * VCH::Logger::setBackend(std::make_unique<MyCompanyLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     *
     * @param level Log level
     * @param message Pre-formatted message (function name already included)
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Set minimum log level
     *
     * Messages below this level should be ignored.
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush log buffers
     */
    virtual void flush() = 0;
};

}  // namespace VCH
