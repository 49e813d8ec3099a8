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

#include "backends/SpdlogBackend.h"
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace VCH {

namespace {
constexpr const char *LOGGER_NAME = "VCH";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
}  // namespace

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(console_sink);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "vch.log";

        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        file_sink->set_pattern(FILE_PATTERN);
        sinks.push_back(file_sink);
    }

    // A second backend (e.g. re-initialization in tests) must not collide in the registry
    spdlog::drop(LOGGER_NAME);
    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    spdlog::register_logger(logger_);

    logger_->set_level(spdlog::level::warn);

    const char *env_level = std::getenv("SPDLOG_LEVEL");
    if (env_level) {
        if (auto level = parseLogLevel(env_level)) {
            logger_->set_level(convertLevel(*level));
        }
    }
}

void SpdlogBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    if (logger_) {
        logger_->log(convertLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    default:
        return spdlog::level::warn;
    }
}

}  // namespace VCH
