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

#include "backends/DefaultBackend.h"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <format>

namespace VCH {

DefaultBackend::DefaultBackend(std::ostream &out) : out_(out), currentLevel_(LogLevel::Warn) {
    // Honour SPDLOG_LEVEL so both backends are configured the same way
    const char *env_level = std::getenv("SPDLOG_LEVEL");
    if (env_level) {
        if (auto level = parseLogLevel(env_level)) {
            currentLevel_ = *level;
        }
    }
}

void DefaultBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < currentLevel_ || currentLevel_ == LogLevel::Off) {
        return;
    }

    out_ << "[" << getTimestamp() << "] [" << levelToString(level) << "] " << message << "\n";
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

const char *DefaultBackend::levelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    default:
        return "unknown";
    }
}

std::string DefaultBackend::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_time_t, &tm_buf);

    return std::format("{:02d}:{:02d}:{:02d}.{:03d}", tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(now_ms.count()));
}

}  // namespace VCH
