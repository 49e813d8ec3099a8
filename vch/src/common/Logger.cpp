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

#include "common/Logger.h"

#ifdef VCH_USE_SPDLOG
#include "backends/SpdlogBackend.h"
#else
#include "backends/DefaultBackend.h"
#endif

#include <algorithm>
#include <cctype>
#include <mutex>

namespace VCH {

std::unique_ptr<ILoggerBackend> Logger::backend_;

static std::mutex backend_mutex;

std::optional<LogLevel> parseLogLevel(const std::string &name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") {
        return LogLevel::Trace;
    } else if (lowered == "debug") {
        return LogLevel::Debug;
    } else if (lowered == "info") {
        return LogLevel::Info;
    } else if (lowered == "warn" || lowered == "warning") {
        return LogLevel::Warn;
    } else if (lowered == "err" || lowered == "error") {
        return LogLevel::Error;
    } else if (lowered == "critical") {
        return LogLevel::Critical;
    } else if (lowered == "off") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
#ifdef VCH_USE_SPDLOG
        backend_ = std::make_unique<SpdlogBackend>();
#else
        backend_ = std::make_unique<DefaultBackend>();
#endif
    }
}

void Logger::initialize([[maybe_unused]] const std::string &logDir, [[maybe_unused]] bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
#ifdef VCH_USE_SPDLOG
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
        // DefaultBackend doesn't support file logging
        backend_ = std::make_unique<DefaultBackend>();
#endif
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::write(LogLevel level, const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(level, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string full_name = loc.function_name();

    size_t paren_pos = full_name.find('(');
    if (paren_pos == std::string::npos) {
        return "UnknownFunction";
    }

    // The qualified name starts after the last top-level space (return type)
    size_t name_start = 0;
    int angle_depth = 0;
    for (size_t i = 0; i < paren_pos; i++) {
        char c = full_name[i];
        if (c == '<') {
            angle_depth++;
        } else if (c == '>') {
            angle_depth--;
        } else if (c == ' ' && angle_depth == 0) {
            name_start = i + 1;
        }
    }

    std::string result;
    int template_depth = 0;
    for (size_t i = name_start; i < paren_pos; i++) {
        char c = full_name[i];
        if (c == '<') {
            template_depth++;
        } else if (c == '>') {
            template_depth--;
        } else if (template_depth == 0 && c != '*' && c != '&') {
            result += c;
        }
    }

    constexpr std::string_view NAMESPACE_PREFIX = "VCH::";
    if (result.starts_with(NAMESPACE_PREFIX)) {
        result.erase(0, NAMESPACE_PREFIX.size());
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace VCH
