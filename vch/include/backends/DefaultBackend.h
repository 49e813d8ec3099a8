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
#include <iostream>
#include <mutex>
#include <ostream>

namespace VCH {

/**
 * @brief Plain stream logger with no external dependencies
 *
 * Used when VCH is built without spdlog (VCH_USE_SPDLOG=OFF).
 * Writes "[HH:MM:SS.mmm] [level] message" lines to the given stream
 * (stderr by default) under a mutex. No file logging, no colors.
 */
class DefaultBackend : public ILoggerBackend {
public:
    explicit DefaultBackend(std::ostream &out = std::cerr);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::ostream &out_;
    LogLevel currentLevel_;
    std::mutex mutex_;

    const char *levelToString(LogLevel level);
    std::string getTimestamp();
};

}  // namespace VCH
