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
#include "harness/HarnessConfig.h"
#include "harness/HarnessOrchestrator.h"
#include <optional>
#include <string>
#include <vector>

namespace VCH {

/**
 * @brief Process exit codes of the vch tool (sysexits.h values)
 */
namespace ExitCode {
constexpr int OK = 0;
constexpr int USAGE = 2;
constexpr int DATA_ERROR = 65;
constexpr int NO_INPUT = 66;
constexpr int CONFIG_ERROR = 78;
}  // namespace ExitCode

int exitCodeFor(RunStatus status);

enum class CliCommand { RUN, INFO, HELP, VERSION };

struct CliOptions {
    CliCommand command{CliCommand::RUN};
    HarnessConfig config;
    std::optional<std::string> inputFile;  // stdin when unset or "-"
    std::optional<LogLevel> logLevel;
    std::optional<std::string> logDir;
};

struct CliParseResult {
    bool isSuccess = false;
    CliOptions options;
    std::string errorMessage;
    int exitCode = ExitCode::OK;

    static CliParseResult success(CliOptions options) {
        CliParseResult result;
        result.isSuccess = true;
        result.options = std::move(options);
        return result;
    }

    static CliParseResult error(const std::string &message, int exitCode = ExitCode::USAGE) {
        CliParseResult result;
        result.errorMessage = message;
        result.exitCode = exitCode;
        return result;
    }
};

/**
 * @brief Parse vch's arguments (without the program name)
 *
 * Unknown options and unknown dialects are usage errors; option
 * combinations rejected by HarnessConfig::validate() are configuration
 * errors.
 */
CliParseResult parseCommandLine(const std::vector<std::string> &args);

std::string usage(const std::string &program);

}  // namespace VCH
