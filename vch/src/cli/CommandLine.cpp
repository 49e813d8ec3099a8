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

#include "cli/CommandLine.h"
#include <format>

namespace VCH {

namespace {

std::optional<std::chrono::milliseconds> parseSeconds(const std::string &value) {
    try {
        size_t consumed = 0;
        double seconds = std::stod(value, &consumed);
        if (consumed != value.size() || seconds <= 0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

std::optional<size_t> parseCount(const std::string &value) {
    try {
        size_t consumed = 0;
        long long count = std::stoll(value, &consumed);
        if (consumed != value.size() || count < 0) {
            return std::nullopt;
        }
        return static_cast<size_t>(count);
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

}  // namespace

int exitCodeFor(RunStatus status) {
    switch (status) {
    case RunStatus::OK:
        return ExitCode::OK;
    case RunStatus::NO_INPUT:
        return ExitCode::NO_INPUT;
    case RunStatus::CONFIG_ERROR:
        return ExitCode::CONFIG_ERROR;
    case RunStatus::DATA_ERROR:
        return ExitCode::DATA_ERROR;
    }
    return ExitCode::CONFIG_ERROR;
}

CliParseResult parseCommandLine(const std::vector<std::string> &args) {
    CliOptions options;
    HarnessConfig &config = options.config;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string &arg = args[i];

        auto value = [&](std::string &out) {
            if (i + 1 >= args.size()) {
                return false;
            }
            out = args[++i];
            return true;
        };
        std::string operand;

        if (arg == "-h" || arg == "--help") {
            options.command = CliCommand::HELP;
            return CliParseResult::success(std::move(options));
        } else if (arg == "--version") {
            options.command = CliCommand::VERSION;
            return CliParseResult::success(std::move(options));
        } else if (arg == "--info") {
            options.command = CliCommand::INFO;
        } else if (arg == "-i" || arg == "--implementation") {
            if (!value(operand)) {
                return CliParseResult::error(arg + " needs an implementation id");
            }
            config.implementations.push_back(operand);
        } else if (arg == "-D" || arg == "--dialect") {
            if (!value(operand)) {
                return CliParseResult::error(arg + " needs a dialect");
            }
            auto dialect = DialectRegistry::known().lookup(operand);
            if (!dialect) {
                return CliParseResult::error(std::format("unknown dialect '{}'", operand));
            }
            config.dialect = *dialect;
        } else if (arg == "-x" || arg == "--fail-fast") {
            config.failFast = true;
        } else if (arg == "--max-fail") {
            if (!value(operand)) {
                return CliParseResult::error("--max-fail needs a count");
            }
            auto count = parseCount(operand);
            if (!count) {
                return CliParseResult::error(std::format("invalid --max-fail count '{}'", operand));
            }
            config.maxFail = *count;
        } else if (arg == "-k" || arg == "--filter") {
            if (!value(operand)) {
                return CliParseResult::error(arg + " needs a substring");
            }
            config.caseFilter = operand;
        } else if (arg == "--set-schema") {
            config.setSchema = true;
        } else if (arg == "--expect-success") {
            config.expectSuccess = true;
        } else if (arg == "--start-timeout" || arg == "--read-timeout" || arg == "--stop-grace") {
            if (!value(operand)) {
                return CliParseResult::error(arg + " needs a number of seconds");
            }
            auto timeout = parseSeconds(operand);
            if (!timeout) {
                return CliParseResult::error(std::format("invalid {} '{}'", arg, operand));
            }
            if (arg == "--start-timeout") {
                config.timeouts.start = *timeout;
            } else if (arg == "--read-timeout") {
                config.timeouts.response = *timeout;
            } else {
                config.timeouts.stopGrace = *timeout;
            }
        } else if (arg == "--log-level") {
            if (!value(operand)) {
                return CliParseResult::error("--log-level needs a level");
            }
            auto level = parseLogLevel(operand);
            if (!level) {
                return CliParseResult::error(std::format("unknown log level '{}'", operand));
            }
            options.logLevel = *level;
        } else if (arg == "--log-dir") {
            if (!value(operand)) {
                return CliParseResult::error("--log-dir needs a directory");
            }
            options.logDir = operand;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return CliParseResult::error(std::format("unknown option '{}'", arg));
        } else if (!options.inputFile) {
            options.inputFile = arg;
        } else {
            return CliParseResult::error(std::format("unexpected argument '{}'", arg));
        }
    }

    config.args = args;

    auto problems = config.validate();
    if (!problems.empty()) {
        std::string message;
        for (const auto &problem : problems) {
            if (!message.empty()) {
                message += "; ";
            }
            message += problem;
        }
        return CliParseResult::error(message, ExitCode::CONFIG_ERROR);
    }

    return CliParseResult::success(std::move(options));
}

std::string usage(const std::string &program) {
    std::string text = std::format("Usage: {} -i IMPLEMENTATION [-i ...] [options] [CASES_FILE]\n", program);
    text += R"(
Run test cases (one JSON object per line, from CASES_FILE or stdin) against
every implementation and write the report, one JSON record per line, to stdout.

Implementations:
  -i, --implementation ID  Implementation to run (repeatable)
                           exec:PROGRAM [ARGS]   run a program directly
                           container:NAME        attach to an existing container
                           image:REF or REF      run a container image (no network)
      --info               Start each implementation, print its metadata and exit

Run control:
  -D, --dialect DIALECT    Dialect URI or name (e.g. 2020-12, 7); default newest
  -x, --fail-fast          Stop after the first case with a failure
      --max-fail N         Stop once N failures have been seen
  -k, --filter TEXT        Only run cases whose description contains TEXT
      --set-schema         Add $schema for the dialect to schemas without one
      --expect-success     Exit with status 65 when any outcome is a failure
      --start-timeout SEC  Time an implementation gets to answer start (default 30)
      --read-timeout SEC   Time an implementation gets to answer a case (default 30)
      --stop-grace SEC     Time to exit after stop before it is killed (default 2)

Logging:
      --log-level LEVEL    trace, debug, info, warn, error, critical or off
      --log-dir DIR        Also write logs to DIR/vch.log

  -h, --help               Show this help message
      --version            Show the version

Environment:
  VCH_CONTAINER_RUNTIME    Container CLI to use (default docker)
  SPDLOG_LEVEL             Default log level
)";
    return text;
}

}  // namespace VCH
