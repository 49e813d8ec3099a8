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
#include "common/Logger.h"
#include "harness/HarnessOrchestrator.h"
#include "process/SubprocessTransport.h"
#include "report/ReportSink.h"
#include <cstdio>
#include <fstream>
#include <iostream>

#ifndef VCH_VERSION
#define VCH_VERSION "0.0.0"
#endif

namespace {

int printInfo(VCH::HarnessOrchestrator &orchestrator) {
    auto sessions = orchestrator.startAll(nullptr);
    if (sessions.empty()) {
        return VCH::ExitCode::CONFIG_ERROR;
    }

    VCH::json info = VCH::json::object();
    for (auto &session : sessions) {
        info[session->id()] = session->info()->toJson();
        session->stop();
    }
    std::cout << VCH::JsonUtils::toPrettyString(info) << std::endl;
    return VCH::ExitCode::OK;
}

}  // namespace

/**
 * @brief vch - run schema validator implementations against a shared case stream
 *
 * The report goes to stdout, diagnostics and logs to stderr.
 */
int main(int argc, char *argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = VCH::parseCommandLine(args);
    if (!parsed.isSuccess) {
        fprintf(stderr, "%s: %s\n", argv[0], parsed.errorMessage.c_str());
        fprintf(stderr, "Try '%s --help' for more information.\n", argv[0]);
        return parsed.exitCode;
    }

    VCH::CliOptions &options = parsed.options;
    if (options.command == VCH::CliCommand::HELP) {
        printf("%s", VCH::usage(argv[0]).c_str());
        return VCH::ExitCode::OK;
    }
    if (options.command == VCH::CliCommand::VERSION) {
        printf("vch %s\n", VCH_VERSION);
        return VCH::ExitCode::OK;
    }

    if (options.logDir) {
        VCH::Logger::initialize(*options.logDir, true);
    } else {
        VCH::Logger::initialize();
    }
    if (options.logLevel) {
        VCH::Logger::setLevel(*options.logLevel);
    }

    options.config.harnessVersion = VCH_VERSION;

    VCH::SubprocessLauncher launcher;
    VCH::DefaultImplementationResolver resolver(VCH::HarnessConfig::containerRuntime());
    VCH::StreamDiagnosticSink diagnostics(std::cerr);
    VCH::HarnessOrchestrator orchestrator(options.config, launcher, resolver, diagnostics);

    if (options.command == VCH::CliCommand::INFO) {
        int code = printInfo(orchestrator);
        VCH::Logger::flush();
        return code;
    }

    std::ifstream file;
    std::istream *input = &std::cin;
    if (options.inputFile && *options.inputFile != "-") {
        file.open(*options.inputFile);
        if (!file) {
            fprintf(stderr, "%s: cannot open '%s'\n", argv[0], options.inputFile->c_str());
            return VCH::ExitCode::NO_INPUT;
        }
        input = &file;
    }

    VCH::JsonLinesTestCaseSource source(*input);
    VCH::JsonLinesReportSink sink(std::cout);

    int code = VCH::ExitCode::OK;
    try {
        auto summary = orchestrator.run(source, sink);
        code = VCH::exitCodeFor(summary.status);
    } catch (const VCH::TestCaseSourceError &e) {
        LOG_ERROR("vch: {}", e.what());
        fprintf(stderr, "%s: %s\n", argv[0], e.what());
        code = VCH::ExitCode::DATA_ERROR;
    }

    VCH::Logger::flush();
    return code;
}
