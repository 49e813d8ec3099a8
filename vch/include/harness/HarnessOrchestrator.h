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

#include "harness/Diagnostics.h"
#include "harness/HarnessConfig.h"
#include "harness/ImplementationResolver.h"
#include "harness/TestCaseSource.h"
#include "process/IProcessLauncher.h"
#include "protocol/ProtocolSession.h"
#include "report/ReportSink.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace VCH {

/**
 * @brief Logical end state of a run
 */
enum class RunStatus {
    OK,            // cases ran
    NO_INPUT,      // no case was dispatched
    CONFIG_ERROR,  // invalid configuration or no implementation started
    DATA_ERROR     // cases ran, failures present, and the caller expected none
};

std::string runStatusToString(RunStatus status);

struct ImplementationTally {
    size_t outcomes{0};
    size_t valid{0};
    size_t invalid{0};
    size_t errored{0};
    size_t skipped{0};
    size_t failed{0};  // outcomes counting against the failure budget
};

struct RunSummary {
    RunStatus status{RunStatus::OK};
    size_t casesDispatched{0};
    size_t failures{0};
    bool stoppedEarly{false};
    std::map<std::string, ImplementationTally> implementations;
    std::vector<std::string> dropped;  // ids that failed to start or crashed

    bool isSuccessful() const {
        return failures == 0;
    }
};

/**
 * @brief Drives every live implementation through the case stream
 *
 * Startup is concurrent; each case is sent to all live sessions
 * concurrently, and its record is written only after every session has
 * answered or crashed, so the report keeps input order. Sessions that
 * crash are dropped for the rest of the run.
 */
class HarnessOrchestrator {
public:
    HarnessOrchestrator(const HarnessConfig &config, IProcessLauncher &launcher, IImplementationResolver &resolver,
                        IDiagnosticSink &diagnostics);

    /**
     * @brief Run the whole case stream and write the report to `sink`
     *
     * @throws TestCaseSourceError when the input holds a malformed case
     */
    RunSummary run(ITestCaseSource &source, IReportSink &sink);

    /**
     * @brief Launch and start every configured implementation concurrently
     *
     * Implementations that fail are reported and left out. When `dialect`
     * is given, each started session is also switched to it and dropped
     * if it does not support it.
     *
     * @return Started sessions in configuration order
     */
    std::vector<std::unique_ptr<ProtocolSession>> startAll(const Dialect *dialect);

private:
    std::unique_ptr<ProtocolSession> startOne(const std::string &id, const Dialect *dialect, Diagnostic &failure);
    void dispatch(const TestCase &testCase, std::vector<std::unique_ptr<ProtocolSession>> &live, CaseResult &record,
                  RunSummary &summary, size_t &caseFailures);
    void checkDeclaredDialect(const TestCase &testCase);

    const HarnessConfig &config_;
    IProcessLauncher &launcher_;
    IImplementationResolver &resolver_;
    IDiagnosticSink &diagnostics_;
};

}  // namespace VCH
