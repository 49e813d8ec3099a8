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

#include "harness/HarnessOrchestrator.h"
#include "common/Logger.h"
#include "harness/ResultClassifier.h"
#include <algorithm>
#include <format>
#include <future>

namespace VCH {

std::string runStatusToString(RunStatus status) {
    switch (status) {
    case RunStatus::OK:
        return "OK";
    case RunStatus::NO_INPUT:
        return "NO_INPUT";
    case RunStatus::CONFIG_ERROR:
        return "CONFIG_ERROR";
    case RunStatus::DATA_ERROR:
        return "DATA_ERROR";
    }
    return "UNKNOWN";
}

HarnessOrchestrator::HarnessOrchestrator(const HarnessConfig &config, IProcessLauncher &launcher,
                                         IImplementationResolver &resolver, IDiagnosticSink &diagnostics)
    : config_(config), launcher_(launcher), resolver_(resolver), diagnostics_(diagnostics) {}

RunSummary HarnessOrchestrator::run(ITestCaseSource &source, IReportSink &sink) {
    RunSummary summary;

    auto problems = config_.validate();
    if (!problems.empty()) {
        for (const auto &problem : problems) {
            LOG_ERROR("HarnessOrchestrator: {}", problem);
        }
        summary.status = RunStatus::CONFIG_ERROR;
        return summary;
    }

    const Dialect &dialect = config_.effectiveDialect();
    const std::string started = JsonUtils::utcTimestamp();

    auto live = startAll(&dialect);
    for (const auto &id : config_.implementations) {
        bool isLive = std::any_of(live.begin(), live.end(), [&id](const auto &session) { return session->id() == id; });
        if (!isLive) {
            summary.dropped.push_back(id);
        }
    }
    if (live.empty()) {
        LOG_ERROR("HarnessOrchestrator: no implementation started");
        summary.status = RunStatus::CONFIG_ERROR;
        return summary;
    }

    ReportMetadata metadata{dialect, {}, started, config_.harnessVersion, config_.args};
    for (const auto &session : live) {
        metadata.implementations.emplace(session->id(), *session->info());
        summary.implementations[session->id()];
    }
    sink.writeMetadata(metadata);

    LOG_INFO("HarnessOrchestrator: running {} implementation(s) under {}", live.size(), dialect.prettyName);

    while (!live.empty()) {
        auto next = source.next();
        if (!next) {
            break;
        }
        if (config_.caseFilter && next->description.find(*config_.caseFilter) == std::string::npos) {
            continue;
        }

        TestCase testCase = config_.setSchema ? next->withDialect(dialect) : std::move(*next);
        checkDeclaredDialect(testCase);

        CaseResult record{testCase, std::vector<std::map<std::string, Outcome>>(testCase.tests.size())};
        size_t caseFailures = 0;
        dispatch(testCase, live, record, summary, caseFailures);

        sink.writeCase(record);
        ++summary.casesDispatched;
        summary.failures += caseFailures;

        if (config_.failFast && caseFailures > 0) {
            diagnostics_.report({DiagnosticKind::STOPPED, "",
                                 std::format("stopping after '{}' failed (--fail-fast)", testCase.description)});
            summary.stoppedEarly = true;
            break;
        }
        if (config_.maxFail && summary.failures >= *config_.maxFail) {
            diagnostics_.report({DiagnosticKind::STOPPED, "",
                                 std::format("stopping after {} failures (--max-fail {})", summary.failures,
                                             *config_.maxFail)});
            summary.stoppedEarly = true;
            break;
        }
    }

    if (live.empty() && !summary.stoppedEarly) {
        LOG_WARN("HarnessOrchestrator: every implementation crashed, stopping");
    }

    for (auto &session : live) {
        session->stop();
    }

    if (summary.casesDispatched == 0) {
        diagnostics_.report({DiagnosticKind::NO_INPUT, "", "no test cases were run"});
        summary.status = RunStatus::NO_INPUT;
    } else if (config_.expectSuccess && !summary.isSuccessful()) {
        summary.status = RunStatus::DATA_ERROR;
    }

    LOG_INFO("HarnessOrchestrator: {} case(s), {} failure(s), status {}", summary.casesDispatched, summary.failures,
             runStatusToString(summary.status));
    return summary;
}

std::vector<std::unique_ptr<ProtocolSession>> HarnessOrchestrator::startAll(const Dialect *dialect) {
    const auto &ids = config_.implementations;
    std::vector<Diagnostic> failures(ids.size());
    std::vector<std::future<std::unique_ptr<ProtocolSession>>> pending;
    pending.reserve(ids.size());

    for (size_t i = 0; i < ids.size(); ++i) {
        pending.push_back(std::async(std::launch::async, [this, &ids, &failures, dialect, i] {
            return startOne(ids[i], dialect, failures[i]);
        }));
    }

    std::vector<std::unique_ptr<ProtocolSession>> sessions;
    for (size_t i = 0; i < pending.size(); ++i) {
        auto session = pending[i].get();
        if (session) {
            sessions.push_back(std::move(session));
        } else {
            diagnostics_.report(failures[i]);
        }
    }
    return sessions;
}

std::unique_ptr<ProtocolSession> HarnessOrchestrator::startOne(const std::string &id, const Dialect *dialect,
                                                               Diagnostic &failure) {
    std::string error;
    auto spec = resolver_.resolve(id, &error);
    if (!spec) {
        failure = {DiagnosticKind::START_FAILED, id, "failed to start: " + error, "", ErrorType::LAUNCH_FAILURE};
        return nullptr;
    }

    auto launched = launcher_.launch(*spec);
    if (!launched.isSuccess) {
        failure = {DiagnosticKind::START_FAILED, id, "failed to start: " + launched.errorMessage, "",
                   ErrorType::LAUNCH_FAILURE};
        return nullptr;
    }

    auto session = std::make_unique<ProtocolSession>(id, std::move(launched.transport), config_.timeouts);
    auto started = session->start();
    if (!started.isSuccess) {
        failure = {DiagnosticKind::START_FAILED, id, "failed to start: " + started.errorMessage, started.stderrOutput,
                   started.errorType};
        return nullptr;
    }

    if (dialect) {
        auto selected = session->setDialect(*dialect);
        if (!selected.isSuccess) {
            if (selected.errorType == ErrorType::DIALECT_UNSUPPORTED) {
                failure = {DiagnosticKind::DIALECT_UNSUPPORTED, id, selected.errorMessage, selected.stderrOutput,
                           selected.errorType};
            } else {
                failure = {DiagnosticKind::DIALECT_FAILED, id,
                           "failed as we were beginning: " + selected.errorMessage, selected.stderrOutput,
                           selected.errorType};
            }
            session->stop();
            return nullptr;
        }
    }

    return session;
}

void HarnessOrchestrator::dispatch(const TestCase &testCase, std::vector<std::unique_ptr<ProtocolSession>> &live,
                                   CaseResult &record, RunSummary &summary, size_t &caseFailures) {
    std::vector<std::future<ProtocolResult>> pending;
    pending.reserve(live.size());
    for (auto &session : live) {
        ProtocolSession *target = session.get();
        pending.push_back(std::async(std::launch::async, [target, &testCase] {
            return target->run(target->nextSequenceNumber(), testCase);
        }));
    }

    for (size_t i = 0; i < live.size(); ++i) {
        ProtocolSession &session = *live[i];
        ProtocolResult result = pending[i].get();

        std::vector<Outcome> outcomes;
        if (result.isSuccess) {
            outcomes = ResultClassifier::classifyResponse(result.response, testCase);
            std::string stderrOutput = session.takeStderr();
            if (!stderrOutput.empty()) {
                diagnostics_.report({DiagnosticKind::IMPLEMENTATION_STDERR, session.id(),
                                     std::format("wrote to stderr during '{}'", testCase.description), stderrOutput});
            }
        } else {
            json context{{"message", result.errorMessage}};
            if (!result.stderrOutput.empty()) {
                context["stderr"] = result.stderrOutput;
            }
            outcomes = ResultClassifier::erroredCase(testCase, context);

            if (session.state() == SessionState::CRASHED) {
                diagnostics_.report({DiagnosticKind::CRASHED, session.id(),
                                     std::format("crashed during '{}': {}", testCase.description,
                                                 result.errorMessage),
                                     result.stderrOutput, result.errorType});
            } else {
                auto kind = result.errorType == ErrorType::SEQUENCE_MISMATCH ? DiagnosticKind::SEQUENCE_MISMATCH
                                                                              : DiagnosticKind::INVALID_RESPONSE;
                diagnostics_.report({kind, session.id(),
                                     std::format("{} in '{}'", result.errorMessage, testCase.description),
                                     result.stderrOutput, result.errorType});
            }
        }

        auto &tally = summary.implementations[session.id()];
        for (size_t t = 0; t < outcomes.size(); ++t) {
            const Outcome &outcome = outcomes[t];
            ++tally.outcomes;
            if (std::holds_alternative<ValidOutcome>(outcome)) {
                ++tally.valid;
            } else if (std::holds_alternative<InvalidOutcome>(outcome)) {
                ++tally.invalid;
            } else if (std::holds_alternative<ErroredOutcome>(outcome)) {
                ++tally.errored;
            } else {
                ++tally.skipped;
            }
            if (isFailure(outcome, testCase.tests[t])) {
                ++tally.failed;
                ++caseFailures;
            }
            record.results[t].emplace(session.id(), outcome);
        }
    }

    auto crashed = std::remove_if(live.begin(), live.end(), [&summary](const auto &session) {
        if (session->state() != SessionState::CRASHED) {
            return false;
        }
        summary.dropped.push_back(session->id());
        return true;
    });
    live.erase(crashed, live.end());
}

void HarnessOrchestrator::checkDeclaredDialect(const TestCase &testCase) {
    auto declared = testCase.declaredDialect();
    if (!declared) {
        return;
    }
    auto resolved = DialectRegistry::known().byUri(*declared);
    if (!resolved && testCase.registry && testCase.registry->is_object()) {
        // A metaschema from the case's registry names its dialect through its own $schema
        auto metaschema = testCase.registry->find(*declared);
        if (metaschema != testCase.registry->end()) {
            if (auto viaRegistry = JsonUtils::getOptionalString(*metaschema, "$schema")) {
                resolved = DialectRegistry::known().byUri(*viaRegistry);
            }
        }
    }
    // Unknown declarations are treated as absent
    const Dialect &dialect = config_.effectiveDialect();
    if (resolved && !(*resolved == dialect)) {
        diagnostics_.report({DiagnosticKind::DIALECT_MISMATCH, "",
                             std::format("'{}' declares {} but the run uses {}", testCase.description,
                                         resolved->prettyName, dialect.prettyName)});
    }
}

}  // namespace VCH
