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

#include "protocol/ProtocolSession.h"
#include "common/Logger.h"
#include "protocol/Protocol.h"

namespace VCH {

std::string sessionStateToString(SessionState state) {
    switch (state) {
    case SessionState::UNSTARTED:
        return "Unstarted";
    case SessionState::STARTING:
        return "Starting";
    case SessionState::READY:
        return "Ready";
    case SessionState::DIALECT_SET:
        return "DialectSet";
    case SessionState::RUNNING:
        return "Running";
    case SessionState::STOPPED:
        return "Stopped";
    case SessionState::CRASHED:
        return "Crashed";
    }
    return "Unknown";
}

ProtocolSession::ProtocolSession(std::string id, std::unique_ptr<ITransport> transport, SessionTimeouts timeouts)
    : id_(std::move(id)), transport_(std::move(transport)), timeouts_(timeouts) {}

ProtocolSession::~ProtocolSession() {
    stop();
}

ProtocolResult ProtocolSession::start() {
    if (state_ != SessionState::UNSTARTED) {
        return ProtocolResult::error(ErrorType::STARTUP_FAILURE,
                                     std::format("cannot start a session in state {}", sessionStateToString(state_)));
    }
    state_ = SessionState::STARTING;

    auto written = transport_->writeLine(JsonUtils::toCompactString(Protocol::startRequest()));
    if (!written.isSuccess) {
        return crash(ErrorType::STARTUP_FAILURE, written.errorMessage);
    }

    auto read = transport_->readLine(timeouts_.start);
    if (!read.isSuccess) {
        return crash(ErrorType::STARTUP_FAILURE, read.errorMessage);
    }

    std::string parseError;
    auto response = JsonUtils::parseJson(read.line, &parseError);
    if (!response || !response->is_object()) {
        return crash(ErrorType::STARTUP_FAILURE, std::format("invalid JSON response={}", read.line));
    }

    const auto version = response->find("version");
    if (version == response->end() || !version->is_number_integer() || *version != json(Protocol::VERSION)) {
        std::string declared = version == response->end() ? "none" : JsonUtils::toCompactString(*version);
        return crash(ErrorType::PROTOCOL_VERSION_MISMATCH,
                     std::format("expected to speak version {} but speaks version {}", Protocol::VERSION, declared));
    }

    const auto implementation = response->find("implementation");
    if (implementation == response->end()) {
        return crash(ErrorType::INVALID_METADATA, "'implementation' is a required property");
    }
    auto metadata = parseImplementationInfo(*implementation);
    if (!metadata.isSuccess) {
        return crash(ErrorType::INVALID_METADATA, metadata.errorSummary());
    }

    info_ = std::move(metadata.info);
    state_ = SessionState::READY;
    LOG_DEBUG("ProtocolSession: '{}' started ({} {})", id_, info_->language, info_->name);
    return ProtocolResult::success(std::move(*response));
}

ProtocolResult ProtocolSession::setDialect(const Dialect &dialect) {
    if (state_ != SessionState::READY) {
        return ProtocolResult::error(ErrorType::DIALECT_UNSUPPORTED,
                                     std::format("cannot set dialect in state {}", sessionStateToString(state_)));
    }
    if (!info_->supports(dialect)) {
        return ProtocolResult::error(ErrorType::DIALECT_UNSUPPORTED,
                                     std::format("does not support {}", dialect.prettyName));
    }

    auto written = transport_->writeLine(JsonUtils::toCompactString(Protocol::dialectRequest(dialect)));
    if (!written.isSuccess) {
        return crash(ErrorType::TRANSPORT_FAILURE, written.errorMessage);
    }

    auto read = transport_->readLine(timeouts_.response);
    if (!read.isSuccess) {
        return crash(ErrorType::TRANSPORT_FAILURE, read.errorMessage);
    }

    auto response = JsonUtils::parseJson(read.line);
    if (!response || !response->is_object()) {
        return exchangeFailure(ErrorType::INVALID_RESPONSE, std::format("invalid JSON response={}", read.line));
    }

    const auto ok = response->find("ok");
    if (ok == response->end() || !JsonUtils::isTruthy(*ok)) {
        return ProtocolResult::error(ErrorType::DIALECT_UNSUPPORTED,
                                     std::format("does not support {}", dialect.prettyName), takeStderr());
    }

    dialect_ = dialect;
    state_ = SessionState::DIALECT_SET;
    return ProtocolResult::success(std::move(*response));
}

int ProtocolSession::nextSequenceNumber() {
    return lastSequenceNumber_ + 1;
}

ProtocolResult ProtocolSession::run(int seq, const TestCase &testCase) {
    if (state_ != SessionState::DIALECT_SET && state_ != SessionState::RUNNING) {
        return ProtocolResult::error(ErrorType::TRANSPORT_FAILURE,
                                     std::format("cannot run in state {}", sessionStateToString(state_)));
    }
    if (seq <= lastSequenceNumber_) {
        return ProtocolResult::error(
            ErrorType::SEQUENCE_MISMATCH,
            std::format("sequence number {} does not follow {}", seq, lastSequenceNumber_));
    }
    lastSequenceNumber_ = seq;
    state_ = SessionState::RUNNING;

    auto written = transport_->writeLine(JsonUtils::toCompactString(Protocol::runRequest(seq, testCase)));
    if (!written.isSuccess) {
        return crash(ErrorType::TRANSPORT_FAILURE, written.errorMessage);
    }

    auto read = transport_->readLine(timeouts_.response);
    if (!read.isSuccess) {
        return crash(ErrorType::TRANSPORT_FAILURE, read.errorMessage);
    }

    auto response = JsonUtils::parseJson(read.line);
    if (!response || !response->is_object()) {
        return exchangeFailure(ErrorType::INVALID_RESPONSE, std::format("invalid JSON response={}", read.line));
    }

    const auto echoed = response->find("seq");
    if (echoed == response->end() || !echoed->is_number_integer() || *echoed != json(seq)) {
        std::string got = echoed == response->end() ? "none" : JsonUtils::toCompactString(*echoed);
        return exchangeFailure(ErrorType::SEQUENCE_MISMATCH,
                               std::format("mismatched seq (expected {}, got {})", seq, got));
    }

    if (response->contains("errored") && JsonUtils::isTruthy((*response)["errored"])) {
        return ProtocolResult::success(std::move(*response));
    }
    if (response->contains("skipped") && JsonUtils::isTruthy((*response)["skipped"])) {
        return ProtocolResult::success(std::move(*response));
    }

    const auto results = response->find("results");
    if (results == response->end() || !results->is_array()) {
        return exchangeFailure(ErrorType::INVALID_RESPONSE, std::format("missing results response={}", read.line));
    }
    if (results->size() != testCase.tests.size()) {
        return exchangeFailure(ErrorType::INVALID_RESPONSE,
                               std::format("expected {} results but got {} response={}", testCase.tests.size(),
                                           results->size(), read.line));
    }

    return ProtocolResult::success(std::move(*response));
}

void ProtocolSession::stop() {
    if (transportClosed_) {
        return;
    }

    if (state_ == SessionState::READY || state_ == SessionState::DIALECT_SET || state_ == SessionState::RUNNING) {
        auto written = transport_->writeLine(JsonUtils::toCompactString(Protocol::stopRequest()));
        if (!written.isSuccess) {
            LOG_DEBUG("ProtocolSession: '{}' did not accept stop: {}", id_, written.errorMessage);
        }
    }

    shutdownTransport();
    if (state_ != SessionState::CRASHED) {
        state_ = SessionState::STOPPED;
    }
}

std::string ProtocolSession::takeStderr() {
    return transport_ ? transport_->takeStderr() : std::string();
}

ProtocolResult ProtocolSession::crash(ErrorType type, const std::string &message) {
    LOG_DEBUG("ProtocolSession: '{}' crashed in state {}: {}", id_, sessionStateToString(state_), message);
    state_ = SessionState::CRASHED;
    shutdownTransport();
    return ProtocolResult::error(type, message, takeStderr());
}

ProtocolResult ProtocolSession::exchangeFailure(ErrorType type, const std::string &message) {
    // A bad exchange escalates to a crash only when the transport is gone too
    if (!transport_->isAlive()) {
        return crash(type, message);
    }
    return ProtocolResult::error(type, message, takeStderr());
}

void ProtocolSession::shutdownTransport() {
    if (transportClosed_) {
        return;
    }
    transportClosed_ = true;
    transport_->terminate(timeouts_.stopGrace);
}

}  // namespace VCH
