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

#include "model/Dialect.h"
#include "model/ImplementationInfo.h"
#include "model/TestCase.h"
#include "process/ITransport.h"
#include "protocol/ProtocolTypes.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace VCH {

enum class SessionState { UNSTARTED, STARTING, READY, DIALECT_SET, RUNNING, STOPPED, CRASHED };

std::string sessionStateToString(SessionState state);

struct SessionTimeouts {
    std::chrono::milliseconds start{std::chrono::seconds(30)};
    std::chrono::milliseconds response{std::chrono::seconds(30)};
    std::chrono::milliseconds stopGrace{std::chrono::seconds(2)};
};

/**
 * @brief The harness side of one implementation's protocol conversation
 *
 * Owns the transport exclusively. A failed exchange (bad JSON, wrong seq)
 * leaves the session usable; only a dead transport moves it to CRASHED,
 * which is absorbing. A session is driven by one thread at a time.
 */
class ProtocolSession {
public:
    ProtocolSession(std::string id, std::unique_ptr<ITransport> transport, SessionTimeouts timeouts = {});
    ~ProtocolSession();

    ProtocolSession(const ProtocolSession &) = delete;
    ProtocolSession &operator=(const ProtocolSession &) = delete;

    /**
     * @brief Handshake: send the protocol version, validate the reply
     *
     * Any failure crashes the session; it is never retried.
     */
    ProtocolResult start();

    /**
     * @brief Select the dialect for the rest of the run
     *
     * Fails with DIALECT_UNSUPPORTED without contacting the implementation
     * when its metadata does not declare the dialect. The dialect can only
     * be set once.
     */
    ProtocolResult setDialect(const Dialect &dialect);

    /**
     * @brief Next sequence number for run(); strictly increasing per session
     */
    int nextSequenceNumber();

    /**
     * @brief Send one test case and return the validated response envelope
     *
     * On success `response` holds either a `results` array with one entry
     * per test, or a case-level `errored` / `skipped` marker.
     */
    ProtocolResult run(int seq, const TestCase &testCase);

    /**
     * @brief Ask the implementation to stop and tear the unit down; idempotent
     */
    void stop();

    /**
     * @brief Error-stream output collected since the last call
     */
    std::string takeStderr();

    SessionState state() const {
        return state_;
    }

    const std::string &id() const {
        return id_;
    }

    const std::optional<ImplementationInfo> &info() const {
        return info_;
    }

    const std::optional<Dialect> &dialect() const {
        return dialect_;
    }

private:
    ProtocolResult crash(ErrorType type, const std::string &message);
    ProtocolResult exchangeFailure(ErrorType type, const std::string &message);
    void shutdownTransport();

    std::string id_;
    std::unique_ptr<ITransport> transport_;
    SessionTimeouts timeouts_;
    SessionState state_{SessionState::UNSTARTED};
    std::optional<ImplementationInfo> info_;
    std::optional<Dialect> dialect_;
    int lastSequenceNumber_{0};
    bool transportClosed_{false};
};

}  // namespace VCH
