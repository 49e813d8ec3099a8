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

#include <chrono>
#include <string>

namespace VCH {

/**
 * @brief Result of a single transport operation
 */
struct TransportResult {
    bool isSuccess = false;
    std::string line;          // Line read (readLine only), without the trailing newline
    std::string errorMessage;  // Error description (if failed)

    enum class ErrorType {
        NONE,
        CLOSED,       // Peer closed its output (EOF) or exited
        TIMEOUT,      // No complete line within the deadline
        BROKEN_PIPE,  // Peer no longer reads its input
        IO_ERROR
    } errorType = ErrorType::NONE;

    static TransportResult success(std::string line = "") {
        TransportResult result;
        result.isSuccess = true;
        result.line = std::move(line);
        return result;
    }

    static TransportResult error(const std::string &error, ErrorType type) {
        TransportResult result;
        result.isSuccess = false;
        result.errorMessage = error;
        result.errorType = type;
        return result;
    }
};

/**
 * @brief Line-oriented duplex channel to one running implementation
 *
 * A transport is owned exclusively by one ProtocolSession and is only ever
 * used from one thread at a time.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Write one line; a newline is appended
     */
    virtual TransportResult writeLine(const std::string &line) = 0;

    /**
     * @brief Read the next complete line, waiting at most `timeout`
     *
     * Partial writes from the peer are buffered until a newline arrives.
     */
    virtual TransportResult readLine(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Everything the implementation wrote to its error stream since the last call
     */
    virtual std::string takeStderr() = 0;

    virtual bool isAlive() = 0;

    /**
     * @brief Close the channel and end the execution unit
     *
     * Waits up to `gracePeriod` for a voluntary exit before forcing it.
     * Must tolerate the unit having already exited; calling twice is harmless.
     */
    virtual void terminate(std::chrono::milliseconds gracePeriod) = 0;
};

}  // namespace VCH
