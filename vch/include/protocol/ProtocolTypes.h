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

#include "common/JsonUtils.h"
#include <string>

namespace VCH {

/**
 * @brief Failure taxonomy shared by sessions, the orchestrator and report readers
 */
enum class ErrorType {
    NONE,
    LAUNCH_FAILURE,             // Execution unit could not be created
    STARTUP_FAILURE,            // Unit exists but the start handshake failed
    PROTOCOL_VERSION_MISMATCH,  // Implementation speaks another protocol version
    INVALID_METADATA,           // Start response metadata failed validation
    DIALECT_UNSUPPORTED,        // Implementation refused or does not declare the dialect
    SEQUENCE_MISMATCH,          // Run response echoed the wrong seq
    INVALID_RESPONSE,           // Response line was not a well-formed response
    TRANSPORT_FAILURE,          // Process died, pipe broke or response timed out
    REPORT_PARSE_FAILURE        // A serialized report could not be read back
};

/**
 * @brief Stable name of an error type, e.g. "SequenceMismatch"
 */
std::string errorTypeToString(ErrorType type);

/**
 * @brief Result of one protocol exchange
 */
struct ProtocolResult {
    bool isSuccess = false;
    ErrorType errorType = ErrorType::NONE;
    std::string errorMessage;
    std::string stderrOutput;  // What the implementation wrote to its error stream, if anything
    json response;             // Decoded response (on success)

    static ProtocolResult success(json response = json::object()) {
        ProtocolResult result;
        result.isSuccess = true;
        result.response = std::move(response);
        return result;
    }

    static ProtocolResult error(ErrorType type, const std::string &message, std::string stderrOutput = "") {
        ProtocolResult result;
        result.errorType = type;
        result.errorMessage = message;
        result.stderrOutput = std::move(stderrOutput);
        return result;
    }
};

}  // namespace VCH
