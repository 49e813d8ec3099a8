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

#include "protocol/ProtocolTypes.h"
#include <mutex>
#include <ostream>
#include <string>

namespace VCH {

enum class DiagnosticKind {
    START_FAILED,           // launch, handshake, version or metadata failure
    DIALECT_UNSUPPORTED,    // implementation does not support the run dialect
    DIALECT_FAILED,         // dialect exchange itself failed
    CRASHED,                // transport died during a case
    SEQUENCE_MISMATCH,
    INVALID_RESPONSE,
    DIALECT_MISMATCH,       // case declares a different dialect than the run (advisory)
    STOPPED,                // fail-fast or max-fail ended the run
    NO_INPUT,
    IMPLEMENTATION_STDERR,  // implementation wrote to its error stream
};

std::string diagnosticKindToString(DiagnosticKind kind);

/**
 * @brief One side-channel message about the run
 *
 * Diagnostics never go to the report stream.
 */
struct Diagnostic {
    DiagnosticKind kind;
    std::string implementation;  // empty for run-wide diagnostics
    std::string message;
    std::string stderrOutput;
    ErrorType errorType{ErrorType::NONE};

    /**
     * @brief Whether the diagnostic reports lost results (vs. advisory)
     */
    bool isError() const;

    /**
     * @brief Single human readable line (stderr output appended on following lines)
     */
    std::string format() const;
};

class IDiagnosticSink {
public:
    virtual ~IDiagnosticSink() = default;

    virtual void report(const Diagnostic &diagnostic) = 0;
};

/**
 * @brief Writes diagnostics to a stream and mirrors them to the logger
 */
class StreamDiagnosticSink : public IDiagnosticSink {
public:
    explicit StreamDiagnosticSink(std::ostream &out);

    void report(const Diagnostic &diagnostic) override;

private:
    std::ostream &out_;
    std::mutex mutex_;
};

}  // namespace VCH
