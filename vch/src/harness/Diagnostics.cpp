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

#include "harness/Diagnostics.h"
#include "common/Logger.h"

namespace VCH {

std::string diagnosticKindToString(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::START_FAILED:
        return "start-failed";
    case DiagnosticKind::DIALECT_UNSUPPORTED:
        return "dialect-unsupported";
    case DiagnosticKind::DIALECT_FAILED:
        return "dialect-failed";
    case DiagnosticKind::CRASHED:
        return "crashed";
    case DiagnosticKind::SEQUENCE_MISMATCH:
        return "sequence-mismatch";
    case DiagnosticKind::INVALID_RESPONSE:
        return "invalid-response";
    case DiagnosticKind::DIALECT_MISMATCH:
        return "dialect-mismatch";
    case DiagnosticKind::STOPPED:
        return "stopped";
    case DiagnosticKind::NO_INPUT:
        return "no-input";
    case DiagnosticKind::IMPLEMENTATION_STDERR:
        return "stderr";
    }
    return "unknown";
}

bool Diagnostic::isError() const {
    switch (kind) {
    case DiagnosticKind::START_FAILED:
    case DiagnosticKind::DIALECT_FAILED:
    case DiagnosticKind::CRASHED:
    case DiagnosticKind::SEQUENCE_MISMATCH:
    case DiagnosticKind::INVALID_RESPONSE:
        return true;
    default:
        return false;
    }
}

std::string Diagnostic::format() const {
    std::string line = implementation.empty() ? message : std::format("{}: {}", implementation, message);
    if (!stderrOutput.empty()) {
        line += "\n  stderr:\n";
        line += stderrOutput;
        if (line.back() != '\n') {
            line += '\n';
        }
        line.pop_back();
    }
    return line;
}

StreamDiagnosticSink::StreamDiagnosticSink(std::ostream &out) : out_(out) {}

void StreamDiagnosticSink::report(const Diagnostic &diagnostic) {
    std::string text = diagnostic.format();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "[" << diagnosticKindToString(diagnostic.kind) << "] " << text << std::endl;
    }

    if (diagnostic.isError()) {
        LOG_INFO("{} ({})", text, errorTypeToString(diagnostic.errorType));
    } else {
        LOG_DEBUG("{}", text);
    }
}

}  // namespace VCH
