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

#include "protocol/ProtocolTypes.h"

namespace VCH {

std::string errorTypeToString(ErrorType type) {
    switch (type) {
    case ErrorType::NONE:
        return "None";
    case ErrorType::LAUNCH_FAILURE:
        return "LaunchFailure";
    case ErrorType::STARTUP_FAILURE:
        return "StartupFailure";
    case ErrorType::PROTOCOL_VERSION_MISMATCH:
        return "ProtocolVersionMismatch";
    case ErrorType::INVALID_METADATA:
        return "InvalidMetadata";
    case ErrorType::DIALECT_UNSUPPORTED:
        return "DialectUnsupported";
    case ErrorType::SEQUENCE_MISMATCH:
        return "SequenceMismatch";
    case ErrorType::INVALID_RESPONSE:
        return "InvalidResponse";
    case ErrorType::TRANSPORT_FAILURE:
        return "TransportFailure";
    case ErrorType::REPORT_PARSE_FAILURE:
        return "ReportParseFailure";
    }
    return "Unknown";
}

}  // namespace VCH
