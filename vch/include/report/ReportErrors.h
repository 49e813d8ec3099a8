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

#include "report/Report.h"
#include <optional>
#include <stdexcept>
#include <string>

namespace VCH {

/**
 * @brief A serialized report could not be read back
 */
class ReportParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The report holds no case records
 *
 * Carries the metadata when a metadata record was present, so a consumer
 * can tell "nothing ran" apart from "nothing was written at all".
 */
class EmptyReportError : public ReportParseError {
public:
    explicit EmptyReportError(std::optional<ReportMetadata> metadata = std::nullopt)
        : ReportParseError(metadata ? "report contains no test case results" : "report is empty"),
          metadata_(std::move(metadata)) {}

    const std::optional<ReportMetadata> &metadata() const {
        return metadata_;
    }

private:
    std::optional<ReportMetadata> metadata_;
};

/**
 * @brief A report line is not a well-formed record
 */
class InvalidReportError : public ReportParseError {
public:
    InvalidReportError(size_t lineNumber, const std::string &message)
        : ReportParseError("line " + std::to_string(lineNumber) + ": " + message), lineNumber_(lineNumber) {}

    size_t lineNumber() const {
        return lineNumber_;
    }

private:
    size_t lineNumber_;
};

}  // namespace VCH
