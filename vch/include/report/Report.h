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
#include "model/Dialect.h"
#include "model/ImplementationInfo.h"
#include "model/Outcome.h"
#include "model/TestCase.h"
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace VCH {

/**
 * @brief First record of every report
 */
struct ReportMetadata {
    Dialect dialect;
    std::map<std::string, ImplementationInfo> implementations;  // id -> metadata, started implementations only
    std::string started;                                        // ISO-8601 UTC
    std::string harnessVersion;
    std::vector<std::string> args;

    bool operator==(const ReportMetadata &) const = default;

    json toJson() const;

    /**
     * @throws InvalidReportError on malformed metadata
     */
    static ReportMetadata fromJson(const json &raw, size_t lineNumber = 1);
};

/**
 * @brief Outcomes of one test case: one row per test, keyed by implementation id
 *
 * A row only has entries for implementations that were live when the case ran.
 */
struct CaseResult {
    TestCase testCase;
    std::vector<std::map<std::string, Outcome>> results;

    bool operator==(const CaseResult &) const = default;

    json toJson() const;

    /**
     * @throws InvalidReportError on malformed case records
     */
    static CaseResult fromJson(const json &raw, size_t lineNumber);
};

/**
 * @brief A complete run: metadata plus case results in input order
 */
struct Report {
    ReportMetadata metadata;
    std::vector<CaseResult> cases;

    bool operator==(const Report &) const = default;

    /**
     * @brief Newline-delimited JSON: metadata line then one line per case
     */
    std::string serialize() const;

    /**
     * @brief Read a report written by serialize() or a JsonLinesReportSink
     *
     * Blank lines are ignored.
     *
     * @throws EmptyReportError when there is no metadata or no case record
     * @throws InvalidReportError when any line is malformed
     */
    static Report fromSerialized(std::istream &input);

    static Report fromLines(const std::vector<std::string> &lines);
};

}  // namespace VCH
