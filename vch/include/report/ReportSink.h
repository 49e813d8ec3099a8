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
#include <mutex>
#include <optional>
#include <ostream>

namespace VCH {

/**
 * @brief Receives report records as the run produces them
 *
 * The orchestrator calls writeMetadata once, then writeCase once per
 * dispatched case in input order.
 */
class IReportSink {
public:
    virtual ~IReportSink() = default;

    virtual void writeMetadata(const ReportMetadata &metadata) = 0;
    virtual void writeCase(const CaseResult &caseResult) = 0;
};

/**
 * @brief Streams records as newline-delimited JSON, flushing every line
 */
class JsonLinesReportSink : public IReportSink {
public:
    explicit JsonLinesReportSink(std::ostream &out);

    void writeMetadata(const ReportMetadata &metadata) override;
    void writeCase(const CaseResult &caseResult) override;

private:
    void writeLine(const json &record);

    std::ostream &out_;
    std::mutex mutex_;
};

/**
 * @brief Keeps the whole report in memory
 */
class InMemoryReportSink : public IReportSink {
public:
    void writeMetadata(const ReportMetadata &metadata) override;
    void writeCase(const CaseResult &caseResult) override;

    const std::optional<ReportMetadata> &metadata() const {
        return metadata_;
    }

    const std::vector<CaseResult> &cases() const {
        return cases_;
    }

    /**
     * @throws EmptyReportError when nothing or only metadata was written
     */
    Report report() const;

private:
    std::optional<ReportMetadata> metadata_;
    std::vector<CaseResult> cases_;
};

}  // namespace VCH
