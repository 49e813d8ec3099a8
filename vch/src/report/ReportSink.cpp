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

#include "report/ReportSink.h"
#include "report/ReportErrors.h"

namespace VCH {

JsonLinesReportSink::JsonLinesReportSink(std::ostream &out) : out_(out) {}

void JsonLinesReportSink::writeMetadata(const ReportMetadata &metadata) {
    writeLine(metadata.toJson());
}

void JsonLinesReportSink::writeCase(const CaseResult &caseResult) {
    writeLine(caseResult.toJson());
}

void JsonLinesReportSink::writeLine(const json &record) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << JsonUtils::toCompactString(record) << '\n';
    out_.flush();
}

void InMemoryReportSink::writeMetadata(const ReportMetadata &metadata) {
    metadata_ = metadata;
}

void InMemoryReportSink::writeCase(const CaseResult &caseResult) {
    cases_.push_back(caseResult);
}

Report InMemoryReportSink::report() const {
    if (!metadata_ || cases_.empty()) {
        throw EmptyReportError(metadata_);
    }
    return Report{*metadata_, cases_};
}

}  // namespace VCH
