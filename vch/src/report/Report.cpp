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

#include "report/Report.h"
#include "report/ReportErrors.h"
#include <format>
#include <istream>
#include <sstream>

namespace VCH {

json ReportMetadata::toJson() const {
    json impls = json::object();
    for (const auto &[id, info] : implementations) {
        impls[id] = info.toJson();
    }
    return json{{"dialect", dialect.uri},
                {"implementations", std::move(impls)},
                {"started", started},
                {"harness_version", harnessVersion},
                {"args", args}};
}

ReportMetadata ReportMetadata::fromJson(const json &raw, size_t lineNumber) {
    if (!raw.is_object()) {
        throw InvalidReportError(lineNumber, "metadata record is not a JSON object");
    }

    ReportMetadata metadata;

    auto uri = JsonUtils::getOptionalString(raw, "dialect");
    if (!uri) {
        throw InvalidReportError(lineNumber, "metadata has no 'dialect'");
    }
    auto dialect = DialectRegistry::known().byUri(*uri);
    if (!dialect) {
        throw InvalidReportError(lineNumber, std::format("unknown dialect '{}'", *uri));
    }
    metadata.dialect = *dialect;

    auto impls = raw.find("implementations");
    if (impls == raw.end() || !impls->is_object()) {
        throw InvalidReportError(lineNumber, "metadata has no 'implementations' object");
    }
    for (const auto &[id, value] : impls->items()) {
        auto parsed = parseImplementationInfo(value);
        if (!parsed.isSuccess) {
            throw InvalidReportError(lineNumber, std::format("implementation '{}': {}", id, parsed.errorSummary()));
        }
        metadata.implementations.emplace(id, std::move(parsed.info));
    }

    metadata.started = JsonUtils::getString(raw, "started");
    metadata.harnessVersion = JsonUtils::getString(raw, "harness_version");
    auto args = raw.find("args");
    if (args != raw.end() && args->is_array()) {
        for (const auto &arg : *args) {
            if (arg.is_string()) {
                metadata.args.push_back(arg.get<std::string>());
            }
        }
    }
    return metadata;
}

json CaseResult::toJson() const {
    json rows = json::array();
    for (const auto &row : results) {
        json outcomes = json::object();
        for (const auto &[id, outcome] : row) {
            outcomes[id] = outcomeToJson(outcome);
        }
        rows.push_back(std::move(outcomes));
    }
    return json{{"case", testCase.toJson()}, {"results", std::move(rows)}};
}

CaseResult CaseResult::fromJson(const json &raw, size_t lineNumber) {
    if (!raw.is_object() || !raw.contains("case")) {
        throw InvalidReportError(lineNumber, "case record has no 'case'");
    }

    std::string error;
    auto testCase = TestCase::fromJson(raw["case"], &error);
    if (!testCase) {
        throw InvalidReportError(lineNumber, error);
    }

    auto rows = raw.find("results");
    if (rows == raw.end() || !rows->is_array()) {
        throw InvalidReportError(lineNumber, "case record has no 'results' array");
    }
    if (rows->size() != testCase->tests.size()) {
        throw InvalidReportError(lineNumber, std::format("case has {} tests but {} result rows",
                                                         testCase->tests.size(), rows->size()));
    }

    CaseResult result{std::move(*testCase), {}};
    for (const auto &row : *rows) {
        if (!row.is_object()) {
            throw InvalidReportError(lineNumber, "result row is not a JSON object");
        }
        std::map<std::string, Outcome> outcomes;
        for (const auto &[id, value] : row.items()) {
            auto outcome = outcomeFromJson(value, &error);
            if (!outcome) {
                throw InvalidReportError(lineNumber, std::format("implementation '{}': {}", id, error));
            }
            outcomes.emplace(id, std::move(*outcome));
        }
        result.results.push_back(std::move(outcomes));
    }
    return result;
}

std::string Report::serialize() const {
    std::string out = JsonUtils::toCompactString(metadata.toJson());
    out += '\n';
    for (const auto &caseResult : cases) {
        out += JsonUtils::toCompactString(caseResult.toJson());
        out += '\n';
    }
    return out;
}

Report Report::fromSerialized(std::istream &input) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        lines.push_back(std::move(line));
    }
    return fromLines(lines);
}

Report Report::fromLines(const std::vector<std::string> &lines) {
    std::optional<ReportMetadata> metadata;
    std::vector<CaseResult> cases;

    size_t lineNumber = 0;
    for (const auto &line : lines) {
        ++lineNumber;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        std::string error;
        auto record = JsonUtils::parseJson(line, &error);
        if (!record) {
            throw InvalidReportError(lineNumber, error);
        }

        if (!metadata) {
            metadata = ReportMetadata::fromJson(*record, lineNumber);
        } else {
            cases.push_back(CaseResult::fromJson(*record, lineNumber));
        }
    }

    if (!metadata || cases.empty()) {
        throw EmptyReportError(std::move(metadata));
    }
    return Report{std::move(*metadata), std::move(cases)};
}

}  // namespace VCH
