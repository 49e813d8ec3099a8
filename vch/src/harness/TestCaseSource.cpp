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

#include "harness/TestCaseSource.h"
#include <format>
#include <string>

namespace VCH {

JsonLinesTestCaseSource::JsonLinesTestCaseSource(std::istream &input) : input_(input) {}

std::optional<TestCase> JsonLinesTestCaseSource::next() {
    std::string line;
    while (std::getline(input_, line)) {
        ++lineNumber_;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        std::string error;
        auto raw = JsonUtils::parseJson(line, &error);
        if (!raw) {
            throw TestCaseSourceError(std::format("input line {}: {}", lineNumber_, error));
        }
        auto testCase = TestCase::fromJson(*raw, &error);
        if (!testCase) {
            throw TestCaseSourceError(std::format("input line {}: {}", lineNumber_, error));
        }
        return testCase;
    }
    return std::nullopt;
}

}  // namespace VCH
