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

#include "model/TestCase.h"
#include <istream>
#include <optional>
#include <stdexcept>

namespace VCH {

/**
 * @brief A test case record in the input could not be parsed
 */
class TestCaseSourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Ordered stream of test cases
 */
class ITestCaseSource {
public:
    virtual ~ITestCaseSource() = default;

    /**
     * @return The next case, or nullopt at end of input
     * @throws TestCaseSourceError on a malformed record
     */
    virtual std::optional<TestCase> next() = 0;
};

/**
 * @brief One JSON test case per line; blank lines are skipped
 */
class JsonLinesTestCaseSource : public ITestCaseSource {
public:
    explicit JsonLinesTestCaseSource(std::istream &input);

    std::optional<TestCase> next() override;

private:
    std::istream &input_;
    size_t lineNumber_{0};
};

}  // namespace VCH
