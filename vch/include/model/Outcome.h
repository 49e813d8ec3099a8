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
#include "model/TestCase.h"
#include <optional>
#include <string>
#include <variant>

namespace VCH {

struct ValidOutcome {
    bool operator==(const ValidOutcome &) const = default;
};

struct InvalidOutcome {
    bool operator==(const InvalidOutcome &) const = default;
};

/**
 * @brief The implementation could not produce a result for a test
 *
 * `inErroredCase` distinguishes a single failed test from a whole case
 * that failed (crash, malformed response, case-level error marker).
 */
struct ErroredOutcome {
    json context = json::object();
    bool inErroredCase{false};

    bool operator==(const ErroredOutcome &) const = default;

    static ErroredOutcome forCase(json context = json::object()) {
        return ErroredOutcome{std::move(context), true};
    }
};

struct SkippedOutcome {
    std::optional<std::string> message;
    std::optional<std::string> issueUrl;

    bool operator==(const SkippedOutcome &) const = default;
};

/**
 * @brief Classified result of one implementation validating one test
 */
using Outcome = std::variant<ValidOutcome, InvalidOutcome, ErroredOutcome, SkippedOutcome>;

/**
 * @brief Report tag for an outcome: "valid", "invalid", "error" or "skipped"
 */
std::string outcomeTag(const Outcome &outcome);

/**
 * @brief Serialize an outcome for the report
 *
 * Valid and Invalid serialize to their bare tag string; Errored and Skipped
 * serialize to an object carrying the tag and their payload.
 */
json outcomeToJson(const Outcome &outcome);

/**
 * @brief Parse an outcome written by outcomeToJson
 * @param errorOut Optional error message output
 */
std::optional<Outcome> outcomeFromJson(const json &raw, std::string *errorOut = nullptr);

/**
 * @brief Whether an outcome counts against the run's failure budget
 *
 * Errored and Skipped always count. Otherwise the outcome counts when it
 * disagrees with the test's expected validity, or, for tests without an
 * expectation, when it is Invalid.
 */
bool isFailure(const Outcome &outcome, const Test &test);

}  // namespace VCH
