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

#include "harness/ResultClassifier.h"

namespace VCH {

namespace {

json contextFrom(const json &object) {
    auto it = object.find("context");
    if (it == object.end() || it->is_null()) {
        return json::object();
    }
    if (it->is_object()) {
        return *it;
    }
    return json{{"message", *it}};
}

SkippedOutcome skippedFrom(const json &object) {
    return SkippedOutcome{JsonUtils::getOptionalString(object, "message"),
                          JsonUtils::getOptionalString(object, "issue_url")};
}

bool isMarked(const json &object, const char *key) {
    auto it = object.find(key);
    return it != object.end() && JsonUtils::isTruthy(*it);
}

}  // namespace

Outcome ResultClassifier::classifyResult(const json &element) {
    if (element.is_object()) {
        if (isMarked(element, "errored")) {
            return ErroredOutcome{contextFrom(element), false};
        }
        if (isMarked(element, "skipped")) {
            return skippedFrom(element);
        }
        auto valid = element.find("valid");
        if (valid != element.end() && valid->is_boolean()) {
            if (valid->get<bool>()) {
                return ValidOutcome{};
            }
            return InvalidOutcome{};
        }
    }
    return ErroredOutcome{json{{"message", "unrecognized result"}, {"result", element}}, false};
}

std::vector<Outcome> ResultClassifier::classifyResponse(const json &response, const TestCase &testCase) {
    if (isMarked(response, "errored")) {
        return erroredCase(testCase, contextFrom(response));
    }
    if (isMarked(response, "skipped")) {
        return std::vector<Outcome>(testCase.tests.size(), skippedFrom(response));
    }

    auto results = response.find("results");
    if (results == response.end() || !results->is_array() || results->size() != testCase.tests.size()) {
        return erroredCase(testCase, json{{"message", "unrecognized response"}, {"response", response}});
    }

    std::vector<Outcome> outcomes;
    outcomes.reserve(results->size());
    for (const auto &element : *results) {
        outcomes.push_back(classifyResult(element));
    }
    return outcomes;
}

std::vector<Outcome> ResultClassifier::erroredCase(const TestCase &testCase, const json &context) {
    return std::vector<Outcome>(testCase.tests.size(), ErroredOutcome::forCase(context));
}

}  // namespace VCH
