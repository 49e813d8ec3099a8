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

#include "model/Outcome.h"
#include <format>

namespace VCH {

namespace {

// Helper for std::visit with lambdas
template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

constexpr const char *TAG_VALID = "valid";
constexpr const char *TAG_INVALID = "invalid";
constexpr const char *TAG_ERROR = "error";
constexpr const char *TAG_SKIPPED = "skipped";

}  // namespace

std::string outcomeTag(const Outcome &outcome) {
    return std::visit(Overloaded{
                          [](const ValidOutcome &) { return std::string(TAG_VALID); },
                          [](const InvalidOutcome &) { return std::string(TAG_INVALID); },
                          [](const ErroredOutcome &) { return std::string(TAG_ERROR); },
                          [](const SkippedOutcome &) { return std::string(TAG_SKIPPED); },
                      },
                      outcome);
}

json outcomeToJson(const Outcome &outcome) {
    return std::visit(Overloaded{
                          [](const ValidOutcome &) { return json(TAG_VALID); },
                          [](const InvalidOutcome &) { return json(TAG_INVALID); },
                          [](const ErroredOutcome &errored) {
                              json out = {{"outcome", TAG_ERROR}, {"context", errored.context}};
                              if (errored.inErroredCase) {
                                  out["in_errored_case"] = true;
                              }
                              return out;
                          },
                          [](const SkippedOutcome &skipped) {
                              json out = {{"outcome", TAG_SKIPPED}};
                              if (skipped.message) {
                                  out["message"] = *skipped.message;
                              }
                              if (skipped.issueUrl) {
                                  out["issue_url"] = *skipped.issueUrl;
                              }
                              return out;
                          },
                      },
                      outcome);
}

std::optional<Outcome> outcomeFromJson(const json &raw, std::string *errorOut) {
    std::string tag;
    if (raw.is_string()) {
        tag = raw.get<std::string>();
    } else {
        tag = JsonUtils::getString(raw, "outcome");
    }

    if (tag == TAG_VALID) {
        return ValidOutcome{};
    }
    if (tag == TAG_INVALID) {
        return InvalidOutcome{};
    }
    if (tag == TAG_ERROR && raw.is_object()) {
        ErroredOutcome errored;
        if (auto context = raw.find("context"); context != raw.end()) {
            errored.context = *context;
        }
        if (auto flag = raw.find("in_errored_case"); flag != raw.end() && flag->is_boolean()) {
            errored.inErroredCase = flag->get<bool>();
        }
        return errored;
    }
    if (tag == TAG_SKIPPED && raw.is_object()) {
        return SkippedOutcome{JsonUtils::getOptionalString(raw, "message"),
                              JsonUtils::getOptionalString(raw, "issue_url")};
    }

    if (errorOut) {
        *errorOut = std::format("unknown outcome {}", JsonUtils::toCompactString(raw));
    }
    return std::nullopt;
}

bool isFailure(const Outcome &outcome, const Test &test) {
    if (std::holds_alternative<ErroredOutcome>(outcome) || std::holds_alternative<SkippedOutcome>(outcome)) {
        return true;
    }

    const bool saidValid = std::holds_alternative<ValidOutcome>(outcome);
    if (test.valid) {
        return saidValid != *test.valid;
    }
    return !saidValid;
}

}  // namespace VCH
