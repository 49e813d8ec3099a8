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

#include "model/TestCase.h"
#include <format>

namespace VCH {

namespace {

void setError(std::string *errorOut, std::string message) {
    if (errorOut) {
        *errorOut = std::move(message);
    }
}

std::optional<Test> testFromJson(const json &raw, size_t index, std::string *errorOut) {
    if (!raw.is_object()) {
        setError(errorOut, std::format("test {} is not an object", index));
        return std::nullopt;
    }

    auto description = JsonUtils::getOptionalString(raw, "description");
    if (!description) {
        setError(errorOut, std::format("test {} has no string 'description'", index));
        return std::nullopt;
    }

    auto instance = raw.find("instance");
    if (instance == raw.end()) {
        setError(errorOut, std::format("test {} ('{}') has no 'instance'", index, *description));
        return std::nullopt;
    }

    Test test;
    test.description = *description;
    test.instance = *instance;
    test.comment = JsonUtils::getOptionalString(raw, "comment");

    auto valid = raw.find("valid");
    if (valid != raw.end() && !valid->is_null()) {
        if (!valid->is_boolean()) {
            setError(errorOut, std::format("test {} ('{}') has a non-boolean 'valid'", index, *description));
            return std::nullopt;
        }
        test.valid = valid->get<bool>();
    }
    return test;
}

}  // namespace

json Test::toJson() const {
    json out = {{"description", description}, {"instance", instance}};
    if (valid) {
        out["valid"] = *valid;
    }
    if (comment) {
        out["comment"] = *comment;
    }
    return out;
}

json TestCase::toJson() const {
    json testsJson = json::array();
    for (const auto &test : tests) {
        testsJson.push_back(test.toJson());
    }

    json out = {{"description", description}, {"schema", schema}, {"tests", std::move(testsJson)}};
    if (registry) {
        out["registry"] = *registry;
    }
    if (comment) {
        out["comment"] = *comment;
    }
    return out;
}

std::optional<TestCase> TestCase::fromJson(const json &raw, std::string *errorOut) {
    if (!raw.is_object()) {
        setError(errorOut, "test case is not a JSON object");
        return std::nullopt;
    }

    auto description = JsonUtils::getOptionalString(raw, "description");
    if (!description) {
        setError(errorOut, "test case has no string 'description'");
        return std::nullopt;
    }

    auto schema = raw.find("schema");
    if (schema == raw.end()) {
        setError(errorOut, std::format("test case '{}' has no 'schema'", *description));
        return std::nullopt;
    }

    auto tests = raw.find("tests");
    if (tests == raw.end() || !tests->is_array() || tests->empty()) {
        setError(errorOut, std::format("test case '{}' needs a non-empty 'tests' array", *description));
        return std::nullopt;
    }

    TestCase testCase;
    testCase.description = *description;
    testCase.schema = *schema;
    testCase.comment = JsonUtils::getOptionalString(raw, "comment");

    auto registry = raw.find("registry");
    if (registry != raw.end() && !registry->is_null()) {
        if (!registry->is_object()) {
            setError(errorOut, std::format("test case '{}' has a non-object 'registry'", *description));
            return std::nullopt;
        }
        testCase.registry = *registry;
    }

    for (size_t i = 0; i < tests->size(); ++i) {
        auto test = testFromJson((*tests)[i], i, errorOut);
        if (!test) {
            return std::nullopt;
        }
        testCase.tests.push_back(std::move(*test));
    }
    return testCase;
}

std::optional<std::string> TestCase::declaredDialect() const {
    return JsonUtils::getOptionalString(schema, "$schema");
}

TestCase TestCase::withDialect(const Dialect &dialect) const {
    TestCase copy = *this;
    if (copy.schema.is_object() && !copy.schema.contains("$schema")) {
        copy.schema["$schema"] = dialect.uri;
    }
    return copy;
}

}  // namespace VCH
