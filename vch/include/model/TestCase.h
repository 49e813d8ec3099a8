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
#include <optional>
#include <string>
#include <vector>

namespace VCH {

/**
 * @brief One instance to validate against a case's schema
 *
 * `valid` is the expected validity. The protocol never looks at it; it is
 * only used when deciding whether an outcome counts as a failure.
 */
struct Test {
    std::string description;
    json instance;
    std::optional<bool> valid;
    std::optional<std::string> comment;

    bool operator==(const Test &) const = default;

    json toJson() const;
};

/**
 * @brief A schema plus the ordered, non-empty list of tests sharing it
 */
struct TestCase {
    std::string description;
    json schema;
    std::optional<json> registry;  // URI -> schema, for resolving external references
    std::vector<Test> tests;
    std::optional<std::string> comment;

    bool operator==(const TestCase &) const = default;

    json toJson() const;

    /**
     * @brief Parse a test case record
     *
     * Requires a string description, a schema, and a non-empty `tests` array
     * whose entries each have a string description and an instance.
     *
     * @param errorOut Optional error message output
     * @return Parsed case or nullopt on failure
     */
    static std::optional<TestCase> fromJson(const json &raw, std::string *errorOut = nullptr);

    /**
     * @brief The `$schema` the schema declares, if it is an object declaring a string one
     */
    std::optional<std::string> declaredDialect() const;

    /**
     * @brief Copy of this case with `$schema` set to the dialect URI
     *
     * Only object schemas without an existing `$schema` are changed; boolean
     * schemas cannot carry a declaration and are left alone.
     */
    TestCase withDialect(const Dialect &dialect) const;
};

}  // namespace VCH
