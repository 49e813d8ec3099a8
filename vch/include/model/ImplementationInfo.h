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

struct ImplementationLink {
    std::string description;
    std::string url;

    bool operator==(const ImplementationLink &) const = default;
};

/**
 * @brief Self-description an implementation sends in its start response
 *
 * Required fields are typed members; anything else the implementation
 * reports is kept verbatim in `extensions` so it survives into the report.
 */
struct ImplementationInfo {
    std::string name;
    std::string language;
    std::string homepage;
    std::string issues;
    std::string source;
    std::vector<std::string> dialects;  // declared dialect URIs, as sent

    std::optional<std::string> version;
    std::optional<std::string> languageVersion;
    std::optional<std::string> os;
    std::optional<std::string> osVersion;
    std::vector<ImplementationLink> links;

    json extensions = json::object();

    bool operator==(const ImplementationInfo &) const = default;

    /**
     * @brief Whether the declared dialect set contains the given dialect
     */
    bool supports(const Dialect &dialect) const;

    json toJson() const;
};

/**
 * @brief Outcome of validating implementation metadata
 */
struct MetadataResult {
    bool isSuccess = false;
    ImplementationInfo info;
    std::vector<std::string> errors;

    static MetadataResult success(ImplementationInfo info) {
        MetadataResult result;
        result.isSuccess = true;
        result.info = std::move(info);
        return result;
    }

    static MetadataResult error(std::vector<std::string> errors) {
        MetadataResult result;
        result.errors = std::move(errors);
        return result;
    }

    /**
     * @brief All errors joined with "; "
     */
    std::string errorSummary() const;
};

/**
 * @brief Validate raw metadata against the implementation self-description schema
 *
 * Checks required string fields (name, language, homepage, issues, source),
 * a non-empty array of dialect URI strings, optional string fields and the
 * shape of `links`. Error messages name the offending property, e.g.
 * "'homepage' is a required property".
 */
MetadataResult parseImplementationInfo(const json &raw);

}  // namespace VCH
