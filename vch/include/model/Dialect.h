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

#include <optional>
#include <string>
#include <vector>

namespace VCH {

/**
 * @brief A schema-language version identified by its canonical URI
 *
 * Dialects are immutable values taken from the fixed set in DialectRegistry.
 */
struct Dialect {
    std::string uri;
    std::string shortName;   // e.g. "draft2020-12", "draft7"
    std::string prettyName;  // e.g. "Draft 2020-12"
    std::string firstPublished;  // YYYY-MM-DD, orders dialects by recency
    bool hasBooleanSchemas{true};

    bool operator==(const Dialect &other) const {
        return uri == other.uri;
    }
};

/**
 * @brief The fixed set of dialects known to the harness, newest first
 */
class DialectRegistry {
public:
    static const DialectRegistry &known();

    /**
     * @brief All known dialects ordered by recency (newest first)
     */
    const std::vector<Dialect> &newestFirst() const {
        return dialects_;
    }

    /**
     * @brief The default dialect when none is requested
     */
    const Dialect &newest() const {
        return dialects_.front();
    }

    /**
     * @brief Look up by canonical URI
     *
     * The comparison ignores an empty trailing fragment, so
     * "http://json-schema.org/draft-07/schema" and "...schema#" match.
     */
    std::optional<Dialect> byUri(const std::string &uri) const;

    /**
     * @brief Look up by short name ("draft7") or alias ("7", "2020-12")
     */
    std::optional<Dialect> byShortName(const std::string &name) const;

    /**
     * @brief Look up by URI first, then by short name
     */
    std::optional<Dialect> lookup(const std::string &uriOrName) const;

private:
    DialectRegistry();

    std::vector<Dialect> dialects_;
};

}  // namespace VCH
