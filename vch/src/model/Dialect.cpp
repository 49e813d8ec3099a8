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

#include "model/Dialect.h"
#include <string_view>

namespace VCH {

namespace {

std::string normalizeUri(const std::string &uri) {
    if (!uri.empty() && uri.back() == '#') {
        return uri.substr(0, uri.size() - 1);
    }
    return uri;
}

std::string stripDraftPrefix(const std::string &name) {
    constexpr std::string_view PREFIX = "draft";
    if (name.starts_with(PREFIX)) {
        return name.substr(PREFIX.size());
    }
    return name;
}

}  // namespace

DialectRegistry::DialectRegistry()
    : dialects_{
          {"https://json-schema.org/draft/2020-12/schema", "draft2020-12", "Draft 2020-12", "2021-02-01", true},
          {"https://json-schema.org/draft/2019-09/schema", "draft2019-09", "Draft 2019-09", "2019-09-16", true},
          {"http://json-schema.org/draft-07/schema#", "draft7", "Draft 7", "2017-11-19", true},
          {"http://json-schema.org/draft-06/schema#", "draft6", "Draft 6", "2017-04-21", true},
          {"http://json-schema.org/draft-04/schema#", "draft4", "Draft 4", "2013-02-01", false},
          {"http://json-schema.org/draft-03/schema#", "draft3", "Draft 3", "2010-11-22", false},
      } {}

const DialectRegistry &DialectRegistry::known() {
    static const DialectRegistry registry;
    return registry;
}

std::optional<Dialect> DialectRegistry::byUri(const std::string &uri) const {
    const std::string wanted = normalizeUri(uri);
    for (const auto &dialect : dialects_) {
        if (normalizeUri(dialect.uri) == wanted) {
            return dialect;
        }
    }
    return std::nullopt;
}

std::optional<Dialect> DialectRegistry::byShortName(const std::string &name) const {
    const std::string wanted = stripDraftPrefix(name);
    if (wanted.empty()) {
        return std::nullopt;
    }
    for (const auto &dialect : dialects_) {
        const std::string candidate = stripDraftPrefix(dialect.shortName);
        if (candidate == wanted) {
            return dialect;
        }
        // A bare year ("2019") names the dated dialect published under it
        if (wanted.find('-') == std::string::npos && candidate.starts_with(wanted + "-")) {
            return dialect;
        }
    }
    return std::nullopt;
}

std::optional<Dialect> DialectRegistry::lookup(const std::string &uriOrName) const {
    if (auto dialect = byUri(uriOrName)) {
        return dialect;
    }
    return byShortName(uriOrName);
}

}  // namespace VCH
