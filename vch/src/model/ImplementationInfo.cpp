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

#include "model/ImplementationInfo.h"
#include <algorithm>
#include <array>
#include <format>
#include <string_view>

namespace VCH {

namespace {

constexpr std::array<const char *, 5> REQUIRED_STRINGS = {"name", "language", "homepage", "issues", "source"};
constexpr std::array<const char *, 4> OPTIONAL_STRINGS = {"version", "language_version", "os", "os_version"};
constexpr std::array<std::string_view, 11> KNOWN_FIELDS = {
    "name", "language", "homepage", "issues", "source", "dialects",
    "version", "language_version", "os", "os_version", "links",
};

void addOptional(json &out, const char *key, const std::optional<std::string> &value) {
    if (value) {
        out[key] = *value;
    }
}

}  // namespace

bool ImplementationInfo::supports(const Dialect &dialect) const {
    for (const auto &uri : dialects) {
        auto declared = DialectRegistry::known().byUri(uri);
        if (declared ? *declared == dialect : uri == dialect.uri) {
            return true;
        }
    }
    return false;
}

json ImplementationInfo::toJson() const {
    json out = extensions.is_object() ? extensions : json::object();
    out["name"] = name;
    out["language"] = language;
    out["homepage"] = homepage;
    out["issues"] = issues;
    out["source"] = source;
    out["dialects"] = dialects;
    addOptional(out, "version", version);
    addOptional(out, "language_version", languageVersion);
    addOptional(out, "os", os);
    addOptional(out, "os_version", osVersion);
    if (!links.empty()) {
        json array = json::array();
        for (const auto &link : links) {
            array.push_back({{"description", link.description}, {"url", link.url}});
        }
        out["links"] = std::move(array);
    }
    return out;
}

std::string MetadataResult::errorSummary() const {
    std::string summary;
    for (const auto &error : errors) {
        if (!summary.empty()) {
            summary += "; ";
        }
        summary += error;
    }
    return summary;
}

MetadataResult parseImplementationInfo(const json &raw) {
    if (!raw.is_object()) {
        return MetadataResult::error({std::format("{} is not of type 'object'", JsonUtils::toCompactString(raw))});
    }

    std::vector<std::string> errors;

    for (const char *key : REQUIRED_STRINGS) {
        auto it = raw.find(key);
        if (it == raw.end()) {
            errors.push_back(std::format("'{}' is a required property", key));
        } else if (!it->is_string()) {
            errors.push_back(std::format("'{}' is not of type 'string'", key));
        }
    }

    for (const char *key : OPTIONAL_STRINGS) {
        auto it = raw.find(key);
        if (it != raw.end() && !it->is_string() && !it->is_null()) {
            errors.push_back(std::format("'{}' is not of type 'string'", key));
        }
    }

    std::vector<std::string> dialects;
    auto dialectsIt = raw.find("dialects");
    if (dialectsIt == raw.end()) {
        errors.push_back("'dialects' is a required property");
    } else if (!dialectsIt->is_array()) {
        errors.push_back("'dialects' is not of type 'array'");
    } else if (dialectsIt->empty()) {
        errors.push_back("'dialects' should be non-empty");
    } else {
        for (const auto &uri : *dialectsIt) {
            if (!uri.is_string()) {
                errors.push_back(std::format("{} in 'dialects' is not of type 'string'", JsonUtils::toCompactString(uri)));
                continue;
            }
            dialects.push_back(uri.get<std::string>());
        }
    }

    std::vector<ImplementationLink> links;
    auto linksIt = raw.find("links");
    if (linksIt != raw.end() && !linksIt->is_null()) {
        if (!linksIt->is_array()) {
            errors.push_back("'links' is not of type 'array'");
        } else {
            for (const auto &link : *linksIt) {
                auto description = JsonUtils::getOptionalString(link, "description");
                auto url = JsonUtils::getOptionalString(link, "url");
                if (!description || !url) {
                    errors.push_back(std::format("{} in 'links' requires string 'description' and 'url'",
                                                 JsonUtils::toCompactString(link)));
                    continue;
                }
                links.push_back({*description, *url});
            }
        }
    }

    if (!errors.empty()) {
        return MetadataResult::error(std::move(errors));
    }

    ImplementationInfo info;
    info.name = raw["name"].get<std::string>();
    info.language = raw["language"].get<std::string>();
    info.homepage = raw["homepage"].get<std::string>();
    info.issues = raw["issues"].get<std::string>();
    info.source = raw["source"].get<std::string>();
    info.dialects = std::move(dialects);
    info.version = JsonUtils::getOptionalString(raw, "version");
    info.languageVersion = JsonUtils::getOptionalString(raw, "language_version");
    info.os = JsonUtils::getOptionalString(raw, "os");
    info.osVersion = JsonUtils::getOptionalString(raw, "os_version");
    info.links = std::move(links);

    for (const auto &[key, value] : raw.items()) {
        if (std::find(KNOWN_FIELDS.begin(), KNOWN_FIELDS.end(), key) == KNOWN_FIELDS.end()) {
            info.extensions[key] = value;
        }
    }

    return MetadataResult::success(std::move(info));
}

}  // namespace VCH
