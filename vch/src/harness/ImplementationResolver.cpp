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

#include "harness/ImplementationResolver.h"
#include <sstream>
#include <string_view>
#include <vector>

namespace VCH {

namespace {

constexpr std::string_view EXEC_PREFIX = "exec:";
constexpr std::string_view CONTAINER_PREFIX = "container:";
constexpr std::string_view IMAGE_PREFIX = "image:";

bool startsWith(const std::string &value, std::string_view prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

DefaultImplementationResolver::DefaultImplementationResolver(std::string containerRuntime)
    : containerRuntime_(std::move(containerRuntime)) {}

std::optional<LaunchSpec> DefaultImplementationResolver::resolve(const std::string &id, std::string *errorOut) {
    auto fail = [&](const std::string &message) -> std::optional<LaunchSpec> {
        if (errorOut) {
            *errorOut = message;
        }
        return std::nullopt;
    };

    if (startsWith(id, EXEC_PREFIX)) {
        std::istringstream words(id.substr(EXEC_PREFIX.size()));
        std::vector<std::string> argv;
        std::string word;
        while (words >> word) {
            argv.push_back(word);
        }
        if (argv.empty()) {
            return fail("'exec:' needs a program to run");
        }
        return LaunchSpec::forCommand(id, std::move(argv));
    }

    if (startsWith(id, CONTAINER_PREFIX)) {
        std::string container = id.substr(CONTAINER_PREFIX.size());
        if (container.empty()) {
            return fail("'container:' needs a container name or id");
        }
        return LaunchSpec::forContainer(id, container, containerRuntime_);
    }

    std::string image = startsWith(id, IMAGE_PREFIX) ? id.substr(IMAGE_PREFIX.size()) : id;
    if (image.empty() || image.find_first_of(" \t") != std::string::npos) {
        return fail("'" + id + "' is not a valid image reference");
    }
    return LaunchSpec::forImage(id, image, containerRuntime_);
}

}  // namespace VCH
