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

#include "harness/HarnessConfig.h"
#include <algorithm>
#include <cstdlib>
#include <format>

namespace VCH {

std::vector<std::string> HarnessConfig::validate() const {
    std::vector<std::string> problems;

    if (failFast && maxFail) {
        problems.push_back("don't provide both --fail-fast and --max-fail");
    }
    if (maxFail && *maxFail == 0) {
        problems.push_back("--max-fail must be at least 1");
    }
    if (implementations.empty()) {
        problems.push_back("no implementations given");
    }
    for (auto it = implementations.begin(); it != implementations.end(); ++it) {
        if (std::find(implementations.begin(), it, *it) != it) {
            problems.push_back(std::format("implementation '{}' given more than once", *it));
        }
    }
    if (timeouts.start.count() <= 0 || timeouts.response.count() <= 0) {
        problems.push_back("timeouts must be positive");
    }
    return problems;
}

std::string HarnessConfig::containerRuntime() {
    const char *runtime = std::getenv("VCH_CONTAINER_RUNTIME");
    if (runtime && *runtime) {
        return runtime;
    }
    return "docker";
}

}  // namespace VCH
