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

#include "model/Dialect.h"
#include "protocol/ProtocolSession.h"
#include <optional>
#include <string>
#include <vector>

namespace VCH {

/**
 * @brief Everything one run needs, built once by the caller
 */
struct HarnessConfig {
    std::vector<std::string> implementations;  // ids, resolved by an IImplementationResolver
    std::optional<Dialect> dialect;            // newest known dialect when unset

    bool failFast{false};
    std::optional<size_t> maxFail;
    bool expectSuccess{false};

    bool setSchema{false};
    std::optional<std::string> caseFilter;  // substring of the case description

    SessionTimeouts timeouts;

    std::string harnessVersion;
    std::vector<std::string> args;

    const Dialect &effectiveDialect() const {
        return dialect ? *dialect : DialectRegistry::known().newest();
    }

    /**
     * @brief Check option combinations
     * @return Human readable problems; empty when the configuration is usable
     */
    std::vector<std::string> validate() const;

    /**
     * @brief Container CLI from VCH_CONTAINER_RUNTIME, "docker" when unset
     */
    static std::string containerRuntime();
};

}  // namespace VCH
