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

#include "process/ITransport.h"
#include "process/LaunchSpec.h"
#include <memory>
#include <string>

namespace VCH {

/**
 * @brief Result of creating an execution unit
 *
 * A failure here is a LaunchFailure: the unit never existed (binary or
 * image runtime not found, permission denied, fork failure).
 */
struct LaunchResult {
    bool isSuccess = false;
    std::unique_ptr<ITransport> transport;
    std::string errorMessage;

    static LaunchResult success(std::unique_ptr<ITransport> transport) {
        LaunchResult result;
        result.isSuccess = true;
        result.transport = std::move(transport);
        return result;
    }

    static LaunchResult error(const std::string &error) {
        LaunchResult result;
        result.errorMessage = error;
        return result;
    }
};

/**
 * @brief Creates execution units; has no protocol knowledge
 */
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    virtual LaunchResult launch(const LaunchSpec &spec) = 0;
};

}  // namespace VCH
