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

#include "process/LaunchSpec.h"
#include <optional>
#include <string>

namespace VCH {

/**
 * @brief Turns an implementation id into a launch specification
 */
class IImplementationResolver {
public:
    virtual ~IImplementationResolver() = default;

    /**
     * @param errorOut Optional error message output
     * @return Launch spec, or nullopt when the id cannot be resolved
     */
    virtual std::optional<LaunchSpec> resolve(const std::string &id, std::string *errorOut = nullptr) = 0;
};

/**
 * @brief Resolves ids by prefix
 *
 *   exec:<program> [args...]   run the program directly
 *   container:<name-or-id>     attach to an existing container
 *   image:<ref> or <ref>       run a fresh, network-less container from an image
 */
class DefaultImplementationResolver : public IImplementationResolver {
public:
    explicit DefaultImplementationResolver(std::string containerRuntime);

    std::optional<LaunchSpec> resolve(const std::string &id, std::string *errorOut = nullptr) override;

private:
    std::string containerRuntime_;
};

}  // namespace VCH
