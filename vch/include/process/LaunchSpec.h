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

struct EnvVar {
    std::string key;
    std::string value;
};

/**
 * @brief How to create the execution unit behind one implementation
 *
 * Containers are launched through their runtime's CLI, so a container
 * implementation is just a LaunchSpec whose argv starts with e.g. "docker".
 */
struct LaunchSpec {
    std::string id;  // implementation id, for diagnostics
    std::vector<std::string> argv;
    std::vector<EnvVar> env;
    std::optional<std::string> workingDir;

    /**
     * @brief Run a fresh container from an image with stdin attached and no network
     */
    static LaunchSpec forImage(const std::string &id, const std::string &image, const std::string &runtime = "docker");

    /**
     * @brief Attach to an existing, already created container
     */
    static LaunchSpec forContainer(const std::string &id, const std::string &containerId,
                                   const std::string &runtime = "docker");

    /**
     * @brief Run an executable directly
     */
    static LaunchSpec forCommand(const std::string &id, std::vector<std::string> argv);
};

}  // namespace VCH
