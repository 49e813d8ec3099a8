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

#include "process/LaunchSpec.h"

namespace VCH {

LaunchSpec LaunchSpec::forImage(const std::string &id, const std::string &image, const std::string &runtime) {
    LaunchSpec spec;
    spec.id = id;
    spec.argv = {runtime, "run", "--rm", "--interactive", "--network=none", image};
    return spec;
}

LaunchSpec LaunchSpec::forContainer(const std::string &id, const std::string &containerId,
                                    const std::string &runtime) {
    LaunchSpec spec;
    spec.id = id;
    spec.argv = {runtime, "start", "--attach", "--interactive", containerId};
    return spec;
}

LaunchSpec LaunchSpec::forCommand(const std::string &id, std::vector<std::string> argv) {
    LaunchSpec spec;
    spec.id = id;
    spec.argv = std::move(argv);
    return spec;
}

}  // namespace VCH
