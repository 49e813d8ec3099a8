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

#include "common/JsonUtils.h"
#include "model/Outcome.h"
#include "model/TestCase.h"
#include <vector>

namespace VCH {

/**
 * @brief Maps protocol responses and failures onto outcomes
 */
class ResultClassifier {
public:
    /**
     * @brief Classify one element of a run response's `results` array
     *
     * {"valid": bool} is Valid/Invalid, {"errored": true, "context"?} is
     * Errored, {"skipped": true, "message"?, "issue_url"?} is Skipped.
     * Anything else is Errored with the raw element kept as context.
     */
    static Outcome classifyResult(const json &element);

    /**
     * @brief Classify a whole validated run response, one outcome per test
     *
     * Handles case-level `errored` and `skipped` responses as well as
     * per-test `results`.
     */
    static std::vector<Outcome> classifyResponse(const json &response, const TestCase &testCase);

    /**
     * @brief Every test of the case errored as part of a failed case
     */
    static std::vector<Outcome> erroredCase(const TestCase &testCase, const json &context);
};

}  // namespace VCH
