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
#include "model/Dialect.h"
#include "model/TestCase.h"

namespace VCH {

/**
 * @brief Wire format of the harness <-> implementation protocol
 *
 * One JSON object per line in each direction; every request gets exactly
 * one response line, except stop which needs none.
 */
namespace Protocol {

constexpr int VERSION = 1;

json startRequest();
json dialectRequest(const Dialect &dialect);
json runRequest(int seq, const TestCase &testCase);
json stopRequest();

}  // namespace Protocol

}  // namespace VCH
