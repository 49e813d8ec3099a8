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

#include "protocol/Protocol.h"

namespace VCH {
namespace Protocol {

json startRequest() {
    return json{{"cmd", "start"}, {"version", VERSION}};
}

json dialectRequest(const Dialect &dialect) {
    return json{{"cmd", "dialect"}, {"dialect", dialect.uri}};
}

json runRequest(int seq, const TestCase &testCase) {
    return json{{"cmd", "run"}, {"seq", seq}, {"case", testCase.toJson()}};
}

json stopRequest() {
    return json{{"cmd", "stop"}};
}

}  // namespace Protocol
}  // namespace VCH
