// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-PFSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PFSM (Pushdown Finite State Machine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Full terms: see LICENSE

#pragma once

#include "types.h"
#include <string>

namespace PFSM {

/**
 * @brief Convert error kind to its display name
 */
const char *toString(FSMError error);

/**
 * @brief Outcome of a registration or transition request
 *
 * Failures are reported, never thrown. A failed result guarantees the
 * engine's current/previous/pushed bookkeeping was left untouched.
 */
struct FSMResult {
    bool success = false;
    FSMError error = FSMError::NONE;
    std::string errorMessage;
    std::string fromState;  // Name of the state current before the operation
    std::string toState;    // Name of the state current after the operation

    explicit operator bool() const {
        return success;
    }

    static FSMResult createSuccess(const std::string &from = "", const std::string &to = "") {
        FSMResult result;
        result.success = true;
        result.fromState = from;
        result.toState = to;
        return result;
    }

    static FSMResult createError(FSMError error, const std::string &message) {
        FSMResult result;
        result.success = false;
        result.error = error;
        result.errorMessage = message;
        return result;
    }
};

}  // namespace PFSM
