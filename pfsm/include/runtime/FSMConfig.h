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

#include "common/Constants.h"
#include "types.h"
#include <cstddef>

namespace PFSM {

/**
 * @brief Construction-time configuration of an FSMEngine
 *
 * @code
 * PFSM::FSMConfig config;
 * config.maxTransitionDepth = 8;
 * PFSM::FSMEngine fsm(config);
 * @endcode
 */
struct FSMConfig {
    // Nested transition bound, see Constants::DEFAULT_MAX_TRANSITION_DEPTH
    std::size_t maxTransitionDepth = Constants::DEFAULT_MAX_TRANSITION_DEPTH;

    PushHistoryMode pushHistoryMode = PushHistoryMode::STACK;

    // When true, addState() records the current state as transition history
    // for every state registered after the first one.
    bool registrationUpdatesHistory = false;

    /**
     * @brief Configuration for hosts relying on single-slot push semantics
     *
     * Single-slot push history and registration-updates-history enabled.
     */
    static FSMConfig legacy() {
        FSMConfig config;
        config.pushHistoryMode = PushHistoryMode::SINGLE_SLOT;
        config.registrationUpdatesHistory = true;
        return config;
    }
};

}  // namespace PFSM
