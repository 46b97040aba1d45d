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

#include "runtime/FSMResult.h"

namespace PFSM {

const char *toString(FSMError error) {
    switch (error) {
    case FSMError::NONE:
        return "None";
    case FSMError::NULL_TARGET:
        return "NullTarget";
    case FSMError::DUPLICATE_STATE:
        return "DuplicateState";
    case FSMError::STATE_NOT_FOUND:
        return "StateNotFound";
    case FSMError::NO_HISTORY:
        return "NoHistory";
    case FSMError::TRANSITION_DEPTH_EXCEEDED:
        return "TransitionDepthExceeded";
    default:
        return "Unknown";
    }
}

}  // namespace PFSM
