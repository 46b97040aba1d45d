#pragma once

namespace PFSM {

enum class FSMError {
    NONE,                      // Operation succeeded
    NULL_TARGET,               // Empty state reference passed in
    DUPLICATE_STATE,           // State identity already registered
    STATE_NOT_FOUND,           // State identity not in the registered set
    NO_HISTORY,                // Nothing recorded to return to
    TRANSITION_DEPTH_EXCEEDED  // Nested transitions past FSMConfig::maxTransitionDepth
};

enum class PushHistoryMode {
    STACK,       // Every push records a return point, pops unwind in LIFO order
    SINGLE_SLOT  // One return point; a push while pushed overwrites it
};

}  // namespace PFSM
