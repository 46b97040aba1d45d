#ifndef PFSM_TRANSITION_DEPTH_GUARD_H
#define PFSM_TRANSITION_DEPTH_GUARD_H

#include <cstddef>

namespace PFSM {

/**
 * @brief RAII guard counting nested transitions
 *
 * @details A state's onEnter/onExit may request another transition, which runs
 * to completion inside the outer one. Each transition holds a guard for the
 * duration of its exit/enter hooks, so the counter equals the current nesting
 * depth and drops back even if a hook throws.
 *
 * Usage:
 * @code
 * if (depth_ >= config_.maxTransitionDepth) {
 *     return fail(...);
 * }
 * TransitionDepthGuard guard(depth_);
 * current->onExit();
 * @endcode
 */
class TransitionDepthGuard {
public:
    explicit TransitionDepthGuard(std::size_t &depth) : depth_(depth) {
        ++depth_;
    }

    ~TransitionDepthGuard() noexcept {
        --depth_;
    }

    // Non-copyable, non-movable (RAII idiom)
    TransitionDepthGuard(const TransitionDepthGuard &) = delete;
    TransitionDepthGuard &operator=(const TransitionDepthGuard &) = delete;
    TransitionDepthGuard(TransitionDepthGuard &&) = delete;
    TransitionDepthGuard &operator=(TransitionDepthGuard &&) = delete;

private:
    std::size_t &depth_;
};

}  // namespace PFSM

#endif  // PFSM_TRANSITION_DEPTH_GUARD_H
