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

#include "runtime/FSMConfig.h"
#include "runtime/FSMResult.h"
#include "runtime/IState.h"
#include <any>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace PFSM {

/**
 * @brief Pushdown finite state machine driving one controlled entity
 *
 * The host loop calls the frame hooks (update, fixedUpdate, lateUpdate,
 * onGUI, onPostRender) once per frame; each is forwarded to the current
 * state. States request transitions from inside those hooks and the
 * transition runs to completion before the hook returns.
 *
 * Two independent return points are kept:
 * - transition history: state current before the last goToState/goToPreviousState
 * - push history: states suspended by pushState, restored by popState
 *
 * Misuse never throws: every operation returns an FSMResult, logs the failure
 * and leaves the bookkeeping as it was.
 *
 * Not thread-safe. One engine belongs to one entity and is driven from the
 * thread running its frame loop.
 */
class FSMEngine {
public:
    struct Statistics {
        int totalTransitions = 0;  // goToState / goToPreviousState
        int totalPushes = 0;
        int totalPops = 0;
        int failedOperations = 0;
        std::size_t registeredStates = 0;
        std::size_t pushDepth = 0;
        std::string currentState;
    };

    FSMEngine();

    explicit FSMEngine(const FSMConfig &config);

    FSMEngine(const FSMEngine &) = delete;
    FSMEngine &operator=(const FSMEngine &) = delete;

    /**
     * @brief Register a state
     *
     * The first registered state becomes the current state without firing onEnter.
     *
     * @return NULL_TARGET or DUPLICATE_STATE on failure
     */
    FSMResult addState(std::shared_ptr<IState> state);

    /**
     * @brief Remove a state from the registered set
     *
     * Current state and history slots are left alone, so the current state may
     * stay active after its deletion. Transitions to it fail from then on.
     *
     * @return NULL_TARGET or STATE_NOT_FOUND on failure
     */
    FSMResult deleteState(const std::shared_ptr<IState> &state);

    /**
     * @brief Exit the current state and enter a registered state
     *
     * Records the departed state as transition history.
     *
     * @return NULL_TARGET, STATE_NOT_FOUND or TRANSITION_DEPTH_EXCEEDED on failure
     */
    FSMResult goToState(const std::shared_ptr<IState> &state);

    /**
     * @brief goToState passing data to the entered state's onEnter(payload)
     */
    FSMResult goToState(const std::shared_ptr<IState> &state, const std::any &payload);

    /**
     * @brief Return to the state recorded as transition history
     *
     * The departed state becomes the new history, so repeated calls toggle
     * between the two most recent states.
     *
     * @return NO_HISTORY, STATE_NOT_FOUND or TRANSITION_DEPTH_EXCEEDED on failure
     */
    FSMResult goToPreviousState();

    /**
     * @brief Suspend the current state and enter a registered state
     *
     * The suspended state gets no onExit. Transition history is not touched.
     * In PushHistoryMode::SINGLE_SLOT a push while already pushed replaces the
     * recorded return point.
     *
     * @return NULL_TARGET, STATE_NOT_FOUND or TRANSITION_DEPTH_EXCEEDED on failure
     */
    FSMResult pushState(const std::shared_ptr<IState> &state);

    FSMResult pushState(const std::shared_ptr<IState> &state, const std::any &payload);

    /**
     * @brief Exit the pushed state and resume the state it suspended
     *
     * The resumed state gets no onEnter.
     *
     * @return NO_HISTORY, STATE_NOT_FOUND or TRANSITION_DEPTH_EXCEEDED on failure
     */
    FSMResult popState();

    // Frame hooks, called by the host loop in this order
    void update();
    void fixedUpdate();
    void lateUpdate();  // onLateUpdate then reason
    void onGUI();
    void onPostRender();

    std::shared_ptr<IState> getCurrentState() const;

    /**
     * @brief Target of the transition in flight, null outside exit/enter hooks
     */
    std::shared_ptr<IState> getNextState() const;

    std::shared_ptr<IState> getPreviousState() const;

    /**
     * @brief State popState would resume, null when nothing is pushed
     */
    std::shared_ptr<IState> getPushOrigin() const;

    bool isStatePushed() const;

    std::size_t getPushDepth() const;

    bool hasState(const std::shared_ptr<IState> &state) const;

    std::size_t getStateCount() const;

    const std::vector<std::shared_ptr<IState>> &getStates() const;

    Statistics getStatistics() const;

    /**
     * @brief Most recent failure, NONE if every operation so far succeeded
     */
    const FSMResult &getLastError() const;

    const FSMConfig &getConfig() const;

private:
    FSMResult enterState(const std::shared_ptr<IState> &state, const std::any *payload);
    FSMResult suspendAndEnter(const std::shared_ptr<IState> &state, const std::any *payload);
    FSMResult fail(FSMError error, const std::string &message);
    bool isDepthExhausted() const;
    static std::string nameOf(const std::shared_ptr<IState> &state);

    FSMConfig config_;

    std::vector<std::shared_ptr<IState>> states_;  // Registration order

    std::shared_ptr<IState> currentState_;
    std::shared_ptr<IState> nextState_;
    std::shared_ptr<IState> previousState_;
    std::vector<std::shared_ptr<IState>> pushHistory_;  // Back is the next pop target

    std::size_t transitionDepth_ = 0;

    Statistics stats_;
    FSMResult lastError_ = FSMResult::createSuccess();
};

}  // namespace PFSM
