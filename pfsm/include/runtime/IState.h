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

#include <any>
#include <string>

namespace PFSM {

/**
 * @brief Unit of behavior hosted by an FSMEngine
 *
 * The engine calls these hooks; a state never calls them on itself or on
 * another state. States are registered and compared by identity, so two
 * instances of the same class are two distinct states.
 *
 * Hook timing:
 * - onEnter: the state became current through goToState, goToPreviousState or pushState
 * - onExit: the state stopped being current through a direct transition or popState
 * - Suspension by pushState and restoration by popState fire neither hook
 * - onUpdate / onFixedUpdate / onLateUpdate / onGUI / onPostRender: once per
 *   matching frame phase while current
 * - reason: once per frame right after onLateUpdate
 *
 * States that drive transitions keep a reference to their engine:
 * @code
 * class WalkState : public PFSM::IState {
 * public:
 *     WalkState(PFSM::FSMEngine &fsm, Character &character) : fsm_(fsm), character_(character) {}
 *
 *     void reason() override {
 *         if (character_.speed() < 0.1f) {
 *             fsm_.goToState(character_.idleState());
 *         }
 *     }
 *     ...
 * };
 * @endcode
 */
class IState {
public:
    virtual ~IState() = default;

    /**
     * @brief Name used in engine log messages
     */
    virtual std::string getName() const = 0;

    virtual void onEnter() = 0;

    /**
     * @brief Enter with auxiliary data supplied by the transition
     *
     * Defaults to onEnter() for states that ignore the payload.
     *
     * @param payload Data passed to goToState/pushState
     */
    virtual void onEnter([[maybe_unused]] const std::any &payload) {
        onEnter();
    }

    virtual void onExit() = 0;

    virtual void onUpdate() = 0;

    virtual void onFixedUpdate() {}

    virtual void onLateUpdate() {}

    /**
     * @brief Per-frame transition checks, called after onLateUpdate
     */
    virtual void reason() {}

    virtual void onGUI() {}

    virtual void onPostRender() {}
};

}  // namespace PFSM
