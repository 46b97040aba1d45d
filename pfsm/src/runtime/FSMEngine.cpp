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

#include "runtime/FSMEngine.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "runtime/TransitionDepthGuard.h"
#include <algorithm>
#include <utility>

namespace PFSM {

namespace {

// Publishes the transition target through getNextState() while exit/enter hooks run.
// Nested transitions restore the enclosing target on the way out.
class NextStateScope {
public:
    NextStateScope(std::shared_ptr<IState> &slot, std::shared_ptr<IState> target)
        : slot_(slot), saved_(std::move(slot)) {
        slot_ = std::move(target);
    }

    ~NextStateScope() noexcept {
        slot_ = std::move(saved_);
    }

    NextStateScope(const NextStateScope &) = delete;
    NextStateScope &operator=(const NextStateScope &) = delete;

private:
    std::shared_ptr<IState> &slot_;
    std::shared_ptr<IState> saved_;
};

}  // namespace

FSMEngine::FSMEngine() : FSMEngine(FSMConfig{}) {}

FSMEngine::FSMEngine(const FSMConfig &config) : config_(config) {
    if (config_.maxTransitionDepth == 0) {
        LOG_WARN("maxTransitionDepth 0 would reject every transition, using {}",
                 Constants::DEFAULT_MAX_TRANSITION_DEPTH);
        config_.maxTransitionDepth = Constants::DEFAULT_MAX_TRANSITION_DEPTH;
    }
}

FSMResult FSMEngine::addState(std::shared_ptr<IState> state) {
    if (!state) {
        return fail(FSMError::NULL_TARGET, "Unable to add state: null reference is not allowed");
    }

    // First registered state is the state the machine starts in
    if (states_.empty()) {
        LOG_INFO("State added to machine as initial state: {}", state->getName());
        states_.push_back(state);
        currentState_ = std::move(state);
        return FSMResult::createSuccess("", nameOf(currentState_));
    }

    if (hasState(state)) {
        return fail(FSMError::DUPLICATE_STATE,
                    fmt::format("Unable to add state {} because state has already been added", state->getName()));
    }

    if (config_.registrationUpdatesHistory) {
        previousState_ = currentState_;
    }
    LOG_INFO("State added to machine: {}", state->getName());
    states_.push_back(std::move(state));
    return FSMResult::createSuccess(nameOf(currentState_), nameOf(currentState_));
}

FSMResult FSMEngine::deleteState(const std::shared_ptr<IState> &state) {
    if (!state) {
        return fail(FSMError::NULL_TARGET, "Unable to delete state: null reference is not allowed");
    }

    auto it = std::find(states_.begin(), states_.end(), state);
    if (it == states_.end()) {
        return fail(FSMError::STATE_NOT_FOUND,
                    fmt::format("Unable to delete state {} because state is not registered", state->getName()));
    }

    states_.erase(it);
    LOG_DEBUG("State deleted from machine: {}", state->getName());
    return FSMResult::createSuccess(nameOf(currentState_), nameOf(currentState_));
}

FSMResult FSMEngine::goToState(const std::shared_ptr<IState> &state) {
    return enterState(state, nullptr);
}

FSMResult FSMEngine::goToState(const std::shared_ptr<IState> &state, const std::any &payload) {
    return enterState(state, &payload);
}

FSMResult FSMEngine::enterState(const std::shared_ptr<IState> &state, const std::any *payload) {
    if (!state) {
        return fail(FSMError::NULL_TARGET, "Unable to go to state: null reference is not allowed");
    }
    if (!hasState(state)) {
        return fail(FSMError::STATE_NOT_FOUND,
                    fmt::format("Unable to go to state {} because state is not registered", state->getName()));
    }
    if (isDepthExhausted()) {
        return fail(FSMError::TRANSITION_DEPTH_EXCEEDED,
                    fmt::format("Unable to go to state {}: nested transition depth limit {} reached",
                                state->getName(), config_.maxTransitionDepth));
    }

    LOG_DEBUG("Going to state {} from {}", state->getName(), nameOf(currentState_));

    TransitionDepthGuard depthGuard(transitionDepth_);
    NextStateScope nextScope(nextState_, state);

    std::shared_ptr<IState> departing = currentState_;
    previousState_ = departing;
    if (departing) {
        departing->onExit();
    }

    currentState_ = state;
    stats_.totalTransitions++;
    if (payload) {
        state->onEnter(*payload);
    } else {
        state->onEnter();
    }

    return FSMResult::createSuccess(nameOf(departing), nameOf(currentState_));
}

FSMResult FSMEngine::goToPreviousState() {
    if (!previousState_) {
        return fail(FSMError::NO_HISTORY, "Unable to go to previous state: no previous state recorded");
    }
    if (!hasState(previousState_)) {
        return fail(FSMError::STATE_NOT_FOUND,
                    fmt::format("Unable to go to previous state {} because state is not registered anymore",
                                previousState_->getName()));
    }
    if (isDepthExhausted()) {
        return fail(FSMError::TRANSITION_DEPTH_EXCEEDED,
                    fmt::format("Unable to go to previous state {}: nested transition depth limit {} reached",
                                previousState_->getName(), config_.maxTransitionDepth));
    }

    std::shared_ptr<IState> target = previousState_;
    std::shared_ptr<IState> departing = currentState_;

    LOG_DEBUG("Going back to state {} from {}", target->getName(), nameOf(departing));

    TransitionDepthGuard depthGuard(transitionDepth_);
    NextStateScope nextScope(nextState_, target);

    if (departing) {
        departing->onExit();
    }

    // Swap: the departed state is what a second call returns to
    currentState_ = target;
    previousState_ = departing;
    stats_.totalTransitions++;
    target->onEnter();

    return FSMResult::createSuccess(nameOf(departing), nameOf(currentState_));
}

FSMResult FSMEngine::pushState(const std::shared_ptr<IState> &state) {
    return suspendAndEnter(state, nullptr);
}

FSMResult FSMEngine::pushState(const std::shared_ptr<IState> &state, const std::any &payload) {
    return suspendAndEnter(state, &payload);
}

FSMResult FSMEngine::suspendAndEnter(const std::shared_ptr<IState> &state, const std::any *payload) {
    if (!state) {
        return fail(FSMError::NULL_TARGET, "Unable to push state: null reference is not allowed");
    }
    if (!hasState(state)) {
        return fail(FSMError::STATE_NOT_FOUND,
                    fmt::format("Unable to push state {} because state is not registered", state->getName()));
    }
    if (isDepthExhausted()) {
        return fail(FSMError::TRANSITION_DEPTH_EXCEEDED,
                    fmt::format("Unable to push state {}: nested transition depth limit {} reached", state->getName(),
                                config_.maxTransitionDepth));
    }

    std::shared_ptr<IState> suspended = currentState_;

    if (config_.pushHistoryMode == PushHistoryMode::SINGLE_SLOT && !pushHistory_.empty()) {
        LOG_WARN("Pushing {} while {} is pushed: return point {} is replaced by {}", state->getName(),
                 nameOf(suspended), nameOf(pushHistory_.back()), nameOf(suspended));
        pushHistory_.back() = suspended;
    } else {
        pushHistory_.push_back(suspended);
    }

    LOG_DEBUG("Pushing state {} over {} (depth {})", state->getName(), nameOf(suspended), pushHistory_.size());

    TransitionDepthGuard depthGuard(transitionDepth_);
    NextStateScope nextScope(nextState_, state);

    currentState_ = state;
    stats_.totalPushes++;
    if (payload) {
        state->onEnter(*payload);
    } else {
        state->onEnter();
    }

    return FSMResult::createSuccess(nameOf(suspended), nameOf(currentState_));
}

FSMResult FSMEngine::popState() {
    if (pushHistory_.empty()) {
        return fail(FSMError::NO_HISTORY, "Unable to pop state: no state has been pushed");
    }

    std::shared_ptr<IState> origin = pushHistory_.back();
    if (!hasState(origin)) {
        return fail(FSMError::STATE_NOT_FOUND,
                    fmt::format("Unable to pop back to state {} because state is not registered anymore",
                                nameOf(origin)));
    }
    if (isDepthExhausted()) {
        return fail(FSMError::TRANSITION_DEPTH_EXCEEDED,
                    fmt::format("Unable to pop back to state {}: nested transition depth limit {} reached",
                                nameOf(origin), config_.maxTransitionDepth));
    }

    std::shared_ptr<IState> departing = currentState_;
    const std::size_t slot = pushHistory_.size() - 1;

    LOG_DEBUG("Popping state {} back to {}", nameOf(departing), nameOf(origin));

    TransitionDepthGuard depthGuard(transitionDepth_);
    NextStateScope nextScope(nextState_, origin);

    if (departing) {
        departing->onExit();
    }

    // onExit may have pushed or popped on its own; only the record this pop consumed is dropped
    currentState_ = origin;
    if (slot < pushHistory_.size() && pushHistory_[slot] == origin) {
        pushHistory_.erase(pushHistory_.begin() + static_cast<std::ptrdiff_t>(slot));
    }
    stats_.totalPops++;

    return FSMResult::createSuccess(nameOf(departing), nameOf(currentState_));
}

void FSMEngine::update() {
    if (!currentState_) {
        LOG_WARN("update() called with no registered state");
        return;
    }
    // Held locally: the hook may delete itself and transition away
    std::shared_ptr<IState> state = currentState_;
    state->onUpdate();
}

void FSMEngine::fixedUpdate() {
    if (!currentState_) {
        LOG_WARN("fixedUpdate() called with no registered state");
        return;
    }
    std::shared_ptr<IState> state = currentState_;
    state->onFixedUpdate();
}

void FSMEngine::lateUpdate() {
    if (!currentState_) {
        LOG_WARN("lateUpdate() called with no registered state");
        return;
    }
    std::shared_ptr<IState> lateState = currentState_;
    lateState->onLateUpdate();
    // A transition requested from onLateUpdate hands reason() to the new state
    std::shared_ptr<IState> reasonState = currentState_;
    reasonState->reason();
}

void FSMEngine::onGUI() {
    if (!currentState_) {
        LOG_WARN("onGUI() called with no registered state");
        return;
    }
    std::shared_ptr<IState> state = currentState_;
    state->onGUI();
}

void FSMEngine::onPostRender() {
    if (!currentState_) {
        LOG_WARN("onPostRender() called with no registered state");
        return;
    }
    std::shared_ptr<IState> state = currentState_;
    state->onPostRender();
}

std::shared_ptr<IState> FSMEngine::getCurrentState() const {
    return currentState_;
}

std::shared_ptr<IState> FSMEngine::getNextState() const {
    return nextState_;
}

std::shared_ptr<IState> FSMEngine::getPreviousState() const {
    return previousState_;
}

std::shared_ptr<IState> FSMEngine::getPushOrigin() const {
    return pushHistory_.empty() ? nullptr : pushHistory_.back();
}

bool FSMEngine::isStatePushed() const {
    return !pushHistory_.empty();
}

std::size_t FSMEngine::getPushDepth() const {
    return pushHistory_.size();
}

bool FSMEngine::hasState(const std::shared_ptr<IState> &state) const {
    return state && std::find(states_.begin(), states_.end(), state) != states_.end();
}

std::size_t FSMEngine::getStateCount() const {
    return states_.size();
}

const std::vector<std::shared_ptr<IState>> &FSMEngine::getStates() const {
    return states_;
}

FSMEngine::Statistics FSMEngine::getStatistics() const {
    Statistics stats = stats_;
    stats.registeredStates = states_.size();
    stats.pushDepth = pushHistory_.size();
    stats.currentState = nameOf(currentState_);
    return stats;
}

const FSMResult &FSMEngine::getLastError() const {
    return lastError_;
}

const FSMConfig &FSMEngine::getConfig() const {
    return config_;
}

FSMResult FSMEngine::fail(FSMError error, const std::string &message) {
    LOG_ERROR("FSM ERROR [{}]: {}", toString(error), message);
    stats_.failedOperations++;
    lastError_ = FSMResult::createError(error, message);
    lastError_.fromState = nameOf(currentState_);
    lastError_.toState = lastError_.fromState;
    return lastError_;
}

bool FSMEngine::isDepthExhausted() const {
    return transitionDepth_ >= config_.maxTransitionDepth;
}

std::string FSMEngine::nameOf(const std::shared_ptr<IState> &state) {
    return state ? state->getName() : Constants::NULL_STATE_NAME;
}

}  // namespace PFSM
