#include "common/FSMTestFixture.h"
#include "mocks/MockState.h"
#include "runtime/FSMEngine.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace PFSM;
using namespace PFSM::Test;

class FSMEngineTransitionTest : public FSMTestFixture {
protected:
    void SetUp() override {
        FSMTestFixture::SetUp();
        a_ = makeState("A");
        b_ = makeState("B");
        c_ = makeState("C");
        fsm_.addState(a_);
        fsm_.addState(b_);
        fsm_.addState(c_);
    }

    FSMEngine fsm_;
    std::shared_ptr<TraceState> a_;
    std::shared_ptr<TraceState> b_;
    std::shared_ptr<TraceState> c_;
};

TEST_F(FSMEngineTransitionTest, GoToStateExitsThenEnters) {
    FSMResult result = fsm_.goToState(b_);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.fromState, "A");
    EXPECT_EQ(result.toState, "B");
    EXPECT_EQ(fsm_.getCurrentState(), b_);
    EXPECT_EQ(fsm_.getPreviousState(), a_);
    EXPECT_EQ((std::vector<std::string>{"A.onExit", "B.onEnter"}), trace_);
}

TEST_F(FSMEngineTransitionTest, HookOrderWithMocks) {
    FSMEngine fsm;
    auto idle = std::make_shared<::testing::NiceMock<MockState>>("Idle");
    auto walk = std::make_shared<::testing::NiceMock<MockState>>("Walk");
    fsm.addState(idle);
    fsm.addState(walk);

    {
        ::testing::InSequence sequence;
        EXPECT_CALL(*idle, onExit());
        EXPECT_CALL(*walk, onEnter());
    }
    EXPECT_CALL(*walk, onExit()).Times(0);
    EXPECT_CALL(*idle, onEnter()).Times(0);

    EXPECT_TRUE(fsm.goToState(walk).success);
}

TEST_F(FSMEngineTransitionTest, GoToPreviousReturnsToDepartedState) {
    fsm_.goToState(b_);
    trace_.clear();

    FSMResult result = fsm_.goToPreviousState();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(fsm_.getCurrentState(), a_);
    EXPECT_EQ(fsm_.getPreviousState(), b_);
    EXPECT_EQ((std::vector<std::string>{"B.onExit", "A.onEnter"}), trace_);
}

TEST_F(FSMEngineTransitionTest, GoToPreviousTogglesBetweenTwoMostRecentStates) {
    fsm_.goToState(b_);
    fsm_.goToState(c_);

    fsm_.goToPreviousState();
    EXPECT_EQ(fsm_.getCurrentState(), b_);
    fsm_.goToPreviousState();
    EXPECT_EQ(fsm_.getCurrentState(), c_);
    fsm_.goToPreviousState();
    EXPECT_EQ(fsm_.getCurrentState(), b_);
    fsm_.goToPreviousState();
    EXPECT_EQ(fsm_.getCurrentState(), c_);

    // A is never reached again: history is a single toggle slot
    EXPECT_EQ(a_->enterCount, 0);
}

TEST_F(FSMEngineTransitionTest, GoToPreviousWithoutHistoryReportsNoHistory) {
    FSMResult result = fsm_.goToPreviousState();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, FSMError::NO_HISTORY);
    EXPECT_EQ(fsm_.getCurrentState(), a_);
    EXPECT_TRUE(trace_.empty());
    EXPECT_TRUE(errorLogged("NoHistory"));
}

TEST_F(FSMEngineTransitionTest, GoToPreviousAfterHistoryDeletedReportsNotFound) {
    fsm_.goToState(b_);
    fsm_.deleteState(a_);
    trace_.clear();

    FSMResult result = fsm_.goToPreviousState();

    EXPECT_EQ(result.error, FSMError::STATE_NOT_FOUND);
    EXPECT_EQ(fsm_.getCurrentState(), b_);
    EXPECT_EQ(fsm_.getPreviousState(), a_);
    EXPECT_TRUE(trace_.empty());
}

TEST_F(FSMEngineTransitionTest, GoToUnregisteredStateReportsNotFound) {
    auto stranger = makeState("X");

    FSMResult result = fsm_.goToState(stranger);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, FSMError::STATE_NOT_FOUND);
    EXPECT_EQ(result.fromState, "A");
    EXPECT_EQ(result.toState, "A");
    EXPECT_EQ(fsm_.getCurrentState(), a_);
    EXPECT_EQ(fsm_.getPreviousState(), nullptr);
    EXPECT_TRUE(trace_.empty());
    EXPECT_TRUE(errorLogged("Unable to go to state X"));
}

TEST_F(FSMEngineTransitionTest, GoToNullReportsNullTarget) {
    FSMResult result = fsm_.goToState(nullptr);

    EXPECT_EQ(result.error, FSMError::NULL_TARGET);
    EXPECT_EQ(fsm_.getCurrentState(), a_);
    EXPECT_TRUE(trace_.empty());
}

TEST_F(FSMEngineTransitionTest, PayloadIsDeliveredToEnteredState) {
    FSMResult result = fsm_.goToState(b_, std::string("ledge"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ((std::vector<std::string>{"A.onExit", "B.onEnter(payload)"}), trace_);
    ASSERT_TRUE(b_->lastPayload.has_value());
    EXPECT_EQ(std::any_cast<std::string>(b_->lastPayload), "ledge");
}

TEST_F(FSMEngineTransitionTest, PayloadEnterFallsBackToPlainEnter) {
    FSMEngine fsm;
    auto idle = std::make_shared<::testing::NiceMock<MockState>>("Idle");
    auto hurt = std::make_shared<::testing::NiceMock<MockState>>("Hurt");
    fsm.addState(idle);
    fsm.addState(hurt);

    std::any damage = 12;
    EXPECT_CALL(*hurt, onEnter(::testing::A<const std::any &>())).WillOnce([&hurt](const std::any &payload) {
        EXPECT_EQ(std::any_cast<int>(payload), 12);
        hurt->IState::onEnter(payload);
    });
    EXPECT_CALL(*hurt, onEnter()).Times(1);

    EXPECT_TRUE(fsm.goToState(hurt, damage).success);
}

TEST_F(FSMEngineTransitionTest, SelfTransitionExitsAndReentersState) {
    FSMResult result = fsm_.goToState(a_);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(fsm_.getCurrentState(), a_);
    EXPECT_EQ(fsm_.getPreviousState(), a_);
    EXPECT_EQ((std::vector<std::string>{"A.onExit", "A.onEnter"}), trace_);
}

TEST_F(FSMEngineTransitionTest, NextStateIsVisibleOnlyDuringTransition) {
    std::shared_ptr<IState> seenOnExit;
    std::shared_ptr<IState> seenOnEnter;
    std::shared_ptr<IState> currentOnExit;
    std::shared_ptr<IState> currentOnEnter;
    a_->exitAction = [&] {
        seenOnExit = fsm_.getNextState();
        currentOnExit = fsm_.getCurrentState();
    };
    b_->enterAction = [&] {
        seenOnEnter = fsm_.getNextState();
        currentOnEnter = fsm_.getCurrentState();
    };

    EXPECT_EQ(fsm_.getNextState(), nullptr);
    fsm_.goToState(b_);

    EXPECT_EQ(seenOnExit, b_);
    EXPECT_EQ(seenOnEnter, b_);
    EXPECT_EQ(currentOnExit, a_);
    EXPECT_EQ(currentOnEnter, b_);
    EXPECT_EQ(fsm_.getNextState(), nullptr);
}

TEST_F(FSMEngineTransitionTest, FailedTransitionKeepsPreviousHistory) {
    fsm_.goToState(b_);
    auto stranger = makeState("X");

    fsm_.goToState(stranger);

    EXPECT_EQ(fsm_.getCurrentState(), b_);
    EXPECT_EQ(fsm_.getPreviousState(), a_);
}

TEST_F(FSMEngineTransitionTest, StatisticsCountTransitionsAndFailures) {
    fsm_.goToState(b_);
    fsm_.goToPreviousState();
    fsm_.goToState(makeState("X"));
    fsm_.popState();

    FSMEngine::Statistics stats = fsm_.getStatistics();
    EXPECT_EQ(stats.totalTransitions, 2);
    EXPECT_EQ(stats.failedOperations, 2);
    EXPECT_EQ(stats.registeredStates, 3u);
    EXPECT_EQ(stats.currentState, "A");
    EXPECT_EQ(fsm_.getLastError().error, FSMError::NO_HISTORY);
}

TEST_F(FSMEngineTransitionTest, SuccessfulTransitionIsLoggedAtDebug) {
    fsm_.goToState(c_);

    EXPECT_TRUE(logger_->contains(LogLevel::Debug, "Going to state C from A"));
    EXPECT_TRUE(logger_->contains(LogLevel::Debug, "FSMEngine::enterState"));
    EXPECT_EQ(logger_->getCount(LogLevel::Error), 0);
}
