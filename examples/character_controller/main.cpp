#include "common/Logger.h"
#include "runtime/FSMEngine.h"
#include <any>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// A platformer character driven by a scripted input sequence.
// Idle/Walk/Jump/Falling use direct transitions, Emote returns with
// goToPreviousState, and the pause menu is pushed over whatever was active.

namespace {

constexpr float FIXED_DT = 1.0f / 50.0f;
constexpr float MAX_SPEED = 4.0f;
constexpr float JUMP_SPEED = 6.0f;
constexpr float GRAVITY = -60.0f;

struct FrameInput {
    float horizontal = 0.0f;
    bool jump = false;
    bool pause = false;
    bool emote = false;
};

struct Character {
    float x = 0.0f;
    float y = 0.0f;
    float vx = 0.0f;
    float vy = 0.0f;
    FrameInput input;
    std::string animation;

    void integrate() {
        vy += GRAVITY * FIXED_DT;
        x += vx * FIXED_DT;
        y += vy * FIXED_DT;
    }
};

// Handles to every state, filled in once all of them exist
struct CharacterStates {
    std::shared_ptr<PFSM::IState> idle;
    std::shared_ptr<PFSM::IState> walk;
    std::shared_ptr<PFSM::IState> jump;
    std::shared_ptr<PFSM::IState> falling;
    std::shared_ptr<PFSM::IState> emote;
    std::shared_ptr<PFSM::IState> pause;
};

class CharacterState : public PFSM::IState {
public:
    CharacterState(std::string name, PFSM::FSMEngine &fsm, Character &character, const CharacterStates &states)
        : name_(std::move(name)), fsm_(fsm), character_(character), states_(states) {}

    std::string getName() const override {
        return name_;
    }

    void onEnter() override {
        character_.animation = name_;
        std::cout << "    enter " << name_ << "\n";
    }

    void onExit() override {
        std::cout << "    exit  " << name_ << "\n";
    }

    void onUpdate() override {}

protected:
    // Pause and emote are reachable from every grounded state
    bool handleCommonInput() {
        if (character_.input.pause) {
            fsm_.pushState(states_.pause);
            return true;
        }
        if (character_.input.emote) {
            fsm_.goToState(states_.emote);
            return true;
        }
        return false;
    }

    std::string name_;
    PFSM::FSMEngine &fsm_;
    Character &character_;
    const CharacterStates &states_;
};

class IdleState : public CharacterState {
public:
    using CharacterState::CharacterState;

    void onFixedUpdate() override {
        character_.vx = 0.0f;
    }

    void reason() override {
        if (handleCommonInput()) {
            return;
        }
        if (character_.input.jump) {
            fsm_.goToState(states_.jump, std::string("idle"));
        } else if (std::fabs(character_.input.horizontal) > 0.1f) {
            fsm_.goToState(states_.walk);
        }
    }
};

class WalkState : public CharacterState {
public:
    using CharacterState::CharacterState;

    void onUpdate() override {
        character_.vx = character_.input.horizontal * MAX_SPEED;
    }

    void onFixedUpdate() override {
        character_.x += character_.vx * FIXED_DT;
    }

    void reason() override {
        if (handleCommonInput()) {
            return;
        }
        if (character_.input.jump) {
            fsm_.goToState(states_.jump, std::string("walk"));
        } else if (std::fabs(character_.vx) < 0.1f) {
            fsm_.goToState(states_.idle);
        }
    }
};

class JumpState : public CharacterState {
public:
    using CharacterState::CharacterState;

    void onEnter(const std::any &payload) override {
        CharacterState::onEnter();
        character_.vy = JUMP_SPEED;
        if (const auto *from = std::any_cast<std::string>(&payload)) {
            std::cout << "    jumped from " << *from << "\n";
        }
    }

    void onEnter() override {
        onEnter(std::any{});
    }

    void onFixedUpdate() override {
        character_.integrate();
    }

    void reason() override {
        if (character_.vy <= 0.0f) {
            fsm_.goToState(states_.falling);
        }
    }
};

class FallingState : public CharacterState {
public:
    using CharacterState::CharacterState;

    void onFixedUpdate() override {
        character_.integrate();
    }

    void reason() override {
        if (character_.y <= 0.0f) {
            character_.y = 0.0f;
            character_.vy = 0.0f;
            fsm_.goToState(std::fabs(character_.input.horizontal) > 0.1f ? states_.walk : states_.idle);
        }
    }
};

class EmoteState : public CharacterState {
public:
    using CharacterState::CharacterState;

    void onEnter() override {
        CharacterState::onEnter();
        framesLeft_ = 3;
    }

    void onUpdate() override {
        --framesLeft_;
    }

    void reason() override {
        if (framesLeft_ <= 0) {
            fsm_.goToPreviousState();
        }
    }

private:
    int framesLeft_ = 0;
};

class PauseMenuState : public CharacterState {
public:
    using CharacterState::CharacterState;

    void onGUI() override {
        std::cout << "    [paused] press pause to resume\n";
    }

    void reason() override {
        if (character_.input.pause) {
            fsm_.popState();
        }
    }
};

std::vector<FrameInput> scriptedInput() {
    std::vector<FrameInput> frames(40);
    for (int i = 2; i < 12; ++i) {
        frames[i].horizontal = 1.0f;
    }
    frames[6].jump = true;
    frames[22].pause = true;
    frames[25].pause = true;
    frames[28].emote = true;
    return frames;
}

}  // namespace

int main() {
    PFSM::Logger::initialize();

    std::cout << "=== Character Controller Example ===" << "\n\n";

    Character character;
    CharacterStates states;
    PFSM::FSMEngine fsm;

    states.idle = std::make_shared<IdleState>("Idle", fsm, character, states);
    states.walk = std::make_shared<WalkState>("Walk", fsm, character, states);
    states.jump = std::make_shared<JumpState>("Jump", fsm, character, states);
    states.falling = std::make_shared<FallingState>("Falling", fsm, character, states);
    states.emote = std::make_shared<EmoteState>("Emote", fsm, character, states);
    states.pause = std::make_shared<PauseMenuState>("PauseMenu", fsm, character, states);

    // Idle is registered first and becomes the starting state
    for (const auto &state : {states.idle, states.walk, states.jump, states.falling, states.emote, states.pause}) {
        if (!fsm.addState(state)) {
            return 1;
        }
    }

    const std::vector<FrameInput> frames = scriptedInput();
    for (size_t frame = 0; frame < frames.size(); ++frame) {
        character.input = frames[frame];
        std::cout << "frame " << frame << ": " << fsm.getCurrentState()->getName() << " x=" << character.x
                  << " y=" << character.y << "\n";

        fsm.update();
        if (!fsm.isStatePushed()) {
            fsm.fixedUpdate();
        }
        fsm.lateUpdate();
        fsm.onGUI();
        fsm.onPostRender();
    }

    const auto stats = fsm.getStatistics();
    std::cout << "\nTransitions: " << stats.totalTransitions << ", pushes: " << stats.totalPushes
              << ", pops: " << stats.totalPops << ", failures: " << stats.failedOperations << "\n";

    PFSM::Logger::flush();
    return stats.failedOperations == 0 ? 0 : 1;
}
