#pragma once

#include "runtime/IState.h"
#include <any>
#include <functional>
#include <string>
#include <vector>

namespace PFSM {
namespace Test {

/**
 * @brief State that appends "<name>.<hook>" to a shared trace on every hook
 *
 * Optional actions run after the trace entry, letting a test trigger
 * transitions from inside a specific hook.
 */
class TraceState : public IState {
public:
    TraceState(std::string name, std::vector<std::string> &trace) : name_(std::move(name)), trace_(trace) {}

    std::string getName() const override {
        return name_;
    }

    void onEnter() override {
        record("onEnter");
        run(enterAction);
    }

    void onEnter(const std::any &payload) override {
        record("onEnter(payload)");
        lastPayload = payload;
        run(enterAction);
    }

    void onExit() override {
        record("onExit");
        run(exitAction);
    }

    void onUpdate() override {
        record("onUpdate");
        run(updateAction);
    }

    void onFixedUpdate() override {
        record("onFixedUpdate");
    }

    void onLateUpdate() override {
        record("onLateUpdate");
        run(lateUpdateAction);
    }

    void reason() override {
        record("reason");
        run(reasonAction);
    }

    void onGUI() override {
        record("onGUI");
    }

    void onPostRender() override {
        record("onPostRender");
    }

    int enterCount = 0;
    int exitCount = 0;
    std::any lastPayload;

    std::function<void()> enterAction;
    std::function<void()> exitAction;
    std::function<void()> updateAction;
    std::function<void()> lateUpdateAction;
    std::function<void()> reasonAction;

private:
    void record(const char *hook) {
        trace_.push_back(name_ + "." + hook);
        if (std::string(hook).rfind("onEnter", 0) == 0) {
            enterCount++;
        } else if (std::string(hook) == "onExit") {
            exitCount++;
        }
    }

    static void run(const std::function<void()> &action) {
        if (action) {
            action();
        }
    }

    std::string name_;
    std::vector<std::string> &trace_;
};

}  // namespace Test
}  // namespace PFSM
