#pragma once

#include <functional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include "gates/gate.hpp"

namespace hookguard::testing {

// Scripted gate that records how often it ran.
class FakeGate : public gates::Gate {
public:
    using Script =
        std::function<core::errors::Result<protocol::GateDecision>(const gates::GateContext&)>;

    FakeGate(std::string name, std::set<protocol::EventType> events, Script script)
        : name_(std::move(name)), events_(std::move(events)), script_(std::move(script)) {}

    FakeGate(std::string name, protocol::GateDecision decision)
        : FakeGate(std::move(name),
                   {protocol::EventType::SessionStart, protocol::EventType::UserPromptSubmit,
                    protocol::EventType::PreToolUse, protocol::EventType::PostToolUse,
                    protocol::EventType::Stop, protocol::EventType::SessionEnd},
                   [decision](const gates::GateContext&) {
                       return core::errors::Result<protocol::GateDecision>(decision);
                   }) {}

    std::string name() const override { return name_; }

    bool applies_to(const protocol::EventType type) const override {
        return events_.count(type) != 0;
    }

    core::errors::Result<protocol::GateDecision> evaluate(
        const gates::GateContext& context) override {
        ++calls;
        return script_(context);
    }

    int calls = 0;

private:
    std::string name_;
    std::set<protocol::EventType> events_;
    Script script_;
};

}  // namespace hookguard::testing
