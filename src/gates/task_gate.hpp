#pragma once

#include <string>
#include <vector>
#include "gates/gate.hpp"
#include "policy/tool_policy.hpp"

namespace hookguard::gates {

// Tracks task binding, planning and critic review, and gates consequential
// tool calls on the configured subset of those conditions.
class TaskGate : public Gate {
public:
    static constexpr const char* kName = "task";

    explicit TaskGate(std::vector<std::string> required = {"task_bound"},
                      policy::ToolPolicy tool_policy = policy::ToolPolicy());

    std::string name() const override { return kName; }
    bool applies_to(protocol::EventType type) const override;
    core::errors::Result<protocol::GateDecision> evaluate(
        const GateContext& context) override;

    const std::vector<std::string>& required() const { return required_; }

private:
    protocol::GateDecision on_pre_tool(const GateContext& context) const;
    protocol::GateDecision on_post_tool(const GateContext& context) const;

    std::vector<std::string> required_;
    policy::ToolPolicy tool_policy_;
};

}  // namespace hookguard::gates
