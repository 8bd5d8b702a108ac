#pragma once

#include <string>
#include "gates/gate.hpp"
#include "policy/tool_policy.hpp"

namespace hookguard::gates {

// Requires the prompt-hydrator to run after a prompt before any
// consequential tool call.
class HydrationGate : public Gate {
public:
    static constexpr const char* kName = "hydration";

    explicit HydrationGate(bool every_prompt = false, policy::ToolPolicy tool_policy = policy::ToolPolicy());

    std::string name() const override { return kName; }
    bool applies_to(protocol::EventType type) const override;
    core::errors::Result<protocol::GateDecision> evaluate(
        const GateContext& context) override;

    // Slash commands, dot-prefixed prompts and notifications skip hydration.
    static bool skips_hydration(const std::string& prompt);

private:
    protocol::GateDecision on_prompt(const GateContext& context) const;
    protocol::GateDecision on_pre_tool(const GateContext& context) const;
    protocol::GateDecision on_post_tool(const GateContext& context) const;

    bool every_prompt_;
    policy::ToolPolicy tool_policy_;
};

}  // namespace hookguard::gates
