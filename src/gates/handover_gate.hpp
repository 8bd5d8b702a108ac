#pragma once

#include <string>
#include "gates/gate.hpp"
#include "policy/tool_policy.hpp"

namespace hookguard::gates {

// A session holding a task must run the handover skill before it stops.
// Any destructive action after a handover invalidates it.
class HandoverGate : public Gate {
public:
    static constexpr const char* kName = "handover";

    explicit HandoverGate(policy::ToolPolicy tool_policy = policy::ToolPolicy());

    std::string name() const override { return kName; }
    bool applies_to(protocol::EventType type) const override;
    core::errors::Result<protocol::GateDecision> evaluate(
        const GateContext& context) override;

private:
    policy::ToolPolicy tool_policy_;
};

}  // namespace hookguard::gates
