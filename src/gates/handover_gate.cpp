#include "gates/handover_gate.hpp"

#include <utility>

namespace hookguard::gates {

using protocol::EventType;
using protocol::GateDecision;
using protocol::StateMutation;

HandoverGate::HandoverGate(policy::ToolPolicy tool_policy)
    : tool_policy_(std::move(tool_policy)) {}

bool HandoverGate::applies_to(const EventType type) const {
    return type == EventType::PostToolUse || type == EventType::Stop;
}

core::errors::Result<GateDecision> HandoverGate::evaluate(const GateContext& context) {
    const auto& event = context.event;
    const auto& state = context.state;

    if (event.event_type == EventType::PostToolUse) {
        const std::string tool = event.tool_name.value_or("");
        GateDecision decision = GateDecision::ok();
        if (tool_policy_.spawns(tool, event.tool_input, "handover")) {
            decision.state_mutations.push_back(
                StateMutation{session::flags::kHandoverInvoked, true});
        } else if (state.flag_bool(session::flags::kHandoverInvoked) &&
                   tool_policy_.is_destructive(tool, event.tool_input)) {
            decision.state_mutations.push_back(
                StateMutation{session::flags::kHandoverInvoked, false});
        }
        return decision;
    }

    if (event.event_type != EventType::Stop ||
        !state.flag_bool(session::flags::kTaskBound) ||
        state.flag_bool(session::flags::kHandoverInvoked)) {
        return GateDecision::ok();
    }

    const std::string task = state.flag_string(session::flags::kCurrentTask);
    return GateDecision::block(
        "Handover required: task " + (task.empty() ? std::string("(unnamed)") : task) +
            " is still bound. Run the handover skill to record progress before "
            "stopping.",
        std::string("handover-gate: hand over before stopping"));
}

}  // namespace hookguard::gates
