#include "gates/hydration_gate.hpp"

#include <utility>

namespace hookguard::gates {

using protocol::EventType;
using protocol::GateDecision;
using protocol::StateMutation;

namespace {

constexpr const char* kHydratorNeedle = "hydrator";
constexpr const char* kCitation = "hydration-gate: hydrate before acting";

std::string trim_left(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    return first == std::string::npos ? "" : value.substr(first);
}

}  // namespace

HydrationGate::HydrationGate(const bool every_prompt, policy::ToolPolicy tool_policy)
    : every_prompt_(every_prompt), tool_policy_(std::move(tool_policy)) {}

bool HydrationGate::applies_to(const EventType type) const {
    return type == EventType::UserPromptSubmit || type == EventType::PreToolUse ||
           type == EventType::PostToolUse;
}

bool HydrationGate::skips_hydration(const std::string& prompt) {
    const std::string text = trim_left(prompt);
    if (text.empty()) {
        return true;
    }
    if (text.front() == '/' || text.front() == '.') {
        return true;
    }
    return text.rfind("<agent-notification>", 0) == 0 ||
           text.rfind("<task-notification>", 0) == 0;
}

core::errors::Result<GateDecision> HydrationGate::evaluate(const GateContext& context) {
    switch (context.event.event_type) {
        case EventType::UserPromptSubmit:
            return on_prompt(context);
        case EventType::PreToolUse:
            return on_pre_tool(context);
        case EventType::PostToolUse:
            return on_post_tool(context);
        default:
            return GateDecision::ok();
    }
}

GateDecision HydrationGate::on_prompt(const GateContext& context) const {
    const std::string prompt = context.event.prompt.value_or("");
    if (skips_hydration(prompt)) {
        return GateDecision::ok();
    }

    const bool first_prompt = !context.state.flag_bool(session::flags::kPromptSeen);
    GateDecision decision = GateDecision::ok();
    decision.state_mutations.push_back(StateMutation{session::flags::kPromptSeen, true});
    if (first_prompt || every_prompt_) {
        decision.state_mutations.push_back(
            StateMutation{session::flags::kHydrationPending, true});
        decision.context =
            "Before acting on this prompt, invoke the prompt-hydrator agent with the "
            "user's request. File edits and task changes stay gated until it finishes.";
    }
    return decision;
}

GateDecision HydrationGate::on_pre_tool(const GateContext& context) const {
    if (!context.state.flag_bool(session::flags::kHydrationPending)) {
        return GateDecision::ok();
    }
    const std::string tool = context.event.tool_name.value_or("");
    if (tool.empty() || !tool_policy_.is_consequential(tool, context.event.tool_input)) {
        return GateDecision::ok();
    }
    return GateDecision::block(
        "Hydration required: invoke the prompt-hydrator agent before using " + tool +
            ".",
        std::string(kCitation));
}

GateDecision HydrationGate::on_post_tool(const GateContext& context) const {
    const std::string tool = context.event.tool_name.value_or("");
    if (!tool_policy_.spawns(tool, context.event.tool_input, kHydratorNeedle)) {
        return GateDecision::ok();
    }
    GateDecision decision = GateDecision::ok();
    decision.state_mutations.push_back(
        StateMutation{session::flags::kHydrationPending, false});
    return decision;
}

}  // namespace hookguard::gates
