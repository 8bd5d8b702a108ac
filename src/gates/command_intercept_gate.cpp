#include "gates/command_intercept_gate.hpp"

#include <set>
#include <utility>

namespace hookguard::gates {

using protocol::EventType;
using protocol::GateDecision;

namespace {

bool is_search_tool(const std::string& tool) {
    static const std::set<std::string> tools = {"Grep", "grep_search",
                                                "search_file_content"};
    return tools.count(tool) != 0;
}

}  // namespace

CommandInterceptGate::CommandInterceptGate(std::vector<std::string> excludes)
    : excludes_(std::move(excludes)) {}

bool CommandInterceptGate::applies_to(const EventType type) const {
    return type == EventType::PreToolUse;
}

std::string CommandInterceptGate::exclusion_glob() const {
    std::string joined;
    for (const auto& pattern : excludes_) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += pattern;
    }
    return "!{" + joined + "}";
}

core::errors::Result<GateDecision> CommandInterceptGate::evaluate(
    const GateContext& context) {
    const auto& event = context.event;
    if (excludes_.empty() || !event.tool_name.has_value() ||
        !is_search_tool(event.tool_name.value()) || !event.tool_input.is_object()) {
        return GateDecision::ok();
    }

    const auto glob = event.tool_input.find("glob");
    if (glob != event.tool_input.end() && !glob->is_null() &&
        !(glob->is_string() && glob->get<std::string>().empty())) {
        return GateDecision::ok();
    }

    GateDecision decision = GateDecision::ok();
    nlohmann::json rewritten = event.tool_input;
    rewritten["glob"] = exclusion_glob();
    decision.updated_input = std::move(rewritten);
    return decision;
}

}  // namespace hookguard::gates
