#include "gates/task_gate.hpp"

#include <optional>
#include <utility>

namespace hookguard::gates {

using nlohmann::json;
using protocol::EventType;
using protocol::GateDecision;
using protocol::StateMutation;

namespace {

constexpr const char* kCitation = "task-gate: work must be bound to a task";

std::optional<std::string> string_field(const json& payload, const char* key) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    const auto it = payload.find(key);
    if (it == payload.end()) {
        return std::nullopt;
    }
    if (it->is_string() && !it->get<std::string>().empty()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<std::int64_t>());
    }
    return std::nullopt;
}

// Task tool responses report failure either as success=false or an error key.
bool tool_failed(const json& response) {
    if (!response.is_object()) {
        return false;
    }
    const auto success = response.find("success");
    if (success != response.end() && success->is_boolean() && !success->get<bool>()) {
        return true;
    }
    const auto error = response.find("error");
    return error != response.end() && !error->is_null() &&
           !(error->is_string() && error->get<std::string>().empty());
}

std::string task_id_of(const json& input, const json& response) {
    for (const char* key : {"id", "task_id"}) {
        if (auto value = string_field(input, key)) {
            return *value;
        }
    }
    if (auto value = string_field(response, "id")) {
        return *value;
    }
    if (response.is_object()) {
        const auto task = response.find("task");
        if (task != response.end()) {
            if (auto value = string_field(*task, "id")) {
                return *value;
            }
        }
    }
    return "";
}

void bind_task(GateDecision& decision, const std::string& task_id) {
    decision.state_mutations.push_back(StateMutation{session::flags::kTaskBound, true});
    decision.state_mutations.push_back(
        StateMutation{session::flags::kCurrentTask, task_id});
}

void unbind_task(GateDecision& decision) {
    decision.state_mutations.push_back(StateMutation{session::flags::kTaskBound, false});
    decision.state_mutations.push_back(
        StateMutation{session::flags::kCurrentTask, std::string()});
}

std::string remedy_for(const std::string& condition) {
    if (condition == session::flags::kTaskBound) {
        return "claim or create a task";
    }
    if (condition == session::flags::kPlanInvoked) {
        return "plan the work (EnterPlanMode or a planner agent)";
    }
    return "have a critic agent review the plan";
}

}  // namespace

TaskGate::TaskGate(std::vector<std::string> required, policy::ToolPolicy tool_policy)
    : required_(std::move(required)), tool_policy_(std::move(tool_policy)) {}

bool TaskGate::applies_to(const EventType type) const {
    return type == EventType::PreToolUse || type == EventType::PostToolUse;
}

core::errors::Result<GateDecision> TaskGate::evaluate(const GateContext& context) {
    if (context.event.event_type == EventType::PreToolUse) {
        return on_pre_tool(context);
    }
    if (context.event.event_type == EventType::PostToolUse) {
        return on_post_tool(context);
    }
    return GateDecision::ok();
}

GateDecision TaskGate::on_pre_tool(const GateContext& context) const {
    const std::string tool = context.event.tool_name.value_or("");
    if (tool.empty() || tool_policy_.is_task_mutation(tool) ||
        !tool_policy_.is_consequential(tool, context.event.tool_input)) {
        return GateDecision::ok();
    }

    std::vector<std::string> unmet;
    for (const auto& condition : required_) {
        if (!context.state.flag_bool(condition)) {
            unmet.push_back(condition);
        }
    }
    if (unmet.empty()) {
        return GateDecision::ok();
    }

    std::string listed;
    std::string remedies;
    for (const auto& condition : unmet) {
        listed += (listed.empty() ? "" : ", ") + condition;
        remedies += (remedies.empty() ? "" : "; ") + remedy_for(condition);
    }
    return GateDecision::block("Task gate: unmet conditions before " + tool + ": " +
                                   listed + ". To proceed: " + remedies + ".",
                               std::string(kCitation));
}

GateDecision TaskGate::on_post_tool(const GateContext& context) const {
    const auto& event = context.event;
    const std::string tool = event.tool_name.value_or("");
    GateDecision decision = GateDecision::ok();
    if (tool.empty()) {
        return decision;
    }

    if (tool_policy_.is_task_mutation(tool) && !tool_failed(event.tool_response)) {
        const std::string base = policy::ToolPolicy::base_name(tool);
        const std::string task_id = task_id_of(event.tool_input, event.tool_response);
        if (base == "claim_next_task") {
            bind_task(decision, task_id);
        } else if (base == "update_task") {
            const std::string status =
                string_field(event.tool_input, "status").value_or("");
            if (status == "in_progress") {
                bind_task(decision, task_id);
            } else if (status == "done" || status == "cancelled") {
                const std::string current =
                    context.state.flag_string(session::flags::kCurrentTask);
                if (current.empty() || task_id.empty() || current == task_id) {
                    unbind_task(decision);
                }
            }
        } else if (base == "complete_task" || base == "complete_tasks") {
            unbind_task(decision);
        }
    }

    if (tool == "EnterPlanMode" ||
        tool_policy_.spawns(tool, event.tool_input, "planner")) {
        decision.state_mutations.push_back(
            StateMutation{session::flags::kPlanInvoked, true});
    }
    if (tool_policy_.spawns(tool, event.tool_input, "critic")) {
        decision.state_mutations.push_back(
            StateMutation{session::flags::kCriticInvoked, true});
    }
    return decision;
}

}  // namespace hookguard::gates
