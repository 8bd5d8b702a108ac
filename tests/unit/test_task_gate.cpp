#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "gates/task_gate.hpp"

namespace {

using hookguard::core::errors::get_value;
using hookguard::core::errors::is_error;
using hookguard::gates::GateContext;
using hookguard::gates::TaskGate;
using hookguard::protocol::EnforcementMode;
using hookguard::protocol::EventType;
using hookguard::protocol::GateDecision;
using hookguard::protocol::HookEvent;
using hookguard::protocol::Verdict;
using hookguard::session::apply_mutations;
using hookguard::session::make_default_state;
using hookguard::session::SessionState;
namespace flags = hookguard::session::flags;
using nlohmann::json;

HookEvent tool_event(EventType type, const std::string& tool, json input = json::object(),
                     json response = json::object()) {
    HookEvent event;
    event.session_id = "s1";
    event.event_type = type;
    event.tool_name = tool;
    event.tool_input = std::move(input);
    event.tool_response = std::move(response);
    return event;
}

GateDecision evaluate(TaskGate& gate, const HookEvent& event, const SessionState& state) {
    auto result = gate.evaluate(GateContext{event, state, EnforcementMode::Block});
    EXPECT_FALSE(is_error(result));
    return get_value(result);
}

SessionState after(TaskGate& gate, const HookEvent& event, const SessionState& state) {
    return apply_mutations(state, evaluate(gate, event, state).state_mutations);
}

TEST(TaskGateTest, BlocksEditWithoutBoundTask) {
    TaskGate gate;
    const auto decision =
        evaluate(gate, tool_event(EventType::PreToolUse, "Edit"), make_default_state("s1"));
    EXPECT_EQ(decision.verdict, Verdict::Block);
    EXPECT_NE(decision.message.find("task_bound"), std::string::npos);
}

TEST(TaskGateTest, TaskToolsAndReadsPassWithoutBinding) {
    TaskGate gate;
    const auto state = make_default_state("s1");
    EXPECT_EQ(evaluate(gate, tool_event(EventType::PreToolUse, "Read"), state).verdict, Verdict::Ok);
    EXPECT_EQ(evaluate(gate, tool_event(EventType::PreToolUse, "mcp__tm__create_task"), state).verdict,
              Verdict::Ok);
}

TEST(TaskGateTest, ClaimBindsAndCompleteUnbinds) {
    TaskGate gate;
    auto state = after(gate,
                       tool_event(EventType::PostToolUse, "mcp__tm__claim_next_task", json::object(),
                                  {{"success", true}, {"task", {{"id", "t-1"}}}}),
                       make_default_state("s1"));
    EXPECT_TRUE(state.flag_bool(flags::kTaskBound));
    EXPECT_EQ(state.flag_string(flags::kCurrentTask), "t-1");
    EXPECT_EQ(evaluate(gate, tool_event(EventType::PreToolUse, "Edit"), state).verdict, Verdict::Ok);

    state = after(gate, tool_event(EventType::PostToolUse, "mcp__tm__complete_task", {{"id", "t-1"}}),
                  state);
    EXPECT_FALSE(state.flag_bool(flags::kTaskBound));
    EXPECT_EQ(state.flag_string(flags::kCurrentTask), "");
}

TEST(TaskGateTest, UpdateTaskStatusDrivesBinding) {
    TaskGate gate;
    auto state = after(gate,
                       tool_event(EventType::PostToolUse, "update_task",
                                  {{"id", "t-9"}, {"status", "in_progress"}}),
                       make_default_state("s1"));
    EXPECT_TRUE(state.flag_bool(flags::kTaskBound));

    // Closing a different task leaves the binding alone.
    state = after(gate, tool_event(EventType::PostToolUse, "update_task", {{"id", "t-3"}, {"status", "done"}}),
                  state);
    EXPECT_TRUE(state.flag_bool(flags::kTaskBound));

    state = after(gate,
                  tool_event(EventType::PostToolUse, "update_task", {{"id", "t-9"}, {"status", "cancelled"}}),
                  state);
    EXPECT_FALSE(state.flag_bool(flags::kTaskBound));
}

TEST(TaskGateTest, FailedClaimDoesNotBind) {
    TaskGate gate;
    const auto state = after(gate,
                             tool_event(EventType::PostToolUse, "claim_next_task", json::object(),
                                        {{"success", false}, {"error", "no ready tasks"}}),
                             make_default_state("s1"));
    EXPECT_FALSE(state.flag_bool(flags::kTaskBound));
}

TEST(TaskGateTest, TracksPlanAndCritic) {
    TaskGate gate;
    auto state = after(gate, tool_event(EventType::PostToolUse, "EnterPlanMode"), make_default_state("s1"));
    EXPECT_TRUE(state.flag_bool(flags::kPlanInvoked));
    EXPECT_FALSE(state.flag_bool(flags::kCriticInvoked));

    state = after(gate, tool_event(EventType::PostToolUse, "Agent", {{"subagent_type", "critic"}}), state);
    EXPECT_TRUE(state.flag_bool(flags::kCriticInvoked));
}

TEST(TaskGateTest, OptionalConditionsAreTrackedButNotEnforced) {
    TaskGate gate;
    const auto bound = apply_mutations(make_default_state("s1"), {{flags::kTaskBound, true}});
    EXPECT_EQ(evaluate(gate, tool_event(EventType::PreToolUse, "Write"), bound).verdict, Verdict::Ok);
}

TEST(TaskGateTest, ListsEveryUnmetRequiredCondition) {
    TaskGate gate({"task_bound", "plan_invoked", "critic_invoked"});
    const auto bound = apply_mutations(make_default_state("s1"), {{flags::kTaskBound, true}});
    const auto decision = evaluate(gate, tool_event(EventType::PreToolUse, "Write"), bound);
    EXPECT_EQ(decision.verdict, Verdict::Block);
    EXPECT_EQ(decision.message.find("task_bound"), std::string::npos);
    EXPECT_NE(decision.message.find("plan_invoked"), std::string::npos);
    EXPECT_NE(decision.message.find("critic_invoked"), std::string::npos);
}

}  // namespace
