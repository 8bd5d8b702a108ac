#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "gates/hydration_gate.hpp"

namespace {

using hookguard::core::errors::get_value;
using hookguard::core::errors::is_error;
using hookguard::gates::GateContext;
using hookguard::gates::HydrationGate;
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

HookEvent prompt_event(const std::string& prompt) {
    HookEvent event;
    event.session_id = "s1";
    event.event_type = EventType::UserPromptSubmit;
    event.prompt = prompt;
    return event;
}

HookEvent tool_event(EventType type, const std::string& tool, json input = json::object()) {
    HookEvent event;
    event.session_id = "s1";
    event.event_type = type;
    event.tool_name = tool;
    event.tool_input = std::move(input);
    return event;
}

GateDecision evaluate(HydrationGate& gate, const HookEvent& event, const SessionState& state) {
    auto result = gate.evaluate(GateContext{event, state, EnforcementMode::Block});
    EXPECT_FALSE(is_error(result));
    return get_value(result);
}

TEST(HydrationGateTest, AppliesToPromptAndToolEvents) {
    const HydrationGate gate;
    EXPECT_TRUE(gate.applies_to(EventType::UserPromptSubmit));
    EXPECT_TRUE(gate.applies_to(EventType::PreToolUse));
    EXPECT_TRUE(gate.applies_to(EventType::PostToolUse));
    EXPECT_FALSE(gate.applies_to(EventType::Stop));
    EXPECT_FALSE(gate.applies_to(EventType::SessionStart));
}

TEST(HydrationGateTest, FirstPromptSetsPendingAndAddsContext) {
    HydrationGate gate;
    const auto decision = evaluate(gate, prompt_event("fix the parser"), make_default_state("s1"));
    EXPECT_EQ(decision.verdict, Verdict::Ok);
    ASSERT_TRUE(decision.context.has_value());

    const auto state = apply_mutations(make_default_state("s1"), decision.state_mutations);
    EXPECT_TRUE(state.flag_bool(flags::kHydrationPending));
    EXPECT_TRUE(state.flag_bool(flags::kPromptSeen));
}

TEST(HydrationGateTest, LaterPromptsDoNotRearmUnlessConfigured) {
    auto seen = apply_mutations(make_default_state("s1"), {{flags::kPromptSeen, true}});

    HydrationGate once;
    const auto later = apply_mutations(seen, evaluate(once, prompt_event("next"), seen).state_mutations);
    EXPECT_FALSE(later.flag_bool(flags::kHydrationPending));

    HydrationGate every(true);
    const auto rearmed =
        apply_mutations(seen, evaluate(every, prompt_event("next"), seen).state_mutations);
    EXPECT_TRUE(rearmed.flag_bool(flags::kHydrationPending));
}

TEST(HydrationGateTest, CommandsAndNotificationsSkipHydration) {
    EXPECT_TRUE(HydrationGate::skips_hydration("/commit"));
    EXPECT_TRUE(HydrationGate::skips_hydration("  .status"));
    EXPECT_TRUE(HydrationGate::skips_hydration("<task-notification>done</task-notification>"));
    EXPECT_TRUE(HydrationGate::skips_hydration("<agent-notification>x"));
    EXPECT_FALSE(HydrationGate::skips_hydration("refactor /src"));

    HydrationGate gate;
    const auto decision = evaluate(gate, prompt_event("/clear"), make_default_state("s1"));
    EXPECT_TRUE(decision.state_mutations.empty());
}

TEST(HydrationGateTest, BlocksConsequentialToolsWhilePending) {
    HydrationGate gate;
    const auto pending = apply_mutations(make_default_state("s1"), {{flags::kHydrationPending, true}});

    const auto edit = evaluate(gate, tool_event(EventType::PreToolUse, "Edit"), pending);
    EXPECT_EQ(edit.verdict, Verdict::Block);
    EXPECT_NE(edit.message.find("prompt-hydrator"), std::string::npos);
    EXPECT_TRUE(edit.citation.has_value());

    const auto task = evaluate(gate, tool_event(EventType::PreToolUse, "mcp__tm__update_task"), pending);
    EXPECT_EQ(task.verdict, Verdict::Block);
}

TEST(HydrationGateTest, AllowsReadOnlyAndSpawnToolsWhilePending) {
    HydrationGate gate;
    const auto pending = apply_mutations(make_default_state("s1"), {{flags::kHydrationPending, true}});

    EXPECT_EQ(evaluate(gate, tool_event(EventType::PreToolUse, "Read"), pending).verdict, Verdict::Ok);
    EXPECT_EQ(evaluate(gate, tool_event(EventType::PreToolUse, "Bash", {{"command", "git status"}}), pending).verdict,
              Verdict::Ok);
    EXPECT_EQ(evaluate(gate,
                       tool_event(EventType::PreToolUse, "Agent", {{"subagent_type", "prompt-hydrator"}}),
                       pending)
                  .verdict,
              Verdict::Ok);
}

TEST(HydrationGateTest, AllowsEverythingWhenNotPending) {
    HydrationGate gate;
    EXPECT_EQ(evaluate(gate, tool_event(EventType::PreToolUse, "Write"), make_default_state("s1")).verdict,
              Verdict::Ok);
}

TEST(HydrationGateTest, HydratorCompletionClearsPending) {
    HydrationGate gate;
    const auto pending = apply_mutations(make_default_state("s1"), {{flags::kHydrationPending, true}});

    const auto unrelated = evaluate(gate, tool_event(EventType::PostToolUse, "Agent", {{"subagent_type", "critic"}}), pending);
    EXPECT_TRUE(unrelated.state_mutations.empty());

    const auto done = evaluate(
        gate, tool_event(EventType::PostToolUse, "Task", {{"subagent_type", "aops-core:prompt-hydrator"}}), pending);
    const auto cleared = apply_mutations(pending, done.state_mutations);
    EXPECT_FALSE(cleared.flag_bool(flags::kHydrationPending));
}

}  // namespace
