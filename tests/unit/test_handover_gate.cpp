#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "gates/handover_gate.hpp"

namespace {

using hookguard::core::errors::get_value;
using hookguard::core::errors::is_error;
using hookguard::gates::GateContext;
using hookguard::gates::HandoverGate;
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

HookEvent make_event(EventType type, const std::string& tool = "", json input = json::object()) {
    HookEvent event;
    event.session_id = "s1";
    event.event_type = type;
    if (!tool.empty()) {
        event.tool_name = tool;
    }
    event.tool_input = std::move(input);
    return event;
}

GateDecision evaluate(HandoverGate& gate, const HookEvent& event, const SessionState& state) {
    auto result = gate.evaluate(GateContext{event, state, EnforcementMode::Block});
    EXPECT_FALSE(is_error(result));
    return get_value(result);
}

TEST(HandoverGateTest, StopWithoutTaskIsAllowed) {
    HandoverGate gate;
    EXPECT_EQ(evaluate(gate, make_event(EventType::Stop), make_default_state("s1")).verdict, Verdict::Ok);
}

TEST(HandoverGateTest, StopWithBoundTaskRequiresHandover) {
    HandoverGate gate;
    const auto bound = apply_mutations(make_default_state("s1"),
                                       {{flags::kTaskBound, true}, {flags::kCurrentTask, std::string("t-5")}});
    const auto decision = evaluate(gate, make_event(EventType::Stop), bound);
    EXPECT_EQ(decision.verdict, Verdict::Block);
    EXPECT_NE(decision.message.find("t-5"), std::string::npos);

    const auto handed_over = apply_mutations(
        bound, evaluate(gate, make_event(EventType::PostToolUse, "Skill", {{"skill", "aops-core:handover"}}), bound)
                   .state_mutations);
    EXPECT_TRUE(handed_over.flag_bool(flags::kHandoverInvoked));
    EXPECT_EQ(evaluate(gate, make_event(EventType::Stop), handed_over).verdict, Verdict::Ok);
}

TEST(HandoverGateTest, DestructiveWorkAfterHandoverInvalidatesIt) {
    HandoverGate gate;
    const auto handed_over = apply_mutations(make_default_state("s1"),
                                             {{flags::kTaskBound, true}, {flags::kHandoverInvoked, true}});

    const auto read = evaluate(gate, make_event(EventType::PostToolUse, "Read"), handed_over);
    EXPECT_TRUE(read.state_mutations.empty());

    const auto edited = apply_mutations(
        handed_over, evaluate(gate, make_event(EventType::PostToolUse, "Edit"), handed_over).state_mutations);
    EXPECT_FALSE(edited.flag_bool(flags::kHandoverInvoked));
    EXPECT_EQ(evaluate(gate, make_event(EventType::Stop), edited).verdict, Verdict::Block);
}

}  // namespace
