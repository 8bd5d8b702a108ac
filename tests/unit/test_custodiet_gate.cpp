#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "gates/compliance_checker.hpp"
#include "gates/custodiet_gate.hpp"
#include "temp_workspace.hpp"

namespace {

using hookguard::core::errors::ErrorCategory;
using hookguard::core::errors::get_value;
using hookguard::core::errors::HookError;
using hookguard::core::errors::is_error;
using hookguard::core::errors::Result;
using hookguard::gates::CommandComplianceChecker;
using hookguard::gates::ComplianceChecker;
using hookguard::gates::ComplianceVerdict;
using hookguard::gates::CustodietGate;
using hookguard::gates::GateContext;
using hookguard::protocol::EnforcementMode;
using hookguard::protocol::EventType;
using hookguard::protocol::GateDecision;
using hookguard::protocol::HookEvent;
using hookguard::protocol::Verdict;
using hookguard::session::apply_mutations;
using hookguard::session::make_default_state;
using hookguard::session::SessionState;
using hookguard::testing::TempWorkspace;
namespace flags = hookguard::session::flags;
using nlohmann::json;

class FakeChecker : public ComplianceChecker {
public:
    explicit FakeChecker(Result<ComplianceVerdict> answer) : answer_(std::move(answer)) {}

    Result<ComplianceVerdict> check(const json& summary) override {
        ++calls;
        last_summary = summary;
        return answer_;
    }

    int calls = 0;
    json last_summary;

private:
    Result<ComplianceVerdict> answer_;
};

HookEvent pre_tool(const std::string& tool, json input = json::object()) {
    HookEvent event;
    event.session_id = "s1";
    event.event_type = EventType::PreToolUse;
    event.tool_name = tool;
    event.tool_input = std::move(input);
    return event;
}

GateDecision evaluate(CustodietGate& gate, const HookEvent& event, const SessionState& state,
                      EnforcementMode mode = EnforcementMode::Block) {
    auto result = gate.evaluate(GateContext{event, state, mode});
    EXPECT_FALSE(is_error(result));
    return get_value(result);
}

SessionState with_count(std::int64_t count) {
    return apply_mutations(make_default_state("s1"), {{flags::kToolCallsSinceCustodiet, count}});
}

TEST(CustodietGateTest, CountsToolCallsBelowInterval) {
    auto checker = std::make_shared<FakeChecker>(ComplianceVerdict{});
    CustodietGate gate(3, checker);

    auto state = make_default_state("s1");
    for (int i = 1; i <= 2; ++i) {
        const auto decision = evaluate(gate, pre_tool("Read"), state);
        EXPECT_EQ(decision.verdict, Verdict::Ok);
        state = apply_mutations(state, decision.state_mutations);
        EXPECT_EQ(state.flag_int(flags::kToolCallsSinceCustodiet), i);
    }
    EXPECT_EQ(checker->calls, 0);

    const auto due = evaluate(gate, pre_tool("Read"), state);
    state = apply_mutations(state, due.state_mutations);
    EXPECT_EQ(checker->calls, 1);
    EXPECT_EQ(state.flag_int(flags::kToolCallsSinceCustodiet), 0);
}

TEST(CustodietGateTest, CustodietSpawnResetsCounter) {
    auto checker = std::make_shared<FakeChecker>(ComplianceVerdict{});
    CustodietGate gate(3, checker);

    const auto state = apply_mutations(
        with_count(2), evaluate(gate, pre_tool("Agent", {{"subagent_type", "custodiet"}}), with_count(2))
                           .state_mutations);
    EXPECT_EQ(state.flag_int(flags::kToolCallsSinceCustodiet), 0);
    EXPECT_EQ(checker->calls, 0);
}

TEST(CustodietGateTest, WarnsWhenNoCheckerConfigured) {
    CustodietGate gate(2, nullptr);
    const auto decision = evaluate(gate, pre_tool("Edit"), with_count(1));
    EXPECT_EQ(decision.verdict, Verdict::Warn);
    EXPECT_NE(decision.message.find("CUSTODIET_CHECK_COMMAND"), std::string::npos);
    EXPECT_FALSE(decision.latch);
}

TEST(CustodietGateTest, CheckerFailureDegradesToWarn) {
    auto checker = std::make_shared<FakeChecker>(
        HookError{ErrorCategory::ExternalCheck, "checker timed out", "external_check_timeout"});
    CustodietGate gate(1, checker);

    const auto decision = evaluate(gate, pre_tool("Edit"), make_default_state("s1"));
    EXPECT_EQ(decision.verdict, Verdict::Warn);
    EXPECT_NE(decision.message.find("checker timed out"), std::string::npos);
    EXPECT_FALSE(decision.latch);
}

TEST(CustodietGateTest, BlockVerdictLatchesInBlockMode) {
    auto checker = std::make_shared<FakeChecker>(
        ComplianceVerdict{Verdict::Block, std::string("AXIOM-3"), "scope drift"});
    CustodietGate gate(1, checker);

    const auto decision = evaluate(gate, pre_tool("Edit"), make_default_state("s1"));
    EXPECT_EQ(decision.verdict, Verdict::Block);
    EXPECT_TRUE(decision.latch);
    EXPECT_EQ(decision.citation.value_or(""), "AXIOM-3");
    EXPECT_NE(decision.message.find("hookguard clear-block --session s1"), std::string::npos);

    const auto state = apply_mutations(make_default_state("s1"), decision.state_mutations);
    EXPECT_TRUE(state.flag_bool(flags::kCustodietBlockActive));
    EXPECT_EQ(state.flag_string(flags::kCustodietMode), "block");
}

TEST(CustodietGateTest, BlockVerdictInWarnModeDoesNotLatch) {
    auto checker = std::make_shared<FakeChecker>(
        ComplianceVerdict{Verdict::Block, std::nullopt, "scope drift"});
    CustodietGate gate(1, checker);

    const auto decision =
        evaluate(gate, pre_tool("Edit"), make_default_state("s1"), EnforcementMode::Warn);
    EXPECT_FALSE(decision.latch);
    const auto state = apply_mutations(make_default_state("s1"), decision.state_mutations);
    EXPECT_FALSE(state.flag_bool(flags::kCustodietBlockActive));
    EXPECT_EQ(state.flag_string(flags::kCustodietMode), "warn");
}

TEST(CustodietGateTest, SummaryIsBounded) {
    TempWorkspace workspace("custodiet_summary");
    std::string transcript;
    for (int i = 0; i < 50; ++i) {
        transcript += "{\"line\":" + std::to_string(i) + "}\n";
    }
    transcript += std::string(1000, 'x') + "\n";

    auto event = pre_tool("Write", {{"content", std::string(5000, 'a')}});
    event.transcript_path = workspace.write_file("transcript.jsonl", transcript).string();

    auto state = make_default_state("s1");
    for (int i = 0; i < 15; ++i) {
        state.append_audit({i, "PreToolUse", "task", Verdict::Warn, "warned", std::nullopt, json::object()});
    }

    const auto summary = CustodietGate::build_summary(GateContext{event, state, EnforcementMode::Warn});
    EXPECT_TRUE(summary.at("tool_input").is_string());
    EXPECT_TRUE(summary.at("tool_input_truncated").get<bool>());
    EXPECT_EQ(summary.at("recent_audit").size(), CustodietGate::kRecentAuditEntries);
    EXPECT_EQ(summary.at("recent_audit").back().at("ts_unix_ms").get<int>(), 14);

    const auto& tail = summary.at("transcript_tail");
    ASSERT_EQ(tail.size(), CustodietGate::kTranscriptTailLines);
    EXPECT_LE(tail.back().get<std::string>().size(), CustodietGate::kTranscriptLineChars + 3);
    EXPECT_EQ(summary.at("flags").at(flags::kTaskBound), false);
}

TEST(CustodietGateTest, TruncationKeepsMultibyteCharactersWhole) {
    TempWorkspace workspace("custodiet_utf8");
    // The two-byte character straddles the per-line cut.
    const std::string long_line =
        std::string(CustodietGate::kTranscriptLineChars - 1, 'a') + "\xc3\xa9 tail";
    auto event = pre_tool("Write", {{"content", std::string(2035, 'b') + "\xc3\xa9"}});
    event.transcript_path = workspace.write_file("transcript.jsonl", long_line + "\n").string();
    const auto state = make_default_state("s1");

    const auto summary =
        CustodietGate::build_summary(GateContext{event, state, EnforcementMode::Warn});
    EXPECT_NO_THROW(summary.dump());
    EXPECT_EQ(summary.at("transcript_tail").at(0).get<std::string>(),
              std::string(CustodietGate::kTranscriptLineChars - 1, 'a') + "...");
    ASSERT_TRUE(summary.at("tool_input").is_string());
    EXPECT_EQ(summary.at("tool_input").get<std::string>().size(),
              CustodietGate::kMaxToolInputBytes - 1 + 3);
}

TEST(CustodietGateTest, NonAsciiTranscriptReachesCommandChecker) {
    TempWorkspace workspace("custodiet_utf8_checker");
    auto checker = std::make_shared<CommandComplianceChecker>(
        "cat > /dev/null; echo '{\"verdict\":\"OK\"}'", 5000);
    CustodietGate gate(1, checker);

    auto event = pre_tool("Edit", {{"file_path", "caf\xc3\xa9.txt"}});
    event.transcript_path =
        workspace
            .write_file("transcript.jsonl",
                        std::string(CustodietGate::kTranscriptLineChars - 1, 'a') + "\xc3\xa9\n")
            .string();

    const auto decision = evaluate(gate, event, with_count(5));
    EXPECT_EQ(decision.verdict, Verdict::Ok);
    const auto state = apply_mutations(with_count(5), decision.state_mutations);
    EXPECT_EQ(state.flag_int(flags::kToolCallsSinceCustodiet), 0);
}

}  // namespace
