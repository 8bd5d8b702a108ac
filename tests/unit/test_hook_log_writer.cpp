#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "session/hook_log_writer.hpp"
#include "temp_workspace.hpp"

namespace {

using hookguard::core::errors::get_value;
using hookguard::core::errors::is_error;
using hookguard::protocol::EnforcementMode;
using hookguard::protocol::EventType;
using hookguard::protocol::GateOutcome;
using hookguard::protocol::HookEvent;
using hookguard::protocol::HookResponse;
using hookguard::protocol::Verdict;
using hookguard::session::HookLogWriter;
using hookguard::testing::TempWorkspace;
using nlohmann::json;

std::vector<json> read_lines(const TempWorkspace& workspace, const std::filesystem::path& path) {
    std::vector<json> lines;
    std::istringstream in(workspace.read_file(path));
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(json::parse(line));
    }
    return lines;
}

TEST(HookLogWriterTest, AppendsOneLinePerInvocation) {
    TempWorkspace workspace("hook_log");
    HookLogWriter writer(workspace.root());

    HookEvent event;
    event.session_id = "s1";
    event.event_type = EventType::PreToolUse;
    event.tool_name = "Edit";

    HookResponse response;
    response.verdict = Verdict::Block;
    response.messages = {"blocked"};
    response.outcomes.push_back(
        GateOutcome{"task", EnforcementMode::Block, Verdict::Block, "blocked", std::string("T-1")});

    auto first = writer.write_invocation(event, response);
    ASSERT_FALSE(is_error(first));
    auto second = writer.write_invocation(event, HookResponse{});
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(first), get_value(second));

    const auto lines = read_lines(workspace, get_value(first));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].at("session_id"), "s1");
    EXPECT_EQ(lines[0].at("event"), "PreToolUse");
    EXPECT_EQ(lines[0].at("decision"), "block");
    EXPECT_EQ(lines[0].at("gates").size(), 1u);
    EXPECT_EQ(lines[0].at("gates")[0].at("citation"), "T-1");
    EXPECT_EQ(lines[1].at("decision"), "allow");
    EXPECT_FALSE(lines[1].at("input_rewritten").get<bool>());
}

TEST(HookLogWriterTest, FailuresWithoutSessionGoToUnscopedLog) {
    TempWorkspace workspace("hook_log");
    HookLogWriter writer(workspace.root());

    auto written = writer.write_failure(std::nullopt, "invalid_json", "not json");
    ASSERT_FALSE(is_error(written));
    EXPECT_EQ(get_value(written), writer.unscoped_log_path());

    const auto lines = read_lines(workspace, get_value(written));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_TRUE(lines[0].at("session_id").is_null());
    EXPECT_EQ(lines[0].at("error_code"), "invalid_json");
}

TEST(HookLogWriterTest, SessionNamedLikeFailureLogStaysSeparate) {
    TempWorkspace workspace("hook_log");
    HookLogWriter writer(workspace.root());

    HookEvent event;
    event.session_id = "_unscoped";
    event.event_type = EventType::Stop;
    auto session_log = writer.write_invocation(event, HookResponse{});
    auto failure_log = writer.write_failure(std::nullopt, "invalid_json", "not json");
    ASSERT_FALSE(is_error(session_log));
    ASSERT_FALSE(is_error(failure_log));

    EXPECT_NE(get_value(session_log), get_value(failure_log));
    EXPECT_EQ(read_lines(workspace, get_value(session_log)).size(), 1u);
    EXPECT_EQ(read_lines(workspace, get_value(failure_log)).size(), 1u);
}

TEST(HookLogWriterTest, EmptySessionIdIsRejected) {
    TempWorkspace workspace("hook_log");
    HookLogWriter writer(workspace.root());
    EXPECT_TRUE(is_error(writer.log_path("")));
}

}  // namespace
