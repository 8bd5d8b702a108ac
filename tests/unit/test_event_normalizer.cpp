#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "session/event_normalizer.hpp"
#include "temp_workspace.hpp"

namespace {

using hookguard::core::errors::ErrorCategory;
using hookguard::core::errors::get_error;
using hookguard::core::errors::get_value;
using hookguard::core::errors::is_error;
using hookguard::protocol::EventType;
using hookguard::protocol::Runtime;
using hookguard::session::EventNormalizer;
using hookguard::session::ProcessContext;
using hookguard::testing::TempWorkspace;
using nlohmann::json;

ProcessContext no_process() {
    return ProcessContext{};
}

TEST(EventNormalizerTest, MapsClaudeEvents) {
    EXPECT_EQ(EventNormalizer::map_event_name(Runtime::Claude, "PreToolUse"), EventType::PreToolUse);
    EXPECT_EQ(EventNormalizer::map_event_name(Runtime::Claude, "UserPromptSubmit"),
              EventType::UserPromptSubmit);
    EXPECT_EQ(EventNormalizer::map_event_name(Runtime::Claude, "SessionEnd"), EventType::SessionEnd);
    EXPECT_FALSE(EventNormalizer::map_event_name(Runtime::Claude, "Notification").has_value());
}

TEST(EventNormalizerTest, MapsGeminiEvents) {
    EXPECT_EQ(EventNormalizer::map_event_name(Runtime::Gemini, "BeforeTool"), EventType::PreToolUse);
    EXPECT_EQ(EventNormalizer::map_event_name(Runtime::Gemini, "AfterTool"), EventType::PostToolUse);
    EXPECT_EQ(EventNormalizer::map_event_name(Runtime::Gemini, "BeforeAgent"),
              EventType::UserPromptSubmit);
    EXPECT_FALSE(EventNormalizer::map_event_name(Runtime::Gemini, "PreToolUse").has_value());
}

TEST(EventNormalizerTest, NormalizesClaudePayload) {
    TempWorkspace workspace("normalizer");
    EventNormalizer normalizer(workspace.root());
    const json payload = {{"hook_event_name", "PreToolUse"},
                          {"session_id", "abc"},
                          {"tool_name", "Edit"},
                          {"tool_input", {{"file_path", "a.cpp"}}},
                          {"cwd", "/work"}};

    auto result = normalizer.normalize(payload, Runtime::Claude, std::nullopt, no_process());
    ASSERT_FALSE(is_error(result));
    const auto& event = get_value(result);
    EXPECT_EQ(event.session_id, "abc");
    EXPECT_EQ(event.event_type, EventType::PreToolUse);
    EXPECT_EQ(event.tool_name.value_or(""), "Edit");
    EXPECT_EQ(event.tool_input.at("file_path"), "a.cpp");
    EXPECT_EQ(event.cwd.value_or(""), "/work");
    EXPECT_EQ(event.raw, payload);
}

TEST(EventNormalizerTest, EventOverrideAndStringToolInput) {
    TempWorkspace workspace("normalizer");
    EventNormalizer normalizer(workspace.root());
    const json payload = {{"session_id", "g1"},
                          {"tool_name", "run_shell_command"},
                          {"tool_input", "{\"command\":\"ls\"}"}};

    auto result = normalizer.normalize(payload, Runtime::Gemini, std::string("BeforeTool"),
                                       no_process());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).event_type, EventType::PreToolUse);
    EXPECT_EQ(get_value(result).tool_input.at("command"), "ls");
}

TEST(EventNormalizerTest, RejectsBadPayloads) {
    TempWorkspace workspace("normalizer");
    EventNormalizer normalizer(workspace.root());

    auto not_object = normalizer.normalize(json::array(), Runtime::Claude, std::nullopt, no_process());
    ASSERT_TRUE(is_error(not_object));
    EXPECT_EQ(get_error(not_object).code, "invalid_json");

    auto missing = normalizer.normalize(json{{"session_id", "x"}}, Runtime::Claude, std::nullopt,
                                        no_process());
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_event");

    auto unsupported = normalizer.normalize(
        json{{"session_id", "x"}, {"hook_event_name", "Notification"}}, Runtime::Claude,
        std::nullopt, no_process());
    ASSERT_TRUE(is_error(unsupported));
    EXPECT_EQ(get_error(unsupported).code, "unsupported_event");
    EXPECT_EQ(get_error(unsupported).category, ErrorCategory::Input);
}

TEST(EventNormalizerTest, DerivesSessionFromTranscriptAndRemembersIt) {
    TempWorkspace workspace("normalizer");
    EventNormalizer normalizer(workspace.root());
    ProcessContext process;
    process.parent_pid = 4242;

    const json first = {{"hook_event_name", "SessionStart"},
                        {"transcript_path", "/home/u/.gemini/tmp/p1/chats/session-1.json"}};
    auto derived = normalizer.normalize(first, Runtime::Gemini, std::nullopt, process);
    ASSERT_FALSE(is_error(derived));
    const std::string session_id = get_value(derived).session_id;
    EXPECT_EQ(session_id.rfind("gemini-", 0), 0u);
    EXPECT_EQ(session_id, EventNormalizer::derive_from_transcript(
                              Runtime::Gemini, "/home/u/.gemini/tmp/p1/chats/session-1.json"));
    EXPECT_TRUE(std::filesystem::exists(normalizer.session_map_path(4242)));

    // A later event from the same parent process carries no identifiers.
    auto reused = normalizer.normalize(json{{"hook_event_name", "BeforeTool"}}, Runtime::Gemini,
                                       std::nullopt, process);
    ASSERT_FALSE(is_error(reused));
    EXPECT_EQ(get_value(reused).session_id, session_id);
}

TEST(EventNormalizerTest, TranscriptHashIsStableAcrossLogSubdirectories) {
    EXPECT_EQ(EventNormalizer::derive_from_transcript(Runtime::Gemini, "/p/chats/s.json"),
              EventNormalizer::derive_from_transcript(Runtime::Gemini, "/p/logs/s.json"));
    EXPECT_NE(EventNormalizer::derive_from_transcript(Runtime::Gemini, "/p/chats/s.json"),
              EventNormalizer::derive_from_transcript(Runtime::Gemini, "/q/chats/s.json"));
}

TEST(EventNormalizerTest, FallsBackToWorkingDirectory) {
    TempWorkspace workspace("normalizer");
    EventNormalizer normalizer(workspace.root());
    ProcessContext process;
    process.working_directory = "/work/project";

    auto first = normalizer.normalize(json{{"hook_event_name", "Stop"}}, Runtime::Claude,
                                      std::nullopt, process);
    auto second = normalizer.normalize(json{{"hook_event_name", "Stop"}}, Runtime::Claude,
                                       std::nullopt, process);
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(first).session_id.rfind("claude-cwd-", 0), 0u);
    EXPECT_EQ(get_value(first).session_id, get_value(second).session_id);
}

TEST(EventNormalizerTest, UnscopedEventIsAConfigurationError) {
    TempWorkspace workspace("normalizer");
    EventNormalizer normalizer(workspace.root());

    auto result = normalizer.normalize(json{{"hook_event_name", "Stop"}}, Runtime::Claude,
                                       std::nullopt, no_process());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "session_unscoped");
    EXPECT_EQ(get_error(result).category, ErrorCategory::Configuration);
}

}  // namespace
