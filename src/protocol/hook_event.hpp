#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace hookguard::protocol {

enum class EventType {
    SessionStart,
    UserPromptSubmit,
    PreToolUse,
    PostToolUse,
    Stop,
    SessionEnd
};

enum class Runtime {
    Claude,
    Gemini
};

// Canonical envelope every runtime payload is normalized into.
struct HookEvent {
    std::string session_id;
    EventType event_type = EventType::SessionStart;
    Runtime runtime = Runtime::Claude;
    std::optional<std::string> tool_name;
    nlohmann::json tool_input = nlohmann::json::object();
    nlohmann::json tool_response = nlohmann::json::object();
    std::optional<std::string> prompt;
    std::optional<std::string> transcript_path;
    std::optional<std::string> cwd;
    nlohmann::json raw = nlohmann::json::object();
};

inline std::string to_string(const EventType type) {
    switch (type) {
        case EventType::SessionStart:
            return "SessionStart";
        case EventType::UserPromptSubmit:
            return "UserPromptSubmit";
        case EventType::PreToolUse:
            return "PreToolUse";
        case EventType::PostToolUse:
            return "PostToolUse";
        case EventType::Stop:
            return "Stop";
        case EventType::SessionEnd:
            return "SessionEnd";
        default:
            return "unknown";
    }
}

inline std::string to_string(const Runtime runtime) {
    switch (runtime) {
        case Runtime::Claude:
            return "claude";
        case Runtime::Gemini:
            return "gemini";
        default:
            return "unknown";
    }
}

inline std::optional<Runtime> parse_runtime(const std::string& text) {
    if (text == "claude") return Runtime::Claude;
    if (text == "gemini") return Runtime::Gemini;
    return std::nullopt;
}

}  // namespace hookguard::protocol
