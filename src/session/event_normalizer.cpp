#include "session/event_normalizer.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/config/clock.hpp"
#include "core/config/session_key.hpp"
#include "core/logging/logger.hpp"

namespace hookguard::session {

using core::errors::ErrorCategory;
using core::errors::HookError;
using nlohmann::json;
using protocol::EventType;
using protocol::HookEvent;
using protocol::Runtime;

namespace {

std::optional<std::string> non_empty_string(const json& payload, const char* key) {
    const auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

// Hosts sometimes send nested payloads as JSON text.
json structured_field(const json& payload, const char* key) {
    const auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return json::object();
    }
    if (it->is_string()) {
        json parsed = json::parse(it->get<std::string>(), nullptr, false);
        if (parsed.is_discarded()) {
            return json(it->get<std::string>());
        }
        return parsed;
    }
    return *it;
}

}  // namespace

ProcessContext ProcessContext::current(const core::config::EnvLookup& env) {
    ProcessContext context;
    const pid_t parent = getppid();
    if (parent > 1) {
        context.parent_pid = static_cast<long>(parent);
    }
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (!ec && !cwd.empty()) {
        context.working_directory = cwd.string();
    }
    for (const char* name : {"CLAUDE_PROJECT_DIR", "GEMINI_PROJECT_DIR"}) {
        const auto value = env(name);
        if (value.has_value() && !value->empty()) {
            context.project_directory = value;
            break;
        }
    }
    return context;
}

EventNormalizer::EventNormalizer(std::filesystem::path state_root)
    : state_root_(std::move(state_root)) {}

std::optional<EventType> EventNormalizer::map_event_name(const Runtime runtime,
                                                         const std::string& name) {
    if (runtime == Runtime::Gemini) {
        if (name == "SessionStart") return EventType::SessionStart;
        if (name == "BeforeAgent") return EventType::UserPromptSubmit;
        if (name == "BeforeTool") return EventType::PreToolUse;
        if (name == "AfterTool") return EventType::PostToolUse;
        if (name == "SessionEnd") return EventType::Stop;
        return std::nullopt;
    }
    if (name == "SessionStart") return EventType::SessionStart;
    if (name == "UserPromptSubmit") return EventType::UserPromptSubmit;
    if (name == "PreToolUse") return EventType::PreToolUse;
    if (name == "PostToolUse") return EventType::PostToolUse;
    if (name == "Stop") return EventType::Stop;
    if (name == "SessionEnd") return EventType::SessionEnd;
    return std::nullopt;
}

std::string EventNormalizer::derive_from_transcript(const Runtime runtime,
                                                    const std::filesystem::path& transcript) {
    std::vector<std::filesystem::path> parts(transcript.begin(), transcript.end());
    std::filesystem::path root = transcript.parent_path();
    for (std::size_t i = parts.size(); i-- > 0;) {
        if (parts[i] == "chats" || parts[i] == "logs") {
            root.clear();
            for (std::size_t j = 0; j < i; ++j) {
                root /= parts[j];
            }
            break;
        }
    }
    const std::filesystem::path stem = root / transcript.stem();
    return protocol::to_string(runtime) + "-" + core::config::stable_hash(stem.string());
}

std::filesystem::path EventNormalizer::session_map_path(const long parent_pid) const {
    return state_root_ / "session-map" / ("ppid-" + std::to_string(parent_pid) + ".json");
}

std::optional<std::string> EventNormalizer::load_mapping(const long parent_pid) const {
    std::ifstream in(session_map_path(parent_pid));
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const json payload = json::parse(buffer.str(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        LOG_WARN("EventNormalizer: ignoring malformed session map for ppid " +
                 std::to_string(parent_pid));
        return std::nullopt;
    }
    return non_empty_string(payload, "session_id");
}

void EventNormalizer::store_mapping(const long parent_pid, const std::string& session_id,
                                    const std::string& source) const {
    const auto path = session_map_path(parent_pid);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        LOG_WARN("EventNormalizer: unable to create " + path.parent_path().string());
        return;
    }

    const auto temp_path = path.string() + "." + core::config::generate_token() + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::trunc);
        out << json{{"session_id", session_id},
                    {"source", source},
                    {"ts_unix_ms", core::config::now_unix_ms()}}
                   .dump()
            << "\n";
        if (!out.good()) {
            LOG_WARN("EventNormalizer: unable to write session map " + temp_path);
            std::filesystem::remove(temp_path, ec);
            return;
        }
    }
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        LOG_WARN("EventNormalizer: unable to publish session map: " + ec.message());
        std::error_code ignore;
        std::filesystem::remove(temp_path, ignore);
    }
}

core::errors::Result<std::string> EventNormalizer::resolve_session(
    const json& payload, const Runtime runtime, const ProcessContext& process) const {
    if (auto explicit_id = non_empty_string(payload, "session_id")) {
        return explicit_id.value();
    }

    if (auto transcript = non_empty_string(payload, "transcript_path")) {
        const std::string derived = derive_from_transcript(runtime, transcript.value());
        if (process.parent_pid.has_value()) {
            store_mapping(process.parent_pid.value(), derived, "transcript_path");
        }
        return derived;
    }

    if (process.parent_pid.has_value()) {
        if (auto mapped = load_mapping(process.parent_pid.value())) {
            return mapped.value();
        }
    }

    std::optional<std::string> directory = process.project_directory;
    if (!directory.has_value()) {
        directory = non_empty_string(payload, "cwd");
    }
    if (!directory.has_value()) {
        directory = process.working_directory;
    }
    if (directory.has_value() && !directory->empty()) {
        const std::string derived = protocol::to_string(runtime) + "-cwd-" +
                                    core::config::stable_hash(directory.value());
        if (process.parent_pid.has_value()) {
            store_mapping(process.parent_pid.value(), derived, "working_directory");
        }
        return derived;
    }

    return HookError{ErrorCategory::Configuration,
                     "Cannot scope hook event to a session: no session_id, "
                     "transcript_path, parent process or working directory.",
                     "session_unscoped",
                     "Pass session_id in the hook payload."};
}

core::errors::Result<HookEvent> EventNormalizer::normalize(
    const json& payload, const Runtime runtime,
    const std::optional<std::string>& event_override,
    const ProcessContext& process) const {
    if (!payload.is_object()) {
        return HookError{ErrorCategory::Input, "Hook payload is not a JSON object.",
                         "invalid_json"};
    }

    std::optional<std::string> event_name = non_empty_string(payload, "hook_event_name");
    if (event_override.has_value() && !event_override->empty()) {
        event_name = event_override;
    }
    if (!event_name.has_value()) {
        return HookError{ErrorCategory::Input, "Hook payload has no hook_event_name.",
                         "missing_event"};
    }

    const auto event_type = map_event_name(runtime, event_name.value());
    if (!event_type.has_value()) {
        return HookError{ErrorCategory::Input,
                         "Unsupported " + protocol::to_string(runtime) +
                             " event: " + event_name.value(),
                         "unsupported_event"};
    }

    auto session_id = resolve_session(payload, runtime, process);
    if (core::errors::is_error(session_id)) {
        return core::errors::get_error(session_id);
    }

    HookEvent event;
    event.session_id = core::errors::get_value(session_id);
    event.event_type = event_type.value();
    event.runtime = runtime;
    event.tool_name = non_empty_string(payload, "tool_name");
    event.tool_input = structured_field(payload, "tool_input");
    if (!event.tool_input.is_object()) {
        event.tool_input = json::object();
    }
    event.tool_response = structured_field(payload, "tool_response");
    event.prompt = non_empty_string(payload, "prompt");
    event.transcript_path = non_empty_string(payload, "transcript_path");
    event.cwd = non_empty_string(payload, "cwd");
    if (!event.cwd.has_value()) {
        event.cwd = process.working_directory;
    }
    event.raw = payload;
    return event;
}

}  // namespace hookguard::session
