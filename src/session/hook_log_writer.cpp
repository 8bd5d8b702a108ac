#include "session/hook_log_writer.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/clock.hpp"
#include "core/config/session_key.hpp"

namespace hookguard::session {

using core::errors::ErrorCategory;
using core::errors::HookError;
using nlohmann::json;

namespace {

// The leading dot keeps it apart from sanitized session keys.
constexpr const char* kUnscopedLog = ".unscoped";

json outcome_to_json(const protocol::GateOutcome& outcome) {
    json payload;
    payload["gate"] = outcome.gate;
    payload["mode"] = protocol::to_string(outcome.mode);
    payload["verdict"] = protocol::to_string(outcome.verdict);
    payload["message"] = outcome.message;
    payload["citation"] = outcome.citation.has_value() ? json(outcome.citation.value())
                                                       : json(nullptr);
    return payload;
}

}  // namespace

HookLogWriter::HookLogWriter(std::filesystem::path state_root,
                             std::filesystem::path log_subdir)
    : state_root_(std::move(state_root)), log_subdir_(std::move(log_subdir)) {}

core::errors::Result<std::filesystem::path> HookLogWriter::log_path(
    const std::string& session_id) const {
    if (session_id.empty()) {
        return HookError{ErrorCategory::Input, "Session ID cannot be empty.",
                         "invalid_session_id"};
    }
    return state_root_ / log_subdir_ / (core::config::session_file_key(session_id) + ".jsonl");
}

std::filesystem::path HookLogWriter::unscoped_log_path() const {
    return state_root_ / log_subdir_ / (std::string(kUnscopedLog) + ".jsonl");
}

core::errors::Result<std::filesystem::path> HookLogWriter::append_line(
    const std::filesystem::path& path, const std::string& line) const {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return HookError{ErrorCategory::State,
                         "Unable to create log directory: " + path.parent_path().string(),
                         "state_io_failed"};
    }

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return HookError{ErrorCategory::State, "Unable to open hook log: " + path.string(),
                         "state_io_failed"};
    }

    out << line << "\n";
    out.flush();
    if (!out.good()) {
        return HookError{ErrorCategory::State,
                         "Unable to write hook log: " + path.string(), "state_io_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> HookLogWriter::write_invocation(
    const protocol::HookEvent& event, const protocol::HookResponse& response) const {
    json entry;
    entry["ts_unix_ms"] = core::config::now_unix_ms();
    entry["session_id"] = event.session_id;
    entry["runtime"] = protocol::to_string(event.runtime);
    entry["event"] = protocol::to_string(event.event_type);
    entry["tool_name"] = event.tool_name.has_value() ? json(event.tool_name.value())
                                                     : json(nullptr);
    entry["verdict"] = protocol::to_string(response.verdict);
    entry["decision"] = protocol::decision_text(response.verdict);
    entry["input_rewritten"] = response.updated_input.has_value();

    json outcomes = json::array();
    for (const auto& outcome : response.outcomes) {
        outcomes.push_back(outcome_to_json(outcome));
    }
    entry["gates"] = outcomes;
    entry["messages"] = response.messages;

    auto path = log_path(event.session_id);
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    return append_line(core::errors::get_value(path), entry.dump());
}

core::errors::Result<std::filesystem::path> HookLogWriter::write_failure(
    const std::optional<std::string>& session_id, const std::string& error_code,
    const std::string& message) const {
    json entry;
    entry["ts_unix_ms"] = core::config::now_unix_ms();
    entry["session_id"] = session_id.has_value() ? json(session_id.value()) : json(nullptr);
    entry["error_code"] = error_code;
    entry["message"] = message;
    if (!session_id.has_value() || session_id->empty()) {
        return append_line(unscoped_log_path(), entry.dump());
    }
    auto path = log_path(session_id.value());
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    return append_line(core::errors::get_value(path), entry.dump());
}

}  // namespace hookguard::session
