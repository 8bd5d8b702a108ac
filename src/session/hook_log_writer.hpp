#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/hook_errors.hpp"
#include "protocol/hook_event.hpp"
#include "protocol/hook_response.hpp"

namespace hookguard::session {

// One JSONL line per router invocation, under <state_root>/logs/<ns>.jsonl.
class HookLogWriter {
public:
    explicit HookLogWriter(std::filesystem::path state_root,
                           std::filesystem::path log_subdir = "logs");

    core::errors::Result<std::filesystem::path> write_invocation(
        const protocol::HookEvent& event, const protocol::HookResponse& response) const;

    // Invocations that failed before a session was known go to .unscoped.jsonl.
    core::errors::Result<std::filesystem::path> write_failure(
        const std::optional<std::string>& session_id, const std::string& error_code,
        const std::string& message) const;

    core::errors::Result<std::filesystem::path> log_path(
        const std::string& session_id) const;

    std::filesystem::path unscoped_log_path() const;

private:
    core::errors::Result<std::filesystem::path> append_line(
        const std::filesystem::path& path, const std::string& line) const;

    std::filesystem::path state_root_;
    std::filesystem::path log_subdir_;
};

}  // namespace hookguard::session
