#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/settings.hpp"
#include "core/errors/hook_errors.hpp"
#include "protocol/hook_event.hpp"

namespace hookguard::session {

// Facts about the invoking process used to scope sessions that arrive
// without an explicit id.
struct ProcessContext {
    std::optional<long> parent_pid;
    std::optional<std::string> working_directory;
    std::optional<std::string> project_directory;

    static ProcessContext current(const core::config::EnvLookup& env);
};

// Maps runtime-native hook payloads onto HookEvent and resolves the session
// namespace. Derived namespaces are remembered per parent pid under
// <state_root>/session-map/.
class EventNormalizer {
public:
    explicit EventNormalizer(std::filesystem::path state_root);

    // Input errors: invalid_json, missing_event, unsupported_event.
    // Configuration error: session_unscoped.
    core::errors::Result<protocol::HookEvent> normalize(
        const nlohmann::json& payload, protocol::Runtime runtime,
        const std::optional<std::string>& event_override,
        const ProcessContext& process) const;

    static std::optional<protocol::EventType> map_event_name(protocol::Runtime runtime,
                                                             const std::string& name);

    // "<runtime>-<hash>" for a transcript path.
    static std::string derive_from_transcript(protocol::Runtime runtime,
                                              const std::filesystem::path& transcript);

    std::filesystem::path session_map_path(long parent_pid) const;

private:
    core::errors::Result<std::string> resolve_session(const nlohmann::json& payload,
                                                      protocol::Runtime runtime,
                                                      const ProcessContext& process) const;
    std::optional<std::string> load_mapping(long parent_pid) const;
    void store_mapping(long parent_pid, const std::string& session_id,
                       const std::string& source) const;

    std::filesystem::path state_root_;
};

}  // namespace hookguard::session
