#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/hook_errors.hpp"
#include "protocol/gate_contract.hpp"

namespace hookguard::session {

namespace flags {
inline constexpr const char* kHydrationPending = "hydration_pending";
inline constexpr const char* kPromptSeen = "prompt_seen";
inline constexpr const char* kTaskBound = "task_bound";
inline constexpr const char* kCurrentTask = "current_task";
inline constexpr const char* kPlanInvoked = "plan_invoked";
inline constexpr const char* kCriticInvoked = "critic_invoked";
inline constexpr const char* kHandoverInvoked = "handover_invoked";
inline constexpr const char* kCustodietMode = "custodiet_mode";
inline constexpr const char* kCustodietBlockActive = "custodiet_block_active";
inline constexpr const char* kToolCallsSinceCustodiet = "tool_calls_since_custodiet";
}  // namespace flags

struct AuditEntry {
    std::int64_t ts_unix_ms = 0;
    std::string event;
    std::string gate;
    protocol::Verdict verdict = protocol::Verdict::Ok;
    std::string message;
    std::optional<std::string> citation;
    // Fields written by a newer build, carried through untouched.
    nlohmann::json extra = nlohmann::json::object();
};

struct SessionState {
    static constexpr int kSchemaVersion = 1;
    static constexpr std::size_t kMaxAuditEntries = 200;

    std::string session_id;
    int schema_version = kSchemaVersion;
    std::int64_t created_at_ms = 0;
    std::int64_t updated_at_ms = 0;
    std::map<std::string, protocol::FlagValue> flags;
    std::vector<AuditEntry> audit;
    // Unknown top-level fields, and unknown flags whose type is not a
    // FlagValue. Both are written back unchanged.
    nlohmann::json extra = nlohmann::json::object();
    nlohmann::json extra_flags = nlohmann::json::object();

    // Lookups fall back to the documented default for known flags.
    bool flag_bool(const std::string& name) const;
    std::int64_t flag_int(const std::string& name) const;
    std::string flag_string(const std::string& name) const;

    void append_audit(AuditEntry entry);
};

// Fresh record with every documented flag at its default.
SessionState make_default_state(const std::string& session_id);

// Documented default for a flag; nullopt for unknown names.
std::optional<protocol::FlagValue> default_flag_value(const std::string& name);

// Applies mutations in order. Each one is a set, so the result is idempotent.
SessionState apply_mutations(SessionState state,
                             const std::vector<protocol::StateMutation>& mutations);

nlohmann::json to_json(const SessionState& state);
nlohmann::json to_json(const AuditEntry& entry);
core::errors::Result<SessionState> from_json(const nlohmann::json& payload);

nlohmann::json flag_to_json(const protocol::FlagValue& value);
std::string flag_to_string(const protocol::FlagValue& value);

}  // namespace hookguard::session
