#include "session/session_state.hpp"

#include <utility>

namespace hookguard::session {

using core::errors::ErrorCategory;
using core::errors::HookError;
using nlohmann::json;
using protocol::FlagValue;
using protocol::StateMutation;
using protocol::Verdict;

namespace {

const std::map<std::string, FlagValue>& documented_defaults() {
    static const std::map<std::string, FlagValue> defaults = {
        {flags::kHydrationPending, false},
        {flags::kPromptSeen, false},
        {flags::kTaskBound, false},
        {flags::kCurrentTask, std::string()},
        {flags::kPlanInvoked, false},
        {flags::kCriticInvoked, false},
        {flags::kHandoverInvoked, false},
        {flags::kCustodietMode, std::string("warn")},
        {flags::kCustodietBlockActive, false},
        {flags::kToolCallsSinceCustodiet, std::int64_t{0}},
    };
    return defaults;
}

HookError corrupt(const std::string& message) {
    return HookError{ErrorCategory::State, message, "state_corrupt"};
}

std::optional<FlagValue> flag_from_json(const json& value) {
    if (value.is_boolean()) {
        return FlagValue{value.get<bool>()};
    }
    if (value.is_number_integer()) {
        return FlagValue{value.get<std::int64_t>()};
    }
    if (value.is_string()) {
        return FlagValue{value.get<std::string>()};
    }
    return std::nullopt;
}

core::errors::Result<AuditEntry> audit_from_json(const json& payload) {
    if (!payload.is_object()) {
        return corrupt("Audit entry is not an object.");
    }

    AuditEntry entry;
    entry.extra = json::object();
    for (const auto& [key, value] : payload.items()) {
        if (key == "ts_unix_ms") {
            if (!value.is_number_integer()) {
                return corrupt("Audit entry ts_unix_ms is not an integer.");
            }
            entry.ts_unix_ms = value.get<std::int64_t>();
        } else if (key == "event" || key == "gate" || key == "message" ||
                   key == "citation" || key == "verdict") {
            if (!value.is_string()) {
                return corrupt("Audit entry field '" + key + "' is not a string.");
            }
            const auto text = value.get<std::string>();
            if (key == "event") {
                entry.event = text;
            } else if (key == "gate") {
                entry.gate = text;
            } else if (key == "message") {
                entry.message = text;
            } else if (key == "citation") {
                entry.citation = text;
            } else {
                const auto verdict = protocol::parse_verdict(text);
                if (!verdict.has_value()) {
                    return corrupt("Audit entry verdict is unknown: " + text);
                }
                entry.verdict = verdict.value();
            }
        } else {
            entry.extra[key] = value;
        }
    }
    return entry;
}

}  // namespace

std::optional<FlagValue> default_flag_value(const std::string& name) {
    const auto& defaults = documented_defaults();
    const auto it = defaults.find(name);
    if (it == defaults.end()) {
        return std::nullopt;
    }
    return it->second;
}

SessionState make_default_state(const std::string& session_id) {
    SessionState state;
    state.session_id = session_id;
    state.flags = documented_defaults();
    return state;
}

bool SessionState::flag_bool(const std::string& name) const {
    const auto it = flags.find(name);
    if (it != flags.end() && std::holds_alternative<bool>(it->second)) {
        return std::get<bool>(it->second);
    }
    const auto fallback = default_flag_value(name);
    if (fallback.has_value() && std::holds_alternative<bool>(fallback.value())) {
        return std::get<bool>(fallback.value());
    }
    return false;
}

std::int64_t SessionState::flag_int(const std::string& name) const {
    const auto it = flags.find(name);
    if (it != flags.end() && std::holds_alternative<std::int64_t>(it->second)) {
        return std::get<std::int64_t>(it->second);
    }
    const auto fallback = default_flag_value(name);
    if (fallback.has_value() &&
        std::holds_alternative<std::int64_t>(fallback.value())) {
        return std::get<std::int64_t>(fallback.value());
    }
    return 0;
}

std::string SessionState::flag_string(const std::string& name) const {
    const auto it = flags.find(name);
    if (it != flags.end() && std::holds_alternative<std::string>(it->second)) {
        return std::get<std::string>(it->second);
    }
    const auto fallback = default_flag_value(name);
    if (fallback.has_value() &&
        std::holds_alternative<std::string>(fallback.value())) {
        return std::get<std::string>(fallback.value());
    }
    return "";
}

void SessionState::append_audit(AuditEntry entry) {
    audit.push_back(std::move(entry));
    if (audit.size() > kMaxAuditEntries) {
        audit.erase(audit.begin(),
                    audit.begin() + static_cast<std::ptrdiff_t>(
                                        audit.size() - kMaxAuditEntries));
    }
}

SessionState apply_mutations(SessionState state,
                             const std::vector<StateMutation>& mutations) {
    for (const auto& mutation : mutations) {
        state.flags[mutation.flag] = mutation.value;
        state.extra_flags.erase(mutation.flag);
    }
    return state;
}

json to_json(const AuditEntry& entry) {
    json payload = entry.extra.is_object() ? entry.extra : json::object();
    payload["ts_unix_ms"] = entry.ts_unix_ms;
    payload["event"] = entry.event;
    payload["gate"] = entry.gate;
    payload["verdict"] = protocol::to_string(entry.verdict);
    payload["message"] = entry.message;
    if (entry.citation.has_value()) {
        payload["citation"] = entry.citation.value();
    } else {
        payload.erase("citation");
    }
    return payload;
}

json flag_to_json(const FlagValue& value) {
    if (std::holds_alternative<bool>(value)) {
        return std::get<bool>(value);
    }
    if (std::holds_alternative<std::int64_t>(value)) {
        return std::get<std::int64_t>(value);
    }
    return std::get<std::string>(value);
}

std::string flag_to_string(const FlagValue& value) {
    if (std::holds_alternative<bool>(value)) {
        return std::get<bool>(value) ? "true" : "false";
    }
    if (std::holds_alternative<std::int64_t>(value)) {
        return std::to_string(std::get<std::int64_t>(value));
    }
    return std::get<std::string>(value);
}

json to_json(const SessionState& state) {
    json payload = state.extra.is_object() ? state.extra : json::object();
    payload["session_id"] = state.session_id;
    payload["schema_version"] = state.schema_version;
    payload["created_at_ms"] = state.created_at_ms;
    payload["updated_at_ms"] = state.updated_at_ms;

    json flag_payload = state.extra_flags.is_object() ? state.extra_flags
                                                      : json::object();
    for (const auto& [name, value] : state.flags) {
        flag_payload[name] = flag_to_json(value);
    }
    payload["flags"] = flag_payload;

    json audit_payload = json::array();
    for (const auto& entry : state.audit) {
        audit_payload.push_back(to_json(entry));
    }
    payload["audit"] = audit_payload;
    return payload;
}

core::errors::Result<SessionState> from_json(const json& payload) {
    if (!payload.is_object()) {
        return corrupt("Session state is not a JSON object.");
    }

    const auto id_it = payload.find("session_id");
    if (id_it == payload.end() || !id_it->is_string()) {
        return corrupt("Session state has no string session_id.");
    }

    SessionState state = make_default_state(id_it->get<std::string>());
    state.extra = json::object();

    for (const auto& [key, value] : payload.items()) {
        if (key == "session_id") {
            continue;
        }
        if (key == "schema_version") {
            if (!value.is_number_integer()) {
                return corrupt("schema_version is not an integer.");
            }
            state.schema_version = value.get<int>();
        } else if (key == "created_at_ms" || key == "updated_at_ms") {
            if (!value.is_number_integer()) {
                return corrupt(key + " is not an integer.");
            }
            if (key == "created_at_ms") {
                state.created_at_ms = value.get<std::int64_t>();
            } else {
                state.updated_at_ms = value.get<std::int64_t>();
            }
        } else if (key == "flags") {
            if (!value.is_object()) {
                return corrupt("flags is not an object.");
            }
            for (const auto& [name, raw] : value.items()) {
                const auto parsed = flag_from_json(raw);
                const auto fallback = default_flag_value(name);
                if (fallback.has_value()) {
                    if (!parsed.has_value() ||
                        parsed->index() != fallback->index()) {
                        return corrupt("Flag '" + name + "' has the wrong type.");
                    }
                    state.flags[name] = parsed.value();
                } else if (parsed.has_value()) {
                    state.flags[name] = parsed.value();
                } else {
                    state.extra_flags[name] = raw;
                }
            }
        } else if (key == "audit") {
            if (!value.is_array()) {
                return corrupt("audit is not an array.");
            }
            for (const auto& raw_entry : value) {
                auto entry = audit_from_json(raw_entry);
                if (core::errors::is_error(entry)) {
                    return core::errors::get_error(entry);
                }
                state.audit.push_back(core::errors::get_value(entry));
            }
        } else {
            state.extra[key] = value;
        }
    }

    return state;
}

}  // namespace hookguard::session
