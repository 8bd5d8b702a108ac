#include "core/config/settings.hpp"

#include <charconv>
#include <cstdlib>
#include <set>
#include <system_error>
#include <utility>

namespace hookguard::core::config {

using errors::ErrorCategory;
using errors::HookError;
using protocol::EnforcementMode;

namespace {

std::optional<std::string> first_of(const EnvLookup& env,
                                    std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto value = env(name);
        if (value.has_value() && !value->empty()) {
            return value;
        }
    }
    return std::nullopt;
}

bool truthy(const std::optional<std::string>& value) {
    return value.has_value() &&
           (*value == "1" || *value == "true" || *value == "yes");
}

Result<std::int64_t> parse_positive(const std::string& variable,
                                    const std::string& value,
                                    const std::int64_t max_value) {
    std::int64_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end) {
        return HookError{ErrorCategory::Configuration,
                         "Invalid number for " + variable + ": " + value,
                         "invalid_interval", "Provide a positive integer."};
    }
    if (parsed < 1 || parsed > max_value) {
        return HookError{ErrorCategory::Configuration,
                         variable + " out of bounds: " + value,
                         "invalid_interval",
                         "Must be between 1 and " + std::to_string(max_value) + "."};
    }
    return parsed;
}

}  // namespace

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

EnvLookup map_env(std::map<std::string, std::string> values) {
    return [values = std::move(values)](
               const std::string& name) -> std::optional<std::string> {
        const auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::string current;
    auto flush = [&items, &current]() {
        const auto first = current.find_first_not_of(" \t");
        if (first != std::string::npos) {
            const auto last = current.find_last_not_of(" \t");
            items.push_back(current.substr(first, last - first + 1));
        }
        current.clear();
    };
    for (const char c : value) {
        if (c == ',') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return items;
}

Result<EnforcementMode> parse_mode(const std::string& variable,
                                   const std::string& value) {
    if (value == "warn") {
        return EnforcementMode::Warn;
    }
    if (value == "block") {
        return EnforcementMode::Block;
    }
    return HookError{ErrorCategory::Configuration,
                     "Invalid value for " + variable + ": " + value,
                     "invalid_mode", "Use 'warn' or 'block'."};
}

Result<Settings> load_settings(const EnvLookup& env) {
    Settings settings;

    const std::vector<std::pair<std::vector<const char*>, EnforcementMode*>> modes = {
        {{"HYDRATION_GATE_MODE"}, &settings.hydration_mode},
        {{"TASK_GATE_MODE"}, &settings.task_mode},
        {{"CUSTODIET_MODE", "CUSTODIET_GATE_MODE"}, &settings.custodiet_mode},
        {{"HANDOVER_GATE_MODE"}, &settings.handover_mode},
    };
    for (const auto& [names, target] : modes) {
        for (const char* name : names) {
            const auto value = env(name);
            if (!value.has_value() || value->empty()) {
                continue;
            }
            auto parsed = parse_mode(name, value.value());
            if (errors::is_error(parsed)) {
                return errors::get_error(parsed);
            }
            *target = errors::get_value(parsed);
            break;
        }
    }

    if (const auto interval = first_of(
            env, {"CUSTODIET_INTERVAL", "CUSTODIET_TOOL_CALL_THRESHOLD"})) {
        auto parsed = parse_positive("CUSTODIET_INTERVAL", interval.value(), 100000);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        settings.custodiet_interval = errors::get_value(parsed);
    }

    if (const auto timeout = first_of(env, {"CUSTODIET_CHECK_TIMEOUT_MS"})) {
        auto parsed =
            parse_positive("CUSTODIET_CHECK_TIMEOUT_MS", timeout.value(), 600000);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        settings.custodiet_timeout_ms =
            static_cast<std::uint32_t>(errors::get_value(parsed));
    }

    settings.custodiet_check_command = first_of(env, {"CUSTODIET_CHECK_COMMAND"});

    const std::set<std::string> known_conditions = {"task_bound", "plan_invoked",
                                                    "critic_invoked"};
    if (truthy(env("TASK_GATE_ENFORCE_ALL"))) {
        settings.task_required = {"task_bound", "plan_invoked", "critic_invoked"};
    } else if (const auto required = first_of(env, {"TASK_GATE_REQUIRED"})) {
        settings.task_required = split_list(required.value());
        for (const auto& condition : settings.task_required) {
            if (known_conditions.count(condition) == 0) {
                return HookError{ErrorCategory::Configuration,
                                 "Unknown task gate condition: " + condition,
                                 "invalid_task_requirement",
                                 "Use task_bound, plan_invoked or critic_invoked."};
            }
        }
    }

    settings.hydration_every_prompt = truthy(env("HYDRATION_EVERY_PROMPT"));

    if (const auto excludes = first_of(env, {"COMMAND_INTERCEPT_EXCLUDES"})) {
        settings.intercept_excludes = split_list(excludes.value());
    }

    if (const auto root = first_of(env, {"HOOKGUARD_STATE_DIR", "AOPS_SESSION_STATE_DIR"})) {
        settings.state_root = root.value();
    } else if (const auto home = first_of(env, {"HOME"})) {
        settings.state_root = std::filesystem::path(home.value()) / ".hookguard";
    } else {
        return HookError{ErrorCategory::Configuration,
                         "No state directory: set HOOKGUARD_STATE_DIR or HOME.",
                         "missing_state_dir"};
    }

    return settings;
}

}  // namespace hookguard::core::config
