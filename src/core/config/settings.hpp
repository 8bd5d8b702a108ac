#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/hook_errors.hpp"
#include "protocol/gate_contract.hpp"

namespace hookguard::core::config {

using errors::Result;

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the real process environment.
EnvLookup process_env();

// Lookup over a fixed map, for tests and embedding.
EnvLookup map_env(std::map<std::string, std::string> values);

struct Settings {
    // Every gate defaults to warn so the router can be adopted observe-only.
    protocol::EnforcementMode hydration_mode = protocol::EnforcementMode::Warn;
    protocol::EnforcementMode task_mode = protocol::EnforcementMode::Warn;
    protocol::EnforcementMode custodiet_mode = protocol::EnforcementMode::Warn;
    protocol::EnforcementMode handover_mode = protocol::EnforcementMode::Warn;

    std::int64_t custodiet_interval = 7;
    std::optional<std::string> custodiet_check_command;
    std::uint32_t custodiet_timeout_ms = 10000;

    std::vector<std::string> task_required = {"task_bound"};
    bool hydration_every_prompt = false;
    std::vector<std::string> intercept_excludes = {
        ".venv", "node_modules", "__pycache__", ".git", "*.egg-info",
        ".mypy_cache", ".pytest_cache", ".ruff_cache"};

    std::filesystem::path state_root;
};

// Invalid values are configuration bugs and fail fast.
Result<Settings> load_settings(const EnvLookup& env);

Result<protocol::EnforcementMode> parse_mode(const std::string& variable,
                                             const std::string& value);

std::vector<std::string> split_list(const std::string& value);

}  // namespace hookguard::core::config
