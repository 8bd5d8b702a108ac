#include "policy/tool_policy.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace hookguard::policy {

using nlohmann::json;

namespace {

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() &&
           text.compare(0, prefix.size(), prefix) == 0;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// Spawn tools and the tool_input keys carrying the agent or skill name.
const std::vector<std::pair<std::string, std::vector<std::string>>>& spawn_tools() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> tools = {
        {"Agent", {"subagent_type"}},
        {"Task", {"subagent_type"}},
        {"Skill", {"skill"}},
        {"delegate_to_agent", {"name", "agent_name"}},
        {"activate_skill", {"skill", "name"}},
    };
    return tools;
}

}  // namespace

ToolPolicy::ToolPolicy(ToolPolicyConfig config) : config_(std::move(config)) {}

std::string ToolPolicy::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string ToolPolicy::base_name(const std::string& tool_name) {
    const auto dunder = tool_name.rfind("__");
    if (starts_with(tool_name, "mcp") && dunder != std::string::npos) {
        return tool_name.substr(dunder + 2);
    }
    const auto colon = tool_name.rfind(':');
    if (colon != std::string::npos) {
        return tool_name.substr(colon + 1);
    }
    return tool_name;
}

ToolCategory ToolPolicy::categorize(const std::string& tool_name) const {
    if (config_.always_available.count(tool_name) != 0) {
        return ToolCategory::AlwaysAvailable;
    }
    if (config_.read_only.count(tool_name) != 0) {
        return ToolCategory::ReadOnly;
    }
    if (config_.write.count(tool_name) != 0) {
        return ToolCategory::Write;
    }

    const std::string base = base_name(tool_name);
    if (config_.task_mutation.count(base) != 0) {
        return ToolCategory::TaskMutation;
    }
    if (config_.read_only.count(base) != 0) {
        return ToolCategory::ReadOnly;
    }
    // Unknown tools are treated as writes.
    return ToolCategory::Write;
}

bool ToolPolicy::is_task_mutation(const std::string& tool_name) const {
    return categorize(tool_name) == ToolCategory::TaskMutation;
}

bool ToolPolicy::is_shell_tool(const std::string& tool_name) const {
    return config_.shell_tools.count(tool_name) != 0;
}

std::optional<std::string> ToolPolicy::command_of(const json& tool_input) {
    if (!tool_input.is_object()) {
        return std::nullopt;
    }
    for (const char* key : {"command", "CommandLine"}) {
        const auto it = tool_input.find(key);
        if (it != tool_input.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

bool ToolPolicy::is_destructive_command(const std::string& command) const {
    const std::string lowered = lowercase(trim(command));
    if (lowered.empty()) {
        return true;
    }
    // Substitutions run arbitrary commands inside an otherwise read-only one.
    if (lowered.find("$(") != std::string::npos ||
        lowered.find('`') != std::string::npos) {
        return true;
    }

    bool any_segment = false;
    for (const auto& segment : split_command(lowered)) {
        const std::string part = trim(segment);
        if (part.empty()) {
            continue;
        }
        any_segment = true;
        if (is_destructive_segment(part)) {
            return true;
        }
    }
    return !any_segment;
}

bool ToolPolicy::is_destructive_segment(const std::string& segment) const {
    for (const auto& pattern : config_.destructive_patterns) {
        if (starts_with(segment, pattern) ||
            segment.find(" " + pattern) != std::string::npos) {
            return true;
        }
    }

    for (const auto& prefix : config_.readonly_command_prefixes) {
        if (segment == trim(prefix) || starts_with(segment, prefix)) {
            return false;
        }
    }

    return true;
}

std::vector<std::string> ToolPolicy::split_command(const std::string& command) {
    std::vector<std::string> segments;
    std::string current;
    for (std::size_t i = 0; i < command.size(); ++i) {
        const char c = command[i];
        const bool redirect_amp =
            c == '&' && ((i > 0 && (command[i - 1] == '>' || command[i - 1] == '<')) ||
                         (i + 1 < command.size() && command[i + 1] == '>'));
        if (c == ';' || c == '|' || c == '\n' || (c == '&' && !redirect_amp)) {
            segments.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    segments.push_back(current);
    return segments;
}

bool ToolPolicy::is_consequential(const std::string& tool_name,
                                  const json& tool_input) const {
    const ToolCategory category = categorize(tool_name);
    if (category == ToolCategory::TaskMutation) {
        return true;
    }
    if (category != ToolCategory::Write) {
        return false;
    }
    if (is_shell_tool(tool_name)) {
        const auto command = command_of(tool_input);
        if (!command.has_value()) {
            return true;
        }
        return is_destructive_command(command.value());
    }
    return true;
}

bool ToolPolicy::is_destructive(const std::string& tool_name,
                                const json& tool_input) const {
    if (is_shell_tool(tool_name)) {
        const auto command = command_of(tool_input);
        return !command.has_value() || is_destructive_command(command.value());
    }
    return categorize(tool_name) == ToolCategory::Write;
}

std::optional<std::string> ToolPolicy::spawn_target(const std::string& tool_name,
                                                    const json& tool_input) const {
    if (!tool_input.is_object()) {
        return std::nullopt;
    }
    for (const auto& [spawn_tool, keys] : spawn_tools()) {
        if (spawn_tool != tool_name) {
            continue;
        }
        for (const auto& key : keys) {
            const auto it = tool_input.find(key);
            if (it == tool_input.end() || !it->is_string()) {
                continue;
            }
            const std::string value = trim(it->get<std::string>());
            if (!value.empty()) {
                return lowercase(value);
            }
        }
        return std::nullopt;
    }
    return std::nullopt;
}

bool ToolPolicy::spawns(const std::string& tool_name, const json& tool_input,
                        const std::string& needle) const {
    const auto target = spawn_target(tool_name, tool_input);
    return target.has_value() && target->find(needle) != std::string::npos;
}

std::string to_string(const ToolCategory category) {
    switch (category) {
        case ToolCategory::AlwaysAvailable:
            return "always_available";
        case ToolCategory::ReadOnly:
            return "read_only";
        case ToolCategory::Write:
            return "write";
        case ToolCategory::TaskMutation:
            return "task_mutation";
        default:
            return "unknown";
    }
}

}  // namespace hookguard::policy
