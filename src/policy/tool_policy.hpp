#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hookguard::policy {

enum class ToolCategory {
    AlwaysAvailable,  // spawn/skill/meta tools needed to satisfy gates
    ReadOnly,
    Write,
    TaskMutation
};

struct ToolPolicyConfig {
    std::set<std::string> always_available = {
        "Agent", "Task", "Skill", "delegate_to_agent", "activate_skill",
        "AskUserQuestion", "TodoWrite", "EnterPlanMode", "ExitPlanMode",
        "KillShell", "TaskCreate", "TaskUpdate", "TaskGet", "TaskList"};

    std::set<std::string> read_only = {
        "Read", "Glob", "Grep", "WebFetch", "WebSearch", "ListMcpResourcesTool",
        "ReadMcpResourceTool", "TaskOutput", "TaskStop", "ToolSearch",
        "read_file", "view_file", "list_dir", "list_directory", "find_by_name",
        "grep_search", "search_file_content", "glob", "search_web",
        "google_web_search", "web_fetch", "read_url_content",
        "get_task", "list_tasks", "task_search", "get_task_network",
        "get_blocked_tasks", "semantic_search", "pkb_search", "pkb_context",
        "get_document", "list_documents", "retrieve_memory"};

    std::set<std::string> write = {
        "Edit", "Write", "Bash", "NotebookEdit", "MultiEdit", "write_file",
        "write_to_file", "replace", "replace_file_content", "run_shell_command",
        "run_command", "execute_code", "save_memory"};

    std::set<std::string> task_mutation = {
        "create_task", "update_task", "claim_next_task", "complete_task",
        "complete_tasks", "delete_task"};

    std::set<std::string> shell_tools = {"Bash", "run_shell_command", "run_command"};

    std::vector<std::string> readonly_command_prefixes = {
        "git status", "git diff", "git log", "git show", "git branch",
        "git remote", "git fetch", "ls", "cat ", "head ", "tail ", "grep ",
        "rg ", "fd ", "find ", "which ", "type ", "echo ", "pwd", "env",
        "printenv", "uname", "whoami", "date", "uptime", "wc "};

    std::vector<std::string> destructive_patterns = {
        "git commit", "git push", "git merge", "git rebase", "git reset",
        "git checkout", "git restore", "git clean", "git stash", "rm ",
        "rmdir", "mv ", "cp ", "mkdir", "touch ", "chmod ", "chown ", "> ",
        ">>", "tee ", "sed -i", "npm install", "npm run", "yarn ",
        "pip install", "uv pip", "uv sync", "uv run", "-delete", "-exec "};
};

// Classifies tool invocations by their side effects.
class ToolPolicy {
public:
    explicit ToolPolicy(ToolPolicyConfig config = {});

    ToolCategory categorize(const std::string& tool_name) const;

    // Write or task-mutating. Read-only shell commands are not consequential.
    bool is_consequential(const std::string& tool_name,
                          const nlohmann::json& tool_input) const;

    bool is_task_mutation(const std::string& tool_name) const;
    bool is_shell_tool(const std::string& tool_name) const;

    // Unknown or unparseable commands count as destructive. Chained commands
    // (;, &&, ||, |, &, newline) are read-only only if every part is.
    bool is_destructive_command(const std::string& command) const;

    // Destructive in the handover sense: file writes and destructive shell.
    bool is_destructive(const std::string& tool_name,
                        const nlohmann::json& tool_input) const;

    // Lowercased subagent/skill name when the tool spawns an agent or skill.
    std::optional<std::string> spawn_target(const std::string& tool_name,
                                            const nlohmann::json& tool_input) const;

    // True when the tool spawns an agent or skill whose name contains `needle`.
    bool spawns(const std::string& tool_name, const nlohmann::json& tool_input,
                const std::string& needle) const;

    // Strips MCP prefixes: "mcp__plugin_x_task_manager__update_task" and
    // "aops-core:task_manager:update_task" both become "update_task".
    static std::string base_name(const std::string& tool_name);
    static std::string lowercase(std::string value);

    static std::vector<std::string> split_command(const std::string& command);

private:
    bool is_destructive_segment(const std::string& segment) const;
    static std::optional<std::string> command_of(const nlohmann::json& tool_input);

    ToolPolicyConfig config_;
};

std::string to_string(ToolCategory category);

}  // namespace hookguard::policy
