#include "cli_parser.hpp"
#include <vector>

namespace hookguard::app::cli {

    using namespace hookguard::core::errors;

    namespace {

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> client;
            std::optional<std::string> session;
            std::optional<std::string> state_dir;
            std::optional<std::string> reason;
            std::optional<std::string> actor;
            std::vector<std::string> positionals;
        };

        const char* kUsage =
            "Usage: hookguard route --client claude|gemini [EVENT] [--state-dir DIR]\n"
            "       hookguard clear-block --session ID [--reason TEXT] [--actor NAME]\n"
            "       hookguard status --session ID\n"
            "       hookguard reset --session ID";

    }  // namespace

    Result<CliCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return HookError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        CliCommand cmd;
        const std::string command = argv[1];
        if (command == "route") {
            cmd.kind = CommandKind::Route;
        } else if (command == "clear-block") {
            cmd.kind = CommandKind::ClearBlock;
        } else if (command == "status") {
            cmd.kind = CommandKind::Status;
        } else if (command == "reset") {
            cmd.kind = CommandKind::Reset;
        } else {
            return HookError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and the command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<std::string>* target = nullptr;
            if (args[i] == "--client") {
                target = &raw.client;
            } else if (args[i] == "--session") {
                target = &raw.session;
            } else if (args[i] == "--state-dir") {
                target = &raw.state_dir;
            } else if (args[i] == "--reason") {
                target = &raw.reason;
            } else if (args[i] == "--actor") {
                target = &raw.actor;
            } else if (args[i].rfind("--", 0) == 0) {
                return HookError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            } else {
                raw.positionals.push_back(args[i]);
                continue;
            }

            if (i + 1 >= args.size()) {
                return HookError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            }
            *target = args[++i];
        }

        // 3. Validator Phase: Enforce per-command rules
        if (raw.state_dir) {
            if (raw.state_dir->empty()) {
                return HookError{ErrorCategory::Input, "--state-dir cannot be empty", "invalid_path"};
            }
            cmd.state_dir = std::filesystem::path(raw.state_dir.value());
        }

        if (cmd.kind == CommandKind::Route) {
            if (raw.session || raw.reason || raw.actor) {
                return HookError{ErrorCategory::Input, "route does not accept --session, --reason or --actor", "conflicting_flags"};
            }
            if (raw.client) {
                const auto runtime = hookguard::protocol::parse_runtime(raw.client.value());
                if (!runtime) {
                    return HookError{ErrorCategory::Input, "Unknown client: " + raw.client.value(), "unknown_client", "Use 'claude' or 'gemini'."};
                }
                cmd.runtime = runtime.value();
            }
            if (raw.positionals.size() > 1) {
                return HookError{ErrorCategory::Input, "route accepts at most one EVENT argument", "unexpected_argument"};
            }
            if (!raw.positionals.empty()) {
                cmd.event_name = raw.positionals.front();
            }
            return cmd;
        }

        if (!raw.positionals.empty()) {
            return HookError{ErrorCategory::Input, "Unexpected argument: " + raw.positionals.front(), "unexpected_argument"};
        }
        if (raw.client) {
            return HookError{ErrorCategory::Input, command + " does not accept --client", "conflicting_flags"};
        }
        if (!raw.session || raw.session->empty()) {
            return HookError{ErrorCategory::Input, command + " requires --session", "missing_required_flag", kUsage};
        }
        cmd.session_id = raw.session.value();

        if (cmd.kind != CommandKind::ClearBlock && (raw.reason || raw.actor)) {
            return HookError{ErrorCategory::Input, "--reason and --actor only apply to clear-block", "conflicting_flags"};
        }
        if (raw.reason) cmd.reason = raw.reason.value();
        if (raw.actor) cmd.actor = raw.actor.value();

        return cmd;
    }

} // namespace hookguard::app::cli
