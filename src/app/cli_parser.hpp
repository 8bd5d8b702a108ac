#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/hook_errors.hpp"
#include "protocol/hook_event.hpp"

namespace hookguard::app::cli {

    enum class CommandKind {
        Route,       // read one hook event on stdin, answer on stdout
        ClearBlock,  // explicit, audited release of a sticky block
        Status,
        Reset
    };

    struct CliCommand {
        CommandKind kind = CommandKind::Route;
        hookguard::protocol::Runtime runtime = hookguard::protocol::Runtime::Claude;
        std::optional<std::string> event_name;
        std::optional<std::filesystem::path> state_dir;
        std::string session_id;
        std::string reason = "cleared manually";
        std::string actor = "user";
    };

    hookguard::core::errors::Result<CliCommand> parse_and_validate(int argc, char* argv[]);
}
