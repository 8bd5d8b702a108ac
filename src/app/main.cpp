#include <iostream>
#include <iterator>
#include <string>
#include "app/cli_parser.hpp"
#include "app/router.hpp"
#include "app/session_admin.hpp"
#include "core/config/settings.hpp"
#include "core/errors/hook_errors.hpp"
#include "core/logging/logger.hpp"
#include "session/event_normalizer.hpp"

namespace {

int report_admin(const hookguard::core::errors::Result<nlohmann::json>& result) {
    if (hookguard::core::errors::is_error(result)) {
        const auto& err = hookguard::core::errors::get_error(result);
        LOG_ERROR("Command failed [" + err.code + "]: " + err.message);
        return 1;
    }
    std::cout << hookguard::core::errors::get_value(result).dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = hookguard::app::cli::parse_and_validate(argc, argv);
    if (hookguard::core::errors::is_error(parsed)) {
        const auto& err = hookguard::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            std::cerr << err.hint << std::endl;
        }
        return 2;
    }
    const auto& cmd = hookguard::core::errors::get_value(parsed);

    // 2. Configuration from the environment; errors are fatal but the hook
    // path still answers so the host is never left without a response.
    const auto env = hookguard::core::config::process_env();
    auto loaded = hookguard::core::config::load_settings(env);
    if (hookguard::core::errors::is_error(loaded)) {
        const auto& err = hookguard::core::errors::get_error(loaded);
        LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        if (cmd.kind == hookguard::app::cli::CommandKind::Route) {
            std::cout << hookguard::app::Router::error_response(err).dump() << std::endl;
        }
        return 2;
    }
    auto settings = hookguard::core::errors::get_value(loaded);
    if (cmd.state_dir) {
        settings.state_root = cmd.state_dir.value();
    }

    if (cmd.kind != hookguard::app::cli::CommandKind::Route) {
        hookguard::core::logging::Logger::get().set_session_id(cmd.session_id);
        const hookguard::app::SessionAdmin admin(settings.state_root);
        switch (cmd.kind) {
            case hookguard::app::cli::CommandKind::ClearBlock:
                return report_admin(admin.clear_block(cmd.session_id, cmd.reason, cmd.actor));
            case hookguard::app::cli::CommandKind::Status:
                return report_admin(admin.status(cmd.session_id));
            case hookguard::app::cli::CommandKind::Reset:
                return report_admin(admin.reset(cmd.session_id));
            default:
                break;
        }
    }

    // 3. Route exactly one event
    const std::string input((std::istreambuf_iterator<char>(std::cin)),
                            std::istreambuf_iterator<char>());
    const hookguard::app::Router router(settings,
                                        hookguard::session::ProcessContext::current(env));
    const auto result = router.handle(input, cmd.runtime, cmd.event_name);
    std::cout << result.response.dump() << std::endl;
    return result.exit_code;
}
