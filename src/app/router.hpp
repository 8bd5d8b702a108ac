#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/settings.hpp"
#include "core/errors/hook_errors.hpp"
#include "protocol/hook_event.hpp"
#include "protocol/hook_response.hpp"
#include "session/event_normalizer.hpp"

namespace hookguard::app {

struct RouterResult {
    nlohmann::json response;
    int exit_code = 0;
};

// One event in, exactly one response out. Holds no state between calls;
// continuity lives in the state store.
class Router {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitStateFailure = 1;
    static constexpr int kExitInputOrConfig = 2;

    Router(core::config::Settings settings, session::ProcessContext process);

    RouterResult handle(const std::string& raw_input, protocol::Runtime client,
                        const std::optional<std::string>& event_override) const;

    static nlohmann::json serialize(const protocol::HookResponse& response,
                                    protocol::EventType event_type);

    // Keeps the host moving: continue=true, decision=warn, message explains.
    static nlohmann::json error_response(const core::errors::HookError& error);

    static nlohmann::json passthrough_response();

private:
    RouterResult fail(const core::errors::HookError& error,
                      const std::optional<std::string>& session_id, int exit_code) const;

    core::config::Settings settings_;
    session::ProcessContext process_;
};

}  // namespace hookguard::app
