#include "app/router.hpp"

#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "gates/gate_registry.hpp"
#include "runtime/gate_runner.hpp"
#include "session/block_registry.hpp"
#include "session/hook_log_writer.hpp"
#include "session/state_store.hpp"

namespace hookguard::app {

using core::errors::ErrorCategory;
using core::errors::HookError;
using nlohmann::json;
using protocol::EventType;
using protocol::HookResponse;

namespace {

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (const auto& part : parts) {
        if (part.empty()) {
            continue;
        }
        if (!joined.empty()) {
            joined += separator;
        }
        joined += part;
    }
    return joined;
}

}  // namespace

Router::Router(core::config::Settings settings, session::ProcessContext process)
    : settings_(std::move(settings)), process_(std::move(process)) {}

json Router::serialize(const HookResponse& response, const EventType event_type) {
    json out;
    out["continue"] = response.should_continue();
    out["decision"] = protocol::decision_text(response.verdict);

    const std::string message = response.system_message();
    if (!message.empty()) {
        out["systemMessage"] = message;
    }
    if (!response.should_continue()) {
        out["stopReason"] = message;
    }

    json specific;
    specific["hookEventName"] = protocol::to_string(event_type);
    specific["permissionDecision"] = response.should_continue() ? "allow" : "deny";
    if (!response.should_continue() && !message.empty()) {
        specific["permissionDecisionReason"] = message;
    }
    const std::string context = join(response.contexts, "\n\n");
    if (!context.empty()) {
        specific["additionalContext"] = context;
    }
    if (response.updated_input.has_value()) {
        specific["updatedInput"] = response.updated_input.value();
    }
    out["hookSpecificOutput"] = specific;
    return out;
}

json Router::error_response(const HookError& error) {
    std::string message = "hookguard could not evaluate this event (" + error.code +
                          "): " + error.message;
    if (!error.hint.empty()) {
        message += " " + error.hint;
    }
    return json{{"continue", true}, {"decision", "warn"}, {"systemMessage", message}};
}

json Router::passthrough_response() {
    return json{{"continue", true}};
}

RouterResult Router::fail(const HookError& error,
                          const std::optional<std::string>& session_id,
                          const int exit_code) const {
    LOG_ERROR(core::errors::to_string(error.category) + " error [" + error.code +
              "]: " + error.message);
    const session::HookLogWriter log_writer(settings_.state_root);
    auto logged = log_writer.write_failure(session_id, error.code, error.message);
    if (core::errors::is_error(logged)) {
        LOG_WARN("Unable to write hook log: " + core::errors::get_error(logged).message);
    }
    return RouterResult{error_response(error), exit_code};
}

RouterResult Router::handle(const std::string& raw_input, const protocol::Runtime client,
                            const std::optional<std::string>& event_override) const {
    const json payload = json::parse(raw_input, nullptr, false);
    if (payload.is_discarded()) {
        return fail(HookError{ErrorCategory::Input, "stdin is not valid JSON.",
                              "invalid_json"},
                    std::nullopt, kExitInputOrConfig);
    }

    const session::EventNormalizer normalizer(settings_.state_root);
    auto normalized = normalizer.normalize(payload, client, event_override, process_);
    if (core::errors::is_error(normalized)) {
        const auto& error = core::errors::get_error(normalized);
        if (error.code == "unsupported_event") {
            LOG_DEBUG("Passing through: " + error.message);
            return RouterResult{passthrough_response(), kExitOk};
        }
        return fail(error, std::nullopt, kExitInputOrConfig);
    }
    const auto& event = core::errors::get_value(normalized);
    core::logging::Logger::get().set_session_id(event.session_id);

    auto registry = gates::make_default_registry(settings_);
    if (core::errors::is_error(registry)) {
        return fail(core::errors::get_error(registry), event.session_id,
                    kExitInputOrConfig);
    }

    const session::StateStore store(settings_.state_root);
    const session::BlockRegistry blocks(settings_.state_root);
    const runtime::GateRunner runner(core::errors::get_value(registry), store, blocks);
    auto ran = runner.run(event);
    if (core::errors::is_error(ran)) {
        return fail(core::errors::get_error(ran), event.session_id, kExitStateFailure);
    }
    const auto& response = core::errors::get_value(ran);

    if (event.event_type == EventType::SessionEnd) {
        auto reset = store.reset(event.session_id);
        if (core::errors::is_error(reset)) {
            LOG_WARN("Unable to reset ended session: " +
                     core::errors::get_error(reset).message);
        }
    }

    const session::HookLogWriter log_writer(settings_.state_root);
    auto logged = log_writer.write_invocation(event, response);
    if (core::errors::is_error(logged)) {
        LOG_WARN("Unable to write hook log: " + core::errors::get_error(logged).message);
    }

    LOG_INFO(protocol::to_string(event.event_type) + " -> " +
             protocol::to_string(response.verdict));
    return RouterResult{serialize(response, event.event_type), kExitOk};
}

}  // namespace hookguard::app
