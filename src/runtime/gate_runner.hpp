#pragma once

#include <optional>
#include <string>
#include "core/errors/hook_errors.hpp"
#include "gates/gate_registry.hpp"
#include "protocol/hook_event.hpp"
#include "protocol/hook_response.hpp"
#include "session/block_registry.hpp"
#include "session/state_store.hpp"

namespace hookguard::runtime {

// Runs the registered gates for one event against the session state.
// Evaluation happens inside the store's locked read-modify-write, so the
// verdict and the state it was computed from are persisted together.
class GateRunner {
public:
    GateRunner(const gates::GateRegistry& registry, const session::StateStore& store,
               const session::BlockRegistry& blocks);

    // Errors are State errors from the store; gate failures become WARNs.
    core::errors::Result<protocol::HookResponse> run(const protocol::HookEvent& event) const;

private:
    void run_locked(const protocol::HookEvent& event, session::SessionState& state,
                    protocol::HookResponse& response) const;
    bool sticky_block(const std::string& session_id, const session::SessionState& state,
                      std::optional<session::BlockRecord>& record) const;

    const gates::GateRegistry& registry_;
    const session::StateStore& store_;
    const session::BlockRegistry& blocks_;
};

}  // namespace hookguard::runtime
