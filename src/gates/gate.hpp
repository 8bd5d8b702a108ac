#pragma once

#include <string>
#include "core/errors/hook_errors.hpp"
#include "protocol/gate_contract.hpp"
#include "protocol/hook_event.hpp"
#include "session/session_state.hpp"

namespace hookguard::gates {

// What a gate sees: the event, the session state with earlier gates'
// mutations already staged, and the mode it is registered under.
struct GateContext {
    const protocol::HookEvent& event;
    const session::SessionState& state;
    protocol::EnforcementMode mode = protocol::EnforcementMode::Warn;
};

// A named policy check bound to one or more event types. Gates never touch
// storage; they describe flag changes through GateDecision::state_mutations.
class Gate {
public:
    virtual ~Gate() = default;

    virtual std::string name() const = 0;
    virtual bool applies_to(protocol::EventType type) const = 0;

    // Returning an error (or throwing) is reported by the runner as a WARN.
    virtual core::errors::Result<protocol::GateDecision> evaluate(
        const GateContext& context) = 0;
};

}  // namespace hookguard::gates
