#include "runtime/gate_runner.hpp"

#include <exception>
#include <utility>
#include <vector>
#include "core/config/clock.hpp"
#include "core/logging/logger.hpp"

namespace hookguard::runtime {

using core::errors::ErrorCategory;
using core::errors::HookError;
using protocol::EnforcementMode;
using protocol::GateDecision;
using protocol::GateOutcome;
using protocol::HookEvent;
using protocol::HookResponse;
using protocol::StateMutation;
using protocol::Verdict;
using session::AuditEntry;
using session::SessionState;

namespace {

core::errors::Result<GateDecision> evaluate_guarded(gates::Gate& gate,
                                                    const gates::GateContext& context) {
    try {
        return gate.evaluate(context);
    } catch (const std::exception& e) {
        return HookError{ErrorCategory::Gate,
                         "Gate '" + gate.name() + "' raised: " + e.what(), "gate_failed"};
    }
}

AuditEntry make_audit(const HookEvent& event, const GateOutcome& outcome) {
    AuditEntry entry;
    entry.ts_unix_ms = core::config::now_unix_ms();
    entry.event = protocol::to_string(event.event_type);
    entry.gate = outcome.gate;
    entry.verdict = outcome.verdict;
    entry.message = outcome.message;
    entry.citation = outcome.citation;
    return entry;
}

void record(HookResponse& response, std::vector<AuditEntry>& audit,
            const HookEvent& event, GateOutcome outcome) {
    response.verdict = protocol::max_verdict(response.verdict, outcome.verdict);
    if (outcome.verdict != Verdict::Ok) {
        response.messages.push_back(outcome.message);
        audit.push_back(make_audit(event, outcome));
    }
    response.outcomes.push_back(std::move(outcome));
}

}  // namespace

GateRunner::GateRunner(const gates::GateRegistry& registry,
                       const session::StateStore& store,
                       const session::BlockRegistry& blocks)
    : registry_(registry), store_(store), blocks_(blocks) {}

core::errors::Result<HookResponse> GateRunner::run(const HookEvent& event) const {
    HookResponse response;
    auto updated = store_.update(event.session_id, [&](SessionState& state) {
        run_locked(event, state, response);
    });
    if (core::errors::is_error(updated)) {
        return core::errors::get_error(updated);
    }

    const auto& loaded = core::errors::get_value(updated);
    if (loaded.recovered_from_corruption) {
        auto recorded = blocks_.record_corruption(event.session_id, loaded.corruption_detail);
        if (core::errors::is_error(recorded)) {
            LOG_ERROR("GateRunner: unable to record state corruption: " +
                      core::errors::get_error(recorded).message);
        }
        response.verdict = protocol::max_verdict(response.verdict, Verdict::Warn);
        response.messages.insert(
            response.messages.begin(),
            "Session state was unreadable and has been reset to defaults (" +
                loaded.corruption_detail + ").");
    }
    return response;
}

bool GateRunner::sticky_block(const std::string& session_id, const SessionState& state,
                              std::optional<session::BlockRecord>& record) const {
    auto active = blocks_.active_block(session_id);
    if (core::errors::is_error(active)) {
        // The state flag alone still latches; the history is only detail.
        LOG_WARN("GateRunner: unable to read block records: " +
                 core::errors::get_error(active).message);
    } else {
        record = core::errors::get_value(active);
    }
    return record.has_value() ||
           state.flag_bool(session::flags::kCustodietBlockActive);
}

void GateRunner::run_locked(const HookEvent& event, SessionState& state,
                            HookResponse& response) const {
    const auto& registered_gates = registry_.gates_for(event.event_type);
    std::vector<AuditEntry> audit;

    std::optional<session::BlockRecord> block_record;
    if (sticky_block(event.session_id, state, block_record)) {
        std::string reason = "Session is blocked";
        if (block_record.has_value()) {
            reason += " by " + block_record->gate + ": " + block_record->reason;
        } else {
            reason += " (custodiet_block_active).";
        }
        const std::string remedy = " Resolve it, then run `hookguard clear-block --session " +
                                   event.session_id + "`.";

        GateOutcome outcome;
        outcome.citation = block_record.has_value() ? block_record->citation : std::nullopt;
        if (registered_gates.empty()) {
            outcome.gate = "block_flag";
            outcome.verdict = Verdict::Warn;
            outcome.message = reason + remedy;
        } else {
            outcome.gate = registered_gates.front().gate->name();
            outcome.mode = registered_gates.front().mode;
            outcome.verdict = Verdict::Block;
            outcome.message = reason + remedy;
        }
        LOG_INFO("GateRunner: sticky block on " + protocol::to_string(event.event_type));
        record(response, audit, event, std::move(outcome));
        for (auto& entry : audit) {
            state.append_audit(std::move(entry));
        }
        return;
    }

    SessionState staged = state;
    std::vector<StateMutation> accumulated;

    for (const auto& registered : registered_gates) {
        auto& gate = *registered.gate;
        const gates::GateContext context{event, staged, registered.mode};

        GateOutcome outcome;
        outcome.gate = gate.name();
        outcome.mode = registered.mode;

        auto evaluated = evaluate_guarded(gate, context);
        if (core::errors::is_error(evaluated)) {
            const auto& error = core::errors::get_error(evaluated);
            LOG_WARN("GateRunner: gate " + outcome.gate + " failed: " + error.message);
            outcome.verdict = Verdict::Warn;
            outcome.message = "Gate '" + outcome.gate +
                              "' could not be evaluated: " + error.message;
            record(response, audit, event, std::move(outcome));
            continue;
        }

        auto& decision = core::errors::get_value(evaluated);
        staged = session::apply_mutations(std::move(staged), decision.state_mutations);
        accumulated.insert(accumulated.end(), decision.state_mutations.begin(),
                           decision.state_mutations.end());
        if (decision.updated_input.has_value()) {
            response.updated_input = decision.updated_input;
        }
        if (decision.context.has_value() && !decision.context->empty()) {
            response.contexts.push_back(decision.context.value());
        }

        outcome.verdict = decision.verdict;
        outcome.message = decision.message;
        outcome.citation = decision.citation;
        if (outcome.verdict == Verdict::Block && registered.mode == EnforcementMode::Warn) {
            outcome.verdict = Verdict::Warn;
        }
        if (outcome.verdict != Verdict::Ok && outcome.message.empty()) {
            outcome.message = "Gate '" + outcome.gate + "' returned " +
                              protocol::to_string(outcome.verdict) + ".";
        }
        LOG_DEBUG("GateRunner: " + outcome.gate + " -> " +
                  protocol::to_string(outcome.verdict));

        const bool stop = outcome.verdict == Verdict::Block;
        if (stop && decision.latch) {
            auto latched =
                blocks_.latch(event.session_id, outcome.gate, outcome.message, outcome.citation);
            if (core::errors::is_error(latched)) {
                LOG_ERROR("GateRunner: unable to write block record: " +
                          core::errors::get_error(latched).message);
            }
            accumulated.push_back(StateMutation{session::flags::kCustodietBlockActive, true});
        }
        record(response, audit, event, std::move(outcome));
        if (stop) {
            break;
        }
    }

    state = session::apply_mutations(std::move(state), accumulated);
    for (auto& entry : audit) {
        state.append_audit(std::move(entry));
    }
}

}  // namespace hookguard::runtime
