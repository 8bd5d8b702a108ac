#include "gates/custodiet_gate.hpp"

#include <deque>
#include <fstream>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace hookguard::gates {

using nlohmann::json;
using protocol::EnforcementMode;
using protocol::EventType;
using protocol::GateDecision;
using protocol::StateMutation;
using protocol::Verdict;

namespace {

constexpr const char* kCustodietNeedle = "custodiet";
constexpr const char* kCitation = "custodiet: periodic compliance check";

// Cuts at most `max_bytes` without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

// Reads at most the last 64 KiB of the transcript and keeps its final lines.
json transcript_tail(const std::string& path) {
    json lines = json::array();
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return lines;
    }

    constexpr std::streamoff kWindow = 64 * 1024;
    in.seekg(0, std::ios::end);
    const std::streamoff size = in.tellg();
    if (size > kWindow) {
        in.seekg(size - kWindow, std::ios::beg);
    } else {
        in.seekg(0, std::ios::beg);
    }

    std::deque<std::string> tail;
    std::string line;
    bool first_line = size > kWindow;
    while (std::getline(in, line)) {
        if (first_line) {
            // Partial line at the start of the window.
            first_line = false;
            continue;
        }
        if (line.empty()) {
            continue;
        }
        if (line.size() > CustodietGate::kTranscriptLineChars) {
            line = truncate_utf8(line, CustodietGate::kTranscriptLineChars) + "...";
        }
        tail.push_back(line);
        if (tail.size() > CustodietGate::kTranscriptTailLines) {
            tail.pop_front();
        }
    }
    for (const auto& entry : tail) {
        lines.push_back(entry);
    }
    return lines;
}

GateDecision with_counter(GateDecision decision, const std::int64_t value) {
    decision.state_mutations.insert(
        decision.state_mutations.begin(),
        StateMutation{session::flags::kToolCallsSinceCustodiet, value});
    return decision;
}

}  // namespace

CustodietGate::CustodietGate(const std::int64_t interval,
                             std::shared_ptr<ComplianceChecker> checker,
                             policy::ToolPolicy tool_policy)
    : interval_(interval < 1 ? 1 : interval),
      checker_(std::move(checker)),
      tool_policy_(std::move(tool_policy)) {}

bool CustodietGate::applies_to(const EventType type) const {
    return type == EventType::PreToolUse;
}

json CustodietGate::build_summary(const GateContext& context) {
    const auto& event = context.event;
    const auto& state = context.state;

    json summary = json::object();
    summary["session_id"] = state.session_id;
    summary["event"] = protocol::to_string(event.event_type);
    summary["tool_name"] = event.tool_name.value_or("");

    const std::string input = event.tool_input.dump();
    if (input.size() > kMaxToolInputBytes) {
        summary["tool_input"] = truncate_utf8(input, kMaxToolInputBytes) + "...";
        summary["tool_input_truncated"] = true;
    } else {
        summary["tool_input"] = event.tool_input;
    }

    json flag_values = json::object();
    for (const auto& [name, value] : state.flags) {
        flag_values[name] = session::flag_to_json(value);
    }
    summary["flags"] = flag_values;

    json recent = json::array();
    const std::size_t start = state.audit.size() > kRecentAuditEntries
                                  ? state.audit.size() - kRecentAuditEntries
                                  : 0;
    for (std::size_t i = start; i < state.audit.size(); ++i) {
        recent.push_back(session::to_json(state.audit[i]));
    }
    summary["recent_audit"] = recent;

    summary["transcript_tail"] = event.transcript_path.has_value()
                                     ? transcript_tail(event.transcript_path.value())
                                     : json::array();
    return summary;
}

core::errors::Result<GateDecision> CustodietGate::evaluate(const GateContext& context) {
    const auto& event = context.event;
    const std::string tool = event.tool_name.value_or("");

    if (tool_policy_.spawns(tool, event.tool_input, kCustodietNeedle)) {
        return with_counter(GateDecision::ok(), 0);
    }

    const std::int64_t count =
        context.state.flag_int(session::flags::kToolCallsSinceCustodiet) + 1;
    if (count < interval_) {
        return with_counter(GateDecision::ok(), count);
    }

    // The check is due; the counter restarts whatever its outcome.
    if (!checker_) {
        return with_counter(
            GateDecision::warn("Compliance check due after " + std::to_string(count) +
                                   " tool calls, but no checker is configured "
                                   "(set CUSTODIET_CHECK_COMMAND).",
                               std::string(kCitation)),
            0);
    }

    auto checked = checker_->check(build_summary(context));
    if (core::errors::is_error(checked)) {
        const auto& error = core::errors::get_error(checked);
        LOG_WARN("Custodiet: " + error.code + ": " + error.message);
        return with_counter(
            GateDecision::warn("Compliance check could not complete: " + error.message,
                               std::string(kCitation)),
            0);
    }

    const auto& result = core::errors::get_value(checked);
    const std::string message =
        result.message.empty() ? "Compliance check flagged drift." : result.message;
    GateDecision decision;
    switch (result.verdict) {
        case Verdict::Ok:
            decision = GateDecision::ok();
            break;
        case Verdict::Warn:
            decision = GateDecision::warn("Custodiet: " + message, result.citation);
            break;
        case Verdict::Block:
            decision = GateDecision::block(
                "Custodiet: " + message +
                    " Resolve the drift, then clear the block with "
                    "`hookguard clear-block --session " +
                    context.state.session_id + "`.",
                result.citation);
            if (context.mode == EnforcementMode::Block) {
                decision.latch = true;
                decision.state_mutations.push_back(
                    StateMutation{session::flags::kCustodietBlockActive, true});
            }
            break;
    }
    decision.state_mutations.push_back(StateMutation{
        session::flags::kCustodietMode, protocol::to_string(context.mode)});
    return with_counter(std::move(decision), 0);
}

}  // namespace hookguard::gates
