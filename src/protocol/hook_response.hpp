#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/gate_contract.hpp"

namespace hookguard::protocol {

// Outcome of one gate inside a run, kept for logging and tests.
struct GateOutcome {
    std::string gate;
    EnforcementMode mode = EnforcementMode::Warn;
    Verdict verdict = Verdict::Ok;
    std::string message;
    std::optional<std::string> citation;
};

// Aggregated result of one runner pass, before serialization.
struct HookResponse {
    Verdict verdict = Verdict::Ok;
    std::vector<std::string> messages;
    std::vector<std::string> contexts;
    std::optional<nlohmann::json> updated_input;
    std::vector<GateOutcome> outcomes;

    bool should_continue() const { return verdict != Verdict::Block; }

    std::string system_message() const {
        std::string joined;
        for (const auto& message : messages) {
            if (message.empty()) {
                continue;
            }
            if (!joined.empty()) {
                joined += "\n";
            }
            joined += message;
        }
        return joined;
    }
};

inline std::string decision_text(const Verdict verdict) {
    switch (verdict) {
        case Verdict::Ok:
            return "allow";
        case Verdict::Warn:
            return "warn";
        case Verdict::Block:
            return "block";
        default:
            return "allow";
    }
}

}  // namespace hookguard::protocol
