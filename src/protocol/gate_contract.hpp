#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace hookguard::protocol {

enum class Verdict {
    Ok,
    Warn,
    Block
};

// Enforcement posture of one registry entry.
enum class EnforcementMode {
    Warn,
    Block
};

// A session flag is a boolean, a counter or an enum-like string.
using FlagValue = std::variant<bool, std::int64_t, std::string>;

// Sets one flag. Mutations never increment, so replaying them is harmless.
struct StateMutation {
    std::string flag;
    FlagValue value;
};

struct GateDecision {
    Verdict verdict = Verdict::Ok;
    std::string message;
    std::optional<std::string> citation;
    std::vector<StateMutation> state_mutations;

    // Rewritten tool_input, for request-transforming gates.
    std::optional<nlohmann::json> updated_input;
    // Extra context injected into the agent's next turn.
    std::optional<std::string> context;
    // Ask the runner to persist a BlockRecord and latch the session.
    bool latch = false;

    static GateDecision ok() { return GateDecision{}; }

    static GateDecision warn(std::string message,
                             std::optional<std::string> citation = std::nullopt) {
        GateDecision decision;
        decision.verdict = Verdict::Warn;
        decision.message = std::move(message);
        decision.citation = std::move(citation);
        return decision;
    }

    static GateDecision block(std::string message,
                              std::optional<std::string> citation = std::nullopt) {
        GateDecision decision;
        decision.verdict = Verdict::Block;
        decision.message = std::move(message);
        decision.citation = std::move(citation);
        return decision;
    }
};

inline std::string to_string(const Verdict verdict) {
    switch (verdict) {
        case Verdict::Ok:
            return "OK";
        case Verdict::Warn:
            return "WARN";
        case Verdict::Block:
            return "BLOCK";
        default:
            return "unknown";
    }
}

inline std::optional<Verdict> parse_verdict(const std::string& text) {
    if (text == "OK" || text == "ok") return Verdict::Ok;
    if (text == "WARN" || text == "warn") return Verdict::Warn;
    if (text == "BLOCK" || text == "block") return Verdict::Block;
    return std::nullopt;
}

inline std::string to_string(const EnforcementMode mode) {
    switch (mode) {
        case EnforcementMode::Warn:
            return "warn";
        case EnforcementMode::Block:
            return "block";
        default:
            return "unknown";
    }
}

// Priority used when aggregating: BLOCK > WARN > OK.
inline Verdict max_verdict(const Verdict a, const Verdict b) {
    return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

}  // namespace hookguard::protocol
