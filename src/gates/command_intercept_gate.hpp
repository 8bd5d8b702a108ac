#pragma once

#include <string>
#include <vector>
#include "gates/gate.hpp"

namespace hookguard::gates {

// Request-transforming gate: adds an exclusion glob to unfiltered searches.
// Never blocks.
class CommandInterceptGate : public Gate {
public:
    static constexpr const char* kName = "command_intercept";

    explicit CommandInterceptGate(std::vector<std::string> excludes);

    std::string name() const override { return kName; }
    bool applies_to(protocol::EventType type) const override;
    core::errors::Result<protocol::GateDecision> evaluate(
        const GateContext& context) override;

    // "!{.venv,node_modules}" style negated brace glob.
    std::string exclusion_glob() const;

private:
    std::vector<std::string> excludes_;
};

}  // namespace hookguard::gates
