#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "gates/compliance_checker.hpp"
#include "gates/gate.hpp"
#include "policy/tool_policy.hpp"

namespace hookguard::gates {

// Periodic compliance check. Every `interval` tool calls the session summary
// goes to the external checker; a BLOCK in block mode latches the session.
class CustodietGate : public Gate {
public:
    static constexpr const char* kName = "custodiet";
    static constexpr std::size_t kMaxToolInputBytes = 2048;
    static constexpr std::size_t kRecentAuditEntries = 10;
    static constexpr std::size_t kTranscriptTailLines = 20;
    static constexpr std::size_t kTranscriptLineChars = 240;

    // `checker` may be null: the periodic check then reports a WARN.
    CustodietGate(std::int64_t interval, std::shared_ptr<ComplianceChecker> checker,
                  policy::ToolPolicy tool_policy = policy::ToolPolicy());

    std::string name() const override { return kName; }
    bool applies_to(protocol::EventType type) const override;
    core::errors::Result<protocol::GateDecision> evaluate(
        const GateContext& context) override;

    // Bounded session context handed to the checker.
    static nlohmann::json build_summary(const GateContext& context);

private:
    std::int64_t interval_;
    std::shared_ptr<ComplianceChecker> checker_;
    policy::ToolPolicy tool_policy_;
};

}  // namespace hookguard::gates
