#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/hook_errors.hpp"
#include "protocol/gate_contract.hpp"

namespace hookguard::gates {

struct ComplianceVerdict {
    protocol::Verdict verdict = protocol::Verdict::Ok;
    std::optional<std::string> citation;
    std::string message;
};

// The external judgment call behind CustodietGate. Receives a bounded
// session summary and answers with exactly one verdict.
class ComplianceChecker {
public:
    virtual ~ComplianceChecker() = default;

    // ExternalCheck errors: external_check_timeout, external_check_failed.
    virtual core::errors::Result<ComplianceVerdict> check(
        const nlohmann::json& summary) = 0;
};

// Runs a shell command with the summary JSON on stdin and expects
// {"verdict": "OK|WARN|BLOCK", "citation": "...", "message": "..."} on stdout.
// The child is killed when the deadline passes.
class CommandComplianceChecker : public ComplianceChecker {
public:
    CommandComplianceChecker(std::string command, std::uint32_t timeout_ms,
                             std::filesystem::path working_directory = ".");

    core::errors::Result<ComplianceVerdict> check(
        const nlohmann::json& summary) override;

private:
    std::string command_;
    std::uint32_t timeout_ms_;
    std::filesystem::path working_directory_;
};

// Parses the checker's stdout. The last non-empty line that is a JSON object
// wins, so checkers may print progress before the verdict.
core::errors::Result<ComplianceVerdict> parse_compliance_output(
    const std::string& output);

}  // namespace hookguard::gates
