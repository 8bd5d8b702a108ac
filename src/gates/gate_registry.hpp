#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "core/config/settings.hpp"
#include "core/errors/hook_errors.hpp"
#include "gates/compliance_checker.hpp"
#include "gates/gate.hpp"
#include "protocol/gate_contract.hpp"
#include "protocol/hook_event.hpp"

namespace hookguard::gates {

struct RegisteredGate {
    std::shared_ptr<Gate> gate;
    protocol::EnforcementMode mode = protocol::EnforcementMode::Warn;
};

// Gate instances by name, each with the mode it runs under.
using GateCatalog = std::map<std::string, RegisteredGate>;

// Event -> gate names, in evaluation order.
using RegistryTable =
    std::vector<std::pair<protocol::EventType, std::vector<std::string>>>;

// Static, ordered event -> gate table. Order is significant and stable.
class GateRegistry {
public:
    // Fails with unknown_gate or gate_event_mismatch.
    static core::errors::Result<GateRegistry> build(const GateCatalog& catalog,
                                                    const RegistryTable& table);

    // Empty for events with no gates.
    const std::vector<RegisteredGate>& gates_for(protocol::EventType type) const;

private:
    std::map<protocol::EventType, std::vector<RegisteredGate>> entries_;
};

const RegistryTable& default_table();

GateCatalog make_default_catalog(const core::config::Settings& settings,
                                 std::shared_ptr<ComplianceChecker> checker);

// Checker from CUSTODIET_CHECK_COMMAND, or null when none is configured.
std::shared_ptr<ComplianceChecker> make_checker(const core::config::Settings& settings);

core::errors::Result<GateRegistry> make_default_registry(
    const core::config::Settings& settings);

}  // namespace hookguard::gates
