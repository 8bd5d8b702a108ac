#include "gates/gate_registry.hpp"

#include "gates/command_intercept_gate.hpp"
#include "gates/custodiet_gate.hpp"
#include "gates/handover_gate.hpp"
#include "gates/hydration_gate.hpp"
#include "gates/task_gate.hpp"

namespace hookguard::gates {

using core::errors::ErrorCategory;
using core::errors::HookError;
using protocol::EnforcementMode;
using protocol::EventType;

core::errors::Result<GateRegistry> GateRegistry::build(const GateCatalog& catalog,
                                                       const RegistryTable& table) {
    GateRegistry registry;
    for (const auto& [event, names] : table) {
        auto& entries = registry.entries_[event];
        for (const auto& name : names) {
            const auto it = catalog.find(name);
            if (it == catalog.end() || !it->second.gate) {
                return HookError{ErrorCategory::Configuration,
                                 "Registry references unknown gate '" + name +
                                     "' for " + protocol::to_string(event) + ".",
                                 "unknown_gate"};
            }
            if (!it->second.gate->applies_to(event)) {
                return HookError{ErrorCategory::Configuration,
                                 "Gate '" + name + "' does not apply to " +
                                     protocol::to_string(event) + ".",
                                 "gate_event_mismatch"};
            }
            entries.push_back(it->second);
        }
    }
    return registry;
}

const std::vector<RegisteredGate>& GateRegistry::gates_for(const EventType type) const {
    static const std::vector<RegisteredGate> kNone;
    const auto it = entries_.find(type);
    return it == entries_.end() ? kNone : it->second;
}

const RegistryTable& default_table() {
    static const RegistryTable table = {
        {EventType::SessionStart, {}},
        {EventType::UserPromptSubmit, {HydrationGate::kName}},
        {EventType::PreToolUse,
         {HydrationGate::kName, TaskGate::kName, CustodietGate::kName,
          CommandInterceptGate::kName}},
        {EventType::PostToolUse,
         {HydrationGate::kName, TaskGate::kName, HandoverGate::kName}},
        {EventType::Stop, {HandoverGate::kName}},
        {EventType::SessionEnd, {}},
    };
    return table;
}

std::shared_ptr<ComplianceChecker> make_checker(const core::config::Settings& settings) {
    if (!settings.custodiet_check_command.has_value()) {
        return nullptr;
    }
    return std::make_shared<CommandComplianceChecker>(
        settings.custodiet_check_command.value(), settings.custodiet_timeout_ms);
}

GateCatalog make_default_catalog(const core::config::Settings& settings,
                                 std::shared_ptr<ComplianceChecker> checker) {
    GateCatalog catalog;
    catalog[HydrationGate::kName] = {
        std::make_shared<HydrationGate>(settings.hydration_every_prompt),
        settings.hydration_mode};
    catalog[TaskGate::kName] = {std::make_shared<TaskGate>(settings.task_required),
                                settings.task_mode};
    catalog[CustodietGate::kName] = {
        std::make_shared<CustodietGate>(settings.custodiet_interval, std::move(checker)),
        settings.custodiet_mode};
    catalog[CommandInterceptGate::kName] = {
        std::make_shared<CommandInterceptGate>(settings.intercept_excludes),
        EnforcementMode::Warn};
    catalog[HandoverGate::kName] = {std::make_shared<HandoverGate>(),
                                    settings.handover_mode};
    return catalog;
}

core::errors::Result<GateRegistry> make_default_registry(
    const core::config::Settings& settings) {
    return GateRegistry::build(make_default_catalog(settings, make_checker(settings)),
                               default_table());
}

}  // namespace hookguard::gates
