/* String forms of the core enumerations, used in log messages. */
#include "flowrecon/core/types.hpp"
#include "flowrecon/core/entities.hpp"

namespace flowrecon::core {

std::string_view to_string(FlowDirection v) noexcept {
  return v == FlowDirection::Incoming ? "incoming" : "outgoing";
}

std::string_view to_string(Table v) noexcept {
  switch (v) {
    case Table::Interfaces: return "interfaces";
    case Table::IncomingFlows: return "incoming_flows";
    case Table::OutgoingFlows: return "outgoing_flows";
  }
  return "unknown";
}

std::string_view to_string(TransportType v) noexcept {
  switch (v) {
    case TransportType::IP: return "IP";
    case TransportType::SDI: return "SDI";
    case TransportType::ASI: return "ASI";
    case TransportType::Unknown: break;
  }
  return "unknown";
}

std::string_view to_string(FlowOwner v) noexcept {
  return v == FlowOwner::FlowEngineering ? "FlowEngineering" : "LocalSystem";
}

std::string_view to_string(BitrateStatus v) noexcept {
  switch (v) {
    case BitrateStatus::Normal: return "Normal";
    case BitrateStatus::Low: return "Low";
    case BitrateStatus::High: return "High";
  }
  return "unknown";
}

std::string_view to_string(FlowLifecycleState v) noexcept {
  switch (v) {
    case FlowLifecycleState::NoRow: return "NoRow";
    case FlowLifecycleState::ProvisionedAbsent: return "ProvisionedAbsent";
    case FlowLifecycleState::ProvisionedPresent: return "ProvisionedPresent";
    case FlowLifecycleState::ObservedPresent: return "ObservedPresent";
  }
  return "unknown";
}

FlowLifecycleState lifecycle_state(const Flow& f) noexcept {
  if (f.owner == FlowOwner::FlowEngineering) {
    return f.present ? FlowLifecycleState::ProvisionedPresent : FlowLifecycleState::ProvisionedAbsent;
  }
  return f.present ? FlowLifecycleState::ObservedPresent : FlowLifecycleState::NoRow;
}

FlowLifecycleState lifecycle_state(const Flow* f) noexcept {
  return f ? lifecycle_state(*f) : FlowLifecycleState::NoRow;
}

} // namespace flowrecon::core
