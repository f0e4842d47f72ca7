/* Interface and Flow records: the rows of the three logical tables. */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "flowrecon/core/types.hpp"

namespace flowrecon::core {

// Rollups derived from the flow set of one interface. Never mutated directly;
// always produced by compute_interface_aggregates().
struct InterfaceAggregates {
  Bitrate rx_bitrate {0.0};
  Bitrate tx_bitrate {0.0};
  FlowCount rx_flows {0};
  FlowCount tx_flows {0};
  Bitrate expected_rx_bitrate {0.0};
  Bitrate expected_tx_bitrate {0.0};
  FlowCount expected_rx_flows {0};
  FlowCount expected_tx_flows {0};
  BitrateStatus rx_bitrate_status {BitrateStatus::Normal};
  BitrateStatus tx_bitrate_status {BitrateStatus::Normal};
  BitrateStatus rx_flow_count_status {BitrateStatus::Normal};
  BitrateStatus tx_flow_count_status {BitrateStatus::Normal};

  friend bool operator==(const InterfaceAggregates&, const InterfaceAggregates&) = default;
};

struct Interface {
  Instance index {};          // ifIndex, the row key
  std::string description {};
  std::string display_key {};
  InterfaceType type {InterfaceType::Ethernet};
  AdminStatus admin_status {AdminStatus::Up};
  OperStatus oper_status {OperStatus::Up};
  // Identifier of the physical interface, resolved externally; empty if unknown.
  std::string physical_interface {};
  InterfaceAggregates aggregates {};

  friend bool operator==(const Interface&, const Interface&) = default;
};

// A flow entering (Incoming) or leaving (Outgoing) the device. Both tables
// share this shape; `direction` selects the table.
struct Flow {
  Instance instance {};
  FlowDirection direction {FlowDirection::Incoming};
  TransportType transport {TransportType::Unknown};
  // IP endpoints; empty / nullopt for SDI and ASI.
  std::string destination_ip {};
  std::optional<std::int32_t> destination_port {};
  std::string source_ip {};
  Instance interface_key {};
  Bitrate bitrate {0.0};
  // Set only by provisioning; nullopt means nothing expected.
  std::optional<Bitrate> expected_bitrate {};
  BitrateStatus expected_bitrate_status {BitrateStatus::Normal};
  std::string label {};
  // Cross-direction foreign key (outgoing -> incoming instance). Populated
  // from one side of a link only.
  Instance peer_flow_key {};
  // Correlates this flow with its counterpart on another device.
  std::string linked_flow_id {};
  FlowOwner owner {FlowOwner::LocalSystem};
  bool present {false};

  friend bool operator==(const Flow&, const Flow&) = default;
};

// Map (owner, presence) to the lifecycle state. LocalSystem + absent is not a
// persisted state and reports NoRow.
[[nodiscard]] FlowLifecycleState lifecycle_state(const Flow& f) noexcept;
[[nodiscard]] FlowLifecycleState lifecycle_state(const Flow* f) noexcept;

// One entry of a snapshot or provisioning message that was not applied.
struct Rejection {
  Instance instance {};
  std::string reason {};
};

} // namespace flowrecon::core
