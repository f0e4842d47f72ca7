/* Reconciliation merger: folds a device snapshot into the FlowStore. */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "flowrecon/core/entities.hpp"
#include "flowrecon/core/flow_store.hpp"
#include "flowrecon/core/resolver.hpp"
#include "flowrecon/core/types.hpp"

namespace flowrecon::core {

// A flow as reported by the device poller.
struct ObservedFlow {
  Instance instance {};
  TransportType transport { TransportType::Unknown };
  std::string destination_ip {};
  std::optional<std::int32_t> destination_port {};
  std::string source_ip {};
  Instance interface_key {};
  Bitrate bitrate { 0.0 };
  std::string label {};
};

struct ObservedInterface {
  Instance index {};
  std::string description {};
  std::string display_key {};
  InterfaceType type { InterfaceType::Ethernet };
  AdminStatus admin_status { AdminStatus::Up };
  OperStatus oper_status { OperStatus::Up };
  std::optional<PhysicalInterfaceRef> physical {};
};

struct DeviceSnapshot {
  // nullopt: interfaces were not polled this cycle; keep the current set.
  std::optional<std::vector<ObservedInterface>> interfaces {};
  std::vector<ObservedFlow> incoming {};
  std::vector<ObservedFlow> outgoing {};
};

struct MergeReport {
  std::size_t added {0};            // NoRow -> ObservedPresent
  std::size_t updated {0};          // existing row whose record changed
  std::size_t removed {0};          // ObservedPresent -> NoRow
  std::size_t retained_absent {0};  // ProvisionedPresent -> ProvisionedAbsent
  std::size_t interfaces {0};       // interface rows after a bulk replace
  std::vector<Rejection> rejections {};

  [[nodiscard]] std::size_t rejected() const noexcept { return rejections.size(); }
  MergeReport& operator+=(const MergeReport& other);
};

// Throws MalformedEntryError when the entry lacks an instance, interface,
// transport type, or (for IP) a valid destination address.
void validate_observed_flow(const ObservedFlow& f);

// True for a dotted-quad IPv4 or a textual IPv6 address.
[[nodiscard]] bool is_valid_ip_address(const std::string& text);

// Merge one direction's observed flows:
//   - unknown instance            -> created as ObservedPresent,
//   - known instance              -> fields refreshed, presence=true, owner kept,
//   - known but not observed      -> FlowEngineering: presence=false (retained),
//                                    LocalSystem: row deleted.
// A rejected entry still counts as observed so a malformed report never
// deletes the row it names.
MergeReport merge_observed_flows(FlowStore& store, FlowDirection dir,
                                 const std::vector<ObservedFlow>& observed);

// Build Interface rows from a polled interface list, resolving physical
// references through `resolver` when one is given.
[[nodiscard]] std::vector<Interface> build_interfaces(const std::vector<ObservedInterface>& observed,
                                                      PhysicalInterfaceResolver* resolver,
                                                      std::vector<Rejection>* rejections = nullptr);

// Full polling cycle: bulk-replace interfaces (if polled), then merge both
// flow directions.
MergeReport merge_snapshot(FlowStore& store, const DeviceSnapshot& snapshot,
                           PhysicalInterfaceResolver* resolver = nullptr);

} // namespace flowrecon::core
