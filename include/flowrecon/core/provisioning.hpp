/* Provisioning message handler: applies flow-engineering intent to the store. */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "flowrecon/core/entities.hpp"
#include "flowrecon/core/flow_store.hpp"
#include "flowrecon/core/options.hpp"
#include "flowrecon/core/types.hpp"

namespace flowrecon::core {

enum class ProvisioningAction {
  Add = 1,
  Remove = 2
};

// One flow named by a provisioning message.
struct ProvisionedFlow {
  // Optional; derived from the endpoints when empty (see derive_instance).
  Instance instance {};
  FlowDirection direction { FlowDirection::Incoming };
  TransportType transport { TransportType::Unknown };
  std::string destination_ip {};
  std::optional<std::int32_t> destination_port {};
  std::string source_ip {};
  Instance interface_key {};
  std::optional<Bitrate> expected_bitrate {};
  std::string label {};
  // Flow-engineering identifier; stored as the flow's linked_flow_id.
  std::string provisioned_flow_id {};
};

struct ProvisioningMessage {
  ProvisioningAction action { ProvisioningAction::Add };
  std::vector<ProvisionedFlow> flows {};
  bool ignore_destination_port { false };
};

struct ProvisioningResult {
  // Rows newly added or whose owner/endpoints changed, by direction, for
  // caller-side foreign-key linking. Copies taken after the change.
  std::vector<Flow> added_incoming {};
  std::vector<Flow> added_outgoing {};
  std::size_t updated {0};    // already provisioned; expected fields refreshed
  std::size_t removed {0};    // ProvisionedAbsent -> NoRow
  std::size_t released {0};   // ProvisionedPresent -> ObservedPresent
  std::size_t not_found {0};  // remove naming no provisioned row
  std::size_t linked {0};     // outgoing flows linked by the engine
  std::vector<Rejection> rejections {};

  [[nodiscard]] std::size_t rejected() const noexcept { return rejections.size(); }
};

// Instance used for a provisioned flow that names none; follows the poller
// convention so a later observation lands on the same row:
//   IP      -> "sourceIP/destinationIP/interface"
//   SDI/ASI -> "interface"
[[nodiscard]] Instance derive_instance(const ProvisionedFlow& pf);

// Throws MalformedEntryError. Add requires a transport, an interface and (for
// IP) a valid destination address; Remove requires an instance or the same
// defining attributes.
void validate_provisioned_flow(const ProvisionedFlow& pf, ProvisioningAction action);

// Defining-attribute match: transport, interface (when given) and, for IP,
// destination/source address and destination port (unless ignored).
[[nodiscard]] bool matches(const Flow& row, const ProvisionedFlow& pf, bool ignore_destination_port);

// Existing row for `pf`: by explicit instance first, then by attributes.
[[nodiscard]] const Flow* find_match(const FlowStore& store, const ProvisionedFlow& pf,
                                     bool ignore_destination_port);

// Apply a message entry by entry. A malformed entry is rejected alone; the
// rest of the message is still processed.
ProvisioningResult handle_provisioning(FlowStore& store, const ProvisioningMessage& msg,
                                       const ReconcileOptions& opts);

// Incoming key an outgoing flow should point at: the incoming row whose
// instance is "sourceIP/destinationIP" or starts with it, else that prefix
// itself. Empty for non-IP flows.
[[nodiscard]] Instance incoming_link_key(const FlowStore& store, const Flow& outgoing);

// Set peer_flow_key on each added outgoing flow in `result` still in the
// store. Only the outgoing side of a link is written. Returns flows linked.
std::size_t link_outgoing_flows(FlowStore& store, const ProvisioningResult& result);

// Clear peer_flow_key on `dir` flows pointing at `key`. Returns flows changed.
std::size_t clear_links_to(FlowStore& store, FlowDirection dir, const Instance& key);

} // namespace flowrecon::core
