/*
  Provisioning message handler.

  Add:    NoRow            -> ProvisionedAbsent
          ObservedPresent  -> ProvisionedPresent
          Provisioned*     -> unchanged state, expected fields refreshed
  Remove: ProvisionedAbsent  -> NoRow
          ProvisionedPresent -> ObservedPresent (still observed, owner reverts)

  Entries are independent: a malformed entry is rejected and the remaining
  entries are still applied.
*/
#include "flowrecon/core/provisioning.hpp"
#include "flowrecon/core/error.hpp"
#include "flowrecon/core/logging.hpp"
#include "flowrecon/core/reconciler.hpp"

#include <cmath>

namespace flowrecon::core {

Instance derive_instance(const ProvisionedFlow& pf) {
  if (pf.transport == TransportType::IP) {
    return pf.source_ip + "/" + pf.destination_ip + "/" + pf.interface_key;
  }
  return pf.interface_key;
}

void validate_provisioned_flow(const ProvisionedFlow& pf, ProvisioningAction action) {
  if (action == ProvisioningAction::Remove && !pf.instance.empty()) return;
  if (pf.transport == TransportType::Unknown) throw MalformedEntryError("missing transport type");
  if (pf.interface_key.empty()) throw MalformedEntryError("missing interface key");
  if (pf.transport == TransportType::IP) {
    if (!is_valid_ip_address(pf.destination_ip)) {
      throw MalformedEntryError("invalid destination IP '" + pf.destination_ip + "'");
    }
    if (!pf.source_ip.empty() && !is_valid_ip_address(pf.source_ip)) {
      throw MalformedEntryError("invalid source IP '" + pf.source_ip + "'");
    }
    if (pf.destination_port && (*pf.destination_port < 0 || *pf.destination_port > 65535)) {
      throw MalformedEntryError("destination port out of range");
    }
  }
  if (pf.expected_bitrate && (!std::isfinite(*pf.expected_bitrate) || *pf.expected_bitrate < 0.0)) {
    throw MalformedEntryError("expected bitrate must be finite and >= 0");
  }
}

bool matches(const Flow& row, const ProvisionedFlow& pf, bool ignore_destination_port) {
  if (row.direction != pf.direction || row.transport != pf.transport) return false;
  if (!pf.interface_key.empty() && row.interface_key != pf.interface_key) return false;
  if (pf.transport != TransportType::IP) return true;
  if (row.destination_ip != pf.destination_ip || row.source_ip != pf.source_ip) return false;
  return ignore_destination_port || row.destination_port == pf.destination_port;
}

const Flow* find_match(const FlowStore& store, const ProvisionedFlow& pf,
                       bool ignore_destination_port) {
  if (!pf.instance.empty()) {
    if (const Flow* f = store.get(pf.direction, pf.instance)) return f;
  }
  if (pf.transport == TransportType::Unknown) return nullptr;
  for (auto const& row : store.all(pf.direction)) {
    if (matches(row, pf, ignore_destination_port)) return &row;
  }
  return nullptr;
}

namespace {

bool same_endpoints(const Flow& a, const Flow& b) {
  return a.transport == b.transport && a.destination_ip == b.destination_ip &&
         a.destination_port == b.destination_port && a.source_ip == b.source_ip &&
         a.interface_key == b.interface_key;
}

void record_added(ProvisioningResult& result, const Flow& f) {
  (f.direction == FlowDirection::Incoming ? result.added_incoming : result.added_outgoing).push_back(f);
}

// Overwrite endpoints with the provisioned ones. Only done while the device
// does not report the flow; observed endpoints are device truth.
void apply_endpoints(Flow& row, const ProvisionedFlow& pf, bool ignore_destination_port) {
  row.transport = pf.transport;
  row.interface_key = pf.interface_key.empty() ? row.interface_key : pf.interface_key;
  if (pf.transport == TransportType::IP) {
    row.destination_ip = pf.destination_ip;
    row.source_ip = pf.source_ip;
    if (!ignore_destination_port || !row.destination_port) row.destination_port = pf.destination_port;
  } else {
    row.destination_ip.clear();
    row.source_ip.clear();
    row.destination_port.reset();
  }
}

void apply_intent(Flow& row, const ProvisionedFlow& pf) {
  row.owner = FlowOwner::FlowEngineering;
  if (pf.expected_bitrate) row.expected_bitrate = pf.expected_bitrate;
  if (!pf.label.empty()) row.label = pf.label;
  if (!pf.provisioned_flow_id.empty()) row.linked_flow_id = pf.provisioned_flow_id;
}

void provision_add(FlowStore& store, const ProvisionedFlow& pf, bool ignore_port,
                   ProvisioningResult& result) {
  auto log = logger();
  const Flow* existing = find_match(store, pf, ignore_port);
  if (!existing) {
    Flow row;
    row.instance = pf.instance.empty() ? derive_instance(pf) : pf.instance;
    row.direction = pf.direction;
    if (store.get(pf.direction, row.instance)) {
      throw MalformedEntryError("instance '" + row.instance + "' is held by a flow with other endpoints");
    }
    row.present = false;
    apply_endpoints(row, pf, false);
    apply_intent(row, pf);
    store.upsert(row);
    record_added(result, row);
    log->debug("{} flow '{}': NoRow -> ProvisionedAbsent", to_string(pf.direction), row.instance);
    return;
  }

  Flow row = *existing;
  const FlowOwner prev_owner = row.owner;
  if (!row.present) apply_endpoints(row, pf, ignore_port);
  apply_intent(row, pf);
  const bool owner_changed = prev_owner != row.owner;
  const bool endpoints_changed = !same_endpoints(row, *existing);
  if (row == *existing) {
    ++result.updated;
    return;
  }
  store.upsert(row);
  if (owner_changed || endpoints_changed) {
    record_added(result, row);
    if (owner_changed) {
      log->debug("{} flow '{}': ObservedPresent -> ProvisionedPresent", to_string(pf.direction),
                 row.instance);
    }
  } else {
    ++result.updated;
  }
}

void provision_remove(FlowStore& store, const ProvisionedFlow& pf, bool ignore_port,
                      ProvisioningResult& result) {
  auto log = logger();
  const Flow* existing = find_match(store, pf, ignore_port);
  if (!existing || existing->owner != FlowOwner::FlowEngineering) {
    ++result.not_found;
    log->debug("provisioning remove for {} flow '{}': no provisioned row", to_string(pf.direction),
               existing ? existing->instance : pf.instance);
    return;
  }
  const Instance inst = existing->instance;
  if (!existing->present) {
    store.remove(pf.direction, inst);
    if (pf.direction == FlowDirection::Incoming) {
      clear_links_to(store, FlowDirection::Outgoing, inst);
    }
    ++result.removed;
    log->debug("{} flow '{}': ProvisionedAbsent -> NoRow", to_string(pf.direction), inst);
    return;
  }
  Flow row = *existing;
  row.owner = FlowOwner::LocalSystem;
  row.expected_bitrate.reset();
  row.linked_flow_id.clear();
  store.upsert(row);
  ++result.released;
  record_added(result, row);
  log->debug("{} flow '{}': ProvisionedPresent -> ObservedPresent", to_string(pf.direction), inst);
}

} // namespace

ProvisioningResult handle_provisioning(FlowStore& store, const ProvisioningMessage& msg,
                                       const ReconcileOptions& opts) {
  ProvisioningResult result;
  const bool ignore_port = msg.ignore_destination_port || opts.ignore_destination_port;
  for (auto const& pf : msg.flows) {
    try {
      validate_provisioned_flow(pf, msg.action);
      if (msg.action == ProvisioningAction::Add) {
        provision_add(store, pf, ignore_port, result);
      } else {
        provision_remove(store, pf, ignore_port, result);
      }
    } catch (const MalformedEntryError& e) {
      const Instance inst = pf.instance.empty() ? derive_instance(pf) : pf.instance;
      logger()->warn("rejected provisioned {} flow '{}': {}", to_string(pf.direction), inst, e.what());
      result.rejections.push_back(Rejection{inst, e.what()});
    }
  }
  logger()->debug("provisioning {}: {} added/changed, {} updated, {} removed, {} released, {} rejected",
                  msg.action == ProvisioningAction::Add ? "add" : "remove",
                  result.added_incoming.size() + result.added_outgoing.size(), result.updated,
                  result.removed, result.released, result.rejected());
  return result;
}

Instance incoming_link_key(const FlowStore& store, const Flow& outgoing) {
  if (outgoing.transport != TransportType::IP) return {};
  const Instance prefix = outgoing.source_ip + "/" + outgoing.destination_ip;
  const Instance scoped = prefix + "/";
  for (auto const& in : store.all(FlowDirection::Incoming)) {
    if (in.instance == prefix || in.instance.compare(0, scoped.size(), scoped) == 0) {
      return in.instance;
    }
  }
  return prefix;
}

std::size_t link_outgoing_flows(FlowStore& store, const ProvisioningResult& result) {
  std::size_t linked = 0;
  for (auto const& added : result.added_outgoing) {
    const Flow* current = store.get(FlowDirection::Outgoing, added.instance);
    if (!current) continue;
    Instance key = incoming_link_key(store, *current);
    if (key.empty() || key == current->peer_flow_key) continue;
    Flow row = *current;
    row.peer_flow_key = std::move(key);
    store.upsert(row);
    ++linked;
  }
  return linked;
}

std::size_t clear_links_to(FlowStore& store, FlowDirection dir, const Instance& key) {
  std::size_t changed = 0;
  for (auto const& inst : store.flows_linked_to(dir, key)) {
    Flow row = *store.get(dir, inst);
    row.peer_flow_key.clear();
    store.upsert(row);
    ++changed;
  }
  return changed;
}

} // namespace flowrecon::core
