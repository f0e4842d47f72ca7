/*
  Reconciliation merger: applies the flow lifecycle to a polled snapshot.

  State is derived from (owner, presence):
    ObservedPresent    LocalSystem,     present
    ProvisionedPresent FlowEngineering, present
    ProvisionedAbsent  FlowEngineering, absent
  LocalSystem + absent is never stored; such rows are deleted. Provisioned rows
  are only deleted by an explicit provisioning removal.
*/
#include "flowrecon/core/reconciler.hpp"
#include "flowrecon/core/error.hpp"
#include "flowrecon/core/logging.hpp"

#include <arpa/inet.h>

#include <cmath>

#include <unordered_set>

namespace flowrecon::core {

MergeReport& MergeReport::operator+=(const MergeReport& other) {
  added += other.added;
  updated += other.updated;
  removed += other.removed;
  retained_absent += other.retained_absent;
  interfaces += other.interfaces;
  rejections.insert(rejections.end(), other.rejections.begin(), other.rejections.end());
  return *this;
}

bool is_valid_ip_address(const std::string& text) {
  unsigned char buf[16];
  return inet_pton(AF_INET, text.c_str(), buf) == 1 || inet_pton(AF_INET6, text.c_str(), buf) == 1;
}

void validate_observed_flow(const ObservedFlow& f) {
  if (f.instance.empty()) throw MalformedEntryError("missing instance");
  if (f.interface_key.empty()) throw MalformedEntryError("missing interface key");
  if (!std::isfinite(f.bitrate) || f.bitrate < 0.0) {
    throw MalformedEntryError("bitrate must be finite and >= 0");
  }
  switch (f.transport) {
    case TransportType::IP:
      if (!is_valid_ip_address(f.destination_ip)) {
        throw MalformedEntryError("invalid destination IP '" + f.destination_ip + "'");
      }
      // Empty source means any-source multicast.
      if (!f.source_ip.empty() && !is_valid_ip_address(f.source_ip)) {
        throw MalformedEntryError("invalid source IP '" + f.source_ip + "'");
      }
      if (f.destination_port && (*f.destination_port < 0 || *f.destination_port > 65535)) {
        throw MalformedEntryError("destination port out of range");
      }
      break;
    case TransportType::SDI:
    case TransportType::ASI:
      break;
    case TransportType::Unknown:
      throw MalformedEntryError("missing transport type");
  }
}

namespace {

// Refresh the device-owned fields of `row` from an observation.
void apply_observation(Flow& row, const ObservedFlow& obs) {
  row.transport = obs.transport;
  if (obs.transport == TransportType::IP) {
    row.destination_ip = obs.destination_ip;
    row.source_ip = obs.source_ip;
    // Keep a provisioned port when the device does not report one.
    if (obs.destination_port) row.destination_port = obs.destination_port;
  } else {
    row.destination_ip.clear();
    row.source_ip.clear();
    row.destination_port.reset();
  }
  row.interface_key = obs.interface_key;
  row.bitrate = obs.bitrate;
  if (!obs.label.empty()) row.label = obs.label;
  row.present = true;
}

} // namespace

MergeReport merge_observed_flows(FlowStore& store, FlowDirection dir,
                                 const std::vector<ObservedFlow>& observed) {
  MergeReport report;
  auto log = logger();
  std::unordered_set<Instance> seen;
  seen.reserve(observed.size());

  for (auto const& obs : observed) {
    try {
      validate_observed_flow(obs);
      if (!seen.insert(obs.instance).second) {
        throw MalformedEntryError("duplicate instance in snapshot");
      }
    } catch (const MalformedEntryError& e) {
      if (!obs.instance.empty()) seen.insert(obs.instance);
      log->warn("rejected observed {} flow '{}': {}", to_string(dir), obs.instance, e.what());
      report.rejections.push_back(Rejection{obs.instance, e.what()});
      continue;
    }

    const Flow* existing = store.get(dir, obs.instance);
    if (!existing) {
      Flow row;
      row.instance = obs.instance;
      row.direction = dir;
      row.owner = FlowOwner::LocalSystem;
      apply_observation(row, obs);
      store.upsert(row);
      ++report.added;
      log->debug("{} flow '{}': NoRow -> ObservedPresent", to_string(dir), obs.instance);
      continue;
    }

    Flow row = *existing;
    const FlowLifecycleState before = lifecycle_state(row);
    apply_observation(row, obs);
    if (row == *existing) continue;
    store.upsert(row);
    ++report.updated;
    if (before != lifecycle_state(row)) {
      log->debug("{} flow '{}': {} -> {}", to_string(dir), obs.instance,
                 to_string(before), to_string(lifecycle_state(row)));
    }
  }

  // Absence rule. Collect first: removal shifts the rows being iterated.
  std::vector<Instance> missing;
  for (auto const& row : store.all(dir)) {
    if (!seen.count(row.instance)) missing.push_back(row.instance);
  }
  for (auto const& inst : missing) {
    Flow row = *store.get(dir, inst);
    if (row.owner == FlowOwner::LocalSystem) {
      store.remove(dir, inst);
      ++report.removed;
      log->debug("{} flow '{}': ObservedPresent -> NoRow", to_string(dir), inst);
    } else if (row.present) {
      row.present = false;
      row.bitrate = 0.0;
      store.upsert(row);
      ++report.retained_absent;
      log->debug("{} flow '{}': ProvisionedPresent -> ProvisionedAbsent", to_string(dir), inst);
    }
  }
  return report;
}

std::vector<Interface> build_interfaces(const std::vector<ObservedInterface>& observed,
                                        PhysicalInterfaceResolver* resolver,
                                        std::vector<Rejection>* rejections) {
  std::vector<Interface> out;
  out.reserve(observed.size());
  std::unordered_set<Instance> seen;
  auto reject = [&](const ObservedInterface& obs, const char* reason) {
    logger()->warn("rejected interface '{}': {}", obs.index, reason);
    if (rejections) rejections->push_back(Rejection{obs.index, reason});
  };
  for (auto const& obs : observed) {
    if (obs.index.empty()) { reject(obs, "missing interface index"); continue; }
    if (!seen.insert(obs.index).second) { reject(obs, "duplicate interface index"); continue; }
    Interface itf;
    itf.index = obs.index;
    itf.description = obs.description;
    itf.display_key = obs.display_key.empty() ? obs.description : obs.display_key;
    itf.type = obs.type;
    itf.admin_status = obs.admin_status;
    itf.oper_status = obs.oper_status;
    if (resolver && obs.physical) {
      if (auto id = resolver->resolve(obs.physical->parameter_group, obs.physical->index)) {
        itf.physical_interface = *id;
      } else {
        logger()->debug("interface '{}': physical interface {}/{} not found", obs.index,
                        obs.physical->parameter_group, obs.physical->index);
      }
    }
    out.push_back(std::move(itf));
  }
  return out;
}

MergeReport merge_snapshot(FlowStore& store, const DeviceSnapshot& snapshot,
                           PhysicalInterfaceResolver* resolver) {
  MergeReport report;
  if (snapshot.interfaces) {
    auto rows = build_interfaces(*snapshot.interfaces, resolver, &report.rejections);
    report.interfaces = rows.size();
    store.replace_interfaces(std::move(rows));
  }
  report += merge_observed_flows(store, FlowDirection::Incoming, snapshot.incoming);
  report += merge_observed_flows(store, FlowDirection::Outgoing, snapshot.outgoing);
  return report;
}

} // namespace flowrecon::core
