/*
  FlowStore: keyed interface and flow rows with dirty-interface tracking.

  Per-direction indexes (interface -> flow instances, peer_flow_key -> flow
  instances) are kept in step with every flow mutation so aggregate
  recomputation and link clearing do not need to scan the whole table.
*/
#include "flowrecon/core/flow_store.hpp"

#include <algorithm>
#include <stdexcept>

namespace flowrecon::core {

const Flow* FlowStore::get(FlowDirection dir, const Instance& instance) const {
  return rows(dir).find(instance);
}

void FlowStore::upsert(const Flow& flow) {
  if (flow.instance.empty()) {
    throw std::invalid_argument("FlowStore::upsert: flow instance must not be empty");
  }
  auto& table = rows(flow.direction);
  if (const Flow* prev = table.find(flow.instance)) {
    // Interface may change between observations; both sides are affected.
    if (prev->interface_key != flow.interface_key) {
      unindex(*prev);
    }
    if (prev->peer_flow_key != flow.peer_flow_key) {
      unindex_peer(*prev);
    }
    mark_dirty(prev->interface_key);
  }
  table.put(flow);
  by_interface(flow.direction)[flow.interface_key].insert(flow.instance);
  if (!flow.peer_flow_key.empty()) {
    by_peer(flow.direction)[flow.peer_flow_key].insert(flow.instance);
  }
  mark_dirty(flow.interface_key);
}

std::optional<Flow> FlowStore::remove(FlowDirection dir, const Instance& instance) {
  auto removed = rows(dir).erase(instance);
  if (removed) {
    unindex(*removed);
    unindex_peer(*removed);
    mark_dirty(removed->interface_key);
  }
  return removed;
}

const std::vector<Flow>& FlowStore::all(FlowDirection dir) const noexcept {
  return rows(dir).items();
}

std::size_t FlowStore::size(FlowDirection dir) const noexcept {
  return rows(dir).size();
}

std::vector<Instance> FlowStore::flows_on_interface(FlowDirection dir,
                                                    const Instance& interface_index) const {
  const auto& idx = dir == FlowDirection::Incoming ? incoming_by_if_ : outgoing_by_if_;
  auto it = idx.find(interface_index);
  if (it == idx.end()) return {};
  std::vector<Instance> out(it->second.begin(), it->second.end());
  // Sorted so summation order (and thus the floating-point result) is stable.
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<Instance> FlowStore::flows_linked_to(FlowDirection dir, const Instance& key) const {
  if (key.empty()) return {};
  const auto& idx = dir == FlowDirection::Incoming ? incoming_by_peer_ : outgoing_by_peer_;
  auto it = idx.find(key);
  if (it == idx.end()) return {};
  std::vector<Instance> out(it->second.begin(), it->second.end());
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<Instance> FlowStore::unresolved_flows(FlowDirection dir) const {
  std::vector<Instance> out;
  for (auto const& f : rows(dir).items()) {
    if (!interfaces_.contains(f.interface_key)) out.push_back(f.instance);
  }
  return out;
}

const Interface* FlowStore::get_interface(const Instance& index) const {
  return interfaces_.find(index);
}

bool FlowStore::has_interface(const Instance& index) const {
  return interfaces_.contains(index);
}

void FlowStore::upsert_interface(const Interface& itf) {
  if (itf.index.empty()) {
    throw std::invalid_argument("FlowStore::upsert_interface: interface index must not be empty");
  }
  interfaces_.put(itf);
  mark_dirty(itf.index);
}

bool FlowStore::remove_interface(const Instance& index) {
  if (!interfaces_.erase(index)) return false;
  mark_dirty(index);
  return true;
}

void FlowStore::replace_interfaces(std::vector<Interface> interfaces) {
  for (auto const& itf : interfaces) {
    if (itf.index.empty()) {
      throw std::invalid_argument("FlowStore::replace_interfaces: interface index must not be empty");
    }
  }
  for (auto const& old : interfaces_.items()) dirty_.insert(old.index);
  interfaces_.clear();
  for (auto& itf : interfaces) {
    dirty_.insert(itf.index);
    interfaces_.put(std::move(itf));
  }
  ++interface_generation_;
}

void FlowStore::set_aggregates(const Instance& index, const InterfaceAggregates& agg) {
  if (Interface* itf = interfaces_.find(index)) itf->aggregates = agg;
}

void FlowStore::set_expected_bitrate_status(FlowDirection dir, const Instance& instance,
                                            BitrateStatus status) {
  if (Flow* f = rows(dir).find(instance)) f->expected_bitrate_status = status;
}

void FlowStore::mark_dirty(const Instance& index) {
  if (!index.empty()) dirty_.insert(index);
}

void FlowStore::mark_all_dirty() {
  for (auto const& itf : interfaces_.items()) dirty_.insert(itf.index);
  for (auto const& kv : incoming_by_if_) mark_dirty(kv.first);
  for (auto const& kv : outgoing_by_if_) mark_dirty(kv.first);
}

void FlowStore::clear() noexcept {
  interfaces_.clear();
  incoming_.clear();
  outgoing_.clear();
  incoming_by_if_.clear();
  outgoing_by_if_.clear();
  incoming_by_peer_.clear();
  outgoing_by_peer_.clear();
  dirty_.clear();
  ++interface_generation_;
}

void FlowStore::unindex(const Flow& f) {
  auto& idx = by_interface(f.direction);
  auto it = idx.find(f.interface_key);
  if (it == idx.end()) return;
  it->second.erase(f.instance);
  if (it->second.empty()) idx.erase(it);
}

void FlowStore::unindex_peer(const Flow& f) {
  if (f.peer_flow_key.empty()) return;
  auto& idx = by_peer(f.direction);
  auto it = idx.find(f.peer_flow_key);
  if (it == idx.end()) return;
  it->second.erase(f.instance);
  if (it->second.empty()) idx.erase(it);
}

} // namespace flowrecon::core
