/* FlowStore: canonical in-memory interfaces and flows for one device. */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "flowrecon/core/entities.hpp"
#include "flowrecon/core/types.hpp"

namespace flowrecon::core {

namespace detail {

// Rows keyed by instance string, iterated in insertion order. Removal keeps
// the relative order of the remaining rows.
template <typename T, Instance T::*Key>
class KeyedRows {
public:
  [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
  [[nodiscard]] bool contains(const Instance& key) const { return index_.count(key) != 0; }

  [[nodiscard]] const T* find(const Instance& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &items_[it->second];
  }
  [[nodiscard]] T* find(const Instance& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &items_[it->second];
  }

  // Insert or overwrite in place (an overwrite keeps the original position).
  T& put(T value) {
    auto it = index_.find(value.*Key);
    if (it != index_.end()) {
      items_[it->second] = std::move(value);
      return items_[it->second];
    }
    Instance key = value.*Key;
    items_.push_back(std::move(value));
    index_.emplace(std::move(key), items_.size() - 1);
    return items_.back();
  }

  std::optional<T> erase(const Instance& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    const std::size_t pos = it->second;
    std::optional<T> out(std::move(items_[pos]));
    index_.erase(it);
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(pos));
    for (std::size_t i = pos; i < items_.size(); ++i) index_[items_[i].*Key] = i;
    return out;
  }

  void clear() noexcept {
    items_.clear();
    index_.clear();
  }

  [[nodiscard]] const std::vector<T>& items() const noexcept { return items_; }

private:
  std::vector<T> items_;
  std::unordered_map<Instance, std::size_t> index_;
};

} // namespace detail

// FlowStore is the single source of truth for the current reconciliation
// cycle. Every mutation marks the affected interface(s) dirty so the
// aggregate calculator knows what to recompute. Derived fields (interface
// aggregates, per-flow expected-bitrate status) are written back through the
// dedicated setters, which do not mark anything dirty.
class FlowStore {
public:
  FlowStore() = default;

  // ---- Flows ----
  [[nodiscard]] const Flow* get(FlowDirection dir, const Instance& instance) const;
  // Insert or replace by (direction, instance). Throws std::invalid_argument
  // on an empty instance.
  void upsert(const Flow& flow);
  // Returns the removed record, or nullopt if there was none.
  std::optional<Flow> remove(FlowDirection dir, const Instance& instance);
  [[nodiscard]] const std::vector<Flow>& all(FlowDirection dir) const noexcept;
  [[nodiscard]] std::size_t size(FlowDirection dir) const noexcept;

  // Instances of flows in `dir` whose interface_key equals `interface_index`.
  [[nodiscard]] std::vector<Instance> flows_on_interface(FlowDirection dir,
                                                         const Instance& interface_index) const;
  // Flows in `dir` whose peer_flow_key points at `key` (reverse FK lookup),
  // sorted by instance.
  [[nodiscard]] std::vector<Instance> flows_linked_to(FlowDirection dir, const Instance& key) const;
  // Flows whose interface_key has no Interface row.
  [[nodiscard]] std::vector<Instance> unresolved_flows(FlowDirection dir) const;

  // ---- Interfaces ----
  [[nodiscard]] const Interface* get_interface(const Instance& index) const;
  [[nodiscard]] bool has_interface(const Instance& index) const;
  void upsert_interface(const Interface& itf);
  bool remove_interface(const Instance& index);
  // Swap the whole interface set. Marks every old and new interface dirty and
  // bumps interface_generation().
  void replace_interfaces(std::vector<Interface> interfaces);
  [[nodiscard]] const std::vector<Interface>& interfaces() const noexcept { return interfaces_.items(); }
  [[nodiscard]] std::uint64_t interface_generation() const noexcept { return interface_generation_; }

  // ---- Derived fields ----
  void set_aggregates(const Instance& index, const InterfaceAggregates& agg);
  void set_expected_bitrate_status(FlowDirection dir, const Instance& instance, BitrateStatus status);

  // ---- Dirty tracking ----
  [[nodiscard]] const std::unordered_set<Instance>& dirty_interfaces() const noexcept { return dirty_; }
  void mark_dirty(const Instance& index);
  void mark_all_dirty();
  void clear_dirty() noexcept { dirty_.clear(); }

  // Drop all rows and derived state.
  void clear() noexcept;

private:
  using FlowRows = detail::KeyedRows<Flow, &Flow::instance>;
  using InterfaceRows = detail::KeyedRows<Interface, &Interface::index>;

  FlowRows& rows(FlowDirection dir) noexcept {
    return dir == FlowDirection::Incoming ? incoming_ : outgoing_;
  }
  const FlowRows& rows(FlowDirection dir) const noexcept {
    return dir == FlowDirection::Incoming ? incoming_ : outgoing_;
  }
  std::unordered_map<Instance, std::unordered_set<Instance>>& by_interface(FlowDirection dir) noexcept {
    return dir == FlowDirection::Incoming ? incoming_by_if_ : outgoing_by_if_;
  }
  std::unordered_map<Instance, std::unordered_set<Instance>>& by_peer(FlowDirection dir) noexcept {
    return dir == FlowDirection::Incoming ? incoming_by_peer_ : outgoing_by_peer_;
  }
  void unindex(const Flow& f);
  void unindex_peer(const Flow& f);

  InterfaceRows interfaces_;
  FlowRows incoming_;
  FlowRows outgoing_;
  // interface index -> flow instances referencing it
  std::unordered_map<Instance, std::unordered_set<Instance>> incoming_by_if_;
  std::unordered_map<Instance, std::unordered_set<Instance>> outgoing_by_if_;
  // peer_flow_key -> flow instances carrying it
  std::unordered_map<Instance, std::unordered_set<Instance>> incoming_by_peer_;
  std::unordered_map<Instance, std::unordered_set<Instance>> outgoing_by_peer_;
  std::unordered_set<Instance> dirty_;
  std::uint64_t interface_generation_ {0};
};

} // namespace flowrecon::core
