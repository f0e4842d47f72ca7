/*
  TableSynchronizer: row-level diff between the FlowStore and the tables.

  Interfaces take the bulk path whenever the store's interface set was
  replaced since the last successful write (generation changed), otherwise
  the incremental path. Flows are always incremental.
*/
#include "flowrecon/core/table_sync.hpp"
#include "flowrecon/core/logging.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace flowrecon::core {

// ---- MemoryTableStorage ----

void MemoryTableStorage::upsert_interface(const Interface& row) {
  interfaces_[row.index] = row;
  ++writes_;
}

void MemoryTableStorage::upsert_flow(const Flow& row) {
  auto& table = row.direction == FlowDirection::Incoming ? incoming_ : outgoing_;
  table[row.instance] = row;
  ++writes_;
}

void MemoryTableStorage::delete_row(Table table, const Instance& instance) {
  std::size_t erased = 0;
  switch (table) {
    case Table::Interfaces: erased = interfaces_.erase(instance); break;
    case Table::IncomingFlows: erased = incoming_.erase(instance); break;
    case Table::OutgoingFlows: erased = outgoing_.erase(instance); break;
  }
  writes_ += erased;
}

void MemoryTableStorage::replace_interfaces(const std::vector<Interface>& rows) {
  std::unordered_map<Instance, Interface> next;
  next.reserve(rows.size());
  for (auto const& row : rows) next.emplace(row.index, row);
  interfaces_.swap(next);
  ++writes_;
}

const Interface* MemoryTableStorage::interface_row(const Instance& instance) const {
  auto it = interfaces_.find(instance);
  return it == interfaces_.end() ? nullptr : &it->second;
}

const Flow* MemoryTableStorage::flow_row(FlowDirection dir, const Instance& instance) const {
  const auto& table = dir == FlowDirection::Incoming ? incoming_ : outgoing_;
  auto it = table.find(instance);
  return it == table.end() ? nullptr : &it->second;
}

std::size_t MemoryTableStorage::row_count(Table table) const noexcept {
  switch (table) {
    case Table::Interfaces: return interfaces_.size();
    case Table::IncomingFlows: return incoming_.size();
    case Table::OutgoingFlows: return outgoing_.size();
  }
  return 0;
}

std::shared_ptr<MemoryTableStorage> make_memory_table_storage() {
  return std::make_shared<MemoryTableStorage>();
}

// ---- TableSynchronizer ----

namespace {

// Runs one storage call; on failure records it and returns false.
template <typename Fn>
bool try_write(Fn&& fn, Table table, const Instance& instance, SyncReport& report) {
  try {
    fn();
    return true;
  } catch (const std::exception& e) {
    logger()->error("write to {} failed for '{}': {}", to_string(table), instance, e.what());
    report.failures.push_back(WriteFailure{table, instance, e.what()});
    return false;
  }
}

template <typename Row>
std::vector<Instance> stale_keys(const std::unordered_map<Instance, Row>& written,
                                 const std::unordered_map<Instance, const Row*>& wanted) {
  std::vector<Instance> out;
  for (auto const& kv : written) {
    if (!wanted.count(kv.first)) out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace

TableSynchronizer::TableSynchronizer(TableStoragePtr storage)
  : storage_(std::move(storage)) {
  if (!storage_) {
    throw std::invalid_argument("TableSynchronizer: storage must not be null");
  }
}

SyncReport TableSynchronizer::synchronize(const FlowStore& store) {
  SyncReport report;
  sync_interfaces(store, report);
  sync_flows(store, FlowDirection::Incoming, report);
  sync_flows(store, FlowDirection::Outgoing, report);
  if (report.failures.empty()) full_rewrite_ = false;
  if (!report.noop()) {
    logger()->debug("sync: {} written, {} deleted, {} omitted, {} failed{}", report.written,
                    report.deleted, report.omitted, report.failed(),
                    report.interfaces_replaced ? ", interfaces replaced" : "");
  }
  return report;
}

void TableSynchronizer::invalidate() noexcept {
  full_rewrite_ = true;
}

void TableSynchronizer::sync_interfaces(const FlowStore& store, SyncReport& report) {
  const auto& rows = store.interfaces();
  if (full_rewrite_ || store.interface_generation() != written_generation_) {
    if (!try_write([&] { storage_->replace_interfaces(rows); }, Table::Interfaces, Instance{}, report)) {
      return;
    }
    written_interfaces_.clear();
    for (auto const& row : rows) written_interfaces_.emplace(row.index, row);
    written_generation_ = store.interface_generation();
    report.interfaces_replaced = true;
    return;
  }

  std::unordered_map<Instance, const Interface*> wanted;
  wanted.reserve(rows.size());
  for (auto const& row : rows) {
    wanted.emplace(row.index, &row);
    auto it = written_interfaces_.find(row.index);
    if (it != written_interfaces_.end() && it->second == row) continue;
    if (try_write([&] { storage_->upsert_interface(row); }, Table::Interfaces, row.index, report)) {
      written_interfaces_[row.index] = row;
      ++report.written;
    }
  }
  for (auto const& key : stale_keys(written_interfaces_, wanted)) {
    if (try_write([&] { storage_->delete_row(Table::Interfaces, key); }, Table::Interfaces, key, report)) {
      written_interfaces_.erase(key);
      ++report.deleted;
    }
  }
}

void TableSynchronizer::sync_flows(const FlowStore& store, FlowDirection dir, SyncReport& report) {
  auto& written = dir == FlowDirection::Incoming ? written_incoming_ : written_outgoing_;
  const Table table = table_for(dir);

  std::unordered_map<Instance, const Flow*> wanted;
  wanted.reserve(store.size(dir));
  for (auto const& row : store.all(dir)) {
    // The interface row must be both in the store and persisted.
    if (!store.has_interface(row.interface_key) || !written_interfaces_.count(row.interface_key)) {
      ++report.omitted;
      continue;
    }
    wanted.emplace(row.instance, &row);
    auto it = written.find(row.instance);
    if (!full_rewrite_ && it != written.end() && it->second == row) continue;
    if (try_write([&] { storage_->upsert_flow(row); }, table, row.instance, report)) {
      written[row.instance] = row;
      ++report.written;
    }
  }
  for (auto const& key : stale_keys(written, wanted)) {
    if (try_write([&] { storage_->delete_row(table, key); }, table, key, report)) {
      written.erase(key);
      ++report.deleted;
    }
  }
}

} // namespace flowrecon::core
