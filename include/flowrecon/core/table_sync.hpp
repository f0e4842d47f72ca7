/*
  Table storage interface and the synchronizer that projects a FlowStore onto it.

  The storage is the host's persisted table representation (Interfaces,
  IncomingFlows, OutgoingFlows), each keyed by instance. Implementations report
  a failed write by throwing WriteError.
*/
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "flowrecon/core/entities.hpp"
#include "flowrecon/core/flow_store.hpp"
#include "flowrecon/core/types.hpp"

namespace flowrecon::core {

class TableStorage {
public:
  virtual ~TableStorage() noexcept = default;

  virtual void upsert_interface(const Interface& row) = 0;
  // Table chosen by row.direction.
  virtual void upsert_flow(const Flow& row) = 0;
  virtual void delete_row(Table table, const Instance& instance) = 0;
  // Atomically swap the whole interface set.
  virtual void replace_interfaces(const std::vector<Interface>& rows) = 0;
};

using TableStoragePtr = std::shared_ptr<TableStorage>;

// In-process storage; the default host storage and an inspection point for
// tests and bindings.
class MemoryTableStorage final : public TableStorage {
public:
  void upsert_interface(const Interface& row) override;
  void upsert_flow(const Flow& row) override;
  void delete_row(Table table, const Instance& instance) override;
  void replace_interfaces(const std::vector<Interface>& rows) override;

  [[nodiscard]] const Interface* interface_row(const Instance& instance) const;
  [[nodiscard]] const Flow* flow_row(FlowDirection dir, const Instance& instance) const;
  [[nodiscard]] std::size_t row_count(Table table) const noexcept;
  // Number of storage calls that changed something, across all tables.
  [[nodiscard]] std::uint64_t write_count() const noexcept { return writes_; }

private:
  std::unordered_map<Instance, Interface> interfaces_;
  std::unordered_map<Instance, Flow> incoming_;
  std::unordered_map<Instance, Flow> outgoing_;
  std::uint64_t writes_ {0};
};

[[nodiscard]] std::shared_ptr<MemoryTableStorage> make_memory_table_storage();

struct WriteFailure {
  Table table { Table::Interfaces };
  Instance instance {};  // empty for a failed bulk interface replace
  std::string reason {};
};

struct SyncReport {
  std::size_t written {0};   // rows upserted
  std::size_t deleted {0};   // rows deleted
  std::size_t omitted {0};   // flows held back for an unresolved interface
  bool interfaces_replaced {false};
  std::vector<WriteFailure> failures {};

  [[nodiscard]] std::size_t failed() const noexcept { return failures.size(); }
  [[nodiscard]] bool noop() const noexcept {
    return written == 0 && deleted == 0 && !interfaces_replaced && failures.empty();
  }
};

// TableSynchronizer diffs the store against what it last wrote and emits only
// changed, added and removed rows. Its last-written cache is updated per row
// only after the storage call succeeds, so a failed write is retried by the
// next synchronize() without touching in-memory state.
//
// Flows whose interface has no Interface row, or whose Interface row has not
// been written successfully, are omitted (and deleted from the table if
// written earlier) so no dangling interface reference is persisted.
class TableSynchronizer {
public:
  explicit TableSynchronizer(TableStoragePtr storage);

  SyncReport synchronize(const FlowStore& store);

  // The next synchronize() rewrites every row and still deletes rows written
  // earlier that the store no longer holds.
  void invalidate() noexcept;

  [[nodiscard]] const TableStoragePtr& storage() const noexcept { return storage_; }

private:
  void sync_interfaces(const FlowStore& store, SyncReport& report);
  void sync_flows(const FlowStore& store, FlowDirection dir, SyncReport& report);

  TableStoragePtr storage_;
  std::unordered_map<Instance, Interface> written_interfaces_;
  std::unordered_map<Instance, Flow> written_incoming_;
  std::unordered_map<Instance, Flow> written_outgoing_;
  std::uint64_t written_generation_ {0};
  bool full_rewrite_ {false};
};

} // namespace flowrecon::core
