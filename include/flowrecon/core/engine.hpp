/*
  DeviceEngine: one device's store, synchronizer and serialisation point.
  EngineRegistry: process-wide map of device id to DeviceEngine.

  Every entry point of a DeviceEngine runs a full cycle (merge, aggregates,
  table write) under the engine's mutex, so a provisioning add can never
  interleave with a poll's absence check on the same store. Engines of
  different devices share nothing and may run in parallel.
*/
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "flowrecon/core/flow_store.hpp"
#include "flowrecon/core/options.hpp"
#include "flowrecon/core/provisioning.hpp"
#include "flowrecon/core/reconciler.hpp"
#include "flowrecon/core/resolver.hpp"
#include "flowrecon/core/table_sync.hpp"

namespace flowrecon::core {

struct SnapshotCycleReport {
  MergeReport merge {};
  std::size_t aggregates_recomputed {0};
  SyncReport sync {};
};

struct ProvisioningCycleReport {
  ProvisioningResult provisioning {};
  std::size_t aggregates_recomputed {0};
  SyncReport sync {};
};

class DeviceEngine {
public:
  // Throws ValueError for invalid options, std::invalid_argument for a null
  // storage. `resolver` may be null.
  DeviceEngine(std::string device_id, TableStoragePtr storage,
               ReconcileOptions opts = {},
               std::shared_ptr<PhysicalInterfaceResolver> resolver = nullptr);

  DeviceEngine(const DeviceEngine&) = delete;
  DeviceEngine& operator=(const DeviceEngine&) = delete;

  // Poll path: merge snapshot, recompute aggregates, write tables.
  SnapshotCycleReport apply_snapshot(const DeviceSnapshot& snapshot);

  // Provisioning path: apply message, link added outgoing flows (when
  // configured), recompute aggregates, write tables.
  ProvisioningCycleReport apply_provisioning(const ProvisioningMessage& msg);

  // Recompute pending aggregates and write pending rows, e.g. to retry after
  // a failed write or to apply new tolerances without waiting for a poll.
  SyncReport synchronize();

  // Discard all cached state and force a full table rewrite on next sync.
  void reset();

  // Copy of the store taken under the lock.
  [[nodiscard]] FlowStore store() const;

  [[nodiscard]] ReconcileOptions options() const;
  void set_options(const ReconcileOptions& opts);

  [[nodiscard]] const std::string& device_id() const noexcept { return device_id_; }

private:
  std::string device_id_;
  mutable std::mutex mu_;
  FlowStore store_;
  TableSynchronizer sync_;
  ReconcileOptions opts_;
  std::shared_ptr<PhysicalInterfaceResolver> resolver_;
};

using DeviceEnginePtr = std::shared_ptr<DeviceEngine>;

class EngineRegistry {
public:
  using StorageFactory = std::function<TableStoragePtr(const std::string& device_id)>;

  // Without a factory each device gets its own MemoryTableStorage.
  explicit EngineRegistry(StorageFactory factory = {}, ReconcileOptions defaults = {},
                          std::shared_ptr<PhysicalInterfaceResolver> resolver = nullptr);

  // Get or create the engine of `device_id`.
  DeviceEnginePtr device(const std::string& device_id);
  // nullptr if the device has no engine yet.
  [[nodiscard]] DeviceEnginePtr find(const std::string& device_id) const;

  // Discard the cached state of one device. Returns false if unknown.
  bool reset(const std::string& device_id);
  void reset_all();

  [[nodiscard]] std::vector<std::string> devices() const;

private:
  mutable std::mutex mu_;
  StorageFactory factory_;
  ReconcileOptions defaults_;
  std::shared_ptr<PhysicalInterfaceResolver> resolver_;
  std::unordered_map<std::string, DeviceEnginePtr> engines_;
};

// Executes a decoded provisioning message received from the flow-engineering
// system against the engine of the addressed device.
class ProvisioningExecutor {
public:
  explicit ProvisioningExecutor(ProvisioningMessage message) : message_(std::move(message)) {}

  ProvisioningCycleReport execute(DeviceEngine& engine) const;
  ProvisioningCycleReport execute(EngineRegistry& registry, const std::string& device_id) const;

  [[nodiscard]] const ProvisioningMessage& message() const noexcept { return message_; }

private:
  ProvisioningMessage message_;
};

} // namespace flowrecon::core
