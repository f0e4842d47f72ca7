/*
  DeviceEngine / EngineRegistry / ProvisioningExecutor.

  A failed table write leaves the in-memory store as merged; the
  synchronizer's cache only advances on success, so the next cycle (or an
  explicit synchronize()) retries it.
*/
#include "flowrecon/core/engine.hpp"
#include "flowrecon/core/aggregates.hpp"
#include "flowrecon/core/logging.hpp"

#include <algorithm>
#include <utility>

namespace flowrecon::core {

DeviceEngine::DeviceEngine(std::string device_id, TableStoragePtr storage,
                           ReconcileOptions opts,
                           std::shared_ptr<PhysicalInterfaceResolver> resolver)
  : device_id_(std::move(device_id)),
    sync_(std::move(storage)),
    opts_(opts),
    resolver_(std::move(resolver)) {
  validate(opts_);
}

SnapshotCycleReport DeviceEngine::apply_snapshot(const DeviceSnapshot& snapshot) {
  std::lock_guard<std::mutex> lock(mu_);
  SnapshotCycleReport report;
  report.merge = merge_snapshot(store_, snapshot, resolver_.get());
  report.aggregates_recomputed = recompute_aggregates(store_, opts_);
  report.sync = sync_.synchronize(store_);
  auto log = logger();
  log->debug("[{}] poll: +{} ~{} -{} absent {} rejected {}", device_id_, report.merge.added,
             report.merge.updated, report.merge.removed, report.merge.retained_absent,
             report.merge.rejected());
  if (report.merge.rejected() > 0) {
    log->warn("[{}] poll: {} entr{} rejected", device_id_, report.merge.rejected(),
              report.merge.rejected() == 1 ? "y" : "ies");
  }
  return report;
}

ProvisioningCycleReport DeviceEngine::apply_provisioning(const ProvisioningMessage& msg) {
  std::lock_guard<std::mutex> lock(mu_);
  ProvisioningCycleReport report;
  report.provisioning = handle_provisioning(store_, msg, opts_);
  if (opts_.auto_link_outgoing) {
    report.provisioning.linked = link_outgoing_flows(store_, report.provisioning);
  }
  report.aggregates_recomputed = recompute_aggregates(store_, opts_);
  report.sync = sync_.synchronize(store_);
  if (report.provisioning.rejected() > 0) {
    logger()->warn("[{}] provisioning: {} of {} flow(s) rejected", device_id_,
                   report.provisioning.rejected(), msg.flows.size());
  }
  return report;
}

SyncReport DeviceEngine::synchronize() {
  std::lock_guard<std::mutex> lock(mu_);
  recompute_aggregates(store_, opts_);
  return sync_.synchronize(store_);
}

void DeviceEngine::reset() {
  std::lock_guard<std::mutex> lock(mu_);
  store_.clear();
  sync_.invalidate();
  logger()->info("[{}] flow store reset", device_id_);
}

FlowStore DeviceEngine::store() const {
  std::lock_guard<std::mutex> lock(mu_);
  return store_;
}

ReconcileOptions DeviceEngine::options() const {
  std::lock_guard<std::mutex> lock(mu_);
  return opts_;
}

void DeviceEngine::set_options(const ReconcileOptions& opts) {
  validate(opts);
  std::lock_guard<std::mutex> lock(mu_);
  opts_ = opts;
  // Tolerances feed every status; recompute on the next cycle.
  store_.mark_all_dirty();
}

EngineRegistry::EngineRegistry(StorageFactory factory, ReconcileOptions defaults,
                               std::shared_ptr<PhysicalInterfaceResolver> resolver)
  : factory_(std::move(factory)), defaults_(defaults), resolver_(std::move(resolver)) {
  validate(defaults_);
}

DeviceEnginePtr EngineRegistry::device(const std::string& device_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = engines_.find(device_id);
  if (it != engines_.end()) return it->second;
  TableStoragePtr storage = factory_ ? factory_(device_id) : make_memory_table_storage();
  auto engine = std::make_shared<DeviceEngine>(device_id, std::move(storage), defaults_, resolver_);
  engines_.emplace(device_id, engine);
  logger()->info("created flow store for device '{}'", device_id);
  return engine;
}

DeviceEnginePtr EngineRegistry::find(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = engines_.find(device_id);
  return it == engines_.end() ? nullptr : it->second;
}

bool EngineRegistry::reset(const std::string& device_id) {
  DeviceEnginePtr engine = find(device_id);
  if (!engine) return false;
  engine->reset();
  return true;
}

void EngineRegistry::reset_all() {
  std::vector<DeviceEnginePtr> all;
  {
    std::lock_guard<std::mutex> lock(mu_);
    all.reserve(engines_.size());
    for (auto const& kv : engines_) all.push_back(kv.second);
  }
  for (auto const& engine : all) engine->reset();
}

std::vector<std::string> EngineRegistry::devices() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  out.reserve(engines_.size());
  for (auto const& kv : engines_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

ProvisioningCycleReport ProvisioningExecutor::execute(DeviceEngine& engine) const {
  return engine.apply_provisioning(message_);
}

ProvisioningCycleReport ProvisioningExecutor::execute(EngineRegistry& registry,
                                                      const std::string& device_id) const {
  return execute(*registry.device(device_id));
}

} // namespace flowrecon::core
