#include <gtest/gtest.h>

#include <thread>

#include "flowrecon/core/engine.hpp"
#include "test_utils.hpp"

using namespace flowrecon::core;
using namespace flowrecon::core::test;

namespace {

const Instance kA = "10.1.1.2/239.0.0.1/1";
const Instance kB = "10.1.1.3/239.0.0.2/1";

ObservedFlow observed_a(Bitrate bitrate) {
  return make_observed(kA, "239.0.0.1", "10.1.1.2", "1", bitrate);
}

ObservedFlow observed_b(Bitrate bitrate) {
  return make_observed(kB, "239.0.0.2", "10.1.1.3", "1", bitrate);
}

ProvisioningMessage provision_a(ProvisioningAction action, Bitrate expected = 100.0) {
  return make_message(action, {make_provisioned("", "239.0.0.1", "10.1.1.2", "1", expected)});
}

} // namespace

TEST(DeviceEngine, ProvisionedFlowThatStopsIsRetainedAsAbsent) {
  auto storage = make_memory_table_storage();
  DeviceEngine engine("dev-1", storage);

  engine.apply_snapshot(make_snapshot({observed_a(50.0), observed_b(10.0)}));
  auto prov = engine.apply_provisioning(provision_a(ProvisioningAction::Add));
  ASSERT_EQ(prov.provisioning.added_incoming.size(), 1u);
  EXPECT_EQ(storage->flow_row(FlowDirection::Incoming, kA)->expected_bitrate_status, BitrateStatus::Low);
  auto before = storage->interface_row("1")->aggregates;
  EXPECT_EQ(before.rx_flows, 2);
  EXPECT_DOUBLE_EQ(before.expected_rx_bitrate, 100.0);

  auto poll = engine.apply_snapshot(make_snapshot({observed_b(10.0)}));
  EXPECT_EQ(poll.merge.retained_absent, 1u);
  const Flow* a = storage->flow_row(FlowDirection::Incoming, kA);
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(lifecycle_state(*a), FlowLifecycleState::ProvisionedAbsent);
  EXPECT_DOUBLE_EQ(a->bitrate, 0.0);

  auto after = storage->interface_row("1")->aggregates;
  EXPECT_EQ(after.rx_flows, before.rx_flows - 1);
  EXPECT_DOUBLE_EQ(after.rx_bitrate, 10.0);
  EXPECT_DOUBLE_EQ(after.expected_rx_bitrate, 100.0);
  EXPECT_EQ(after.expected_rx_flows, 1);
  EXPECT_EQ(after.rx_bitrate_status, BitrateStatus::Low);
}

TEST(DeviceEngine, FullLifecycleEndsWithNoRow) {
  auto storage = make_memory_table_storage();
  DeviceEngine engine("dev-1", storage);
  engine.apply_snapshot(make_snapshot({}));

  engine.apply_provisioning(provision_a(ProvisioningAction::Add));
  EXPECT_EQ(lifecycle_state(storage->flow_row(FlowDirection::Incoming, kA)),
            FlowLifecycleState::ProvisionedAbsent);

  engine.apply_snapshot(make_snapshot({observed_a(98.0)}));
  const Flow* a = storage->flow_row(FlowDirection::Incoming, kA);
  EXPECT_EQ(lifecycle_state(a), FlowLifecycleState::ProvisionedPresent);
  EXPECT_EQ(a->expected_bitrate_status, BitrateStatus::Normal);

  engine.apply_snapshot(make_snapshot({}));
  EXPECT_EQ(lifecycle_state(storage->flow_row(FlowDirection::Incoming, kA)),
            FlowLifecycleState::ProvisionedAbsent);

  auto removed = engine.apply_provisioning(provision_a(ProvisioningAction::Remove));
  EXPECT_EQ(removed.provisioning.removed, 1u);
  EXPECT_EQ(storage->flow_row(FlowDirection::Incoming, kA), nullptr);
  EXPECT_EQ(storage->interface_row("1")->aggregates.expected_rx_flows, 0);
}

TEST(DeviceEngine, AutoLinksOutgoingFlowsWhenEnabled) {
  auto storage = make_memory_table_storage();
  DeviceEngine engine("dev-1", storage);
  engine.apply_snapshot(make_snapshot({observed_a(50.0)}));
  auto out = make_provisioned("", "239.0.0.1", "10.1.1.2", "1", 50.0, FlowDirection::Outgoing);
  auto report = engine.apply_provisioning(make_message(ProvisioningAction::Add, {out}));
  EXPECT_EQ(report.provisioning.linked, 1u);
  EXPECT_EQ(storage->flow_row(FlowDirection::Outgoing, kA)->peer_flow_key, kA);

  ReconcileOptions opts;
  opts.auto_link_outgoing = false;
  DeviceEngine plain("dev-2", make_memory_table_storage(), opts);
  plain.apply_snapshot(make_snapshot({observed_a(50.0)}));
  auto unlinked = plain.apply_provisioning(make_message(ProvisioningAction::Add, {out}));
  EXPECT_EQ(unlinked.provisioning.linked, 0u);
  EXPECT_TRUE(plain.store().get(FlowDirection::Outgoing, kA)->peer_flow_key.empty());
}

TEST(DeviceEngine, FailedWriteLeavesStoreAndRetries) {
  auto storage = std::make_shared<FlakyTableStorage>();
  DeviceEngine engine("dev-1", storage);
  engine.apply_snapshot(make_snapshot({observed_a(50.0)}));

  storage->fail = true;
  auto report = engine.apply_snapshot(make_snapshot({observed_a(60.0)}));
  EXPECT_GT(report.sync.failed(), 0u);
  EXPECT_DOUBLE_EQ(engine.store().get(FlowDirection::Incoming, kA)->bitrate, 60.0);
  EXPECT_DOUBLE_EQ(storage->inner.flow_row(FlowDirection::Incoming, kA)->bitrate, 50.0);

  storage->fail = false;
  auto retry = engine.synchronize();
  EXPECT_EQ(retry.failed(), 0u);
  EXPECT_DOUBLE_EQ(storage->inner.flow_row(FlowDirection::Incoming, kA)->bitrate, 60.0);
  EXPECT_DOUBLE_EQ(storage->inner.interface_row("1")->aggregates.rx_bitrate, 60.0);
}

TEST(DeviceEngine, SetOptionsValidatesAndRecomputes) {
  auto storage = make_memory_table_storage();
  DeviceEngine engine("dev-1", storage);
  engine.apply_snapshot(make_snapshot({observed_a(50.0)}));
  engine.apply_provisioning(provision_a(ProvisioningAction::Add));
  EXPECT_EQ(storage->interface_row("1")->aggregates.rx_bitrate_status, BitrateStatus::Low);

  ReconcileOptions bad;
  bad.bitrate_tolerance_percent = -5.0;
  EXPECT_THROW(engine.set_options(bad), ValueError);
  EXPECT_DOUBLE_EQ(engine.options().bitrate_tolerance_percent, 10.0);

  ReconcileOptions wide;
  wide.bitrate_tolerance_percent = 60.0;
  engine.set_options(wide);
  engine.synchronize();
  EXPECT_EQ(storage->interface_row("1")->aggregates.rx_bitrate_status, BitrateStatus::Normal);
  EXPECT_EQ(storage->flow_row(FlowDirection::Incoming, kA)->expected_bitrate_status, BitrateStatus::Normal);
}

TEST(DeviceEngine, ConstructorRejectsBadInput) {
  EXPECT_THROW(DeviceEngine("dev-1", nullptr), std::invalid_argument);
  ReconcileOptions bad;
  bad.flow_count_tolerance = -1;
  EXPECT_THROW(DeviceEngine("dev-1", make_memory_table_storage(), bad), ValueError);
}

TEST(DeviceEngine, ResetDropsStateAndClearsTablesOnNextSync) {
  auto storage = make_memory_table_storage();
  DeviceEngine engine("dev-1", storage);
  engine.apply_snapshot(make_snapshot({observed_a(50.0)}, {observed_b(5.0)}));
  engine.reset();
  EXPECT_EQ(engine.store().size(FlowDirection::Incoming), 0u);

  engine.synchronize();
  EXPECT_EQ(storage->row_count(Table::Interfaces), 0u);
  EXPECT_EQ(storage->row_count(Table::IncomingFlows), 0u);
  EXPECT_EQ(storage->row_count(Table::OutgoingFlows), 0u);
}

TEST(DeviceEngine, ResolverAppliesToPolledInterfaces) {
  auto resolver = std::make_shared<MapResolver>();
  resolver->entries["1000:3"] = "slot1/port3";
  auto storage = make_memory_table_storage();
  DeviceEngine engine("dev-1", storage, ReconcileOptions{}, resolver);
  auto snapshot = make_snapshot({});
  (*snapshot.interfaces)[0].physical = PhysicalInterfaceRef{1000, "3"};
  engine.apply_snapshot(snapshot);
  EXPECT_EQ(storage->interface_row("1")->physical_interface, "slot1/port3");
}

// A poll and a provisioning message racing on one device must each see a
// consistent store: every cycle runs to completion under the engine lock.
TEST(DeviceEngine, ConcurrentPollAndProvisioningStayConsistent) {
  auto storage = make_memory_table_storage();
  auto engine = std::make_shared<DeviceEngine>("dev-1", storage);
  engine->apply_snapshot(make_snapshot({}));

  constexpr int kRounds = 200;
  std::thread poller([&] {
    for (int i = 0; i < kRounds; ++i) {
      if (i % 2 == 0) {
        engine->apply_snapshot(make_snapshot({observed_a(50.0 + i), observed_b(10.0)}));
      } else {
        engine->apply_snapshot(make_snapshot({observed_b(10.0)}));
      }
    }
  });
  std::thread provisioner([&] {
    for (int i = 0; i < kRounds; ++i) {
      engine->apply_provisioning(provision_a(i % 3 == 2 ? ProvisioningAction::Remove
                                                        : ProvisioningAction::Add));
    }
  });
  poller.join();
  provisioner.join();

  FlowStore store = engine->store();
  EXPECT_TRUE(no_local_absent_rows(store));
  EXPECT_TRUE(engine->synchronize().noop());
  for (FlowDirection dir : {FlowDirection::Incoming, FlowDirection::Outgoing}) {
    EXPECT_EQ(storage->row_count(table_for(dir)), store.size(dir));
    for (auto const& f : store.all(dir)) {
      const Flow* row = storage->flow_row(dir, f.instance);
      ASSERT_NE(row, nullptr);
      EXPECT_EQ(*row, f);
    }
  }
}

TEST(EngineRegistry, CreatesOneEnginePerDevice) {
  std::vector<std::string> created;
  EngineRegistry registry([&](const std::string& id) -> TableStoragePtr {
    created.push_back(id);
    return make_memory_table_storage();
  });
  auto a = registry.device("dev-b");
  auto b = registry.device("dev-a");
  EXPECT_EQ(registry.device("dev-b"), a);
  EXPECT_NE(a, b);
  EXPECT_EQ(created.size(), 2u);
  EXPECT_EQ(registry.devices(), (std::vector<std::string>{"dev-a", "dev-b"}));
  EXPECT_EQ(registry.find("dev-c"), nullptr);
  EXPECT_EQ(a->device_id(), "dev-b");
}

TEST(EngineRegistry, ResetAffectsOnlyNamedDevice) {
  EngineRegistry registry;
  registry.device("dev-1")->apply_snapshot(make_snapshot({observed_a(50.0)}));
  registry.device("dev-2")->apply_snapshot(make_snapshot({observed_a(50.0)}));

  EXPECT_FALSE(registry.reset("unknown"));
  EXPECT_TRUE(registry.reset("dev-1"));
  EXPECT_EQ(registry.find("dev-1")->store().size(FlowDirection::Incoming), 0u);
  EXPECT_EQ(registry.find("dev-2")->store().size(FlowDirection::Incoming), 1u);

  registry.reset_all();
  EXPECT_EQ(registry.find("dev-2")->store().size(FlowDirection::Incoming), 0u);
  EXPECT_EQ(registry.devices().size(), 2u);
}

TEST(EngineRegistry, DefaultsApplyToNewEngines) {
  ReconcileOptions defaults;
  defaults.ignore_destination_port = true;
  EngineRegistry registry({}, defaults);
  EXPECT_TRUE(registry.device("dev-1")->options().ignore_destination_port);
}

TEST(ProvisioningExecutor, ExecutesAgainstAddressedDevice) {
  EngineRegistry registry;
  registry.device("dev-1")->apply_snapshot(make_snapshot({observed_a(50.0)}));
  ProvisioningExecutor exec(provision_a(ProvisioningAction::Add, 40.0));
  auto report = exec.execute(registry, "dev-1");
  ASSERT_EQ(report.provisioning.added_incoming.size(), 1u);
  EXPECT_EQ(report.provisioning.added_incoming[0].instance, kA);
  EXPECT_EQ(lifecycle_state(registry.find("dev-1")->store().get(FlowDirection::Incoming, kA)),
            FlowLifecycleState::ProvisionedPresent);

  // A device with no prior poll gets an engine on demand.
  exec.execute(registry, "dev-9");
  EXPECT_EQ(lifecycle_state(registry.find("dev-9")->store().get(FlowDirection::Incoming, kA)),
            FlowLifecycleState::ProvisionedAbsent);
  EXPECT_EQ(exec.message().flows.size(), 1u);
}

TEST(DeviceEngine, FlowsAreHeldBackWhileInterfaceReplaceFails) {
  auto storage = std::make_shared<FlakyTableStorage>();
  storage->fail = true;
  storage->fail_only = {""};
  DeviceEngine engine("dev-1", storage);
  auto report = engine.apply_snapshot(make_snapshot({observed_a(50.0)}));
  EXPECT_EQ(report.sync.failed(), 1u);
  EXPECT_EQ(storage->inner.row_count(Table::Interfaces), 0u);
  EXPECT_EQ(storage->inner.row_count(Table::IncomingFlows), 0u);
  EXPECT_NE(engine.store().get(FlowDirection::Incoming, kA), nullptr);

  storage->fail = false;
  engine.synchronize();
  EXPECT_EQ(storage->inner.row_count(Table::Interfaces), 1u);
  EXPECT_NE(storage->inner.flow_row(FlowDirection::Incoming, kA), nullptr);
}
