#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "flowrecon/core/entities.hpp"
#include "flowrecon/core/error.hpp"
#include "flowrecon/core/flow_store.hpp"
#include "flowrecon/core/provisioning.hpp"
#include "flowrecon/core/reconciler.hpp"
#include "flowrecon/core/resolver.hpp"
#include "flowrecon/core/table_sync.hpp"

namespace flowrecon::core::test {

// Multicast flow as the poller reports it: instance "src/dst/if".
inline ObservedFlow make_observed(const std::string& instance, const std::string& dst,
                                  const std::string& src, const std::string& itf,
                                  Bitrate bitrate, std::optional<std::int32_t> port = std::nullopt) {
  ObservedFlow f;
  f.instance = instance;
  f.transport = TransportType::IP;
  f.destination_ip = dst;
  f.source_ip = src;
  f.destination_port = port;
  f.interface_key = itf;
  f.bitrate = bitrate;
  return f;
}

inline ObservedFlow make_observed_sdi(const std::string& instance, const std::string& itf,
                                      Bitrate bitrate) {
  ObservedFlow f;
  f.instance = instance;
  f.transport = TransportType::SDI;
  f.interface_key = itf;
  f.bitrate = bitrate;
  return f;
}

inline ObservedInterface make_observed_interface(const std::string& index,
                                                 InterfaceType type = InterfaceType::Ethernet) {
  ObservedInterface i;
  i.index = index;
  i.description = "eth" + index;
  i.type = type;
  return i;
}

inline Interface make_interface(const std::string& index) {
  Interface i;
  i.index = index;
  i.description = "eth" + index;
  i.display_key = i.description;
  return i;
}

inline Flow make_flow(const std::string& instance, FlowDirection dir, const std::string& itf,
                      Bitrate bitrate, FlowOwner owner = FlowOwner::LocalSystem, bool present = true) {
  Flow f;
  f.instance = instance;
  f.direction = dir;
  f.transport = TransportType::IP;
  f.destination_ip = "239.0.0.1";
  f.source_ip = "10.1.1.2";
  f.interface_key = itf;
  f.bitrate = bitrate;
  f.owner = owner;
  f.present = present;
  return f;
}

inline ProvisionedFlow make_provisioned(const std::string& instance, const std::string& dst,
                                        const std::string& src, const std::string& itf,
                                        std::optional<Bitrate> expected,
                                        FlowDirection dir = FlowDirection::Incoming,
                                        std::optional<std::int32_t> port = std::nullopt) {
  ProvisionedFlow p;
  p.instance = instance;
  p.direction = dir;
  p.transport = TransportType::IP;
  p.destination_ip = dst;
  p.source_ip = src;
  p.destination_port = port;
  p.interface_key = itf;
  p.expected_bitrate = expected;
  return p;
}

inline ProvisioningMessage make_message(ProvisioningAction action, std::vector<ProvisionedFlow> flows,
                                        bool ignore_port = false) {
  ProvisioningMessage m;
  m.action = action;
  m.flows = std::move(flows);
  m.ignore_destination_port = ignore_port;
  return m;
}

// Snapshot with interface "1" and the given incoming flows.
inline DeviceSnapshot make_snapshot(std::vector<ObservedFlow> incoming,
                                    std::vector<ObservedFlow> outgoing = {}) {
  DeviceSnapshot s;
  s.interfaces = std::vector<ObservedInterface>{make_observed_interface("1")};
  s.incoming = std::move(incoming);
  s.outgoing = std::move(outgoing);
  return s;
}

// Memory storage that throws WriteError while `fail` is set, optionally only
// for the listed instances.
class FlakyTableStorage final : public TableStorage {
public:
  bool fail {false};
  std::unordered_set<Instance> fail_only {};
  MemoryTableStorage inner {};

  void upsert_interface(const Interface& row) override {
    check(row.index);
    inner.upsert_interface(row);
  }
  void upsert_flow(const Flow& row) override {
    check(row.instance);
    inner.upsert_flow(row);
  }
  void delete_row(Table table, const Instance& instance) override {
    check(instance);
    inner.delete_row(table, instance);
  }
  void replace_interfaces(const std::vector<Interface>& rows) override {
    check(Instance{});
    inner.replace_interfaces(rows);
  }

private:
  void check(const Instance& instance) const {
    if (!fail) return;
    if (fail_only.empty() || fail_only.count(instance)) {
      throw WriteError("storage unavailable");
    }
  }
};

// Resolver backed by a map keyed "group:index".
class MapResolver final : public PhysicalInterfaceResolver {
public:
  std::unordered_map<std::string, std::string> entries {};
  int calls {0};

  std::optional<std::string> resolve(std::int32_t parameter_group, const std::string& index) override {
    ++calls;
    auto it = entries.find(std::to_string(parameter_group) + ":" + index);
    if (it == entries.end()) return std::nullopt;
    return it->second;
  }
};

inline bool no_local_absent_rows(const FlowStore& store) {
  for (FlowDirection dir : {FlowDirection::Incoming, FlowDirection::Outgoing}) {
    for (auto const& f : store.all(dir)) {
      if (f.owner == FlowOwner::LocalSystem && !f.present) return false;
    }
  }
  return true;
}

} // namespace flowrecon::core::test
