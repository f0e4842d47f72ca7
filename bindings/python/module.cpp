/*
  Pybind11 module exposing the flowrecon core to Python.

  Notes:
    - Records (Interface, Flow, snapshot and message entries) are plain
      value types; attributes map 1:1 to the C++ fields.
    - Engine cycles release the GIL; a Python resolver or table storage
      re-acquires it through its trampoline.
    - Store accessors return copies, never references into engine state.
*/
#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include "flowrecon/core/aggregates.hpp"
#include "flowrecon/core/engine.hpp"
#include "flowrecon/core/error.hpp"
#include "flowrecon/core/logging.hpp"
#include "flowrecon/core/provisioning.hpp"
#include "flowrecon/core/reconciler.hpp"
#include "flowrecon/core/table_sync.hpp"

namespace py = pybind11;
using namespace flowrecon::core;

class PyPhysicalInterfaceResolver : public PhysicalInterfaceResolver {
public:
  using PhysicalInterfaceResolver::PhysicalInterfaceResolver;

  std::optional<std::string> resolve(std::int32_t parameter_group, const std::string& index) override {
    PYBIND11_OVERRIDE_PURE(std::optional<std::string>, PhysicalInterfaceResolver, resolve,
                           parameter_group, index);
  }
};

// Python-implemented table storage. Raising from an override reports the row
// as a failed write for that cycle.
class PyTableStorage : public TableStorage {
public:
  using TableStorage::TableStorage;

  void upsert_interface(const Interface& row) override {
    PYBIND11_OVERRIDE_PURE(void, TableStorage, upsert_interface, row);
  }
  void upsert_flow(const Flow& row) override {
    PYBIND11_OVERRIDE_PURE(void, TableStorage, upsert_flow, row);
  }
  void delete_row(Table table, const Instance& instance) override {
    PYBIND11_OVERRIDE_PURE(void, TableStorage, delete_row, table, instance);
  }
  void replace_interfaces(const std::vector<Interface>& rows) override {
    PYBIND11_OVERRIDE_PURE(void, TableStorage, replace_interfaces, rows);
  }
};

static py::object optional_flow(const Flow* f) {
  if (!f) return py::none();
  return py::cast(*f);
}

PYBIND11_MODULE(_flowrecon_core, m) {
  m.doc() = "flowrecon core C++ bindings";

  py::register_exception<ValueError>(m, "ValueError", PyExc_ValueError);
  py::register_exception<MalformedEntryError>(m, "MalformedEntryError", PyExc_ValueError);
  py::register_exception<WriteError>(m, "WriteError", PyExc_RuntimeError);

  py::enum_<FlowDirection>(m, "FlowDirection")
      .value("INCOMING", FlowDirection::Incoming)
      .value("OUTGOING", FlowDirection::Outgoing);

  py::enum_<Table>(m, "Table")
      .value("INTERFACES", Table::Interfaces)
      .value("INCOMING_FLOWS", Table::IncomingFlows)
      .value("OUTGOING_FLOWS", Table::OutgoingFlows);

  py::enum_<TransportType>(m, "TransportType")
      .value("UNKNOWN", TransportType::Unknown)
      .value("IP", TransportType::IP)
      .value("SDI", TransportType::SDI)
      .value("ASI", TransportType::ASI);

  py::enum_<InterfaceType>(m, "InterfaceType")
      .value("ETHERNET", InterfaceType::Ethernet)
      .value("SDI", InterfaceType::SDI)
      .value("ASI", InterfaceType::ASI);

  py::enum_<AdminStatus>(m, "AdminStatus")
      .value("UP", AdminStatus::Up)
      .value("DOWN", AdminStatus::Down)
      .value("TESTING", AdminStatus::Testing);

  py::enum_<OperStatus>(m, "OperStatus")
      .value("UP", OperStatus::Up)
      .value("DOWN", OperStatus::Down)
      .value("TESTING", OperStatus::Testing)
      .value("UNKNOWN", OperStatus::Unknown)
      .value("DORMANT", OperStatus::Dormant)
      .value("NOT_PRESENT", OperStatus::NotPresent)
      .value("LOWER_LAYER_DOWN", OperStatus::LowerLayerDown);

  py::enum_<FlowOwner>(m, "FlowOwner")
      .value("LOCAL_SYSTEM", FlowOwner::LocalSystem)
      .value("FLOW_ENGINEERING", FlowOwner::FlowEngineering);

  py::enum_<BitrateStatus>(m, "BitrateStatus")
      .value("NORMAL", BitrateStatus::Normal)
      .value("LOW", BitrateStatus::Low)
      .value("HIGH", BitrateStatus::High);

  py::enum_<FlowLifecycleState>(m, "FlowLifecycleState")
      .value("NO_ROW", FlowLifecycleState::NoRow)
      .value("PROVISIONED_ABSENT", FlowLifecycleState::ProvisionedAbsent)
      .value("PROVISIONED_PRESENT", FlowLifecycleState::ProvisionedPresent)
      .value("OBSERVED_PRESENT", FlowLifecycleState::ObservedPresent);

  py::enum_<ProvisioningAction>(m, "ProvisioningAction")
      .value("ADD", ProvisioningAction::Add)
      .value("REMOVE", ProvisioningAction::Remove);

  m.def("set_log_level", [](const std::string& level){
    set_log_level(spdlog::level::from_str(level));
  }, py::arg("level"));

  py::class_<ReconcileOptions>(m, "ReconcileOptions")
      .def(py::init([](bool ignore_destination_port, double bitrate_tolerance_percent,
                       FlowCount flow_count_tolerance, bool auto_link_outgoing){
        ReconcileOptions o;
        o.ignore_destination_port = ignore_destination_port;
        o.bitrate_tolerance_percent = bitrate_tolerance_percent;
        o.flow_count_tolerance = flow_count_tolerance;
        o.auto_link_outgoing = auto_link_outgoing;
        validate(o);
        return o;
      }),
        py::kw_only(),
        py::arg("ignore_destination_port") = false,
        py::arg("bitrate_tolerance_percent") = 10.0,
        py::arg("flow_count_tolerance") = 0,
        py::arg("auto_link_outgoing") = true)
      .def_readwrite("ignore_destination_port", &ReconcileOptions::ignore_destination_port)
      .def_readwrite("bitrate_tolerance_percent", &ReconcileOptions::bitrate_tolerance_percent)
      .def_readwrite("flow_count_tolerance", &ReconcileOptions::flow_count_tolerance)
      .def_readwrite("auto_link_outgoing", &ReconcileOptions::auto_link_outgoing);

  py::class_<InterfaceAggregates>(m, "InterfaceAggregates")
      .def_readonly("rx_bitrate", &InterfaceAggregates::rx_bitrate)
      .def_readonly("tx_bitrate", &InterfaceAggregates::tx_bitrate)
      .def_readonly("rx_flows", &InterfaceAggregates::rx_flows)
      .def_readonly("tx_flows", &InterfaceAggregates::tx_flows)
      .def_readonly("expected_rx_bitrate", &InterfaceAggregates::expected_rx_bitrate)
      .def_readonly("expected_tx_bitrate", &InterfaceAggregates::expected_tx_bitrate)
      .def_readonly("expected_rx_flows", &InterfaceAggregates::expected_rx_flows)
      .def_readonly("expected_tx_flows", &InterfaceAggregates::expected_tx_flows)
      .def_readonly("rx_bitrate_status", &InterfaceAggregates::rx_bitrate_status)
      .def_readonly("tx_bitrate_status", &InterfaceAggregates::tx_bitrate_status)
      .def_readonly("rx_flow_count_status", &InterfaceAggregates::rx_flow_count_status)
      .def_readonly("tx_flow_count_status", &InterfaceAggregates::tx_flow_count_status);

  py::class_<Interface>(m, "Interface")
      .def(py::init<>())
      .def_readwrite("index", &Interface::index)
      .def_readwrite("description", &Interface::description)
      .def_readwrite("display_key", &Interface::display_key)
      .def_readwrite("type", &Interface::type)
      .def_readwrite("admin_status", &Interface::admin_status)
      .def_readwrite("oper_status", &Interface::oper_status)
      .def_readwrite("physical_interface", &Interface::physical_interface)
      .def_readonly("aggregates", &Interface::aggregates)
      .def("__eq__", [](const Interface& a, const Interface& b){ return a == b; });

  py::class_<Flow>(m, "Flow")
      .def(py::init<>())
      .def_readwrite("instance", &Flow::instance)
      .def_readwrite("direction", &Flow::direction)
      .def_readwrite("transport", &Flow::transport)
      .def_readwrite("destination_ip", &Flow::destination_ip)
      .def_readwrite("destination_port", &Flow::destination_port)
      .def_readwrite("source_ip", &Flow::source_ip)
      .def_readwrite("interface_key", &Flow::interface_key)
      .def_readwrite("bitrate", &Flow::bitrate)
      .def_readwrite("expected_bitrate", &Flow::expected_bitrate)
      .def_readonly("expected_bitrate_status", &Flow::expected_bitrate_status)
      .def_readwrite("label", &Flow::label)
      .def_readwrite("peer_flow_key", &Flow::peer_flow_key)
      .def_readwrite("linked_flow_id", &Flow::linked_flow_id)
      .def_readwrite("owner", &Flow::owner)
      .def_readwrite("present", &Flow::present)
      .def_property_readonly("state", [](const Flow& f){ return lifecycle_state(f); })
      .def("__eq__", [](const Flow& a, const Flow& b){ return a == b; });

  py::class_<Rejection>(m, "Rejection")
      .def_readonly("instance", &Rejection::instance)
      .def_readonly("reason", &Rejection::reason)
      .def("__repr__", [](const Rejection& r){ return "Rejection('" + r.instance + "', '" + r.reason + "')"; });

  py::class_<PhysicalInterfaceRef>(m, "PhysicalInterfaceRef")
      .def(py::init([](std::int32_t parameter_group, std::string index){
        return PhysicalInterfaceRef{parameter_group, std::move(index)};
      }), py::arg("parameter_group"), py::arg("index"))
      .def_readwrite("parameter_group", &PhysicalInterfaceRef::parameter_group)
      .def_readwrite("index", &PhysicalInterfaceRef::index);

  py::class_<PhysicalInterfaceResolver, PyPhysicalInterfaceResolver,
             std::shared_ptr<PhysicalInterfaceResolver>>(m, "PhysicalInterfaceResolver")
      .def(py::init<>())
      .def("resolve", &PhysicalInterfaceResolver::resolve, py::arg("parameter_group"), py::arg("index"));

  py::class_<ObservedFlow>(m, "ObservedFlow")
      .def(py::init<>())
      .def_readwrite("instance", &ObservedFlow::instance)
      .def_readwrite("transport", &ObservedFlow::transport)
      .def_readwrite("destination_ip", &ObservedFlow::destination_ip)
      .def_readwrite("destination_port", &ObservedFlow::destination_port)
      .def_readwrite("source_ip", &ObservedFlow::source_ip)
      .def_readwrite("interface_key", &ObservedFlow::interface_key)
      .def_readwrite("bitrate", &ObservedFlow::bitrate)
      .def_readwrite("label", &ObservedFlow::label);

  py::class_<ObservedInterface>(m, "ObservedInterface")
      .def(py::init<>())
      .def_readwrite("index", &ObservedInterface::index)
      .def_readwrite("description", &ObservedInterface::description)
      .def_readwrite("display_key", &ObservedInterface::display_key)
      .def_readwrite("type", &ObservedInterface::type)
      .def_readwrite("admin_status", &ObservedInterface::admin_status)
      .def_readwrite("oper_status", &ObservedInterface::oper_status)
      .def_readwrite("physical", &ObservedInterface::physical);

  py::class_<DeviceSnapshot>(m, "DeviceSnapshot")
      .def(py::init([](std::optional<std::vector<ObservedInterface>> interfaces,
                       std::vector<ObservedFlow> incoming, std::vector<ObservedFlow> outgoing){
        DeviceSnapshot s;
        s.interfaces = std::move(interfaces);
        s.incoming = std::move(incoming);
        s.outgoing = std::move(outgoing);
        return s;
      }),
        py::kw_only(),
        py::arg("interfaces") = py::none(),
        py::arg("incoming") = std::vector<ObservedFlow>{},
        py::arg("outgoing") = std::vector<ObservedFlow>{})
      .def_readwrite("interfaces", &DeviceSnapshot::interfaces)
      .def_readwrite("incoming", &DeviceSnapshot::incoming)
      .def_readwrite("outgoing", &DeviceSnapshot::outgoing);

  py::class_<ProvisionedFlow>(m, "ProvisionedFlow")
      .def(py::init<>())
      .def_readwrite("instance", &ProvisionedFlow::instance)
      .def_readwrite("direction", &ProvisionedFlow::direction)
      .def_readwrite("transport", &ProvisionedFlow::transport)
      .def_readwrite("destination_ip", &ProvisionedFlow::destination_ip)
      .def_readwrite("destination_port", &ProvisionedFlow::destination_port)
      .def_readwrite("source_ip", &ProvisionedFlow::source_ip)
      .def_readwrite("interface_key", &ProvisionedFlow::interface_key)
      .def_readwrite("expected_bitrate", &ProvisionedFlow::expected_bitrate)
      .def_readwrite("label", &ProvisionedFlow::label)
      .def_readwrite("provisioned_flow_id", &ProvisionedFlow::provisioned_flow_id);

  py::class_<ProvisioningMessage>(m, "ProvisioningMessage")
      .def(py::init([](ProvisioningAction action, std::vector<ProvisionedFlow> flows, bool ignore_destination_port){
        ProvisioningMessage msg;
        msg.action = action;
        msg.flows = std::move(flows);
        msg.ignore_destination_port = ignore_destination_port;
        return msg;
      }),
        py::arg("action"), py::arg("flows"),
        py::kw_only(), py::arg("ignore_destination_port") = false)
      .def_readwrite("action", &ProvisioningMessage::action)
      .def_readwrite("flows", &ProvisioningMessage::flows)
      .def_readwrite("ignore_destination_port", &ProvisioningMessage::ignore_destination_port);

  py::class_<MergeReport>(m, "MergeReport")
      .def_readonly("added", &MergeReport::added)
      .def_readonly("updated", &MergeReport::updated)
      .def_readonly("removed", &MergeReport::removed)
      .def_readonly("retained_absent", &MergeReport::retained_absent)
      .def_readonly("interfaces", &MergeReport::interfaces)
      .def_readonly("rejections", &MergeReport::rejections);

  py::class_<ProvisioningResult>(m, "ProvisioningResult")
      .def_readonly("added_incoming", &ProvisioningResult::added_incoming)
      .def_readonly("added_outgoing", &ProvisioningResult::added_outgoing)
      .def_readonly("updated", &ProvisioningResult::updated)
      .def_readonly("removed", &ProvisioningResult::removed)
      .def_readonly("released", &ProvisioningResult::released)
      .def_readonly("not_found", &ProvisioningResult::not_found)
      .def_readonly("linked", &ProvisioningResult::linked)
      .def_readonly("rejections", &ProvisioningResult::rejections);

  py::class_<WriteFailure>(m, "WriteFailure")
      .def_readonly("table", &WriteFailure::table)
      .def_readonly("instance", &WriteFailure::instance)
      .def_readonly("reason", &WriteFailure::reason);

  py::class_<SyncReport>(m, "SyncReport")
      .def_readonly("written", &SyncReport::written)
      .def_readonly("deleted", &SyncReport::deleted)
      .def_readonly("omitted", &SyncReport::omitted)
      .def_readonly("interfaces_replaced", &SyncReport::interfaces_replaced)
      .def_readonly("failures", &SyncReport::failures)
      .def_property_readonly("noop", &SyncReport::noop);

  py::class_<SnapshotCycleReport>(m, "SnapshotCycleReport")
      .def_readonly("merge", &SnapshotCycleReport::merge)
      .def_readonly("aggregates_recomputed", &SnapshotCycleReport::aggregates_recomputed)
      .def_readonly("sync", &SnapshotCycleReport::sync);

  py::class_<ProvisioningCycleReport>(m, "ProvisioningCycleReport")
      .def_readonly("provisioning", &ProvisioningCycleReport::provisioning)
      .def_readonly("aggregates_recomputed", &ProvisioningCycleReport::aggregates_recomputed)
      .def_readonly("sync", &ProvisioningCycleReport::sync);

  py::class_<FlowStore>(m, "FlowStore")
      .def("get", [](const FlowStore& s, FlowDirection dir, const Instance& inst){ return optional_flow(s.get(dir, inst)); },
           py::arg("direction"), py::arg("instance"))
      .def("all", [](const FlowStore& s, FlowDirection dir){ return s.all(dir); }, py::arg("direction"))
      .def("size", &FlowStore::size, py::arg("direction"))
      .def("flows_on_interface", &FlowStore::flows_on_interface, py::arg("direction"), py::arg("interface_index"))
      .def("unresolved_flows", &FlowStore::unresolved_flows, py::arg("direction"))
      .def("get_interface", [](const FlowStore& s, const Instance& index) -> py::object {
        const Interface* itf = s.get_interface(index);
        if (!itf) return py::none();
        return py::cast(*itf);
      }, py::arg("index"))
      .def_property_readonly("interfaces", [](const FlowStore& s){ return s.interfaces(); });

  py::class_<TableStorage, PyTableStorage, std::shared_ptr<TableStorage>>(m, "TableStorage")
      .def(py::init<>())
      .def("upsert_interface", &TableStorage::upsert_interface, py::arg("row"))
      .def("upsert_flow", &TableStorage::upsert_flow, py::arg("row"))
      .def("delete_row", &TableStorage::delete_row, py::arg("table"), py::arg("instance"))
      .def("replace_interfaces", &TableStorage::replace_interfaces, py::arg("rows"));

  py::class_<MemoryTableStorage, TableStorage, std::shared_ptr<MemoryTableStorage>>(m, "MemoryTableStorage")
      .def(py::init<>())
      .def("interface_row", [](const MemoryTableStorage& s, const Instance& index) -> py::object {
        const Interface* itf = s.interface_row(index);
        if (!itf) return py::none();
        return py::cast(*itf);
      }, py::arg("index"))
      .def("flow_row", [](const MemoryTableStorage& s, FlowDirection dir, const Instance& inst){
        return optional_flow(s.flow_row(dir, inst));
      }, py::arg("direction"), py::arg("instance"))
      .def("row_count", &MemoryTableStorage::row_count, py::arg("table"))
      .def_property_readonly("write_count", &MemoryTableStorage::write_count);

  py::class_<DeviceEngine, std::shared_ptr<DeviceEngine>>(m, "DeviceEngine")
      .def(py::init([](std::string device_id, std::shared_ptr<TableStorage> storage, const ReconcileOptions& opts,
                       std::shared_ptr<PhysicalInterfaceResolver> resolver){
        if (!storage) storage = make_memory_table_storage();
        return std::make_shared<DeviceEngine>(std::move(device_id), std::move(storage), opts, std::move(resolver));
      }),
        py::arg("device_id"), py::arg("storage") = nullptr,
        py::kw_only(), py::arg("options") = ReconcileOptions{}, py::arg("resolver") = nullptr)
      .def_property_readonly("device_id", &DeviceEngine::device_id)
      .def("apply_snapshot", [](DeviceEngine& e, const DeviceSnapshot& snap){
        py::gil_scoped_release rel; auto r = e.apply_snapshot(snap); py::gil_scoped_acquire acq; return r;
      }, py::arg("snapshot"))
      .def("apply_provisioning", [](DeviceEngine& e, const ProvisioningMessage& msg){
        py::gil_scoped_release rel; auto r = e.apply_provisioning(msg); py::gil_scoped_acquire acq; return r;
      }, py::arg("message"))
      .def("synchronize", [](DeviceEngine& e){
        py::gil_scoped_release rel; auto r = e.synchronize(); py::gil_scoped_acquire acq; return r;
      })
      .def("reset", [](DeviceEngine& e){ py::gil_scoped_release rel; e.reset(); py::gil_scoped_acquire acq; })
      .def("store", &DeviceEngine::store)
      .def_property("options", &DeviceEngine::options, &DeviceEngine::set_options);

  py::class_<EngineRegistry>(m, "EngineRegistry")
      .def(py::init([](EngineRegistry::StorageFactory factory, const ReconcileOptions& defaults,
                       std::shared_ptr<PhysicalInterfaceResolver> resolver){
        return std::make_unique<EngineRegistry>(std::move(factory), defaults, std::move(resolver));
      }),
        py::kw_only(),
        py::arg("storage_factory") = EngineRegistry::StorageFactory{},
        py::arg("defaults") = ReconcileOptions{},
        py::arg("resolver") = nullptr)
      .def("device", &EngineRegistry::device, py::arg("device_id"))
      .def("find", &EngineRegistry::find, py::arg("device_id"))
      .def("reset", &EngineRegistry::reset, py::arg("device_id"))
      .def("reset_all", &EngineRegistry::reset_all)
      .def("devices", &EngineRegistry::devices);

  py::class_<ProvisioningExecutor>(m, "ProvisioningExecutor")
      .def(py::init<ProvisioningMessage>(), py::arg("message"))
      .def_property_readonly("message", &ProvisioningExecutor::message)
      .def("execute", [](const ProvisioningExecutor& x, DeviceEngine& e){
        py::gil_scoped_release rel; auto r = x.execute(e); py::gil_scoped_acquire acq; return r;
      }, py::arg("engine"))
      .def("execute_on", [](const ProvisioningExecutor& x, EngineRegistry& reg, const std::string& device_id){
        py::gil_scoped_release rel; auto r = x.execute(reg, device_id); py::gil_scoped_acquire acq; return r;
      }, py::arg("registry"), py::arg("device_id"));

  m.def("compare_to_expected", &compare_to_expected,
        py::arg("actual"), py::arg("expected"), py::arg("tolerance_percent"));
  m.def("derive_instance", &derive_instance, py::arg("flow"));
}
