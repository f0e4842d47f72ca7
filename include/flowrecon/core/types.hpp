/* Core type aliases and enumerations shared by the store, merger and tables.
 *
 * Enum values mirror the discrete column values of the external tables, so
 * their numeric values are part of the persisted contract.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace flowrecon::core {

using Instance = std::string;   // Stable row key (interface index or flow instance)
using Bitrate  = double;        // Bits per second
using FlowCount = std::int32_t;

// Which flows table a record belongs to.
enum class FlowDirection {
  Incoming = 1,
  Outgoing = 2
};

// The three logical tables exposed to the table storage.
enum class Table {
  Interfaces = 1,
  IncomingFlows = 2,
  OutgoingFlows = 3
};

enum class TransportType {
  Unknown = 0,
  IP = 1,
  SDI = 2,
  ASI = 3
};

enum class InterfaceType {
  Ethernet = 1,
  SDI = 2,
  ASI = 3
};

enum class AdminStatus {
  Up = 1,
  Down = 2,
  Testing = 3
};

// ifOperStatus values (RFC 2863).
enum class OperStatus {
  Up = 1,
  Down = 2,
  Testing = 3,
  Unknown = 4,
  Dormant = 5,
  NotPresent = 6,
  LowerLayerDown = 7
};

enum class FlowOwner {
  LocalSystem = 1,
  FlowEngineering = 2
};

// Actual-vs-expected comparison result.
enum class BitrateStatus {
  Normal = 1,
  Low = 2,
  High = 3
};

// Lifecycle state derived from (owner, presence); NoRow means no entry.
enum class FlowLifecycleState {
  NoRow = 0,
  ProvisionedAbsent = 1,
  ProvisionedPresent = 2,
  ObservedPresent = 3
};

[[nodiscard]] constexpr Table table_for(FlowDirection dir) noexcept {
  return dir == FlowDirection::Incoming ? Table::IncomingFlows : Table::OutgoingFlows;
}

[[nodiscard]] std::string_view to_string(FlowDirection v) noexcept;
[[nodiscard]] std::string_view to_string(Table v) noexcept;
[[nodiscard]] std::string_view to_string(TransportType v) noexcept;
[[nodiscard]] std::string_view to_string(FlowOwner v) noexcept;
[[nodiscard]] std::string_view to_string(BitrateStatus v) noexcept;
[[nodiscard]] std::string_view to_string(FlowLifecycleState v) noexcept;

} // namespace flowrecon::core
