/* Aggregate calculator: per-interface rollups derived from the flow set. */
#pragma once

#include <cstddef>

#include "flowrecon/core/entities.hpp"
#include "flowrecon/core/flow_store.hpp"
#include "flowrecon/core/options.hpp"
#include "flowrecon/core/types.hpp"

namespace flowrecon::core {

// Compare actual to expected with a symmetric percentage band:
//   actual < expected * (1 - tol/100)  -> Low
//   actual > expected * (1 + tol/100)  -> High
//   otherwise                          -> Normal
// An expected value <= 0 always yields Normal.
[[nodiscard]] BitrateStatus compare_to_expected(Bitrate actual, Bitrate expected,
                                                double tolerance_percent) noexcept;

// Same policy for flow counts with an absolute tolerance.
[[nodiscard]] BitrateStatus compare_flow_count(FlowCount actual, FlowCount expected,
                                               FlowCount tolerance) noexcept;

// Expected-bitrate status of one flow. Absent flows count as 0 bps.
[[nodiscard]] BitrateStatus flow_expected_bitrate_status(const Flow& f,
                                                         const ReconcileOptions& opts) noexcept;

// Pure function of the store's current flow set for `interface_index`:
//   - rx/tx bitrate and flow count over present flows (incoming = rx),
//   - expected rx/tx bitrate over all flows regardless of presence,
//   - expected rx/tx flow count = flows owned by FlowEngineering,
//   - statuses via compare_to_expected / compare_flow_count.
[[nodiscard]] InterfaceAggregates compute_interface_aggregates(const FlowStore& store,
                                                               const Instance& interface_index,
                                                               const ReconcileOptions& opts);

// Recompute aggregates of every dirty interface and the expected-bitrate
// status of every flow referencing one, write them back and clear the dirty
// set. Dirty keys without an Interface row only refresh flow statuses.
// Returns the number of Interface rows recomputed.
std::size_t recompute_aggregates(FlowStore& store, const ReconcileOptions& opts);

} // namespace flowrecon::core
