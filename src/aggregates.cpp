/*
  Aggregate calculator.

  Rollups are recomputed from scratch for each dirty interface; nothing is
  accumulated incrementally, so running it twice without an intervening store
  mutation yields identical values.
*/
#include "flowrecon/core/aggregates.hpp"
#include "flowrecon/core/logging.hpp"

#include <vector>

namespace flowrecon::core {

BitrateStatus compare_to_expected(Bitrate actual, Bitrate expected,
                                  double tolerance_percent) noexcept {
  if (!(expected > 0.0)) return BitrateStatus::Normal;
  const double band = expected * tolerance_percent / 100.0;
  if (actual < expected - band) return BitrateStatus::Low;
  if (actual > expected + band) return BitrateStatus::High;
  return BitrateStatus::Normal;
}

BitrateStatus compare_flow_count(FlowCount actual, FlowCount expected,
                                 FlowCount tolerance) noexcept {
  if (expected <= 0) return BitrateStatus::Normal;
  if (actual < expected - tolerance) return BitrateStatus::Low;
  if (actual > expected + tolerance) return BitrateStatus::High;
  return BitrateStatus::Normal;
}

BitrateStatus flow_expected_bitrate_status(const Flow& f, const ReconcileOptions& opts) noexcept {
  if (!f.expected_bitrate) return BitrateStatus::Normal;
  const Bitrate actual = f.present ? f.bitrate : 0.0;
  return compare_to_expected(actual, *f.expected_bitrate, opts.bitrate_tolerance_percent);
}

InterfaceAggregates compute_interface_aggregates(const FlowStore& store,
                                                 const Instance& interface_index,
                                                 const ReconcileOptions& opts) {
  InterfaceAggregates agg;
  auto accumulate = [&](FlowDirection dir, Bitrate& actual, FlowCount& count,
                        Bitrate& expected, FlowCount& expected_count) {
    for (auto const& inst : store.flows_on_interface(dir, interface_index)) {
      const Flow* f = store.get(dir, inst);
      if (!f) continue;
      if (f->present) {
        actual += f->bitrate;
        ++count;
      }
      if (f->expected_bitrate) expected += *f->expected_bitrate;
      if (f->owner == FlowOwner::FlowEngineering) ++expected_count;
    }
  };
  accumulate(FlowDirection::Incoming, agg.rx_bitrate, agg.rx_flows,
             agg.expected_rx_bitrate, agg.expected_rx_flows);
  accumulate(FlowDirection::Outgoing, agg.tx_bitrate, agg.tx_flows,
             agg.expected_tx_bitrate, agg.expected_tx_flows);

  const double tol = opts.bitrate_tolerance_percent;
  agg.rx_bitrate_status = compare_to_expected(agg.rx_bitrate, agg.expected_rx_bitrate, tol);
  agg.tx_bitrate_status = compare_to_expected(agg.tx_bitrate, agg.expected_tx_bitrate, tol);
  agg.rx_flow_count_status = compare_flow_count(agg.rx_flows, agg.expected_rx_flows,
                                                opts.flow_count_tolerance);
  agg.tx_flow_count_status = compare_flow_count(agg.tx_flows, agg.expected_tx_flows,
                                                opts.flow_count_tolerance);
  return agg;
}

std::size_t recompute_aggregates(FlowStore& store, const ReconcileOptions& opts) {
  // Copy: the setters below must not invalidate the set we iterate.
  std::vector<Instance> dirty(store.dirty_interfaces().begin(), store.dirty_interfaces().end());
  std::size_t recomputed = 0;
  for (auto const& index : dirty) {
    for (FlowDirection dir : {FlowDirection::Incoming, FlowDirection::Outgoing}) {
      for (auto const& inst : store.flows_on_interface(dir, index)) {
        const Flow* f = store.get(dir, inst);
        if (f) store.set_expected_bitrate_status(dir, inst, flow_expected_bitrate_status(*f, opts));
      }
    }
    if (!store.has_interface(index)) continue;
    store.set_aggregates(index, compute_interface_aggregates(store, index, opts));
    ++recomputed;
  }
  store.clear_dirty();
  logger()->debug("recomputed aggregates for {} interface(s) ({} dirty key(s))",
                  recomputed, dirty.size());
  return recomputed;
}

} // namespace flowrecon::core
