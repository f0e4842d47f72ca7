/* Reconciliation options passed explicitly into merge, match and status calls. */
#pragma once

#include "flowrecon/core/types.hpp"

namespace flowrecon::core {

struct ReconcileOptions {
  // Ignore destination-port differences when matching provisioned flows to
  // existing rows (for devices that do not report ports).
  bool ignore_destination_port { false };
  // Actual bitrate within +/- this percentage of expected is Normal.
  double bitrate_tolerance_percent { 10.0 };
  // Absolute slack on flow counts before reporting Low/High.
  FlowCount flow_count_tolerance { 0 };
  // Link newly provisioned outgoing flows to their incoming counterpart.
  bool auto_link_outgoing { true };
};

// Throws ValueError on negative or non-finite tolerances.
void validate(const ReconcileOptions& opts);

} // namespace flowrecon::core
