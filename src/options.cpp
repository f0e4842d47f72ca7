#include "flowrecon/core/options.hpp"
#include "flowrecon/core/error.hpp"

#include <cmath>
#include <string>

namespace flowrecon::core {

void validate(const ReconcileOptions& opts) {
  if (!std::isfinite(opts.bitrate_tolerance_percent) || opts.bitrate_tolerance_percent < 0.0) {
    throw ValueError("bitrate_tolerance_percent must be finite and >= 0, got " +
                     std::to_string(opts.bitrate_tolerance_percent));
  }
  if (opts.flow_count_tolerance < 0) {
    throw ValueError("flow_count_tolerance must be >= 0, got " +
                     std::to_string(opts.flow_count_tolerance));
  }
}

} // namespace flowrecon::core
