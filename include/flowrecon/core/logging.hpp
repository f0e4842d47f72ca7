/* Library-wide spdlog logger. */
#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace flowrecon::core {

// Shared "flowrecon" logger; resolved once on first use (an existing
// registration is reused, otherwise a stderr sink is created).
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

} // namespace flowrecon::core
