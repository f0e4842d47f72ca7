#include "flowrecon/core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace flowrecon::core {

namespace {

constexpr const char* kLoggerName = "flowrecon";

std::shared_ptr<spdlog::logger> make_logger() {
  // The host may have registered its own "flowrecon" logger already.
  if (auto existing = spdlog::get(kLoggerName)) return existing;
  auto created = spdlog::stderr_color_mt(kLoggerName);
  created->set_level(spdlog::level::info);
  created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = make_logger();
  return instance;
}

void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

} // namespace flowrecon::core
