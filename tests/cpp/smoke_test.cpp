#include <gtest/gtest.h>
#include "flowrecon/core/engine.hpp"
#include "flowrecon/core/logging.hpp"
#include "test_utils.hpp"

using namespace flowrecon::core;
using namespace flowrecon::core::test;

TEST(EngineSmoke, PollWritesAllThreeTables) {
  auto storage = make_memory_table_storage();
  DeviceEngine engine("dev-1", storage);
  auto report = engine.apply_snapshot(make_snapshot(
      {make_observed("10.1.1.2/239.0.0.1/1", "239.0.0.1", "10.1.1.2", "1", 50.0)},
      {make_observed("10.1.1.2/239.0.0.1/1", "239.0.0.1", "10.1.1.2", "1", 40.0)}));
  EXPECT_EQ(report.merge.added, 2u);
  EXPECT_EQ(storage->row_count(Table::Interfaces), 1u);
  EXPECT_EQ(storage->row_count(Table::IncomingFlows), 1u);
  EXPECT_EQ(storage->row_count(Table::OutgoingFlows), 1u);
}

TEST(Logging, LoggerIsResolvedOnce) {
  auto first = logger();
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->name(), "flowrecon");
  EXPECT_EQ(logger(), first);
  EXPECT_EQ(spdlog::get("flowrecon"), first);

  set_log_level(spdlog::level::debug);
  EXPECT_EQ(first->level(), spdlog::level::debug);
  set_log_level(spdlog::level::info);
}
