#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>
#include "kernel/config.hpp"
#include "kernel/session_table.hpp"

using namespace royaos::kernel;
using json = nlohmann::json;

namespace {

std::string write_temp(const std::string& name, const std::string& contents)
{
  auto path = std::filesystem::temp_directory_path() /
              ("royaos_" + std::to_string(getpid()) + "_" + name);
  std::ofstream out(path);
  out << contents;
  return path.string();
}

}  // namespace

TEST(Config, DefaultsWhenEmpty)
{
  auto config = KernelConfig::from_json(json::object());
  EXPECT_EQ(config.socket_path, "/tmp/royaos.sock");
  EXPECT_EQ(config.security_level, SecurityLevel::STANDARD);
  EXPECT_EQ(config.memory.max_allocation_bytes, 1024ull * 1024 * 1024);
  EXPECT_EQ(config.memory.optimization_strategy, OptimizationStrategy::BALANCED);
  EXPECT_EQ(config.drain_timeout.count(), 5000);
  EXPECT_TRUE(config.permission_rules.empty());
}

TEST(Config, ParsesAllSections)
{
  json j = {
    {"system", {{"name", "RoyaOS"}, {"log_level", "debug"}, {"data_dir", "/var/lib/royaos"},
                {"socket_path", "/run/royaos.sock"}, {"drain_timeout_ms", 1500}}},
    {"memory", {{"max_allocation", 64}, {"optimization_strategy", "Aggressive"},
                {"category_quotas", {{"Working", 16}, {"short_term", 8}}}}},
    {"security", {{"security_level", "high"},
                  {"allowed_operations", {"file_read", "tool_execution"}},
                  {"rules", {{{"resource_type", "session"}, {"operation", "create"}, {"resource", "*"}}}}}},
    {"audit", {{"max_entries", 50}, {"log_tool", false}}}
  };

  auto config = KernelConfig::from_json(j);
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_EQ(config.data_dir, "/var/lib/royaos");
  EXPECT_EQ(config.socket_path, "/run/royaos.sock");
  EXPECT_EQ(config.drain_timeout.count(), 1500);
  EXPECT_EQ(config.memory.max_allocation_bytes, 64ull * 1024 * 1024);
  EXPECT_EQ(config.memory.optimization_strategy, OptimizationStrategy::AGGRESSIVE);
  EXPECT_EQ(config.memory.quota(MemoryCategory::WORKING), 16ull * 1024 * 1024);
  EXPECT_EQ(config.memory.quota(MemoryCategory::SHORT_TERM), 8ull * 1024 * 1024);
  EXPECT_EQ(config.memory.quota(MemoryCategory::LONG_TERM), 64ull * 1024 * 1024);
  EXPECT_EQ(config.security_level, SecurityLevel::HIGH);
  EXPECT_EQ(config.allowed_operations.size(), 2u);
  ASSERT_EQ(config.permission_rules.size(), 1u);
  EXPECT_EQ(config.permission_rules[0].operation, "create");
  EXPECT_EQ(config.audit.max_entries, 50u);
  EXPECT_FALSE(config.audit.log_tool);
  EXPECT_TRUE(config.audit.log_memory);
}

TEST(Config, RejectsInvalidValues)
{
  EXPECT_THROW(KernelConfig::from_json(json::array()), std::runtime_error);
  EXPECT_THROW(KernelConfig::from_json({{"security", {{"security_level", "paranoid"}}}}),
               std::runtime_error);
  EXPECT_THROW(KernelConfig::from_json({{"memory", {{"optimization_strategy", "lazy"}}}}),
               std::runtime_error);
  EXPECT_THROW(KernelConfig::from_json({{"memory", {{"max_allocation", "lots"}}}}),
               std::runtime_error);
  EXPECT_THROW(KernelConfig::from_json({{"memory", {{"category_quotas", {{"swap", 1}}}}}}),
               std::runtime_error);
  EXPECT_THROW(KernelConfig::from_json({{"system", "oops"}}), std::runtime_error);
}

TEST(Config, RejectsOutOfRangeNumbers)
{
  // 2^44 MB does not fit in 64 bits of bytes
  EXPECT_THROW(KernelConfig::from_json({{"memory", {{"max_allocation", 17592186044416ull}}}}),
               std::runtime_error);
  EXPECT_THROW(KernelConfig::from_json({{"memory", {{"max_allocation", 1.5}}}}),
               std::runtime_error);
  EXPECT_THROW(KernelConfig::from_json({{"memory", {{"category_quotas", {{"working", -1}}}}}}),
               std::runtime_error);
  EXPECT_THROW(KernelConfig::from_json({{"system", {{"drain_timeout_ms", -5}}}}),
               std::runtime_error);
  EXPECT_THROW(KernelConfig::from_json(
                   {{"system", {{"drain_timeout_ms", MAX_DRAIN_TIMEOUT.count() + 1}}}}),
               std::runtime_error);

  try {
    KernelConfig::from_json({{"memory", {{"category_quotas", {{"working", -1}}}}}});
    FAIL() << "expected runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("memory.category_quotas.working"), std::string::npos);
  }

  auto config = KernelConfig::from_json(
      {{"system", {{"drain_timeout_ms", MAX_DRAIN_TIMEOUT.count()}}}});
  EXPECT_EQ(config.drain_timeout, MAX_DRAIN_TIMEOUT);
}

TEST(Config, LoadFromFile)
{
  auto path = write_temp("config.json",
      R"({"system": {"socket_path": "/tmp/test.sock"}, "security": {"security_level": "maximum"}})");
  auto config = load_config(path);
  EXPECT_EQ(config.socket_path, "/tmp/test.sock");
  EXPECT_EQ(config.security_level, SecurityLevel::MAXIMUM);
  std::filesystem::remove(path);
}

TEST(Config, LoadFailures)
{
  EXPECT_THROW(load_config("/nonexistent/royaos/config.json"), std::runtime_error);

  auto path = write_temp("broken.json", "{ not json");
  EXPECT_THROW(load_config(path), std::runtime_error);
  std::filesystem::remove(path);
}
