#include <gtest/gtest.h>
#include "kernel/errors.hpp"
#include "kernel/session_table.hpp"
#include "kernel/syscalls.hpp"

using namespace royaos;
using namespace royaos::kernel;
using json = nlohmann::json;

namespace {

ipc::Request make_request(const std::string& type, json params = json::object())
{
  ipc::Request req;
  req.id = "r1";
  req.type = type;
  req.parameters = std::move(params);
  return req;
}

ErrorKind parse_error(const std::string& type, json params = json::object())
{
  try {
    parse_syscall(make_request(type, std::move(params)));
  } catch (const KernelError& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected KernelError for " << type;
  return ErrorKind::SESSION_NOT_FOUND;
}

}  // namespace

TEST(Syscalls, NormalizeRequestType)
{
  EXPECT_EQ(normalize_request_type("memory/allocate"), "memory_allocate");
  EXPECT_EQ(normalize_request_type("Memory_Allocate"), "memory_allocate");
  EXPECT_EQ(normalize_request_type("sessions/create"), "sessions_create");
}

TEST(Syscalls, ParseMemoryAllocate)
{
  auto sc = parse_syscall(make_request("memory/allocate",
      {{"size_bytes", 1048576}, {"purpose", "Image processing"}, {"category", "Working"}}));
  ASSERT_TRUE(std::holds_alternative<syscalls::MemoryAllocate>(sc));
  const auto& alloc = std::get<syscalls::MemoryAllocate>(sc);
  EXPECT_EQ(alloc.size_bytes, 1048576u);
  EXPECT_EQ(alloc.purpose, "Image processing");
  EXPECT_EQ(alloc.category, MemoryCategory::WORKING);
  EXPECT_STREQ(syscall_name(sc), "memory_allocate");

  auto defaulted = std::get<syscalls::MemoryAllocate>(
      parse_syscall(make_request("memory_allocate", {{"size_bytes", 8}})));
  EXPECT_EQ(defaulted.category, MemoryCategory::WORKING);
  EXPECT_EQ(defaulted.purpose, "");
}

TEST(Syscalls, RejectsBadParameters)
{
  EXPECT_EQ(parse_error("memory_frobnicate"), ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("memory_allocate"), ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("memory_allocate", {{"size_bytes", -5}}), ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("memory_allocate", {{"size_bytes", "big"}}), ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("memory_allocate", {{"size_bytes", 8}, {"category", "swap"}}),
            ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("memory_release"), ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("memory_optimize", {{"strategy", "lazy"}}), ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("security_set_level", {{"level", "paranoid"}}), ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("security_add_permission", {{"resource_type", "file"}}),
            ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("security_add_permission",
      {{"resource_type", "file"}, {"operation", "read"}, {"resource", "/a"}, {"effect", "maybe"}}),
      ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("tools_execute", {{"tool_id", "calculator"}}), ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("tools_execute",
      {{"tool_id", "calculator"}, {"capability", "add"}, {"parameters", 3}}),
      ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("sessions_create", {{"metadata", "x"}}), ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("system_shutdown", {{"drain_timeout_ms", 10000000000000ull}}),
            ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(parse_error("system_shutdown", {{"drain_timeout_ms", MAX_DRAIN_TIMEOUT.count() + 1}}),
            ErrorKind::INVALID_ARGUMENT);
}

TEST(Syscalls, ParseSecurityAndSystem)
{
  auto add = std::get<syscalls::SecurityAddPermission>(parse_syscall(make_request(
      "security/add_permission", {{"resource_type", "file"}, {"operation", "read"}, {"resource", "/a/*"}})));
  EXPECT_EQ(add.rule.effect, Effect::ALLOW);
  EXPECT_EQ(add.rule.resource_pattern, "/a/*");

  auto remove = std::get<syscalls::SecurityRemovePermission>(parse_syscall(make_request(
      "security_remove_permission",
      {{"resource_type", "file"}, {"operation", "read"}, {"resource", "/a/*"}, {"effect", "deny"}})));
  ASSERT_TRUE(remove.effect.has_value());
  EXPECT_EQ(*remove.effect, Effect::DENY);

  auto audit = std::get<syscalls::SecurityAudit>(parse_syscall(make_request("security_audit")));
  EXPECT_EQ(audit.limit, 100u);

  auto shutdown = std::get<syscalls::SystemShutdown>(
      parse_syscall(make_request("system_shutdown", {{"drain_timeout_ms", 250}})));
  ASSERT_TRUE(shutdown.drain_timeout.has_value());
  EXPECT_EQ(shutdown.drain_timeout->count(), 250);

  auto longest = std::get<syscalls::SystemShutdown>(parse_syscall(
      make_request("system_shutdown", {{"drain_timeout_ms", MAX_DRAIN_TIMEOUT.count()}})));
  EXPECT_EQ(*longest.drain_timeout, MAX_DRAIN_TIMEOUT);

  auto echo = std::get<syscalls::SystemEcho>(
      parse_syscall(make_request("system/echo", {{"hello", "world"}})));
  EXPECT_EQ(echo.payload["hello"], "world");
}

TEST(Syscalls, PermissionTriples)
{
  auto triple = [](const std::string& type, json params) {
    return permission_triple(parse_syscall(make_request(type, std::move(params))), "sess-caller");
  };

  auto t = triple("memory_allocate", {{"size_bytes", 1}, {"category", "background"}});
  EXPECT_EQ(t.resource_type, "memory");
  EXPECT_EQ(t.operation, "allocate");
  EXPECT_EQ(t.resource, "background");

  t = triple("sessions_close", json::object());
  EXPECT_EQ(t.resource_type, "session");
  EXPECT_EQ(t.operation, "close");
  EXPECT_EQ(t.resource, "sess-caller");

  t = triple("sessions_close", {{"session_id", "sess-other"}});
  EXPECT_EQ(t.resource, "sess-other");

  t = triple("memory_release", {{"handle_id", "mem-1"}});
  EXPECT_EQ(t.operation, "release");
  EXPECT_EQ(t.resource, "mem-1");

  t = triple("memory_optimize", json::object());
  EXPECT_EQ(t.resource, "default");
  t = triple("memory_optimize", {{"strategy", "aggressive"}});
  EXPECT_EQ(t.resource, "aggressive");

  t = triple("security_set_level", {{"level", "HIGH"}});
  EXPECT_EQ(t.resource_type, "security");
  EXPECT_EQ(t.operation, "set_level");
  EXPECT_EQ(t.resource, "high");

  t = triple("tools_execute", {{"tool_id", "calculator"}, {"capability", "add"}});
  EXPECT_EQ(t.resource_type, "tool");
  EXPECT_EQ(t.operation, "execute");
  EXPECT_EQ(t.resource, "calculator");

  t = triple("system_shutdown", json::object());
  EXPECT_EQ(t.resource_type, "system");
  EXPECT_EQ(t.operation, "shutdown");
  EXPECT_EQ(t.resource, "*");
}
