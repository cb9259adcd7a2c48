#include <gtest/gtest.h>
#include <stdexcept>
#include "kernel/builtin_tools.hpp"
#include "kernel/errors.hpp"
#include "kernel/tool_registry.hpp"

using namespace royaos::kernel;
using json = nlohmann::json;

namespace {

ErrorKind invoke_error(ToolRegistry& registry, const std::string& tool,
                       const std::string& capability, const json& params)
{
  try {
    registry.invoke(tool, capability, params);
  } catch (const KernelError& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected KernelError";
  return ErrorKind::INVALID_ARGUMENT;
}

}  // namespace

TEST(ToolRegistry, CalculatorCapabilities)
{
  ToolRegistry registry;
  register_builtin_tools(registry);

  EXPECT_DOUBLE_EQ(registry.invoke("calculator", "add", {{"a", 2}, {"b", 3}}).data.get<double>(), 5.0);
  EXPECT_DOUBLE_EQ(registry.invoke("calculator", "subtract", {{"a", 2}, {"b", 3}}).data.get<double>(), -1.0);
  EXPECT_DOUBLE_EQ(registry.invoke("calculator", "multiply", {{"a", 2.5}, {"b", 4}}).data.get<double>(), 10.0);
  EXPECT_DOUBLE_EQ(registry.invoke("calculator", "divide", {{"a", 9}, {"b", 3}}).data.get<double>(), 3.0);
}

TEST(ToolRegistry, ErrorKinds)
{
  ToolRegistry registry;
  register_builtin_tools(registry);

  EXPECT_EQ(invoke_error(registry, "weather", "forecast", json::object()), ErrorKind::TOOL_NOT_FOUND);
  EXPECT_EQ(invoke_error(registry, "calculator", "sqrt", {{"a", 4}}), ErrorKind::CAPABILITY_NOT_FOUND);
  EXPECT_EQ(invoke_error(registry, "calculator", "add", {{"a", 1}}), ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(invoke_error(registry, "calculator", "add", json::array()), ErrorKind::INVALID_ARGUMENT);
  EXPECT_EQ(invoke_error(registry, "calculator", "divide", {{"a", 1}, {"b", 0}}),
            ErrorKind::TOOL_EXECUTION_ERROR);
  EXPECT_EQ(invoke_error(registry, "calculator", "add", {{"a", "one"}, {"b", 2}}),
            ErrorKind::TOOL_EXECUTION_ERROR);
}

TEST(ToolRegistry, CapabilityFailureCarriesMessage)
{
  ToolRegistry registry;
  register_builtin_tools(registry);
  try {
    registry.invoke("calculator", "divide", {{"a", 1}, {"b", 0}});
    FAIL() << "expected KernelError";
  } catch (const KernelError& e) {
    EXPECT_NE(std::string(e.what()).find("division by zero"), std::string::npos);
  }
}

TEST(ToolRegistry, DisabledToolFails)
{
  ToolRegistry registry;
  register_builtin_tools(registry);
  registry.set_enabled("calculator", false);
  EXPECT_EQ(invoke_error(registry, "calculator", "add", {{"a", 1}, {"b", 2}}),
            ErrorKind::TOOL_EXECUTION_ERROR);

  registry.set_enabled("calculator", true);
  EXPECT_NO_THROW(registry.invoke("calculator", "add", {{"a", 1}, {"b", 2}}));
  EXPECT_THROW(registry.set_enabled("weather", true), KernelError);
}

TEST(ToolRegistry, DefaultsAndCounters)
{
  ToolRegistry registry;

  ToolMetadata tool;
  tool.id = "greeter";
  tool.name = "Greeter";
  tool.version = "0.1.0";
  ToolCapability greet;
  greet.name = "greet";
  greet.parameters = {ToolParameter{"name", "Who to greet", "string", false, json("world")}};
  greet.return_type = "string";
  greet.handler = [](const json& params) -> json {
    return "hello " + params.at("name").get<std::string>();
  };
  tool.capabilities.push_back(greet);
  registry.register_tool(tool);

  EXPECT_EQ(registry.invoke("greeter", "greet", json::object()).data, "hello world");
  EXPECT_EQ(registry.invoke("greeter", "greet", {{"name", "roya"}}).data, "hello roya");

  auto tools = registry.list();
  ASSERT_EQ(tools.size(), 1u);
  EXPECT_EQ(tools[0].execution_count, 2u);
  EXPECT_EQ(tools[0].capabilities, std::vector<std::string>{"greet"});

  auto described = registry.describe("greeter");
  EXPECT_EQ(described["capabilities"][0]["parameters"][0]["default"], "world");
}

TEST(ToolRegistry, RegisterRejectsMissingHandler)
{
  ToolRegistry registry;
  ToolMetadata tool;
  tool.id = "broken";
  ToolCapability cap;
  cap.name = "run";
  tool.capabilities.push_back(cap);
  EXPECT_THROW(registry.register_tool(tool), KernelError);
  EXPECT_EQ(registry.size(), 0u);
}

TEST(ToolRegistry, ListSortedById)
{
  ToolRegistry registry;
  ToolMetadata b;
  b.id = "beta";
  ToolMetadata a;
  a.id = "alpha";
  registry.register_tool(b);
  registry.register_tool(a);
  register_builtin_tools(registry);

  auto tools = registry.list();
  ASSERT_EQ(tools.size(), 3u);
  EXPECT_EQ(tools[0].id, "alpha");
  EXPECT_EQ(tools[1].id, "beta");
  EXPECT_EQ(tools[2].id, "calculator");
}
