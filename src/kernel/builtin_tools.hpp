#pragma once
#include "kernel/tool_registry.hpp"

namespace royaos::kernel {

// calculator: add, subtract, multiply, divide over numeric "a" and "b"
ToolMetadata make_calculator_tool();

void register_builtin_tools(ToolRegistry& registry);

} // namespace royaos::kernel
