#include "kernel/builtin_tools.hpp"
#include <stdexcept>
#include <string>

namespace royaos::kernel {

using json = nlohmann::json;

namespace {

double number_param(const json& params, const char* name) {
    const auto& value = params.at(name);
    if (!value.is_number()) {
        throw std::invalid_argument(std::string("parameter '") + name + "' must be a number");
    }
    return value.get<double>();
}

std::vector<ToolParameter> binary_operands() {
    return {
        ToolParameter{"a", "First number", "number", true, std::nullopt},
        ToolParameter{"b", "Second number", "number", true, std::nullopt}
    };
}

ToolCapability binary_capability(const std::string& name,
                                 const std::string& description,
                                 std::function<double(double, double)> op) {
    ToolCapability cap;
    cap.name = name;
    cap.description = description;
    cap.parameters = binary_operands();
    cap.return_type = "number";
    cap.handler = [op](const json& params) -> json {
        return op(number_param(params, "a"), number_param(params, "b"));
    };
    return cap;
}

} // namespace

ToolMetadata make_calculator_tool() {
    ToolMetadata tool;
    tool.id = "calculator";
    tool.name = "Calculator";
    tool.description = "Performs mathematical calculations";
    tool.version = "1.0.0";
    tool.author = "RoyaOS Team";
    tool.categories = {"math", "utility"};

    tool.capabilities.push_back(binary_capability("add", "Add two numbers",
        [](double a, double b) { return a + b; }));
    tool.capabilities.push_back(binary_capability("subtract", "Subtract two numbers",
        [](double a, double b) { return a - b; }));
    tool.capabilities.push_back(binary_capability("multiply", "Multiply two numbers",
        [](double a, double b) { return a * b; }));
    tool.capabilities.push_back(binary_capability("divide", "Divide a by b",
        [](double a, double b) {
            if (b == 0.0) {
                throw std::domain_error("division by zero");
            }
            return a / b;
        }));
    return tool;
}

void register_builtin_tools(ToolRegistry& registry) {
    registry.register_tool(make_calculator_tool());
}

} // namespace royaos::kernel
