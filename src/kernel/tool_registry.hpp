/**
 * RoyaOS Tool Registry
 *
 * Maps tool ids to named capabilities. Capabilities are plain callables
 * supplied at registration; whatever they throw comes back to the caller
 * as TOOL_EXECUTION_ERROR.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace royaos::kernel {

struct ToolParameter {
    std::string name;
    std::string description;
    std::string type;                       // "number", "string", ...
    bool required = true;
    std::optional<nlohmann::json> default_value;

    nlohmann::json to_json() const;
};

using CapabilityHandler = std::function<nlohmann::json(const nlohmann::json& params)>;

struct ToolCapability {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;
    std::string return_type;
    CapabilityHandler handler;

    nlohmann::json to_json() const;
};

struct ToolMetadata {
    std::string id;
    std::string name;
    std::string description;
    std::string version;
    std::string author;
    std::vector<std::string> categories;
    std::vector<ToolCapability> capabilities;

    const ToolCapability* find_capability(const std::string& capability) const;
    std::vector<std::string> capability_names() const;
};

// Listing view of a registered tool
struct ToolDescriptor {
    std::string id;
    std::string name;
    std::string description;
    std::string version;
    std::vector<std::string> capabilities;
    bool enabled = true;
    uint64_t execution_count = 0;

    nlohmann::json to_json() const;
};

struct ToolResult {
    nlohmann::json data;
    std::chrono::microseconds duration{0};

    nlohmann::json to_json() const;
};

class ToolRegistry {
public:
    ToolRegistry() = default;

    // Non-copyable
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    // Replaces an existing tool with the same id. Throws INVALID_ARGUMENT
    // for an empty id or a capability without a handler.
    void register_tool(ToolMetadata metadata);

    // Throws TOOL_NOT_FOUND
    void set_enabled(const std::string& tool_id, bool enabled);

    std::vector<ToolDescriptor> list() const;

    // Full metadata including parameter descriptions; TOOL_NOT_FOUND
    nlohmann::json describe(const std::string& tool_id) const;

    // TOOL_NOT_FOUND, CAPABILITY_NOT_FOUND, INVALID_ARGUMENT (parameters
    // not an object or a required one missing), TOOL_EXECUTION_ERROR
    ToolResult invoke(const std::string& tool_id,
                      const std::string& capability,
                      const nlohmann::json& parameters);

    size_t size() const;

private:
    struct ToolEntry {
        ToolMetadata metadata;
        bool enabled = true;
        uint64_t execution_count = 0;
        uint64_t failure_count = 0;
        std::chrono::system_clock::time_point last_execution;
    };

    std::unordered_map<std::string, ToolEntry> tools_;
    mutable std::mutex mutex_;

    void record_execution(const std::string& tool_id, bool success);
};

} // namespace royaos::kernel
