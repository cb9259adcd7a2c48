#include "kernel/tool_registry.hpp"
#include "kernel/errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>

namespace royaos::kernel {

using json = nlohmann::json;

json ToolParameter::to_json() const {
    json j;
    j["name"] = name;
    j["description"] = description;
    j["type"] = type;
    j["required"] = required;
    if (default_value) {
        j["default"] = *default_value;
    }
    return j;
}

json ToolCapability::to_json() const {
    json j;
    j["name"] = name;
    j["description"] = description;
    j["return_type"] = return_type;
    j["parameters"] = json::array();
    for (const auto& param : parameters) {
        j["parameters"].push_back(param.to_json());
    }
    return j;
}

const ToolCapability* ToolMetadata::find_capability(const std::string& capability) const {
    for (const auto& cap : capabilities) {
        if (cap.name == capability) {
            return &cap;
        }
    }
    return nullptr;
}

std::vector<std::string> ToolMetadata::capability_names() const {
    std::vector<std::string> names;
    names.reserve(capabilities.size());
    for (const auto& cap : capabilities) {
        names.push_back(cap.name);
    }
    return names;
}

json ToolDescriptor::to_json() const {
    json j;
    j["id"] = id;
    j["name"] = name;
    j["description"] = description;
    j["version"] = version;
    j["capabilities"] = capabilities;
    j["enabled"] = enabled;
    j["execution_count"] = execution_count;
    return j;
}

json ToolResult::to_json() const {
    json j;
    j["result"] = data;
    j["execution_time_us"] = duration.count();
    return j;
}

// ============================================================================
// ToolRegistry Implementation
// ============================================================================

void ToolRegistry::register_tool(ToolMetadata metadata) {
    if (metadata.id.empty()) {
        throw KernelError(ErrorKind::INVALID_ARGUMENT, "tool id is required");
    }
    for (const auto& cap : metadata.capabilities) {
        if (!cap.handler) {
            throw KernelError(ErrorKind::INVALID_ARGUMENT,
                fmt::format("capability {}.{} has no handler", metadata.id, cap.name));
        }
    }

    std::string id = metadata.id;
    size_t capability_count = metadata.capabilities.size();

    std::lock_guard<std::mutex> lock(mutex_);
    ToolEntry entry;
    entry.metadata = std::move(metadata);
    bool replaced = tools_.count(id) > 0;
    tools_[id] = std::move(entry);

    spdlog::info("{} tool: {} ({} capabilities)",
        replaced ? "Replaced" : "Registered", id, capability_count);
}

void ToolRegistry::set_enabled(const std::string& tool_id, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(tool_id);
    if (it == tools_.end()) {
        throw KernelError(ErrorKind::TOOL_NOT_FOUND, fmt::format("no tool found with id {}", tool_id));
    }
    it->second.enabled = enabled;
    spdlog::info("Tool {} {}", tool_id, enabled ? "enabled" : "disabled");
}

std::vector<ToolDescriptor> ToolRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolDescriptor> result;
    result.reserve(tools_.size());
    for (const auto& [id, entry] : tools_) {
        ToolDescriptor desc;
        desc.id = id;
        desc.name = entry.metadata.name;
        desc.description = entry.metadata.description;
        desc.version = entry.metadata.version;
        desc.capabilities = entry.metadata.capability_names();
        desc.enabled = entry.enabled;
        desc.execution_count = entry.execution_count;
        result.push_back(std::move(desc));
    }
    std::sort(result.begin(), result.end(),
        [](const ToolDescriptor& a, const ToolDescriptor& b) { return a.id < b.id; });
    return result;
}

json ToolRegistry::describe(const std::string& tool_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(tool_id);
    if (it == tools_.end()) {
        throw KernelError(ErrorKind::TOOL_NOT_FOUND, fmt::format("no tool found with id {}", tool_id));
    }
    const auto& meta = it->second.metadata;
    json j;
    j["id"] = meta.id;
    j["name"] = meta.name;
    j["description"] = meta.description;
    j["version"] = meta.version;
    j["author"] = meta.author;
    j["categories"] = meta.categories;
    j["capabilities"] = json::array();
    for (const auto& cap : meta.capabilities) {
        j["capabilities"].push_back(cap.to_json());
    }
    j["enabled"] = it->second.enabled;
    j["execution_count"] = it->second.execution_count;
    j["failure_count"] = it->second.failure_count;
    return j;
}

ToolResult ToolRegistry::invoke(const std::string& tool_id,
                                const std::string& capability,
                                const json& parameters) {
    CapabilityHandler handler;
    json params = parameters.is_null() ? json::object() : parameters;

    // Resolve under the lock, run without it
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tools_.find(tool_id);
        if (it == tools_.end()) {
            throw KernelError(ErrorKind::TOOL_NOT_FOUND,
                fmt::format("no tool found with id {}", tool_id));
        }
        const ToolCapability* cap = it->second.metadata.find_capability(capability);
        if (!cap) {
            throw KernelError(ErrorKind::CAPABILITY_NOT_FOUND,
                fmt::format("capability {} not found for tool {}", capability, tool_id));
        }
        if (!it->second.enabled) {
            throw KernelError(ErrorKind::TOOL_EXECUTION_ERROR,
                fmt::format("tool {} is disabled", tool_id));
        }
        if (!params.is_object()) {
            throw KernelError(ErrorKind::INVALID_ARGUMENT, "tool parameters must be an object");
        }
        for (const auto& param : cap->parameters) {
            if (params.contains(param.name)) continue;
            if (param.default_value) {
                params[param.name] = *param.default_value;
            } else if (param.required) {
                throw KernelError(ErrorKind::INVALID_ARGUMENT,
                    fmt::format("missing required parameter '{}' for {}.{}",
                        param.name, tool_id, capability));
            }
        }
        handler = cap->handler;
    }

    spdlog::debug("Executing tool {} capability {}", tool_id, capability);
    auto start = std::chrono::steady_clock::now();

    ToolResult result;
    try {
        result.data = handler(params);
    } catch (const KernelError& e) {
        record_execution(tool_id, false);
        throw KernelError(ErrorKind::TOOL_EXECUTION_ERROR, e.what());
    } catch (const std::exception& e) {
        record_execution(tool_id, false);
        spdlog::warn("Tool {}.{} failed: {}", tool_id, capability, e.what());
        throw KernelError(ErrorKind::TOOL_EXECUTION_ERROR,
            fmt::format("{}.{} failed: {}", tool_id, capability, e.what()));
    } catch (...) {
        record_execution(tool_id, false);
        spdlog::warn("Tool {}.{} failed with a non-standard exception", tool_id, capability);
        throw KernelError(ErrorKind::TOOL_EXECUTION_ERROR,
            fmt::format("{}.{} failed with an unknown error", tool_id, capability));
    }

    result.duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    record_execution(tool_id, true);
    return result;
}

size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

void ToolRegistry::record_execution(const std::string& tool_id, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(tool_id);
    if (it == tools_.end()) {
        return;  // Unregistered while running
    }
    it->second.execution_count++;
    if (!success) {
        it->second.failure_count++;
    }
    it->second.last_execution = std::chrono::system_clock::now();
}

} // namespace royaos::kernel
