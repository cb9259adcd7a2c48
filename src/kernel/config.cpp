#include "kernel/config.hpp"
#include "kernel/errors.hpp"
#include "kernel/session_table.hpp"
#include <fmt/core.h>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace royaos::kernel {

using json = nlohmann::json;

namespace {

constexpr uint64_t BYTES_PER_MB = 1024ull * 1024;

const json& section(const json& j, const char* name) {
    static const json empty = json::object();
    if (!j.contains(name) || j[name].is_null()) {
        return empty;
    }
    if (!j[name].is_object()) {
        throw std::runtime_error(fmt::format("config section '{}' must be an object", name));
    }
    return j[name];
}

uint64_t unsigned_value(const json& value, const std::string& key) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer() && value.get<int64_t>() >= 0) {
        return static_cast<uint64_t>(value.get<int64_t>());
    }
    throw std::runtime_error(fmt::format("{} must be a non-negative integer", key));
}

uint64_t megabytes_value(const json& value, const std::string& key) {
    uint64_t mb = unsigned_value(value, key);
    if (mb > std::numeric_limits<uint64_t>::max() / BYTES_PER_MB) {
        throw std::runtime_error(fmt::format("{} is too large ({} MB)", key, mb));
    }
    return mb * BYTES_PER_MB;
}

void parse_system(const json& s, KernelConfig& config) {
    config.system_name = s.value("name", config.system_name);
    config.system_version = s.value("version", config.system_version);
    config.log_level = s.value("log_level", config.log_level);
    config.data_dir = s.value("data_dir", config.data_dir);
    config.socket_path = s.value("socket_path", config.socket_path);
    if (s.contains("drain_timeout_ms")) {
        uint64_t ms = unsigned_value(s["drain_timeout_ms"], "system.drain_timeout_ms");
        if (ms > static_cast<uint64_t>(MAX_DRAIN_TIMEOUT.count())) {
            throw std::runtime_error(fmt::format("system.drain_timeout_ms exceeds {} ms",
                MAX_DRAIN_TIMEOUT.count()));
        }
        config.drain_timeout = std::chrono::milliseconds(ms);
    }
}

void parse_memory(const json& m, KernelConfig& config) {
    if (m.contains("max_allocation")) {
        uint64_t bytes = megabytes_value(m["max_allocation"], "memory.max_allocation");
        if (bytes == 0) {
            throw std::runtime_error("memory.max_allocation must be positive");
        }
        config.memory.max_allocation_bytes = bytes;
    }

    if (m.contains("optimization_strategy")) {
        std::string name = m["optimization_strategy"].get<std::string>();
        auto strategy = optimization_strategy_from_string(name);
        if (!strategy) {
            throw std::runtime_error(fmt::format("unknown optimization strategy: {}", name));
        }
        config.memory.optimization_strategy = *strategy;
    }

    if (m.contains("category_quotas")) {
        const auto& quotas = m["category_quotas"];
        if (!quotas.is_object()) {
            throw std::runtime_error("memory.category_quotas must be an object");
        }
        for (auto it = quotas.begin(); it != quotas.end(); ++it) {
            auto category = memory_category_from_string(it.key());
            if (!category) {
                throw std::runtime_error(fmt::format("unknown memory category: {}", it.key()));
            }
            config.memory.category_quotas[*category] =
                megabytes_value(it.value(), "memory.category_quotas." + it.key());
        }
    }
}

void parse_security(const json& s, KernelConfig& config) {
    if (s.contains("security_level")) {
        std::string name = s["security_level"].get<std::string>();
        auto level = security_level_from_string(name);
        if (!level) {
            throw std::runtime_error(fmt::format("invalid security level: {}", name));
        }
        config.security_level = *level;
    }

    if (s.contains("allowed_operations")) {
        config.allowed_operations = s["allowed_operations"].get<std::vector<std::string>>();
    }

    if (s.contains("rules")) {
        if (!s["rules"].is_array()) {
            throw std::runtime_error("security.rules must be an array");
        }
        for (const auto& r : s["rules"]) {
            try {
                config.permission_rules.push_back(PermissionRule::from_json(r));
            } catch (const KernelError& e) {
                throw std::runtime_error(fmt::format("security.rules: {}", e.what()));
            }
        }
    }
}

void parse_audit(const json& a, KernelConfig& config) {
    config.audit.max_entries = a.value("max_entries", config.audit.max_entries);
    config.audit.log_session = a.value("log_session", config.audit.log_session);
    config.audit.log_memory = a.value("log_memory", config.audit.log_memory);
    config.audit.log_tool = a.value("log_tool", config.audit.log_tool);
    config.audit.log_system = a.value("log_system", config.audit.log_system);
}

} // namespace

KernelConfig KernelConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("config must be a JSON object");
    }

    KernelConfig config;
    try {
        parse_system(section(j, "system"), config);
        parse_memory(section(j, "memory"), config);
        parse_security(section(j, "security"), config);
        parse_audit(section(j, "audit"), config);
    } catch (const json::exception& e) {
        throw std::runtime_error(fmt::format("invalid config value: {}", e.what()));
    }
    return config;
}

KernelConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error(fmt::format("cannot open config file: {}", path));
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error(fmt::format("config file is not valid JSON: {}", path));
    }
    return KernelConfig::from_json(j);
}

} // namespace royaos::kernel
