#include "kernel/permissions.hpp"
#include "kernel/errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fnmatch.h>
#include <algorithm>
#include <cctype>

namespace royaos::kernel {

using json = nlohmann::json;

namespace {

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Ordering key for "most specific": longer literal prefix first, then an
// exact pattern over a wildcard one with the same prefix
struct Specificity {
    size_t prefix = 0;
    bool exact = false;

    bool operator<(const Specificity& other) const {
        if (prefix != other.prefix) return prefix < other.prefix;
        return !exact && other.exact;
    }
    bool operator==(const Specificity& other) const {
        return prefix == other.prefix && exact == other.exact;
    }
};

// A pattern spelled exactly like the resource counts as exact, so a rule
// for the literal resource "*" is an explicit grant
bool literal_match(const std::string& pattern, const std::string& resource) {
    return !PermissionChecker::is_wildcard(pattern) || pattern == resource;
}

Specificity specificity_of(const std::string& pattern, const std::string& resource) {
    Specificity s;
    s.prefix = PermissionChecker::literal_prefix_length(pattern);
    s.exact = literal_match(pattern, resource);
    return s;
}

// Whether the current level honors this rule at all
bool rule_applies(const PermissionRule& rule, SecurityLevel level, const std::string& resource) {
    bool wildcard = !literal_match(rule.resource_pattern, resource);
    switch (level) {
        case SecurityLevel::LOW:
            return !(rule.effect == Effect::DENY && wildcard);
        case SecurityLevel::STANDARD:
            return true;
        case SecurityLevel::HIGH:
        case SecurityLevel::MAXIMUM:
            return !(rule.effect == Effect::ALLOW && wildcard);
    }
    return true;
}

Effect default_effect(SecurityLevel level) {
    return (level == SecurityLevel::LOW || level == SecurityLevel::STANDARD)
        ? Effect::ALLOW : Effect::DENY;
}

} // namespace

// ============================================================================
// Enum / struct helpers
// ============================================================================

std::optional<SecurityLevel> security_level_from_string(const std::string& str) {
    std::string s = to_lower(str);
    if (s == "low")      return SecurityLevel::LOW;
    if (s == "standard") return SecurityLevel::STANDARD;
    if (s == "high")     return SecurityLevel::HIGH;
    if (s == "maximum")  return SecurityLevel::MAXIMUM;
    return std::nullopt;
}

std::optional<Effect> effect_from_string(const std::string& str) {
    std::string s = to_lower(str);
    if (s == "allow") return Effect::ALLOW;
    if (s == "deny")  return Effect::DENY;
    return std::nullopt;
}

json PermissionTriple::to_json() const {
    json j;
    j["resource_type"] = resource_type;
    j["operation"] = operation;
    j["resource"] = resource;
    return j;
}

bool PermissionRule::same_as(const PermissionRule& other) const {
    return resource_type == other.resource_type &&
           operation == other.operation &&
           resource_pattern == other.resource_pattern &&
           effect == other.effect;
}

json PermissionRule::to_json() const {
    json j;
    j["resource_type"] = resource_type;
    j["operation"] = operation;
    j["resource"] = resource_pattern;
    j["effect"] = effect_to_string(effect);
    j["sequence"] = sequence;
    return j;
}

PermissionRule PermissionRule::from_json(const json& j) {
    if (!j.is_object()) {
        throw KernelError(ErrorKind::INVALID_ARGUMENT, "permission rule must be an object");
    }

    PermissionRule rule;
    rule.resource_type = j.value("resource_type", "");
    rule.operation = j.value("operation", "");
    rule.resource_pattern = j.value("resource", "");
    if (rule.resource_type.empty() || rule.operation.empty() || rule.resource_pattern.empty()) {
        throw KernelError(ErrorKind::INVALID_ARGUMENT,
            "permission rule requires resource_type, operation and resource");
    }

    std::string effect_str = j.value("effect", "allow");
    auto effect = effect_from_string(effect_str);
    if (!effect) {
        throw KernelError(ErrorKind::INVALID_ARGUMENT,
            fmt::format("invalid permission effect: {}", effect_str));
    }
    rule.effect = *effect;
    return rule;
}

json PermissionDecision::to_json() const {
    json j;
    j["effect"] = effect_to_string(effect);
    j["defaulted"] = defaulted;
    if (protected_resource) {
        j["protected"] = true;
    }
    if (matched_rule) {
        j["rule"] = matched_rule->to_json();
    }
    return j;
}

// ============================================================================
// PermissionChecker Implementation
// ============================================================================

bool PermissionChecker::pattern_matches(const std::string& resource, const std::string& pattern) {
    // No FNM_PATHNAME: '*' also matches '/'
    return fnmatch(pattern.c_str(), resource.c_str(), 0) == 0;
}

bool PermissionChecker::is_wildcard(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

size_t PermissionChecker::literal_prefix_length(const std::string& pattern) {
    size_t pos = pattern.find_first_of("*?[");
    return pos == std::string::npos ? pattern.size() : pos;
}

bool PermissionChecker::is_protected(const PermissionTriple& triple) {
    if (triple.resource_type == "file") {
        // System areas are never reachable
        if (triple.resource.rfind("/system", 0) == 0 ||
            triple.resource.rfind("C:\\Windows", 0) == 0) {
            return true;
        }
        // No writes to executables
        std::string lowered = to_lower(triple.resource);
        if (triple.operation == "write" &&
            (ends_with(lowered, ".exe") || ends_with(lowered, ".dll"))) {
            return true;
        }
        return false;
    }

    if (triple.resource_type == "network" && triple.operation == "connect") {
        const std::string& host = triple.resource;
        if (host.find("localhost") != std::string::npos ||
            host.find("127.0.0.1") != std::string::npos ||
            host.find("api.") != std::string::npos) {
            return false;
        }
        return true;
    }

    return false;
}

// ============================================================================
// PermissionPolicy Implementation
// ============================================================================

PermissionPolicy::PermissionPolicy(SecurityState& state)
    : state_(state) {
    spdlog::info("Permission policy initialized (level={}, rules={})",
        security_level_to_string(state_.level), state_.rules.size());
}

PermissionDecision PermissionPolicy::evaluate(const PermissionTriple& triple) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const PermissionRule* best = nullptr;
    Specificity best_rank;

    for (const auto& rule : state_.rules) {
        if (rule.resource_type != triple.resource_type || rule.operation != triple.operation) {
            continue;
        }
        if (!rule_applies(rule, state_.level, triple.resource)) {
            continue;
        }
        if (!PermissionChecker::pattern_matches(triple.resource, rule.resource_pattern)) {
            continue;
        }

        Specificity rank = specificity_of(rule.resource_pattern, triple.resource);
        if (!best || best_rank < rank ||
            (rank == best_rank && rule.sequence > best->sequence)) {
            best = &rule;
            best_rank = rank;
        }
    }

    PermissionDecision decision;
    if (best) {
        decision.effect = best->effect;
        decision.matched_rule = *best;
    } else {
        decision.effect = default_effect(state_.level);
        decision.defaulted = true;
    }

    if (state_.level == SecurityLevel::MAXIMUM && decision.allowed() &&
        PermissionChecker::is_protected(triple)) {
        decision.effect = Effect::DENY;
        decision.protected_resource = true;
    }

    spdlog::debug("Permission {} {} {}: {}{}",
        triple.resource_type, triple.operation, triple.resource,
        effect_to_string(decision.effect), decision.defaulted ? " (default)" : "");
    return decision;
}

PermissionDecision PermissionPolicy::evaluate(const std::string& resource_type,
                                              const std::string& operation,
                                              const std::string& resource) const {
    return evaluate(PermissionTriple{resource_type, operation, resource});
}

void PermissionPolicy::add_rule(const std::string& resource_type,
                                const std::string& operation,
                                const std::string& resource_pattern,
                                Effect effect) {
    if (resource_type.empty() || operation.empty() || resource_pattern.empty()) {
        throw KernelError(ErrorKind::INVALID_ARGUMENT,
            "permission rule requires resource_type, operation and resource");
    }

    PermissionRule rule;
    rule.resource_type = resource_type;
    rule.operation = operation;
    rule.resource_pattern = resource_pattern;
    rule.effect = effect;

    std::lock_guard<std::mutex> lock(mutex_);
    add_rule_locked(std::move(rule));
    spdlog::info("Added permission rule: {} {} {} -> {}",
        resource_type, operation, resource_pattern, effect_to_string(effect));
}

void PermissionPolicy::add_rule_locked(PermissionRule rule) {
    rule.sequence = state_.next_sequence++;
    for (auto& existing : state_.rules) {
        if (existing.same_as(rule)) {
            existing.sequence = rule.sequence;
            return;
        }
    }
    state_.rules.push_back(std::move(rule));
}

size_t PermissionPolicy::remove_rule(const std::string& resource_type,
                                     const std::string& operation,
                                     const std::string& resource_pattern,
                                     std::optional<Effect> effect) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto before = state_.rules.size();
    state_.rules.erase(
        std::remove_if(state_.rules.begin(), state_.rules.end(),
            [&](const PermissionRule& rule) {
                return rule.resource_type == resource_type &&
                       rule.operation == operation &&
                       rule.resource_pattern == resource_pattern &&
                       (!effect || rule.effect == *effect);
            }),
        state_.rules.end());

    size_t removed = before - state_.rules.size();
    if (removed > 0) {
        spdlog::info("Removed {} permission rule(s): {} {} {}",
            removed, resource_type, operation, resource_pattern);
    } else {
        spdlog::debug("No permission rule to remove: {} {} {}",
            resource_type, operation, resource_pattern);
    }
    return removed;
}

void PermissionPolicy::grant_operations(const std::vector<std::string>& operations) {
    for (const auto& op : operations) {
        if (op == "file_read") {
            add_rule("file", "read", "*");
        } else if (op == "file_write") {
            add_rule("file", "write", "*");
        } else if (op == "network_access") {
            add_rule("network", "connect", "*");
        } else if (op == "tool_execution") {
            add_rule("tool", "execute", "*");
        } else {
            spdlog::warn("Unknown operation in allowed_operations: {}", op);
        }
    }
}

void PermissionPolicy::set_level(SecurityLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::info("Changing security level from {} to {}",
        security_level_to_string(state_.level), security_level_to_string(level));
    state_.level = level;
}

SecurityLevel PermissionPolicy::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.level;
}

std::vector<PermissionRule> PermissionPolicy::rules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.rules;
}

size_t PermissionPolicy::rule_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.rules.size();
}

json PermissionPolicy::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json j;
    j["level"] = security_level_to_string(state_.level);
    j["rules"] = json::array();

    // Oldest first so restore replays the same recency order
    std::vector<PermissionRule> ordered = state_.rules;
    std::sort(ordered.begin(), ordered.end(),
        [](const PermissionRule& a, const PermissionRule& b) { return a.sequence < b.sequence; });
    for (const auto& rule : ordered) {
        j["rules"].push_back(rule.to_json());
    }
    return j;
}

void PermissionPolicy::restore(const json& snapshot) {
    // Parse everything before touching state so a bad blob changes nothing
    std::string level_str = snapshot.value("level", "");
    auto level = security_level_from_string(level_str);
    if (!level) {
        throw KernelError(ErrorKind::INVALID_ARGUMENT,
            fmt::format("invalid security level in snapshot: '{}'", level_str));
    }

    std::vector<PermissionRule> rules;
    if (snapshot.contains("rules")) {
        if (!snapshot["rules"].is_array()) {
            throw KernelError(ErrorKind::INVALID_ARGUMENT, "snapshot rules must be an array");
        }
        for (const auto& r : snapshot["rules"]) {
            rules.push_back(PermissionRule::from_json(r));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_.level = *level;
    state_.rules.clear();
    for (auto& rule : rules) {
        add_rule_locked(std::move(rule));
    }
    spdlog::info("Permission policy restored (level={}, rules={})",
        security_level_to_string(state_.level), state_.rules.size());
}

} // namespace royaos::kernel
