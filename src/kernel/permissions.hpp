/**
 * RoyaOS Permission Policy
 *
 * Evaluates (resource_type, operation, resource) triples against an
 * allow/deny rule set. The most specific matching pattern wins, ties go
 * to the most recently added rule, and the security level decides both
 * the fallback effect and which rules are honored. Raising the level only
 * ever narrows the set of allowed triples.
 */
#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace royaos::kernel {

// Process-wide security level
enum class SecurityLevel {
    LOW,        // Wildcard deny rules are advisory
    STANDARD,   // All rules apply, default allow
    HIGH,       // Explicit grants only, default deny
    MAXIMUM     // HIGH plus built-in resource protections
};

inline const char* security_level_to_string(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::LOW:      return "low";
        case SecurityLevel::STANDARD: return "standard";
        case SecurityLevel::HIGH:     return "high";
        case SecurityLevel::MAXIMUM:  return "maximum";
        default: return "unknown";
    }
}

// Case-insensitive; nullopt for unknown names
std::optional<SecurityLevel> security_level_from_string(const std::string& str);

enum class Effect {
    ALLOW,
    DENY
};

inline const char* effect_to_string(Effect effect) {
    return effect == Effect::ALLOW ? "allow" : "deny";
}

std::optional<Effect> effect_from_string(const std::string& str);

struct PermissionTriple {
    std::string resource_type;
    std::string operation;
    std::string resource;

    nlohmann::json to_json() const;
};

struct PermissionRule {
    std::string resource_type;
    std::string operation;
    std::string resource_pattern;       // Glob: '*' any run (crosses '/'), '?' one char
    Effect effect = Effect::ALLOW;
    uint64_t sequence = 0;              // Insertion order, newest wins ties

    // Same (type, operation, pattern, effect), ignoring sequence
    bool same_as(const PermissionRule& other) const;

    nlohmann::json to_json() const;

    // Throws KernelError(INVALID_ARGUMENT) on missing fields or bad effect
    static PermissionRule from_json(const nlohmann::json& j);
};

struct PermissionDecision {
    Effect effect = Effect::DENY;
    std::optional<PermissionRule> matched_rule;
    bool defaulted = false;             // No rule matched, level default used
    bool protected_resource = false;    // Overridden by a MAXIMUM protection

    bool allowed() const { return effect == Effect::ALLOW; }
    nlohmann::json to_json() const;
};

// Policy state owned by the kernel and handed to PermissionPolicy by
// reference. All mutation goes through PermissionPolicy.
struct SecurityState {
    SecurityLevel level = SecurityLevel::STANDARD;
    std::vector<PermissionRule> rules;
    uint64_t next_sequence = 1;
};

// Pattern helpers
class PermissionChecker {
public:
    static bool pattern_matches(const std::string& resource, const std::string& pattern);

    static bool is_wildcard(const std::string& pattern);

    // Characters before the first wildcard
    static size_t literal_prefix_length(const std::string& pattern);

    // Built-in protections enforced at MAXIMUM
    static bool is_protected(const PermissionTriple& triple);
};

class PermissionPolicy {
public:
    explicit PermissionPolicy(SecurityState& state);

    // Non-copyable
    PermissionPolicy(const PermissionPolicy&) = delete;
    PermissionPolicy& operator=(const PermissionPolicy&) = delete;

    PermissionDecision evaluate(const PermissionTriple& triple) const;
    PermissionDecision evaluate(const std::string& resource_type,
                                const std::string& operation,
                                const std::string& resource) const;

    // Re-adding an identical rule refreshes its recency
    void add_rule(const std::string& resource_type,
                  const std::string& operation,
                  const std::string& resource_pattern,
                  Effect effect = Effect::ALLOW);

    // Removes matching rules (any effect when effect is nullopt).
    // Missing rules are not an error; returns the number removed.
    size_t remove_rule(const std::string& resource_type,
                       const std::string& operation,
                       const std::string& resource_pattern,
                       std::optional<Effect> effect = std::nullopt);

    // Named grants from configuration: file_read, file_write,
    // network_access, tool_execution
    void grant_operations(const std::vector<std::string>& operations);

    void set_level(SecurityLevel level);
    SecurityLevel level() const;

    std::vector<PermissionRule> rules() const;
    size_t rule_count() const;

    // Level + rules as a JSON blob, and the inverse
    nlohmann::json snapshot() const;
    void restore(const nlohmann::json& snapshot);

private:
    SecurityState& state_;
    mutable std::mutex mutex_;

    // Caller must hold the mutex
    void add_rule_locked(PermissionRule rule);
};

} // namespace royaos::kernel
