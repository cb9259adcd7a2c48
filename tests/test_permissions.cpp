#include <gtest/gtest.h>
#include "kernel/errors.hpp"
#include "kernel/permissions.hpp"

using namespace royaos::kernel;

TEST(PermissionChecker, GlobStarCrossesSlash)
{
  EXPECT_TRUE(PermissionChecker::pattern_matches("/tmp/a/b/c.txt", "/tmp/*"));
  EXPECT_TRUE(PermissionChecker::pattern_matches("/tmp/a", "/tmp/?"));
  EXPECT_FALSE(PermissionChecker::pattern_matches("/tmp/ab", "/tmp/?"));
  EXPECT_FALSE(PermissionChecker::pattern_matches("/var/x", "/tmp/*"));
}

TEST(PermissionChecker, LiteralPrefix)
{
  EXPECT_EQ(PermissionChecker::literal_prefix_length("/tmp/*"), 5u);
  EXPECT_EQ(PermissionChecker::literal_prefix_length("/tmp/x"), 6u);
  EXPECT_EQ(PermissionChecker::literal_prefix_length("*"), 0u);
  EXPECT_TRUE(PermissionChecker::is_wildcard("a?"));
  EXPECT_FALSE(PermissionChecker::is_wildcard("/etc/hosts"));
}

TEST(PermissionPolicy, NoRulesFollowsLevelDefault)
{
  SecurityState state;
  PermissionPolicy policy(state);

  auto decision = policy.evaluate("file", "write", "/system/x");
  EXPECT_TRUE(decision.allowed());
  EXPECT_TRUE(decision.defaulted);

  policy.set_level(SecurityLevel::MAXIMUM);
  decision = policy.evaluate("file", "write", "/system/x");
  EXPECT_FALSE(decision.allowed());

  policy.set_level(SecurityLevel::STANDARD);
  EXPECT_TRUE(policy.evaluate("file", "write", "/system/x").allowed());
}

TEST(PermissionPolicy, MostSpecificPatternWins)
{
  SecurityState state;
  PermissionPolicy policy(state);
  policy.add_rule("file", "read", "/home/*", Effect::DENY);
  policy.add_rule("file", "read", "/home/user/*", Effect::ALLOW);
  policy.add_rule("file", "read", "/home/user/secret", Effect::DENY);

  EXPECT_FALSE(policy.evaluate("file", "read", "/home/other/x").allowed());
  EXPECT_TRUE(policy.evaluate("file", "read", "/home/user/notes").allowed());
  EXPECT_FALSE(policy.evaluate("file", "read", "/home/user/secret").allowed());

  auto decision = policy.evaluate("file", "read", "/home/user/notes");
  ASSERT_TRUE(decision.matched_rule.has_value());
  EXPECT_EQ(decision.matched_rule->resource_pattern, "/home/user/*");
  EXPECT_FALSE(decision.defaulted);
}

TEST(PermissionPolicy, ExactBeatsWildcardWithSamePrefix)
{
  SecurityState state;
  PermissionPolicy policy(state);
  policy.add_rule("file", "read", "/data", Effect::ALLOW);
  policy.add_rule("file", "read", "/data*", Effect::DENY);

  EXPECT_TRUE(policy.evaluate("file", "read", "/data").allowed());
  EXPECT_FALSE(policy.evaluate("file", "read", "/data2").allowed());
}

TEST(PermissionPolicy, TieGoesToNewestRule)
{
  SecurityState state;
  PermissionPolicy policy(state);
  policy.add_rule("file", "read", "/srv/*", Effect::ALLOW);
  policy.add_rule("file", "read", "/srv/*", Effect::DENY);
  EXPECT_FALSE(policy.evaluate("file", "read", "/srv/a").allowed());

  // Re-adding refreshes recency instead of duplicating
  policy.add_rule("file", "read", "/srv/*", Effect::ALLOW);
  EXPECT_EQ(policy.rule_count(), 2u);
  EXPECT_TRUE(policy.evaluate("file", "read", "/srv/a").allowed());
}

TEST(PermissionPolicy, RaisingLevelNeverGrants)
{
  SecurityState state;
  PermissionPolicy policy(state);
  policy.add_rule("file", "read", "/pub/*", Effect::ALLOW);
  policy.add_rule("file", "read", "/pub/private/*", Effect::DENY);
  policy.add_rule("file", "read", "/pub/readme", Effect::ALLOW);
  policy.add_rule("network", "connect", "*", Effect::ALLOW);

  const std::vector<PermissionTriple> probes = {
    {"file", "read", "/pub/a"},
    {"file", "read", "/pub/private/key"},
    {"file", "read", "/pub/readme"},
    {"file", "read", "/etc/passwd"},
    {"file", "write", "/pub/a"},
    {"network", "connect", "example.com"},
    {"network", "connect", "localhost"},
  };

  const SecurityLevel levels[] = {
    SecurityLevel::LOW, SecurityLevel::STANDARD, SecurityLevel::HIGH, SecurityLevel::MAXIMUM
  };

  for (const auto& probe : probes) {
    bool previously_allowed = true;
    for (SecurityLevel level : levels) {
      policy.set_level(level);
      bool allowed = policy.evaluate(probe).allowed();
      if (!previously_allowed) {
        EXPECT_FALSE(allowed) << probe.resource_type << " " << probe.operation << " "
                              << probe.resource << " at " << security_level_to_string(level);
      }
      previously_allowed = allowed;
    }
  }
}

TEST(PermissionPolicy, HighIgnoresWildcardAllows)
{
  SecurityState state;
  PermissionPolicy policy(state);
  policy.add_rule("file", "read", "/pub/*", Effect::ALLOW);
  policy.add_rule("file", "read", "/pub/readme", Effect::ALLOW);
  policy.add_rule("session", "create", "*", Effect::ALLOW);
  policy.set_level(SecurityLevel::HIGH);

  EXPECT_FALSE(policy.evaluate("file", "read", "/pub/a").allowed());
  EXPECT_TRUE(policy.evaluate("file", "read", "/pub/readme").allowed());
  // A pattern spelled exactly like the resource is an explicit grant
  EXPECT_TRUE(policy.evaluate("session", "create", "*").allowed());
}

TEST(PermissionPolicy, LowTreatsWildcardDenyAsAdvisory)
{
  SecurityState state;
  PermissionPolicy policy(state);
  policy.add_rule("file", "write", "/etc/*", Effect::DENY);
  policy.add_rule("file", "write", "/etc/shadow", Effect::DENY);
  policy.set_level(SecurityLevel::LOW);

  EXPECT_TRUE(policy.evaluate("file", "write", "/etc/hosts").allowed());
  EXPECT_FALSE(policy.evaluate("file", "write", "/etc/shadow").allowed());
}

TEST(PermissionPolicy, MaximumProtections)
{
  SecurityState state;
  PermissionPolicy policy(state);
  policy.add_rule("file", "write", "/apps/tool.exe", Effect::ALLOW);
  policy.add_rule("network", "connect", "example.com", Effect::ALLOW);
  policy.add_rule("network", "connect", "api.example.com", Effect::ALLOW);
  policy.set_level(SecurityLevel::MAXIMUM);

  auto decision = policy.evaluate("file", "write", "/apps/tool.exe");
  EXPECT_FALSE(decision.allowed());
  EXPECT_TRUE(decision.protected_resource);

  EXPECT_FALSE(policy.evaluate("file", "read", "C:\\Windows\\system32").allowed());
  EXPECT_FALSE(policy.evaluate("network", "connect", "example.com").allowed());
  EXPECT_TRUE(policy.evaluate("network", "connect", "api.example.com").allowed());
}

TEST(PermissionPolicy, RemoveMissingRuleIsNoop)
{
  SecurityState state;
  PermissionPolicy policy(state);
  EXPECT_EQ(policy.remove_rule("file", "read", "/nothing"), 0u);

  policy.add_rule("file", "read", "/a", Effect::ALLOW);
  policy.add_rule("file", "read", "/a", Effect::DENY);
  EXPECT_EQ(policy.remove_rule("file", "read", "/a", Effect::DENY), 1u);
  EXPECT_EQ(policy.rule_count(), 1u);
  EXPECT_EQ(policy.remove_rule("file", "read", "/a"), 1u);
  EXPECT_EQ(policy.remove_rule("file", "read", "/a"), 0u);
}

TEST(PermissionPolicy, AddRuleRejectsEmptyFields)
{
  SecurityState state;
  PermissionPolicy policy(state);
  try {
    policy.add_rule("file", "", "/a");
    FAIL() << "expected KernelError";
  } catch (const KernelError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::INVALID_ARGUMENT);
  }
}

TEST(PermissionPolicy, GrantOperations)
{
  SecurityState state;
  PermissionPolicy policy(state);
  policy.set_level(SecurityLevel::STANDARD);
  policy.add_rule("tool", "execute", "*", Effect::DENY);
  policy.grant_operations({"tool_execution", "not_an_operation"});

  // The grant is newer than the deny with the same specificity
  EXPECT_TRUE(policy.evaluate("tool", "execute", "calculator").allowed());
  EXPECT_EQ(policy.rule_count(), 2u);
}

TEST(PermissionPolicy, SnapshotRestore)
{
  SecurityState state;
  PermissionPolicy policy(state);
  policy.add_rule("file", "read", "/a/*", Effect::ALLOW);
  policy.add_rule("file", "read", "/a/*", Effect::DENY);
  policy.set_level(SecurityLevel::HIGH);
  auto snapshot = policy.snapshot();

  SecurityState other_state;
  PermissionPolicy other(other_state);
  other.restore(snapshot);

  EXPECT_EQ(other.level(), SecurityLevel::HIGH);
  EXPECT_EQ(other.rule_count(), 2u);
  other.set_level(SecurityLevel::STANDARD);
  // Recency order survives the round trip
  EXPECT_FALSE(other.evaluate("file", "read", "/a/x").allowed());
}

TEST(PermissionPolicy, RestoreRejectsBadSnapshotWithoutChanges)
{
  SecurityState state;
  PermissionPolicy policy(state);
  policy.add_rule("file", "read", "/a", Effect::ALLOW);

  nlohmann::json bad = {{"level", "standard"}, {"rules", {{{"resource_type", "file"}}}}};
  EXPECT_THROW(policy.restore(bad), KernelError);
  EXPECT_EQ(policy.rule_count(), 1u);

  nlohmann::json bad_level = {{"level", "paranoid"}};
  EXPECT_THROW(policy.restore(bad_level), KernelError);
  EXPECT_EQ(policy.level(), SecurityLevel::STANDARD);
}
