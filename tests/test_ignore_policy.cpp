#include <gtest/gtest.h>
#include <vibecli/core/ignore_policy.hpp>
#include "test_support.hpp"

using namespace vibecli;
using vibecli::testing_support::TempDir;

TEST(IgnorePolicy, DefaultDenylists) {
    IgnorePolicy policy;
    EXPECT_TRUE(policy.ignored("node_modules", true));
    EXPECT_TRUE(policy.ignored("web/node_modules", true));
    EXPECT_TRUE(policy.ignored("package-lock.json", false));
    EXPECT_TRUE(policy.ignored("public/logo.PNG", false));
    EXPECT_FALSE(policy.ignored("src/app.tsx", false));
    EXPECT_FALSE(policy.ignored("package.json", false));
}

TEST(IgnorePolicy, DotEntriesHiddenExceptAllowlist) {
    IgnorePolicy policy;
    EXPECT_TRUE(policy.ignored(".git", true));
    EXPECT_TRUE(policy.ignored(".cache", true));
    EXPECT_TRUE(policy.ignored(".npmrc", false));
    EXPECT_FALSE(policy.ignored(".env", false));
    EXPECT_FALSE(policy.ignored(".gitignore", false));
}

TEST(IgnorePolicy, ExtensionRuleAppliesToFilesOnly) {
    IgnorePolicy policy;
    EXPECT_TRUE(policy.ignored("assets/font.woff2", false));
    EXPECT_FALSE(policy.ignored("assets/icons.svg", true));
}

TEST(IgnorePolicy, ParsesGitignoreText) {
    std::vector<std::string> patterns = parse_ignore_patterns(
        "# build output\n"
        "\n"
        "/out\n"
        "logs/\n"
        "!keep.log\n"
        "*.tmp\n");
    ASSERT_EQ(3u, patterns.size());
    EXPECT_EQ("out", patterns[0]);
    EXPECT_EQ("logs/", patterns[1]);
    EXPECT_EQ("*.tmp", patterns[2]);
}

TEST(IgnorePolicy, GlobPatternsMatchNameOrRelativePath) {
    IgnoreRuleSet rules = IgnoreRuleSet::defaults().with_patterns(
        parse_ignore_patterns("*.tmp\nlogs/\nsrc/generated/*.ts\n"));
    EXPECT_TRUE(is_ignored(rules, "deep/dir/scratch.tmp", false));
    EXPECT_TRUE(is_ignored(rules, "logs", true));
    EXPECT_FALSE(is_ignored(rules, "logs", false));
    EXPECT_TRUE(is_ignored(rules, "src/generated/api.ts", false));
    EXPECT_FALSE(is_ignored(rules, "src/api.ts", false));
}

TEST(IgnorePolicy, ForRootReadsGitignore) {
    TempDir tmp;
    tmp.write(".gitignore", "secrets.txt\n");
    
    IgnorePolicy with = IgnorePolicy::for_root(tmp.path(), true);
    IgnorePolicy without = IgnorePolicy::for_root(tmp.path(), false);
    EXPECT_TRUE(with.ignored("secrets.txt", false));
    EXPECT_FALSE(without.ignored("secrets.txt", false));
}
