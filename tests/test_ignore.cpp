#include "temp_tree.hpp"
#include "engine/ignore.hpp"

using namespace ctxpack::engine;

namespace {

    IgnoreScope scope_of(const std::string& base, const std::vector<std::string>& lines) {
        auto scope = IgnoreScope::from_lines(base, lines);
        EXPECT_TRUE(scope.has_value());
        return *scope;
    }

}

TEST(IgnoreScopeTest, UnanchoredPatternMatchesAtAnyDepth) {
    auto scope = scope_of("", {"*.log"});
    EXPECT_EQ(scope.match("a.log", false), std::optional<bool>(true));
    EXPECT_EQ(scope.match("deep/dir/a.log", false), std::optional<bool>(true));
    EXPECT_FALSE(scope.match("a.txt", false).has_value());
}

TEST(IgnoreScopeTest, LastMatchingRuleWins) {
    auto scope = scope_of("", {"*.log", "!keep.log"});
    EXPECT_EQ(scope.match("debug.log", false), std::optional<bool>(true));
    EXPECT_EQ(scope.match("keep.log", false), std::optional<bool>(false));
    EXPECT_EQ(scope.match("x/keep.log", false), std::optional<bool>(false));

    auto reversed = scope_of("", {"!keep.log", "*.log"});
    EXPECT_EQ(reversed.match("keep.log", false), std::optional<bool>(true));
}

TEST(IgnoreScopeTest, DirectoryOnlyPattern) {
    auto scope = scope_of("", {"build/"});
    EXPECT_EQ(scope.match("build", true), std::optional<bool>(true));
    EXPECT_EQ(scope.match("src/build", true), std::optional<bool>(true));
    EXPECT_FALSE(scope.match("build", false).has_value());
}

TEST(IgnoreScopeTest, AnchoredPatterns) {
    auto scope = scope_of("", {"/logs", "docs/*.md"});
    EXPECT_EQ(scope.match("logs", true), std::optional<bool>(true));
    EXPECT_FALSE(scope.match("src/logs", true).has_value());
    EXPECT_EQ(scope.match("docs/a.md", false), std::optional<bool>(true));
    EXPECT_FALSE(scope.match("x/docs/a.md", false).has_value());
    EXPECT_FALSE(scope.match("docs/sub/a.md", false).has_value());
}

TEST(IgnoreScopeTest, PatternCoversDescendants) {
    auto scope = scope_of("", {"generated"});
    EXPECT_EQ(scope.match("generated", true), std::optional<bool>(true));
    EXPECT_EQ(scope.match("generated/api.cpp", false), std::optional<bool>(true));
}

TEST(IgnoreScopeTest, DoubleStar) {
    auto scope = scope_of("", {"**/cache", "out/**", "a/**/z.txt"});
    EXPECT_EQ(scope.match("cache", true), std::optional<bool>(true));
    EXPECT_EQ(scope.match("x/y/cache", true), std::optional<bool>(true));
    EXPECT_FALSE(scope.match("out", true).has_value());
    EXPECT_EQ(scope.match("out/file.txt", false), std::optional<bool>(true));
    EXPECT_EQ(scope.match("a/z.txt", false), std::optional<bool>(true));
    EXPECT_EQ(scope.match("a/b/c/z.txt", false), std::optional<bool>(true));
}

TEST(IgnoreScopeTest, CharacterClassesAndWildcardsStopAtSlash) {
    auto scope = scope_of("", {"[ab].txt", "[!x]y.dat", "src/*.o"});
    EXPECT_EQ(scope.match("a.txt", false), std::optional<bool>(true));
    EXPECT_FALSE(scope.match("c.txt", false).has_value());
    EXPECT_EQ(scope.match("zy.dat", false), std::optional<bool>(true));
    EXPECT_FALSE(scope.match("xy.dat", false).has_value());
    EXPECT_EQ(scope.match("src/a.o", false), std::optional<bool>(true));
    EXPECT_FALSE(scope.match("src/sub/a.o", false).has_value());
}

TEST(IgnoreScopeTest, CommentsBlanksAndEscapes) {
    EXPECT_FALSE(IgnoreScope::from_lines("", {"# comment", "", "   "}).has_value());

    auto scope = scope_of("", {"\\#notes", "trailing.txt   ", "dot.file"});
    EXPECT_EQ(scope.match("#notes", false), std::optional<bool>(true));
    EXPECT_EQ(scope.match("trailing.txt", false), std::optional<bool>(true));
    EXPECT_FALSE(scope.match("dotXfile", false).has_value());
}

TEST(IgnoreScopeTest, ScopeIsAnchoredAtItsDirectory) {
    auto scope = scope_of("sub", {"*.tmp", "/top.txt"});
    EXPECT_EQ(scope.match("sub/a.tmp", false), std::optional<bool>(true));
    EXPECT_EQ(scope.match("sub/top.txt", false), std::optional<bool>(true));
    EXPECT_FALSE(scope.match("sub/deeper/top.txt", false).has_value());
    EXPECT_FALSE(scope.match("other/a.tmp", false).has_value());
    EXPECT_FALSE(scope.match("subway/a.tmp", false).has_value());
    EXPECT_FALSE(scope.match("sub", true).has_value());
}

TEST(IgnoreScopeTest, NegatedDirectoryRuleDoesNotReincludeIgnoredFiles) {
    auto scope = scope_of("", {"*", "!*/", "!*.py"});
    EXPECT_EQ(scope.match("src", true), std::optional<bool>(false));
    EXPECT_EQ(scope.match("src/a.py", false), std::optional<bool>(false));
    EXPECT_EQ(scope.match("src/a.txt", false), std::optional<bool>(true));
    EXPECT_EQ(scope.match("b.txt", false), std::optional<bool>(true));
}

TEST(IgnoreScopeTest, NegatedParentNameLosesToDirectFileRule) {
    auto scope = scope_of("", {"*.txt", "!foo"});
    EXPECT_EQ(scope.match("foo", true), std::optional<bool>(false));
    EXPECT_EQ(scope.match("foo/x.txt", false), std::optional<bool>(true));
    EXPECT_EQ(scope.match("foo/x.py", false), std::optional<bool>(false));
}

TEST(IgnoreScopeTest, IgnoredParentWinsOverEarlierDirectNegation) {
    auto scope = scope_of("", {"!vendor/keep.txt", "vendor/"});
    EXPECT_EQ(scope.match("vendor/keep.txt", false), std::optional<bool>(true));

    auto reincluded = scope_of("", {"vendor/", "!vendor/keep.txt"});
    EXPECT_EQ(reincluded.match("vendor/keep.txt", false), std::optional<bool>(false));
}

TEST(IgnoreScopeTest, BracketAsFirstClassMember) {
    auto scope = scope_of("", {"[]a].txt", "[!]]z.md"});
    EXPECT_EQ(scope.match("].txt", false), std::optional<bool>(true));
    EXPECT_EQ(scope.match("a.txt", false), std::optional<bool>(true));
    EXPECT_FALSE(scope.match("b.txt", false).has_value());
    EXPECT_EQ(scope.match("qz.md", false), std::optional<bool>(true));
    EXPECT_FALSE(scope.match("]z.md", false).has_value());
}

TEST(ScopeChainTest, ChildScopeOverridesOnlyWhenItMatches) {
    ScopeChain chain;
    chain.push(scope_of("", {"*.log"}));
    chain.push(scope_of("child", {"!debug.log"}));

    EXPECT_FALSE(chain.is_ignored("child/debug.log", false));
    EXPECT_TRUE(chain.is_ignored("child/other.log", false));
    EXPECT_TRUE(chain.is_ignored("top.log", false));
    EXPECT_FALSE(chain.is_ignored("main.py", false));

    chain.pop();
    EXPECT_EQ(chain.size(), 1u);
    EXPECT_TRUE(chain.is_ignored("child/debug.log", false));
}

TEST(ScopeChainTest, EmptyChainKeepsEverything) {
    ScopeChain chain;
    EXPECT_TRUE(chain.empty());
    EXPECT_FALSE(chain.is_ignored("anything", false));
    chain.pop();
    EXPECT_TRUE(chain.empty());
}

class IgnoreFileTest : public TempTreeTest {};

TEST_F(IgnoreFileTest, MissingOrEmptyFileYieldsNoScope) {
    EXPECT_FALSE(IgnoreScope::load(test_dir, "", {".gitignore"}).has_value());

    write_file(".gitignore", "# only a comment\n\n");
    EXPECT_FALSE(IgnoreScope::load(test_dir, "", {".gitignore"}).has_value());
}

TEST_F(IgnoreFileTest, LoadsRulesFromFile) {
    write_file(".gitignore", "*.log\r\ndata/\n");
    auto scope = IgnoreScope::load(test_dir, "", {".gitignore"});
    ASSERT_TRUE(scope.has_value());
    EXPECT_EQ(scope->rule_count(), 2u);
    EXPECT_EQ(scope->match("out.log", false), std::optional<bool>(true));
    EXPECT_EQ(scope->match("data", true), std::optional<bool>(true));
}

TEST_F(IgnoreFileTest, LaterFilesOverrideEarlierOnes) {
    write_file(".gitignore", "*.log\n");
    write_file(".ctxpackignore", "!keep.log\n");
    auto scope = IgnoreScope::load(test_dir, "", {".gitignore", ".ctxpackignore"});
    ASSERT_TRUE(scope.has_value());
    EXPECT_EQ(scope->match("keep.log", false), std::optional<bool>(false));
    EXPECT_EQ(scope->match("drop.log", false), std::optional<bool>(true));
}
