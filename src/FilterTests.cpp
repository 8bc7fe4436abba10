#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include "core/Filter.hpp"

namespace {

const fs::path kVault = fs::temp_directory_path() / "assetkeeper_filter_vault";

} // namespace

// ExtensionFilter测试用例
TEST(ExtensionFilterTest, EmptyListMatchesEverything) {
    ExtensionFilter filter;
    EXPECT_TRUE(filter.match(Asset("notes.txt", kVault)));
    EXPECT_TRUE(filter.match(Asset("Makefile", kVault)));
    EXPECT_EQ("Extension Filter: all extensions", filter.getFilterDescription());
}

TEST(ExtensionFilterTest, NormalizesDotAndCase) {
    ExtensionFilter filter({"blend", ".PSD"});
    EXPECT_TRUE(filter.isExtensionIncluded(".blend"));
    EXPECT_TRUE(filter.isExtensionIncluded("psd"));
    EXPECT_EQ(2u, filter.getExtensions().size());

    EXPECT_TRUE(filter.match(Asset("scenes/house.blend", kVault)));
    EXPECT_TRUE(filter.match(Asset("art/Poster.Psd", kVault)));
    EXPECT_FALSE(filter.match(Asset("notes.txt", kVault)));
    EXPECT_FALSE(filter.match(Asset("README", kVault)));
}

TEST(ExtensionFilterTest, AddAndRemove) {
    ExtensionFilter filter;
    filter.addExtension(".kra");
    filter.addExtension("");
    EXPECT_EQ(1u, filter.getExtensions().size());
    EXPECT_TRUE(filter.removeExtension("KRA"));
    EXPECT_FALSE(filter.removeExtension(".kra"));
    EXPECT_TRUE(filter.getExtensions().empty());
}

// PatternFilter测试用例
TEST(PatternFilterTest, GlobTranslation) {
    EXPECT_EQ("(?:.*/)?[^/]*\\.tmp", PatternFilter::globToRegex("**/*.tmp"));
    EXPECT_EQ(".*", PatternFilter::globToRegex("**"));
    EXPECT_EQ("cache/[^/]", PatternFilter::globToRegex("cache/?"));
}

TEST(PatternFilterTest, NameOnlyPatternMatchesAnyDirectory) {
    PatternFilter filter({"*.tmp"});
    EXPECT_TRUE(filter.isExcluded("a.tmp"));
    EXPECT_TRUE(filter.isExcluded("deep/nested/b.tmp"));
    EXPECT_FALSE(filter.isExcluded("b.tmp.blend"));
}

TEST(PatternFilterTest, PathPatternsRespectSegments) {
    PatternFilter filter({"renders/*.png", "cache/**"});
    EXPECT_TRUE(filter.isExcluded("renders/frame1.png"));
    EXPECT_FALSE(filter.isExcluded("renders/shots/frame1.png"));
    EXPECT_TRUE(filter.isExcluded("cache/a/b/c.bin"));
    EXPECT_FALSE(filter.isExcluded("scenes/cache.blend"));
}

TEST(PatternFilterTest, MatchUsesLogicalPath) {
    PatternFilter filter({"**/*.blend1"});
    EXPECT_FALSE(filter.match(Asset("scenes/house.blend1", kVault)));
    EXPECT_TRUE(filter.match(Asset("scenes/house.blend", kVault)));
}

TEST(PatternFilterTest, AddRemoveAndDescribe) {
    PatternFilter filter;
    filter.addExcludePattern("*.tmp");
    filter.addExcludePattern("*.bak");
    EXPECT_EQ("Pattern Filter: Excluded Patterns (2): *.tmp, *.bak", filter.getFilterDescription());

    EXPECT_TRUE(filter.removeExcludePattern("*.tmp"));
    EXPECT_FALSE(filter.removeExcludePattern("*.tmp"));
    EXPECT_FALSE(filter.isExcluded("x.tmp"));
    EXPECT_TRUE(filter.isExcluded("x.bak"));

    filter.clearExcludePatterns();
    EXPECT_TRUE(filter.getExcludePatterns().empty());
    EXPECT_FALSE(filter.isExcluded("x.bak"));
}
