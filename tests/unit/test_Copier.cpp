#include <gtest/gtest.h>
#include "mirror/Copier.hpp"
#include "fakes.hpp"

namespace fs = std::filesystem;
using mh::mirror::Copier;
using mh::config::CopyRule;
using mh::test::writeFile;
using mh::test::readFile;

class CopierTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path src;
    fs::path dst;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "mirrorhall_copier_test";
        fs::remove_all(test_dir);
        src = test_dir / "public";
        dst = test_dir / "out";
        writeFile(src / "index.html", "index");
        writeFile(src / "style.css", "css");
        writeFile(src / "posts" / "one" / "index.html", "one");
    }

    void TearDown() override { fs::remove_all(test_dir); }

    [[nodiscard]] std::string pattern(const std::string& tail) const { return (src / tail).string(); }
};

TEST_F(CopierTest, RecursiveRuleMirrorsFilesAndDirectories) {
    Copier copier;
    const auto res = copier.applyRule({pattern("*"), dst, true});

    EXPECT_TRUE(res.ok);
    EXPECT_EQ(res.matched, 3u);
    EXPECT_EQ(res.copied, 3u);
    EXPECT_EQ(readFile(dst / "index.html"), "index");
    EXPECT_EQ(readFile(dst / "style.css"), "css");
    EXPECT_EQ(readFile(dst / "one" / "index.html"), "one");
}

TEST_F(CopierTest, NonRecursiveRuleSkipsDirectories) {
    Copier copier;
    const auto res = copier.applyRule({pattern("*"), dst, false});

    EXPECT_TRUE(res.ok);
    EXPECT_EQ(res.copied, 2u);
    EXPECT_TRUE(fs::exists(dst / "index.html"));
    EXPECT_FALSE(fs::exists(dst / "one"));
    EXPECT_FALSE(fs::exists(dst / "posts"));
}

TEST_F(CopierTest, OverwritesExistingDestinationFiles) {
    writeFile(dst / "style.css", "old");
    Copier copier;
    ASSERT_TRUE(copier.applyRule({pattern("*.css"), dst, false}).ok);
    EXPECT_EQ(readFile(dst / "style.css"), "css");
}

TEST_F(CopierTest, NoMatchIsNotAFailure) {
    Copier copier;
    const auto res = copier.applyRule({pattern("*.pdf"), dst, true});
    EXPECT_TRUE(res.ok);
    EXPECT_EQ(res.matched, 0u);
    EXPECT_FALSE(fs::exists(dst));
}

TEST_F(CopierTest, FailingRuleDoesNotStopLaterRules) {
    writeFile(test_dir / "file-not-dir", "x");
    Copier copier;
    const auto results = copier.apply({
        {pattern("index.html"), test_dir / "file-not-dir" / "nested", false},
        {pattern("style.css"), dst, false}
    });

    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].ok);
    EXPECT_FALSE(results[0].error.empty());
    EXPECT_TRUE(results[1].ok);
    EXPECT_TRUE(fs::exists(dst / "style.css"));
}

TEST_F(CopierTest, EmptyPatternOrDestinationFails) {
    Copier copier;
    EXPECT_FALSE(copier.applyRule({"", dst, false}).ok);
    EXPECT_FALSE(copier.applyRule({pattern("*"), fs::path{}, false}).ok);
}

TEST_F(CopierTest, ExpandReturnsSortedMatches) {
    const auto matches = Copier::expand(pattern("*"));
    ASSERT_EQ(matches.size(), 3u);
    EXPECT_EQ(matches[0].filename(), "index.html");
    EXPECT_EQ(matches[1].filename(), "posts");
    EXPECT_EQ(matches[2].filename(), "style.css");
}
