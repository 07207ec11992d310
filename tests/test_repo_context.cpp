#include <gtest/gtest.h>
#include <vibecli/core/repo_context.hpp>
#include "test_support.hpp"

#include <algorithm>
#include <unistd.h>

using namespace vibecli;
using vibecli::testing_support::TempDir;

namespace {

class RepoContextTest : public ::testing::Test {
protected:
    TempDir tmp;
    
    void SetUp() override {
        tmp.write("src/app.js", "console.log('hi');\n");
        tmp.write("README.md", "# Demo\n");
        tmp.write(".env", "PORT=3000\n");
        tmp.write(".secret", "hidden\n");
        tmp.write("node_modules/react/index.js", "module.exports = {};\n");
        tmp.write("logo.png", "PNG");
    }
    
    RepoContextBuilder builder(const ContextLimits& limits = ContextLimits()) {
        return RepoContextBuilder(tmp.path(), IgnorePolicy(), limits);
    }
};

} // namespace

TEST_F(RepoContextTest, TreeListsDirectoriesFirstAndHonorsPolicy) {
    std::string tree = builder().render_tree(tmp.path());
    EXPECT_EQ("├── src\n"
              "│   └── app.js\n"
              "├── .env\n"
              "└── README.md", tree);
}

TEST_F(RepoContextTest, EmptyDirectoryRendering) {
    tmp.mkdir("empty");
    EXPECT_EQ("(Empty Directory)", builder().render_tree(tmp.file("empty")));
}

TEST_F(RepoContextTest, ScrapeInlinesVisibleFiles) {
    std::string scrape = builder().scrape_contents(tmp.path());
    EXPECT_NE(std::string::npos, scrape.find("### File: `src/app.js`\n```js\nconsole.log('hi');\n"));
    EXPECT_NE(std::string::npos, scrape.find("### File: `README.md`"));
    EXPECT_EQ(std::string::npos, scrape.find("module.exports"));
    EXPECT_EQ(std::string::npos, scrape.find("hidden"));
    EXPECT_EQ(std::string::npos, scrape.find("logo.png"));
}

TEST_F(RepoContextTest, OversizedAndBinaryFilesAreListedNotInlined) {
    tmp.write("big.txt", std::string(2000, 'x'));
    tmp.write("blob.dat", std::string("ab\0cd", 5));
    
    ContextLimits limits;
    limits.max_file_size = 1000;
    std::string scrape = builder(limits).scrape_contents(tmp.path());
    EXPECT_NE(std::string::npos, scrape.find("### File: `big.txt`\n[skipped: 2000 bytes]"));
    EXPECT_NE(std::string::npos, scrape.find("### File: `blob.dat`\n[skipped: binary file]"));
    EXPECT_EQ(std::string::npos, scrape.find(std::string(2000, 'x')));
}

TEST_F(RepoContextTest, TotalBudgetTruncates) {
    for (int i = 0; i < 5; ++i) {
        tmp.write("notes/n" + std::to_string(i) + ".txt", std::string(300, 'a' + i));
    }
    ContextLimits limits;
    limits.max_context_chars = 700;
    std::string scrape = builder(limits).scrape_contents(tmp.path());
    EXPECT_NE(std::string::npos, scrape.find("more files not shown]"));
}

TEST_F(RepoContextTest, SkippedDirectoriesAreReported) {
    tmp.mkdir("web/dist");
    std::vector<std::string> skipped = builder().find_skipped_directories(tmp.path());
    ASSERT_EQ(2u, skipped.size());
    EXPECT_EQ("node_modules", skipped[0]);
    EXPECT_EQ("web/dist", skipped[1]);
    
    std::string context = builder().build(tmp.path());
    EXPECT_EQ(0u, context.find("DIRECTORY STRUCTURE:\n"));
    EXPECT_NE(std::string::npos, context.find("\nFILE CONTENTS:\n"));
    EXPECT_NE(std::string::npos, context.find("SKIPPED DIRECTORIES (not scanned): node_modules, web/dist"));
}

TEST_F(RepoContextTest, RebuildWithoutChangesIsIdentical) {
    RepoContextBuilder b = builder();
    EXPECT_EQ(b.build(tmp.path()), b.build(tmp.path()));
}

TEST_F(RepoContextTest, ListDirectoryMarksSubdirectories) {
    std::vector<std::string> names;
    ASSERT_TRUE(builder().list_directory(tmp.path(), names));
    ASSERT_EQ(3u, names.size());
    EXPECT_EQ("src/", names[0]);
    EXPECT_EQ(".env", names[1]);
    EXPECT_EQ("README.md", names[2]);
    
    names.clear();
    EXPECT_FALSE(builder().list_directory(tmp.file("nope"), names));
}

TEST_F(RepoContextTest, SymlinkOutsideRootIsListedButNotRead) {
    TempDir outside;
    outside.write("keys.txt", "TOPSECRET\n");
    ASSERT_EQ(0, symlink(outside.path().c_str(), tmp.file("ext").c_str()));
    ASSERT_EQ(0, symlink(outside.file("keys.txt").c_str(), tmp.file("keys-link.txt").c_str()));
    
    std::string scrape = builder().scrape_contents(tmp.path());
    EXPECT_EQ(std::string::npos, scrape.find("TOPSECRET"));
    EXPECT_EQ(std::string::npos, scrape.find("### File: `keys-link.txt`"));
    
    std::string tree = builder().render_tree(tmp.path());
    EXPECT_NE(std::string::npos, tree.find("ext"));
    EXPECT_EQ(std::string::npos, tree.find("keys.txt"));
    
    std::vector<std::string> names;
    ASSERT_TRUE(builder().list_directory(tmp.path(), names));
    EXPECT_NE(names.end(), std::find(names.begin(), names.end(), "ext"));
}

TEST_F(RepoContextTest, SymlinkCyclesAreNotDescended) {
    ASSERT_EQ(0, symlink(".", tmp.file("src/l1").c_str()));
    ASSERT_EQ(0, symlink(".", tmp.file("src/l2").c_str()));
    
    EXPECT_EQ("├── src\n"
              "│   ├── app.js\n"
              "│   ├── l1\n"
              "│   └── l2\n"
              "├── .env\n"
              "└── README.md", builder().render_tree(tmp.path()));
    
    std::string context = builder().build(tmp.path());
    EXPECT_EQ(std::string::npos, context.find("src/l1/"));
    std::vector<std::string> skipped = builder().find_skipped_directories(tmp.path());
    ASSERT_EQ(1u, skipped.size());
    EXPECT_EQ("node_modules", skipped[0]);
}
