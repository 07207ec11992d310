#include <gtest/gtest.h>
#include <vibecli/core/backup_store.hpp>
#include <vibecli/core/workspace.hpp>
#include "test_support.hpp"

#include <unistd.h>

using namespace vibecli;
using vibecli::testing_support::TempDir;

TEST(Workspace, OpenCreatesAndCanonicalizesRoot) {
    TempDir tmp;
    Workspace ws;
    ASSERT_TRUE(ws.open(tmp.file("new/project/../project")));
    EXPECT_EQ(tmp.file("new/project"), ws.root());
    EXPECT_TRUE(is_directory(ws.root()));
}

TEST(Workspace, ResolveIsRelativeToWorkingDirectory) {
    TempDir tmp;
    tmp.mkdir("src/components");
    Workspace ws;
    ASSERT_TRUE(ws.open(tmp.path()));
    
    EXPECT_EQ(tmp.file("src/components/Button.tsx"),
              ws.resolve(tmp.file("src"), "components/Button.tsx"));
    EXPECT_EQ(tmp.file("README.md"), ws.resolve(tmp.file("src"), "../README.md"));
    EXPECT_EQ(tmp.file("src/a.txt"), ws.resolve(tmp.path(), "src\\a.txt"));
    EXPECT_EQ(tmp.file("quoted name.txt"), ws.resolve(tmp.path(), "\"quoted name.txt\""));
    EXPECT_EQ(tmp.file("not/yet/there.txt"), ws.resolve(tmp.path(), "not/yet/there.txt"));
}

TEST(Workspace, ContainmentRejectsEscapes) {
    TempDir tmp;
    tmp.mkdir("project");
    tmp.mkdir("projectile");
    Workspace ws;
    ASSERT_TRUE(ws.open(tmp.file("project")));
    
    EXPECT_TRUE(ws.contains(ws.root()));
    EXPECT_TRUE(ws.contains(ws.resolve(ws.root(), "a/b.txt")));
    EXPECT_FALSE(ws.contains(ws.resolve(ws.root(), "../outside.txt")));
    EXPECT_FALSE(ws.contains(tmp.file("projectile/x")));
    EXPECT_FALSE(ws.contains(ws.resolve(ws.root(), "/etc/passwd")));
}

TEST(Workspace, SymlinkOutOfRootIsOutside) {
    TempDir tmp;
    tmp.mkdir("project");
    tmp.mkdir("elsewhere");
    ASSERT_EQ(0, symlink(tmp.file("elsewhere").c_str(), tmp.file("project/link").c_str()));
    Workspace ws;
    ASSERT_TRUE(ws.open(tmp.file("project")));
    EXPECT_FALSE(ws.contains(ws.resolve(ws.root(), "link/file.txt")));
}

TEST(Workspace, RelativeToRoot) {
    TempDir tmp;
    Workspace ws;
    ASSERT_TRUE(ws.open(tmp.path()));
    EXPECT_EQ(".", ws.relative_to_root(ws.root()));
    EXPECT_EQ("src/app.js", ws.relative_to_root(tmp.file("src/app.js")));
}

TEST(Workspace, TreeHelpers) {
    TempDir tmp;
    tmp.write("d/one.txt", "1");
    tmp.write("d/sub/two.txt", "2");
    EXPECT_EQ(2u, Workspace::count_files(tmp.file("d")));
    
    ASSERT_TRUE(Workspace::copy_tree(tmp.file("d"), tmp.file("copy")));
    EXPECT_EQ("2", tmp.read("copy/sub/two.txt"));
    
    std::string error;
    ASSERT_TRUE(Workspace::remove_tree(tmp.file("d"), error));
    EXPECT_FALSE(path_exists(tmp.file("d")));
    EXPECT_FALSE(Workspace::remove_tree(tmp.file("d"), error));
    EXPECT_FALSE(error.empty());
}

TEST(BackupStore, SanitizesPathSeparators) {
    EXPECT_EQ("src_components_App.tsx", BackupStore::sanitize("src/components/App.tsx"));
    EXPECT_EQ("a_b", BackupStore::sanitize("a\\b"));
}

TEST(BackupStore, FileBackupHoldsPriorContent) {
    TempDir tmp;
    tmp.write("src/a.txt", "foo");
    Workspace ws;
    ASSERT_TRUE(ws.open(tmp.path()));
    BackupStore store(ws);
    
    BackupRecord record;
    std::string error;
    ASSERT_TRUE(store.backup_file(tmp.file("src/a.txt"), record, error)) << error;
    EXPECT_EQ("src/a.txt", record.original_relative_path);
    EXPECT_EQ(0u, record.backup_path.find(tmp.file(".vibe/backups/src_a.txt_")));
    EXPECT_TRUE(ends_with(record.backup_path, ".bak"));
    EXPECT_EQ(19u, record.timestamp.size());   // YYYYmmdd_HHMMSS_mmm
    
    std::string saved;
    ASSERT_TRUE(read_file(record.backup_path, saved));
    EXPECT_EQ("foo", saved);
}

TEST(BackupStore, BackupsNeverOverwriteEachOther) {
    TempDir tmp;
    tmp.write("a.txt", "v1");
    Workspace ws;
    ASSERT_TRUE(ws.open(tmp.path()));
    BackupStore store(ws);
    
    std::vector<std::string> paths;
    for (int i = 0; i < 3; ++i) {
        tmp.write("a.txt", "v" + std::to_string(i + 1));
        BackupRecord record;
        std::string error;
        ASSERT_TRUE(store.backup_file(tmp.file("a.txt"), record, error));
        paths.push_back(record.backup_path);
    }
    EXPECT_NE(paths[0], paths[1]);
    EXPECT_NE(paths[1], paths[2]);
    EXPECT_NE(paths[0], paths[2]);
    
    std::string first;
    ASSERT_TRUE(read_file(paths[0], first));
    EXPECT_EQ("v1", first);
}

TEST(BackupStore, DirectoryBackupCopiesTree) {
    TempDir tmp;
    tmp.write("web/index.html", "<html/>");
    tmp.write("web/css/site.css", "body{}");
    Workspace ws;
    ASSERT_TRUE(ws.open(tmp.path()));
    BackupStore store(ws, "snapshots");
    
    BackupRecord record;
    std::string error;
    ASSERT_TRUE(store.backup_directory(tmp.file("web"), record, error)) << error;
    EXPECT_EQ(0u, record.backup_path.find(tmp.file("snapshots/web_")));
    std::string css;
    ASSERT_TRUE(read_file(join_path(record.backup_path, "css/site.css"), css));
    EXPECT_EQ("body{}", css);
}

TEST(BackupStore, EmptyFilesAreBackedUp) {
    TempDir tmp;
    tmp.write("empty.txt", "");
    tmp.write("pkg/__init__.py", "");
    tmp.write("pkg/mod.py", "x = 1\n");
    Workspace ws;
    ASSERT_TRUE(ws.open(tmp.path()));
    BackupStore store(ws);
    
    BackupRecord record;
    std::string error;
    ASSERT_TRUE(store.backup_file(tmp.file("empty.txt"), record, error)) << error;
    ASSERT_TRUE(path_exists(record.backup_path));
    std::string saved = "stale";
    ASSERT_TRUE(read_file(record.backup_path, saved));
    EXPECT_EQ("", saved);
    
    ASSERT_TRUE(store.backup_directory(tmp.file("pkg"), record, error)) << error;
    EXPECT_TRUE(path_exists(join_path(record.backup_path, "__init__.py")));
    ASSERT_TRUE(read_file(join_path(record.backup_path, "mod.py"), saved));
    EXPECT_EQ("x = 1\n", saved);
}

TEST(BackupStore, MissingSourceFails) {
    TempDir tmp;
    Workspace ws;
    ASSERT_TRUE(ws.open(tmp.path()));
    BackupStore store(ws);
    BackupRecord record;
    std::string error;
    EXPECT_FALSE(store.backup_file(tmp.file("ghost.txt"), record, error));
    EXPECT_FALSE(error.empty());
}
