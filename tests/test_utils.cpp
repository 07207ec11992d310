#include <gtest/gtest.h>
#include <vibecli/core/config.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/utils.hpp>
#include "test_support.hpp"

using namespace vibecli;
using vibecli::testing_support::TempDir;

TEST(Utils, TrimAndCase) {
    EXPECT_EQ("abc", trim("  abc \r\n"));
    EXPECT_EQ("", trim(" \t "));
    EXPECT_EQ("npm run dev", to_lower("NPM Run DEV"));
    EXPECT_EQ("WRITE", to_upper("write"));
    EXPECT_TRUE(starts_with("npm install", "npm"));
    EXPECT_FALSE(ends_with("a", "abc"));
}

TEST(Utils, SplitAndJoin) {
    std::vector<std::string> parts = split_whitespace("  npm   react  react-dom ");
    ASSERT_EQ(3u, parts.size());
    EXPECT_EQ("react-dom", parts[2]);
    EXPECT_EQ("npm,react,react-dom", join(parts, ","));
    EXPECT_EQ("", join(std::vector<std::string>(), ","));
}

TEST(Utils, TruncateKeepsUtf8Sequences) {
    std::string s = "ab\xC3\xA9" "cd";   // "abécd"
    EXPECT_EQ("ab", truncate_safe(s, 3));
    EXPECT_EQ(s, truncate_safe(s, 100));
}

TEST(Utils, NormalizePath) {
    EXPECT_EQ("/a/c", normalize_path("/a/b/../c/./"));
    EXPECT_EQ("/", normalize_path("/../.."));
    EXPECT_EQ("../x", normalize_path("../x"));
    EXPECT_EQ("/root/src", join_path("/root/", "/src"));
    EXPECT_EQ("file.txt", base_name("/tmp/dir/file.txt"));
}

TEST(Utils, FileRoundTripCreatesParents) {
    TempDir tmp;
    std::string path = tmp.file("deep/nested/dir/notes.txt");
    ASSERT_TRUE(create_parent_directory(path));
    ASSERT_TRUE(write_file(path, "line1\n\nline3"));
    std::string content;
    ASSERT_TRUE(read_file(path, content));
    EXPECT_EQ("line1\n\nline3", content);
    EXPECT_TRUE(is_directory(tmp.file("deep/nested")));
    EXPECT_FALSE(read_file(tmp.file("missing.txt"), content));
}

TEST(Utils, GlobMatch) {
    EXPECT_TRUE(glob_match("*.log", "server.log"));
    EXPECT_FALSE(glob_match("*.log", "logs/server.log"));
    EXPECT_TRUE(glob_match("logs/*.log", "logs/server.log"));
}

TEST(Logger, ParsesLevelsAndMirrorsToFile) {
    EXPECT_EQ(LogLevel::DEBUG, parse_log_level(" Debug "));
    EXPECT_EQ(LogLevel::WARN, parse_log_level("warning"));
    EXPECT_EQ(LogLevel::INFO, parse_log_level("verbose"));
    EXPECT_STREQ("ERROR", log_level_name(LogLevel::ERROR));

    TempDir tmp;
    std::string path = tmp.file("logs/vibecli.log");
    Logger& log = Logger::instance();
    LogLevel saved = log.level();
    log.set_level(LogLevel::WARN);
    ASSERT_TRUE(log.set_log_file(path));
    LOG_INFO("hidden %d", 1);
    LOG_WARN("backup dir %s missing", ".vibe/backups");
    ASSERT_TRUE(log.set_log_file(""));
    log.set_level(saved);

    std::string content;
    ASSERT_TRUE(read_file(path, content));
    EXPECT_EQ(std::string::npos, content.find("hidden"));
    EXPECT_NE(std::string::npos, content.find("WARN"));
    EXPECT_NE(std::string::npos, content.find("backup dir .vibe/backups missing"));
    EXPECT_EQ(std::string::npos, content.find("\033["));
}

TEST(Config, DottedKeysAndDefaults) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(
        "{\"openrouter\": {\"model\": \"x/y\", \"stream\": false, \"timeout\": 42},"
        " \"agent\": {\"max_history_turns\": \"9\"}}"));
    EXPECT_EQ("x/y", cfg.get_string("openrouter.model", "default"));
    EXPECT_FALSE(cfg.get_bool("openrouter.stream", true));
    EXPECT_EQ(42, cfg.get_int("openrouter.timeout", 300));
    EXPECT_EQ(9, cfg.get_int("agent.max_history_turns", 15));
    EXPECT_EQ("fallback", cfg.get_string("openrouter.missing", "fallback"));
    EXPECT_TRUE(cfg.has("openrouter.model"));
    EXPECT_FALSE(cfg.has("context.max_file_size"));
}

TEST(Config, SetOverridesAndCreatesPath) {
    Config cfg;
    cfg.set_string("openrouter.api_key", "sk-test");
    cfg.set_int("run.timeout", 5);
    cfg.set_bool("agent.classify_intent", true);
    EXPECT_EQ("sk-test", cfg.get_string("openrouter.api_key"));
    EXPECT_EQ(5, cfg.get_int("run.timeout"));
    EXPECT_TRUE(cfg.get_bool("agent.classify_intent"));
}

TEST(Config, InvalidFileKeepsDefaults) {
    TempDir tmp;
    tmp.write("config.json", "{ not json");
    Config cfg;
    EXPECT_FALSE(cfg.load_file(tmp.file("config.json")));
    EXPECT_EQ(300, cfg.get_int("run.timeout", 300));
    EXPECT_FALSE(cfg.load_file(tmp.file("absent.json")));
}

TEST(Config, LoadsFileAndRecordsSource) {
    TempDir tmp;
    tmp.write("config.json", "{\"log_level\": \"debug\"}");
    Config cfg;
    ASSERT_TRUE(cfg.load_file(tmp.file("config.json")));
    EXPECT_EQ("debug", cfg.get_string("log_level"));
    EXPECT_EQ(tmp.file("config.json"), cfg.source());
}
