#include <gtest/gtest.h>
#include <vibecli/core/platform_translator.hpp>

using namespace vibecli;

TEST(PlatformTranslator, PosixIdiomsOnWindows) {
    PlatformTranslator t(Platform::WINDOWS);
    EXPECT_EQ("dir /b", t.translate("ls").command);
    EXPECT_EQ("dir /a", t.translate("ls -la").command);
    EXPECT_EQ("rmdir /s /q build", t.translate("rm -rf build").command);
    EXPECT_EQ("type package.json", t.translate("cat package.json").command);
    EXPECT_EQ("findstr TODO src", t.translate("grep TODO src").command);
}

TEST(PlatformTranslator, WindowsIdiomsOnPosix) {
    PlatformTranslator t(Platform::POSIX);
    EXPECT_EQ("ls -1", t.translate("dir /b").command);
    EXPECT_EQ("rm -rf node_modules", t.translate("rmdir /s /q node_modules").command);
    EXPECT_EQ("clear", t.translate("cls").command);
    EXPECT_EQ("touch index.js", t.translate("type nul > index.js").command);
}

TEST(PlatformTranslator, OnlyWholeWordPrefixesAreRewritten) {
    PlatformTranslator win(Platform::WINDOWS);
    EXPECT_EQ("lsof -i :3000", win.translate("lsof -i :3000").command);
    EXPECT_EQ("npm ls", win.translate("npm ls").command);
    
    PlatformTranslator posix(Platform::POSIX);
    EXPECT_EQ("directory-tool", posix.translate("directory-tool").command);
    EXPECT_TRUE(posix.translate("npm test").warnings.empty());
}

TEST(PlatformTranslator, TranslationIsReported) {
    PlatformTranslator t(Platform::POSIX);
    Translation r = t.translate("del /q old.log");
    EXPECT_EQ("rm -f old.log", r.command);
    ASSERT_EQ(1u, r.warnings.size());
    EXPECT_EQ("Auto-converted: del /q old.log -> rm -f old.log", r.warnings[0]);
    EXPECT_TRUE(r.changed("del /q old.log"));
}

TEST(PlatformTranslator, RulesAreLongestFirst) {
    PlatformTranslator t(Platform::WINDOWS);
    const std::vector<IdiomRule>& rules = t.rules();
    for (size_t i = 1; i < rules.size(); ++i) {
        EXPECT_GE(rules[i - 1].from.size(), rules[i].from.size());
    }
}

TEST(PlatformTranslator, NonInteractiveFlags) {
    PlatformTranslator t(Platform::POSIX);
    EXPECT_EQ("npm create vite@latest app --template react-ts",
              t.make_non_interactive("npm create vite@latest app").command);
    EXPECT_EQ("npx create-next-app@latest web --yes",
              t.make_non_interactive("npx create-next-app@latest web").command);
    EXPECT_EQ("npm create astro@latest site --template minimal --yes",
              t.make_non_interactive("npm create astro@latest site").command);
    EXPECT_EQ("npx shadcn@latest init -y", t.make_non_interactive("npx shadcn@latest init").command);
    EXPECT_EQ("npm init -y", t.make_non_interactive("npm init").command);
}

TEST(PlatformTranslator, ExistingFlagsAreNotDuplicated) {
    PlatformTranslator t(Platform::POSIX);
    std::string cmd = "npm create vite@latest app -- --template vue";
    EXPECT_EQ(cmd, t.make_non_interactive(cmd).command);
    EXPECT_EQ("npx shadcn@latest add button -y",
              t.make_non_interactive("npx shadcn@latest add button -y").command);
    EXPECT_EQ("npm init --yes", t.make_non_interactive("npm init --yes").command);
}

TEST(PlatformTranslator, OnlyPackageManagerInitGetsYes) {
    PlatformTranslator t(Platform::POSIX);
    EXPECT_EQ("pnpm init -y", t.make_non_interactive("pnpm init").command);
    EXPECT_EQ("bun init -y", t.make_non_interactive("bun init").command);

    Translation git = t.prepare("git init");
    EXPECT_EQ("git init", git.command);
    EXPECT_TRUE(git.warnings.empty());
    EXPECT_EQ("terraform init", t.prepare("terraform init").command);
}

TEST(PlatformTranslator, GenericCreateOnlyWarns) {
    PlatformTranslator t(Platform::POSIX);
    Translation r = t.make_non_interactive("npm create svelte@latest app");
    EXPECT_EQ("npm create svelte@latest app", r.command);
    EXPECT_EQ(1u, r.warnings.size());
}

TEST(PlatformTranslator, PrepareChainsBothSteps) {
    PlatformTranslator t(Platform::POSIX);
    Translation r = t.prepare("dir /b");
    EXPECT_EQ("ls -1", r.command);
    EXPECT_EQ(1u, r.warnings.size());
}

TEST(PlatformTranslator, ServerDetection) {
    EXPECT_TRUE(is_server_command("npm run dev"));
    EXPECT_TRUE(is_server_command("NPM START"));
    EXPECT_TRUE(is_server_command("cd web && pnpm dev"));
    EXPECT_TRUE(is_server_command("python manage.py runserver 8000"));
    EXPECT_FALSE(is_server_command("npm run build"));
    EXPECT_FALSE(is_server_command("npm install"));
}

TEST(PlatformTranslator, DirectoryChangeDetection) {
    std::string target;
    ASSERT_TRUE(parse_directory_change("cd backend", target));
    EXPECT_EQ("backend", target);
    ASSERT_TRUE(parse_directory_change("cd \"my app\"", target));
    EXPECT_EQ("my app", target);
    ASSERT_TRUE(parse_directory_change("cd /d C:\\work", target));
    EXPECT_EQ("C:\\work", target);
    ASSERT_TRUE(parse_directory_change("cd", target));
    EXPECT_EQ("", target);
    
    EXPECT_FALSE(parse_directory_change("cd web && npm test", target));
    EXPECT_FALSE(parse_directory_change("cdk deploy", target));
    EXPECT_FALSE(parse_directory_change("npm run build", target));
}
