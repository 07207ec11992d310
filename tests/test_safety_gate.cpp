#include <gtest/gtest.h>
#include <vibecli/core/safety_gate.hpp>
#include "test_support.hpp"

using namespace vibecli;
using vibecli::testing_support::ScriptedPrompter;

TEST(SafetyGate, RecursiveDeleteOfRootIsDangerous) {
    EXPECT_TRUE(SafetyGate::is_dangerous("rm -rf /"));
    EXPECT_TRUE(SafetyGate::is_dangerous("rm -fr /"));
    EXPECT_TRUE(SafetyGate::is_dangerous("rm -r -f /usr"));
    EXPECT_TRUE(SafetyGate::is_dangerous("sudo rm -rf ~"));
    EXPECT_TRUE(SafetyGate::is_dangerous("rm --recursive --force ."));
    EXPECT_TRUE(SafetyGate::is_dangerous("rm -rf *"));
    EXPECT_TRUE(SafetyGate::is_dangerous("rm -rf --no-preserve-root /"));
    EXPECT_TRUE(SafetyGate::is_dangerous("/bin/rm -rf /"));
}

TEST(SafetyGate, DangerHiddenInCompoundCommands) {
    EXPECT_TRUE(SafetyGate::is_dangerous("npm run build && rm -rf /"));
    EXPECT_TRUE(SafetyGate::is_dangerous("echo hi; mkfs.ext4 /dev/sdb1"));
    EXPECT_TRUE(SafetyGate::is_dangerous("cat image.iso > /dev/sda"));
    EXPECT_TRUE(SafetyGate::is_dangerous(":(){ :|:& };:"));
}

TEST(SafetyGate, WindowsRecursiveDeletes) {
    EXPECT_TRUE(SafetyGate::is_dangerous("rmdir /s /q C:\\"));
    EXPECT_TRUE(SafetyGate::is_dangerous("del /s /q *"));
    EXPECT_TRUE(SafetyGate::is_dangerous("format c:"));
    EXPECT_FALSE(SafetyGate::is_dangerous("rmdir /s /q build"));
}

TEST(SafetyGate, OrdinaryCommandsPass) {
    EXPECT_FALSE(SafetyGate::is_dangerous("rm -rf node_modules"));
    EXPECT_FALSE(SafetyGate::is_dangerous("rm -rf /tmp/build-cache"));
    EXPECT_FALSE(SafetyGate::is_dangerous("rm old.txt"));
    EXPECT_FALSE(SafetyGate::is_dangerous("npm install react"));
    EXPECT_FALSE(SafetyGate::is_dangerous("git add ."));
    EXPECT_FALSE(SafetyGate::is_dangerous("ddev start"));
    EXPECT_EQ("", SafetyGate::danger_reason("ls -la"));
}

TEST(SafetyGate, DenylistedPrograms) {
    EXPECT_TRUE(SafetyGate::is_dangerous("dd if=/dev/zero of=disk.img"));
    EXPECT_TRUE(SafetyGate::is_dangerous("sudo shutdown -h now"));
    EXPECT_NE(std::string::npos, SafetyGate::danger_reason("mkfs.ext4 /dev/sdb1").find("denylist"));
}

TEST(SafetyGate, ConfirmActionAcceptsYesOnly) {
    ScriptedPrompter p;
    p.answer("y");
    p.answer(" YES ");
    p.answer("n");
    p.answer("");
    EXPECT_TRUE(SafetyGate::confirm_action(p, "Apply?"));
    EXPECT_TRUE(SafetyGate::confirm_action(p, "Apply?"));
    EXPECT_FALSE(SafetyGate::confirm_action(p, "Apply?"));
    EXPECT_FALSE(SafetyGate::confirm_action(p, "Apply?"));
    EXPECT_EQ(">> Apply? (y/n): ", p.prompts[0]);
}

TEST(SafetyGate, ElevatedConfirmationNeedsExactPhrase) {
    ScriptedPrompter p;
    p.answer("y");
    p.answer("CONFIRM");
    p.answer("  confirm  ");
    p.answer("confirm ");
    p.answer("confirm");
    EXPECT_FALSE(SafetyGate::confirm_elevated(p, "rm -rf /"));
    EXPECT_FALSE(SafetyGate::confirm_elevated(p, "rm -rf /"));
    EXPECT_FALSE(SafetyGate::confirm_elevated(p, "rm -rf /"));
    EXPECT_FALSE(SafetyGate::confirm_elevated(p, "rm -rf /"));
    EXPECT_TRUE(SafetyGate::confirm_elevated(p, "rm -rf /"));
    EXPECT_NE(std::string::npos, p.all_warnings().find("DANGEROUS COMMAND: rm -rf /"));
}
