#include <string>
#include <gtest/gtest.h>
#include "session/confirmation_manager.hpp"

namespace {

using warden::session::ConfirmationManager;

TEST(ConfirmationManagerTest, DestructiveVerbsNeedConfirmation) {
    const ConfirmationManager manager;
    EXPECT_TRUE(manager.requires_confirmation("delete", "/home/user/notes.txt"));
    EXPECT_TRUE(manager.requires_confirmation("Uninstall", "nginx"));
    EXPECT_TRUE(manager.requires_confirmation("file_overwrite", "/tmp/out.txt"));
    EXPECT_FALSE(manager.requires_confirmation("read", "/tmp/a.txt"));
    EXPECT_FALSE(manager.requires_confirmation("list", "/home/user"));
}

TEST(ConfirmationManagerTest, SystemDirectoriesNeedConfirmation) {
    const ConfirmationManager manager;
    EXPECT_TRUE(manager.requires_confirmation("read", "/etc/hosts"));
    EXPECT_TRUE(manager.requires_confirmation("read", "/PROC/self/status"));
    EXPECT_TRUE(manager.requires_confirmation("read", "/sys/class/net"));
    EXPECT_FALSE(manager.requires_confirmation("read", "/etcetera/file.txt"));
}

TEST(ConfirmationManagerTest, SensitiveExtensionsNeedConfirmation) {
    const ConfirmationManager manager;
    for (const char* target : {"app.db", "dump.sql", "server.key", "cert.pem", "ca.crt",
                               "nginx.conf", "app.config", "ID.PEM"}) {
        EXPECT_TRUE(manager.requires_confirmation("read", target)) << target;
    }
    EXPECT_FALSE(manager.requires_confirmation("read", "notes.dbx"));
}

TEST(ConfirmationManagerTest, DisabledSwitchSkipsEveryCheck) {
    ConfirmationManager manager;
    manager.set_require_confirmation(false);
    EXPECT_FALSE(manager.require_confirmation());
    EXPECT_FALSE(manager.requires_confirmation("delete", "/etc/passwd"));

    manager.set_require_confirmation(true);
    EXPECT_TRUE(manager.requires_confirmation("delete", "/etc/passwd"));
}

TEST(ConfirmationManagerTest, OnlyYesConfirms) {
    const ConfirmationManager manager;
    EXPECT_TRUE(manager.validate_confirmation("yes"));
    EXPECT_TRUE(manager.validate_confirmation(" Yes "));
    EXPECT_TRUE(manager.validate_confirmation("YES\n"));
    EXPECT_FALSE(manager.validate_confirmation("y"));
    EXPECT_FALSE(manager.validate_confirmation("yes please"));
    EXPECT_FALSE(manager.validate_confirmation(""));
    EXPECT_FALSE(manager.validate_confirmation("   "));
}

TEST(ConfirmationManagerTest, PromptNamesOperationAndTarget) {
    const ConfirmationManager manager;
    const std::string prompt = manager.get_confirmation_prompt("delete", "/home/user/notes.txt");
    EXPECT_EQ(prompt,
              "WARNING: This operation may be destructive!\n\n"
              "Operation: delete\n"
              "Target: /home/user/notes.txt\n\n"
              "Are you sure you want to proceed? (type 'yes' to confirm): ");
}

}  // namespace
