#include <gtest/gtest.h>
#include "mqttd/core/errors.h"
#include "mqttd/server/auth/ledger_auth_hook.h"
#include <atomic>
#include <thread>
#include <vector>

using namespace mqttd;
using namespace mqttd::server::auth;

namespace {

std::shared_ptr<const core::Ledger> makeLedger(const std::string& password) {
    auto ledger = std::make_shared<core::Ledger>();

    core::UserRecord user;
    user.username = "user01";
    user.password = password;
    user.rules = {
        {"down/+/user01/#", core::PermissionLevel::READ},
        {"up/+/user01/#", core::PermissionLevel::WRITE},
    };
    ledger->addUser(user);
    return ledger;
}

core::ClientIdentity user01() {
    return core::ClientIdentity{"dev-1", "user01", "10.0.0.7"};
}

} // namespace

TEST(LedgerAuthHookTest, InitRequiresALedger) {
    LedgerAuthHook hook(nullptr);
    EXPECT_THROW(hook.init(), core::ConfigError);

    LedgerAuthHook ready(makeLedger("concord"));
    EXPECT_NO_THROW(ready.init());
    EXPECT_EQ(ready.id(), "ledger-auth");
}

TEST(LedgerAuthHookTest, AuthenticatesAgainstTheLedger) {
    LedgerAuthHook hook(makeLedger("concord"));

    EXPECT_TRUE(hook.onConnectAuthenticate(user01(), "concord"));
    EXPECT_FALSE(hook.onConnectAuthenticate(user01(), "wrong"));
    EXPECT_FALSE(hook.onConnectAuthenticate(core::ClientIdentity{"x", "stranger", ""}, "concord"));
}

TEST(LedgerAuthHookTest, AclWriteMeansPublish) {
    LedgerAuthHook hook(makeLedger("concord"));

    EXPECT_TRUE(hook.onAclCheck(user01(), "up/a/user01/state", true));
    EXPECT_FALSE(hook.onAclCheck(user01(), "up/a/user01/state", false));
    EXPECT_TRUE(hook.onAclCheck(user01(), "down/a/user01/cmd", false));
    EXPECT_FALSE(hook.onAclCheck(user01(), "down/a/user01/cmd", true));
    EXPECT_FALSE(hook.onAclCheck(user01(), "other/topic", false));
}

TEST(LedgerAuthHookTest, MissingLedgerDeniesEverything) {
    LedgerAuthHook hook(nullptr);
    EXPECT_FALSE(hook.onConnectAuthenticate(user01(), "concord"));
    EXPECT_FALSE(hook.onAclCheck(user01(), "down/a/user01/cmd", false));
}

TEST(LedgerAuthHookTest, SwapLedgerTakesEffectImmediately) {
    LedgerAuthHook hook(makeLedger("old"));
    ASSERT_TRUE(hook.onConnectAuthenticate(user01(), "old"));

    hook.swapLedger(makeLedger("new"));

    EXPECT_FALSE(hook.onConnectAuthenticate(user01(), "old"));
    EXPECT_TRUE(hook.onConnectAuthenticate(user01(), "new"));
}

TEST(LedgerAuthHookTest, ChecksRunWhileLedgerIsSwapped) {
    LedgerAuthHook hook(makeLedger("a"));
    std::atomic<bool> done{false};
    std::atomic<int> unexpected{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!done) {
                hook.onConnectAuthenticate(user01(), "a");
                if (hook.onConnectAuthenticate(user01(), "c")) {
                    unexpected++;
                }
            }
        });
    }

    for (int i = 0; i < 200; ++i) {
        hook.swapLedger(makeLedger(i % 2 == 0 ? "b" : "a"));
    }
    done = true;
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(unexpected.load(), 0);
    EXPECT_NE(hook.ledger(), nullptr);
}

TEST(AllowAllHookTest, AllowsEverything) {
    AllowAllHook hook;
    EXPECT_EQ(hook.id(), "allow-all-auth");
    EXPECT_TRUE(hook.onConnectAuthenticate(core::ClientIdentity{}, ""));
    EXPECT_TRUE(hook.onAclCheck(core::ClientIdentity{}, "any/topic", true));
}
