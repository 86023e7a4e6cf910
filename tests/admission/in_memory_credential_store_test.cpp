// IptvMux - IPTV Stream Multiplexing Proxy
// Tests for connection-slot accounting
//
// Tests cover:
// - Least loaded credential selection and tie breaking
// - Atomic acquisition against the connection cap
// - Idempotent release and activity tracking
// - Stale slot cleanup
// - Legacy single-credential accounts
// - Status reports

#include <gtest/gtest.h>
#include "iptvmux/admission/in_memory_credential_store.hpp"
#include "iptvmux/core/secure_token.hpp"
#include "../support/test_helpers.hpp"

#include <atomic>
#include <set>
#include <thread>
#include <vector>

namespace iptvmux {
namespace admission {
namespace test {

namespace {

core::CredentialConfig credentialConfig(core::CredentialId id, const std::string& username,
                                        uint32_t maxConnections, bool enabled = true) {
    core::CredentialConfig config;
    config.id = id;
    config.username = username;
    config.password = username + "-pass";
    config.maxConnections = maxConnections;
    config.enabled = enabled;
    return config;
}

} // anonymous namespace

class InMemoryCredentialStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::AccountConfig pooled;
        pooled.id = 1;
        pooled.name = "pooled";
        pooled.server = "provider.example:8080";
        pooled.credentials.push_back(credentialConfig(10, "alpha", 2));
        pooled.credentials.push_back(credentialConfig(11, "beta", 1));
        pooled.credentials.push_back(credentialConfig(12, "gamma", 3, false));

        core::AccountConfig legacy;
        legacy.id = 2;
        legacy.name = "legacy";
        legacy.server = "legacy.example";
        legacy.username = "solo";
        legacy.password = "solo-pass";

        core::AccountConfig empty;
        empty.id = 3;
        empty.name = "empty";
        empty.server = "empty.example";

        core::AccountConfig disabled;
        disabled.id = 4;
        disabled.name = "disabled";
        disabled.server = "disabled.example";
        disabled.enabled = false;
        disabled.credentials.push_back(credentialConfig(40, "delta", 1));

        configs_ = {pooled, legacy, empty, disabled};

        clock_ = std::make_shared<core::ManualClock>();
        accounts_ = std::make_shared<InMemoryAccountStore>(configs_);
        store_ = std::make_shared<InMemoryCredentialStore>(
            accounts_, clock_, iptvmux::test::makeTestLogger(&sink_), std::chrono::seconds(30));
        store_->loadFromConfig(configs_);
    }

    std::string acquire(core::CredentialId id, const std::string& streamId = "100") {
        auto result = store_->acquireConnection(id, streamId, "10.1.1.1");
        EXPECT_TRUE(result.isSuccess());
        return result.isSuccess() ? result.value() : std::string();
    }

    std::vector<core::AccountConfig> configs_;
    std::shared_ptr<core::ManualClock> clock_;
    std::shared_ptr<InMemoryAccountStore> accounts_;
    std::shared_ptr<iptvmux::test::CapturingLogSink> sink_;
    std::shared_ptr<InMemoryCredentialStore> store_;
};

// =============================================================================
// Selection
// =============================================================================

TEST_F(InMemoryCredentialStoreTest, PrefersLowestIdOnTie) {
    auto credential = store_->getAvailableCredential(1);
    ASSERT_TRUE(credential.has_value());
    EXPECT_EQ(credential->id, 10);
    EXPECT_EQ(credential->username, "alpha");
    EXPECT_EQ(credential->password, "alpha-pass");
    EXPECT_EQ(credential->accountId, 1);
    EXPECT_FALSE(credential->isLegacy());
}

TEST_F(InMemoryCredentialStoreTest, PrefersLeastLoaded) {
    acquire(10);

    auto credential = store_->getAvailableCredential(1);
    ASSERT_TRUE(credential.has_value());
    EXPECT_EQ(credential->id, 11);
}

TEST_F(InMemoryCredentialStoreTest, SkipsFullAndDisabledCredentials) {
    acquire(11);
    acquire(10);
    acquire(10);

    EXPECT_FALSE(store_->getAvailableCredential(1).has_value());
    EXPECT_TRUE(sink_->contains("No available credentials for account 1"));
}

TEST_F(InMemoryCredentialStoreTest, UnknownOrDisabledAccountHasNoCredential) {
    EXPECT_FALSE(store_->getAvailableCredential(99).has_value());
    EXPECT_FALSE(store_->getAvailableCredential(4).has_value());
}

TEST_F(InMemoryCredentialStoreTest, AccountWithoutAnyCredentialHasNone) {
    EXPECT_FALSE(store_->getAvailableCredential(3).has_value());
}

// =============================================================================
// Acquire and release
// =============================================================================

TEST_F(InMemoryCredentialStoreTest, AcquireReturnsDistinctHexTokens) {
    std::string first = acquire(10);
    std::string second = acquire(10);

    EXPECT_EQ(first.size(), core::SESSION_TOKEN_BYTES * 2);
    EXPECT_EQ(first.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(first, second);
    EXPECT_EQ(store_->activeConnectionCount(10), 2u);
}

TEST_F(InMemoryCredentialStoreTest, AcquireEnforcesCap) {
    acquire(11);

    auto result = store_->acquireConnection(11, "200", "10.1.1.2");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, AdmissionError::Code::NoAvailableSlots);
    EXPECT_EQ(store_->activeConnectionCount(11), 1u);
}

TEST_F(InMemoryCredentialStoreTest, AcquireRejectsUnknownAndDisabled) {
    auto unknown = store_->acquireConnection(777, "100", "10.1.1.1");
    ASSERT_TRUE(unknown.isError());
    EXPECT_EQ(unknown.error().code, AdmissionError::Code::CredentialNotFound);

    auto disabled = store_->acquireConnection(12, "100", "10.1.1.1");
    ASSERT_TRUE(disabled.isError());
    EXPECT_EQ(disabled.error().code, AdmissionError::Code::CredentialDisabled);
}

TEST_F(InMemoryCredentialStoreTest, ConcurrentAcquireNeverExceedsCap) {
    std::atomic<int> granted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([this, &granted, i] {
            if (store_->acquireConnection(10, std::to_string(i), "10.0.0.1").isSuccess()) {
                ++granted;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(granted.load(), 2);
    EXPECT_EQ(store_->activeConnectionCount(10), 2u);
}

TEST_F(InMemoryCredentialStoreTest, ReleaseIsIdempotent) {
    std::string token = acquire(11);

    EXPECT_TRUE(store_->releaseConnection(token));
    EXPECT_FALSE(store_->releaseConnection(token));
    EXPECT_FALSE(store_->releaseConnection("not-a-token"));
    EXPECT_FALSE(store_->releaseConnection(""));
    EXPECT_EQ(store_->activeConnectionCount(11), 0u);

    EXPECT_TRUE(store_->acquireConnection(11, "100", "10.1.1.1").isSuccess());
}

TEST_F(InMemoryCredentialStoreTest, AcquireAndReleaseAreLogged) {
    std::string token = acquire(10);
    store_->releaseConnection(token);

    EXPECT_TRUE(sink_->contains("credential_acquired"));
    EXPECT_TRUE(sink_->contains("credential_released"));
    EXPECT_FALSE(sink_->contains(token));
}

// =============================================================================
// Activity and stale cleanup
// =============================================================================

TEST_F(InMemoryCredentialStoreTest, StaleSlotsReclaimedOnSelection) {
    acquire(11);
    acquire(10);
    acquire(10);
    ASSERT_FALSE(store_->getAvailableCredential(1).has_value());

    clock_->advance(std::chrono::seconds(31));

    auto credential = store_->getAvailableCredential(1);
    ASSERT_TRUE(credential.has_value());
    EXPECT_EQ(credential->id, 10);
    EXPECT_EQ(store_->activeConnectionCount(10), 0u);
    EXPECT_EQ(store_->activeConnectionCount(11), 0u);
}

TEST_F(InMemoryCredentialStoreTest, ActivityKeepsSlotFresh) {
    std::string busy = acquire(10);
    std::string quiet = acquire(10);

    clock_->advance(std::chrono::seconds(20));
    EXPECT_TRUE(store_->updateActivity(busy));
    clock_->advance(std::chrono::seconds(20));

    EXPECT_EQ(store_->cleanupStaleConnections(1, std::chrono::seconds(30)), 1u);
    EXPECT_FALSE(store_->releaseConnection(quiet));
    EXPECT_TRUE(store_->releaseConnection(busy));
}

TEST_F(InMemoryCredentialStoreTest, UpdateActivityUnknownToken) {
    EXPECT_FALSE(store_->updateActivity("missing"));
}

TEST_F(InMemoryCredentialStoreTest, CleanupScopedToAccount) {
    core::AccountConfig other;
    other.id = 5;
    other.name = "other";
    other.server = "other.example";
    other.credentials.push_back(credentialConfig(50, "epsilon", 1));
    accounts_->upsert(Account{5, "other", "other.example", true, "", "", ""});
    store_->loadFromConfig({other});

    acquire(10);
    acquire(50);
    clock_->advance(std::chrono::minutes(5));

    EXPECT_EQ(store_->cleanupStaleConnections(5, std::chrono::seconds(30)), 1u);
    EXPECT_EQ(store_->activeConnectionCount(10), 1u);
    EXPECT_EQ(store_->cleanupStaleConnections(std::nullopt, std::chrono::seconds(30)), 1u);
}

// =============================================================================
// Legacy accounts
// =============================================================================

TEST_F(InMemoryCredentialStoreTest, LegacyAccountUsesImplicitCredential) {
    auto credential = store_->getAvailableCredential(2);
    ASSERT_TRUE(credential.has_value());
    EXPECT_TRUE(credential->isLegacy());
    EXPECT_EQ(credential->username, "solo");
    EXPECT_EQ(credential->password, "solo-pass");
    EXPECT_EQ(credential->maxConnections, 1u);
}

TEST_F(InMemoryCredentialStoreTest, LegacyAcquisitionIsUntracked) {
    auto first = store_->acquireConnection(core::LEGACY_CREDENTIAL_ID, "100", "10.1.1.1");
    auto second = store_->acquireConnection(core::LEGACY_CREDENTIAL_ID, "100", "10.1.1.1");
    ASSERT_TRUE(first.isSuccess());
    ASSERT_TRUE(second.isSuccess());
    EXPECT_NE(first.value(), second.value());

    EXPECT_TRUE(store_->getActiveConnections(2).empty());
    EXPECT_FALSE(store_->releaseConnection(first.value()));
}

TEST_F(InMemoryCredentialStoreTest, CredentialListDisablesLegacyFallback) {
    core::AccountConfig mixed;
    mixed.id = 6;
    mixed.name = "mixed";
    mixed.server = "mixed.example";
    mixed.username = "old";
    mixed.password = "old-pass";
    mixed.credentials.push_back(credentialConfig(60, "zeta", 1));
    accounts_->upsert(Account{6, "mixed", "mixed.example", true, "", "old", "old-pass"});
    store_->loadFromConfig({mixed});

    acquire(60);
    EXPECT_FALSE(store_->getAvailableCredential(6).has_value());
}

// =============================================================================
// Reports
// =============================================================================

TEST_F(InMemoryCredentialStoreTest, ConnectionStatusSumsCredentials) {
    acquire(10);
    acquire(11);

    auto status = store_->getConnectionStatus(1);
    ASSERT_TRUE(status.isSuccess());
    EXPECT_FALSE(status.value().legacyMode);
    EXPECT_EQ(status.value().totalMaxConnections, 6u);
    EXPECT_EQ(status.value().totalActiveConnections, 2u);
    EXPECT_EQ(status.value().availableConnections, 4u);

    ASSERT_EQ(status.value().credentials.size(), 3u);
    const CredentialStatus& alpha = status.value().credentials[0];
    EXPECT_EQ(alpha.id, 10);
    EXPECT_EQ(alpha.username, "alpha");
    EXPECT_EQ(alpha.activeConnections, 1u);
    EXPECT_EQ(alpha.maxConnections, 2u);
    EXPECT_FALSE(status.value().credentials[2].enabled);
}

TEST_F(InMemoryCredentialStoreTest, ConnectionStatusOfLegacyAccount) {
    auto status = store_->getConnectionStatus(2);
    ASSERT_TRUE(status.isSuccess());
    EXPECT_TRUE(status.value().legacyMode);
    EXPECT_EQ(status.value().totalMaxConnections, 1u);
    EXPECT_EQ(status.value().totalActiveConnections, 0u);
    EXPECT_EQ(status.value().availableConnections, 1u);
}

TEST_F(InMemoryCredentialStoreTest, ConnectionStatusOfUnknownAccount) {
    auto status = store_->getConnectionStatus(99);
    ASSERT_TRUE(status.isError());
    EXPECT_EQ(status.error().code, AdmissionError::Code::AccountNotFound);
}

TEST_F(InMemoryCredentialStoreTest, ActiveConnectionsOrderedByStart) {
    std::string first = acquire(10, "100");
    clock_->advance(std::chrono::seconds(1));
    std::string second = acquire(11, "200");

    auto records = store_->getActiveConnections(std::nullopt);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].sessionToken, first);
    EXPECT_EQ(records[0].streamId, "100");
    EXPECT_EQ(records[0].clientIp, "10.1.1.1");
    EXPECT_EQ(records[0].accountId, 1);
    EXPECT_EQ(records[1].sessionToken, second);
    EXPECT_EQ(records[1].credentialId, 11);

    EXPECT_TRUE(store_->getActiveConnections(2).empty());
}

} // namespace test
} // namespace admission
} // namespace iptvmux
