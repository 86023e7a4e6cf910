// IptvMux - IPTV Stream Multiplexing Proxy
// Wired proxy stack over a scripted upstream for endpoint tests

#ifndef IPTVMUX_TESTS_SUPPORT_PROXY_TEST_ENV_HPP
#define IPTVMUX_TESTS_SUPPORT_PROXY_TEST_ENV_HPP

#include "iptvmux/admission/in_memory_credential_store.hpp"
#include "iptvmux/proxy/admin_api.hpp"
#include "iptvmux/proxy/connectivity_probe.hpp"
#include "iptvmux/proxy/proxy_router.hpp"
#include "iptvmux/proxy/stream_proxy.hpp"
#include "iptvmux/streaming/stream_registry.hpp"
#include "fake_upstream_client.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <string>
#include <vector>

namespace iptvmux {
namespace test {

inline core::CredentialConfig makeCredential(core::CredentialId id, const std::string& username,
                                             uint32_t maxConnections, bool enabled = true) {
    core::CredentialConfig config;
    config.id = id;
    config.username = username;
    config.password = username + "-pass";
    config.maxConnections = maxConnections;
    config.enabled = enabled;
    return config;
}

/**
 * @brief Accounts used across endpoint tests.
 *
 * 1: two credentials (10 cap 2, 11 cap 1) on provider.example:8080
 * 2: legacy username and password, custom user agent
 * 3: disabled
 * 4: one credential (40 cap 1)
 */
inline std::vector<core::AccountConfig> standardAccounts() {
    core::AccountConfig pooled;
    pooled.id = 1;
    pooled.name = "pooled";
    pooled.server = "provider.example:8080";
    pooled.credentials.push_back(makeCredential(10, "alpha", 2));
    pooled.credentials.push_back(makeCredential(11, "beta", 1));

    core::AccountConfig legacy;
    legacy.id = 2;
    legacy.name = "legacy";
    legacy.server = "http://legacy.example/";
    legacy.userAgent = "TiviMate/4.7.0";
    legacy.username = "solo";
    legacy.password = "solo-pass";

    core::AccountConfig disabled;
    disabled.id = 3;
    disabled.name = "disabled";
    disabled.server = "disabled.example";
    disabled.enabled = false;
    disabled.credentials.push_back(makeCredential(30, "gamma", 1));

    core::AccountConfig single;
    single.id = 4;
    single.name = "single";
    single.server = "single.example";
    single.credentials.push_back(makeCredential(40, "delta", 1));

    return {pooled, legacy, disabled, single};
}

/**
 * @brief Admission, registry and endpoints over a FakeUpstreamClient.
 */
class ProxyTestEnv {
public:
    explicit ProxyTestEnv(std::vector<core::AccountConfig> accounts = standardAccounts()) {
        client = std::make_shared<FakeUpstreamClient>();
        clock = std::make_shared<core::ManualClock>();
        logger = makeTestLogger(&sink);

        accountStore = std::make_shared<admission::InMemoryAccountStore>(accounts);
        credentials = std::make_shared<admission::InMemoryCredentialStore>(
            accountStore, clock, logger, std::chrono::seconds(30));
        credentials->loadFromConfig(accounts);

        streaming::StreamRegistryConfig registryConfig;
        registryConfig.chunkSize = 1024;
        registryConfig.subscriberQueueDepth = 16;
        registryConfig.subscriberWait = std::chrono::milliseconds(50);
        registry = std::make_shared<streaming::StreamRegistry>(
            registryConfig, client, credentials, clock, logger);

        proxy::StreamProxyConfig proxyConfig;
        proxyConfig.connectTimeout = std::chrono::milliseconds(2000);
        proxyConfig.connectGrace = std::chrono::milliseconds(0);
        proxyConfig.idleReleasePause = std::chrono::milliseconds(0);
        streamProxy = std::make_shared<proxy::StreamProxy>(
            proxyConfig, accountStore, credentials, registry, logger);

        adminApi = std::make_shared<proxy::AdminApi>(accountStore, credentials, registry, clock, logger);

        proxy::ConnectivityProbeConfig probeConfig;
        probeConfig.timeout = std::chrono::milliseconds(2000);
        probe = std::make_shared<proxy::ConnectivityProbe>(
            probeConfig, accountStore, credentials, client, logger);

        router = std::make_shared<proxy::ProxyRouter>(streamProxy, adminApi, probe, logger);
    }

    ~ProxyTestEnv() {
        registry->stop();
    }

    ProxyTestEnv(const ProxyTestEnv&) = delete;
    ProxyTestEnv& operator=(const ProxyTestEnv&) = delete;

    std::shared_ptr<FakeUpstreamClient> client;
    std::shared_ptr<core::ManualClock> clock;
    std::shared_ptr<CapturingLogSink> sink;
    std::shared_ptr<core::StructuredLogger> logger;
    std::shared_ptr<admission::InMemoryAccountStore> accountStore;
    std::shared_ptr<admission::InMemoryCredentialStore> credentials;
    std::shared_ptr<streaming::StreamRegistry> registry;
    std::shared_ptr<proxy::StreamProxy> streamProxy;
    std::shared_ptr<proxy::AdminApi> adminApi;
    std::shared_ptr<proxy::ConnectivityProbe> probe;
    std::shared_ptr<proxy::ProxyRouter> router;
};

/**
 * @brief Request as the HTTP server would hand it to a handler.
 */
inline net::HttpRequest makeRequest(const std::string& method, const std::string& target) {
    auto parsed = net::parseRequestHead(method + " " + target + " HTTP/1.1\r\nHost: proxy.local");
    net::HttpRequest request = parsed.isSuccess() ? parsed.value() : net::HttpRequest{};
    request.clientIp = "192.168.1.50";
    return request;
}

} // namespace test
} // namespace iptvmux

#endif // IPTVMUX_TESTS_SUPPORT_PROXY_TEST_ENV_HPP
