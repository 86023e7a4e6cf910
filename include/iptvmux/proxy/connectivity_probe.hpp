// IptvMux - IPTV Stream Multiplexing Proxy
// Connectivity Probe - Diagnose one stream without delivering it

#ifndef IPTVMUX_PROXY_CONNECTIVITY_PROBE_HPP
#define IPTVMUX_PROXY_CONNECTIVITY_PROBE_HPP

#include "iptvmux/admission/account_store.hpp"
#include "iptvmux/admission/credential_store.hpp"
#include "iptvmux/core/config_manager.hpp"
#include "iptvmux/core/structured_logger.hpp"
#include "iptvmux/net/upstream_client.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace iptvmux {
namespace proxy {

/**
 * @brief Individual checks of a probe; unset fields were not reached.
 */
struct ProbeChecks {
    std::optional<bool> accountExists;
    std::optional<bool> accountEnabled;
    std::optional<std::string> server;
    std::optional<bool> credentialAvailable;
    std::optional<core::CredentialId> credentialId;
    std::optional<std::string> upstreamUrl;     ///< Masked
    std::optional<int> headStatus;
    std::optional<int> getStatus;
    std::optional<bool> receivedData;
    std::optional<uint64_t> dataSize;
    std::optional<bool> timeout;
    std::optional<bool> connectionError;
};

/**
 * @brief Outcome of a probe and the HTTP status to report it with.
 */
struct ProbeResult {
    core::AccountId accountId = 0;
    std::string streamId;
    bool success = false;
    ProbeChecks checks;
    std::optional<std::string> error;
    int httpStatus = 200;

    std::string toJson() const;
};

/**
 * @brief Probe settings.
 */
struct ConnectivityProbeConfig {
    std::chrono::milliseconds timeout{10000};   ///< Connect and read timeout
    std::size_t sampleBytes = 1024;             ///< Body bytes read by the GET fallback
    uint32_t maxRedirects = 5;
    std::string defaultUserAgent = "okhttp/3.14.9";

    static ConnectivityProbeConfig fromConfig(const core::Configuration& config);
};

/**
 * @brief Checks account, credential availability and upstream reachability
 *        of a ts stream.
 *
 * Selects a credential but never acquires a connection slot. Sends HEAD
 * first and falls back to a short GET when the provider answers 405.
 */
class ConnectivityProbe {
public:
    ConnectivityProbe(ConnectivityProbeConfig config,
                      std::shared_ptr<admission::IAccountStore> accounts,
                      std::shared_ptr<admission::ICredentialStore> credentials,
                      std::shared_ptr<net::IUpstreamClient> upstreamClient,
                      std::shared_ptr<core::StructuredLogger> logger);

    ProbeResult probe(core::AccountId accountId, const std::string& streamId);

private:
    void recordFailure(ProbeResult& result, const net::UpstreamError& error) const;

    ConnectivityProbeConfig config_;
    std::shared_ptr<admission::IAccountStore> accounts_;
    std::shared_ptr<admission::ICredentialStore> credentials_;
    std::shared_ptr<net::IUpstreamClient> upstreamClient_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace proxy
} // namespace iptvmux

#endif // IPTVMUX_PROXY_CONNECTIVITY_PROBE_HPP
