// IptvMux - IPTV Stream Multiplexing Proxy
// Admin API - Operator status and maintenance endpoints
//
// Responsibilities:
// - Credential status of one account
// - Active connection slots, optionally per account
// - Multiplexer snapshot of shared streams and subscribers
// - Manual slot release by session token
// - Manual stale-slot cleanup with a caller supplied idle threshold

#ifndef IPTVMUX_PROXY_ADMIN_API_HPP
#define IPTVMUX_PROXY_ADMIN_API_HPP

#include "iptvmux/admission/account_store.hpp"
#include "iptvmux/admission/credential_store.hpp"
#include "iptvmux/core/clock.hpp"
#include "iptvmux/core/structured_logger.hpp"
#include "iptvmux/streaming/stream_registry.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace iptvmux {
namespace proxy {

/**
 * @brief JSON response of an admin endpoint.
 */
struct AdminResponse {
    int status = 200;
    std::string body;
};

/**
 * @brief Administrative surface over the credential store and registry.
 */
class AdminApi {
public:
    AdminApi(std::shared_ptr<admission::IAccountStore> accounts,
             std::shared_ptr<admission::ICredentialStore> credentials,
             std::shared_ptr<streaming::StreamRegistry> registry,
             std::shared_ptr<core::IClock> clock,
             std::shared_ptr<core::StructuredLogger> logger);

    /// GET /stream/{account}/status
    AdminResponse accountStatus(core::AccountId accountId) const;

    /// GET /stream/active[?account_id=N]
    AdminResponse activeConnections(std::optional<core::AccountId> accountId) const;

    /// GET /stream/multiplexer
    AdminResponse multiplexerStats() const;

    /// POST /stream/{token}/release
    AdminResponse releaseConnection(const std::string& sessionToken);

    /// POST /stream/cleanup[?account_id=N&timeout=S]
    AdminResponse cleanup(std::optional<core::AccountId> accountId, std::chrono::seconds idleTimeout);

private:
    std::shared_ptr<admission::IAccountStore> accounts_;
    std::shared_ptr<admission::ICredentialStore> credentials_;
    std::shared_ptr<streaming::StreamRegistry> registry_;
    std::shared_ptr<core::IClock> clock_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

/**
 * @brief Render an error body {"error": message, "status": status}.
 */
AdminResponse adminError(int status, const std::string& message);

} // namespace proxy
} // namespace iptvmux

#endif // IPTVMUX_PROXY_ADMIN_API_HPP
