// IptvMux - IPTV Stream Multiplexing Proxy
// Connection Lease - Released-once guard over a credential slot

#ifndef IPTVMUX_ADMISSION_CONNECTION_LEASE_HPP
#define IPTVMUX_ADMISSION_CONNECTION_LEASE_HPP

#include "iptvmux/admission/credential_store.hpp"

#include <memory>
#include <string>

namespace iptvmux {
namespace admission {

/**
 * @brief Move-only owner of one acquired session token.
 *
 * The slot is returned to the store exactly once: by release(), or by the
 * destructor if neither release() nor dismiss() ran. dismiss() hands the
 * token over to a new owner (a SharedStream) without releasing it.
 */
class ConnectionLease {
public:
    ConnectionLease() = default;
    ConnectionLease(std::shared_ptr<ICredentialStore> store, std::string sessionToken);
    ~ConnectionLease();

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;
    ConnectionLease(ConnectionLease&& other) noexcept;
    ConnectionLease& operator=(ConnectionLease&& other) noexcept;

    /**
     * @brief Return the slot now.
     * @return true if the store accepted the release
     */
    bool release();

    /**
     * @brief Give up ownership without releasing.
     * @return The token that was held
     */
    std::string dismiss();

    const std::string& token() const { return token_; }
    bool isHeld() const { return store_ != nullptr && !token_.empty(); }

private:
    std::shared_ptr<ICredentialStore> store_;
    std::string token_;
};

} // namespace admission
} // namespace iptvmux

#endif // IPTVMUX_ADMISSION_CONNECTION_LEASE_HPP
