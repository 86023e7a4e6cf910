// IptvMux - IPTV Stream Multiplexing Proxy
// Connection Lease Implementation

#include "iptvmux/admission/connection_lease.hpp"

#include <utility>

namespace iptvmux {
namespace admission {

ConnectionLease::ConnectionLease(std::shared_ptr<ICredentialStore> store, std::string sessionToken)
    : store_(std::move(store))
    , token_(std::move(sessionToken)) {
}

ConnectionLease::~ConnectionLease() {
    release();
}

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : store_(std::move(other.store_))
    , token_(std::move(other.token_)) {
    other.store_.reset();
    other.token_.clear();
}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
        release();
        store_ = std::move(other.store_);
        token_ = std::move(other.token_);
        other.store_.reset();
        other.token_.clear();
    }
    return *this;
}

bool ConnectionLease::release() {
    if (!isHeld()) {
        return false;
    }
    std::shared_ptr<ICredentialStore> store = std::move(store_);
    std::string token = std::move(token_);
    store_.reset();
    token_.clear();
    return store->releaseConnection(token);
}

std::string ConnectionLease::dismiss() {
    std::string token = std::move(token_);
    token_.clear();
    store_.reset();
    return token;
}

} // namespace admission
} // namespace iptvmux
