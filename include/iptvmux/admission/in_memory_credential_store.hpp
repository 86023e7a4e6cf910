// IptvMux - IPTV Stream Multiplexing Proxy
// In-memory credential store loaded from configuration

#ifndef IPTVMUX_ADMISSION_IN_MEMORY_CREDENTIAL_STORE_HPP
#define IPTVMUX_ADMISSION_IN_MEMORY_CREDENTIAL_STORE_HPP

#include "iptvmux/admission/account_store.hpp"
#include "iptvmux/admission/credential_store.hpp"
#include "iptvmux/core/clock.hpp"
#include "iptvmux/core/structured_logger.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace iptvmux {
namespace admission {

/**
 * @brief ICredentialStore keeping slots in process memory.
 *
 * Accounts without a credential list but with a username and password run
 * in legacy mode: getAvailableCredential() returns a pseudo credential with
 * id 0 and cap 1, and its acquisitions return a token without being
 * tracked.
 *
 * ## Thread Safety
 * One mutex serializes every operation, which makes slot acquisition
 * atomic against the cap.
 */
class InMemoryCredentialStore : public ICredentialStore {
public:
    InMemoryCredentialStore(std::shared_ptr<IAccountStore> accounts,
                            std::shared_ptr<core::IClock> clock,
                            std::shared_ptr<core::StructuredLogger> logger,
                            std::chrono::seconds staleTimeout = std::chrono::seconds(30));

    /**
     * @brief Register the credential lists of configured accounts.
     */
    void loadFromConfig(const std::vector<core::AccountConfig>& accounts);

    /**
     * @brief Insert or replace one credential.
     */
    void upsertCredential(Credential credential);

    std::optional<Credential> getAvailableCredential(core::AccountId accountId) override;

    core::Result<std::string, AdmissionError> acquireConnection(
        core::CredentialId credentialId,
        const std::string& streamId,
        const std::string& clientIp) override;

    bool releaseConnection(const std::string& sessionToken) override;

    bool updateActivity(const std::string& sessionToken) override;

    std::size_t cleanupStaleConnections(std::optional<core::AccountId> accountId,
                                        std::chrono::seconds idleTimeout) override;

    core::Result<ConnectionStatus, AdmissionError> getConnectionStatus(
        core::AccountId accountId) const override;

    std::vector<ConnectionRecord> getActiveConnections(
        std::optional<core::AccountId> accountId) const override;

    /**
     * @brief Slots currently charged to a credential.
     */
    std::size_t activeConnectionCount(core::CredentialId credentialId) const;

private:
    std::size_t countLocked(core::CredentialId credentialId) const;
    std::size_t cleanupLocked(std::optional<core::AccountId> accountId,
                              std::chrono::seconds idleTimeout);

    std::shared_ptr<IAccountStore> accounts_;
    std::shared_ptr<core::IClock> clock_;
    std::shared_ptr<core::StructuredLogger> logger_;
    std::chrono::seconds staleTimeout_;

    mutable std::mutex mutex_;
    std::map<core::CredentialId, Credential> credentials_;
    std::map<std::string, ConnectionRecord> connections_;
};

} // namespace admission
} // namespace iptvmux

#endif // IPTVMUX_ADMISSION_IN_MEMORY_CREDENTIAL_STORE_HPP
