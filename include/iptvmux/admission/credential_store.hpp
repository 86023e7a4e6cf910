// IptvMux - IPTV Stream Multiplexing Proxy
// Credential Store - Connection-slot accounting per provider credential
//
// Responsibilities:
// - Pick the least loaded credential of an account that has a free slot
// - Acquire a slot atomically against the credential's connection cap
// - Release slots by session token, idempotently
// - Track slot activity and reclaim slots that went stale
// - Report per-account status for operators

#ifndef IPTVMUX_ADMISSION_CREDENTIAL_STORE_HPP
#define IPTVMUX_ADMISSION_CREDENTIAL_STORE_HPP

#include "iptvmux/core/result.hpp"
#include "iptvmux/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace iptvmux {
namespace admission {

/**
 * @brief Provider credential with a concurrent connection cap.
 */
struct Credential {
    core::CredentialId id = 0;
    core::AccountId accountId = 0;
    std::string username;
    std::string password;
    uint32_t maxConnections = 1;
    bool enabled = true;

    /// Implicit credential of an account without a credential list.
    bool isLegacy() const { return id == core::LEGACY_CREDENTIAL_ID; }
};

/**
 * @brief One charged connection slot.
 */
struct ConnectionRecord {
    std::string sessionToken;
    core::CredentialId credentialId = 0;
    core::AccountId accountId = 0;
    std::string streamId;
    std::string clientIp;
    core::TimePoint startedAt;
    core::TimePoint lastActivity;
};

/**
 * @brief Per-credential line of a status report.
 */
struct CredentialStatus {
    core::CredentialId id = 0;
    std::string username;
    uint32_t maxConnections = 0;
    uint32_t activeConnections = 0;
    bool enabled = true;
};

/**
 * @brief Connection availability of one account.
 */
struct ConnectionStatus {
    uint32_t totalMaxConnections = 0;
    uint32_t totalActiveConnections = 0;
    uint32_t availableConnections = 0;
    std::vector<CredentialStatus> credentials;
    bool legacyMode = false;
};

/**
 * @brief Admission failure.
 */
struct AdmissionError {
    enum class Code {
        AccountNotFound,
        CredentialNotFound,
        CredentialDisabled,
        NoAvailableSlots,
        TokenGenerationFailed
    };

    Code code = Code::NoAvailableSlots;
    std::string message;

    AdmissionError() = default;
    AdmissionError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Interface of the connection-slot authority.
 *
 * Implementations must make acquireConnection() atomic against the
 * credential's cap and releaseConnection() idempotent.
 */
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;

    /**
     * @brief Least loaded enabled credential with a free slot.
     *
     * Stale slots of the account are reclaimed first.
     */
    virtual std::optional<Credential> getAvailableCredential(core::AccountId accountId) = 0;

    /**
     * @brief Charge one slot to a credential.
     * @return Session token identifying the slot
     */
    virtual core::Result<std::string, AdmissionError> acquireConnection(
        core::CredentialId credentialId,
        const std::string& streamId,
        const std::string& clientIp) = 0;

    /**
     * @brief Return a slot.
     * @return true the first time, false for unknown or released tokens
     */
    virtual bool releaseConnection(const std::string& sessionToken) = 0;

    /**
     * @brief Refresh the activity timestamp of a slot.
     * @return false for unknown tokens
     */
    virtual bool updateActivity(const std::string& sessionToken) = 0;

    /**
     * @brief Release slots idle for longer than idleTimeout.
     * @param accountId Limit to one account, all accounts when empty
     * @return Number of released slots
     */
    virtual std::size_t cleanupStaleConnections(std::optional<core::AccountId> accountId,
                                                std::chrono::seconds idleTimeout) = 0;

    virtual core::Result<ConnectionStatus, AdmissionError> getConnectionStatus(
        core::AccountId accountId) const = 0;

    virtual std::vector<ConnectionRecord> getActiveConnections(
        std::optional<core::AccountId> accountId) const = 0;
};

} // namespace admission
} // namespace iptvmux

#endif // IPTVMUX_ADMISSION_CREDENTIAL_STORE_HPP
