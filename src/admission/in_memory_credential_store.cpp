// IptvMux - IPTV Stream Multiplexing Proxy
// In-memory credential store implementation

#include "iptvmux/admission/in_memory_credential_store.hpp"
#include "iptvmux/core/secure_token.hpp"

#include <algorithm>

namespace iptvmux {
namespace admission {

InMemoryCredentialStore::InMemoryCredentialStore(std::shared_ptr<IAccountStore> accounts,
                                                 std::shared_ptr<core::IClock> clock,
                                                 std::shared_ptr<core::StructuredLogger> logger,
                                                 std::chrono::seconds staleTimeout)
    : accounts_(std::move(accounts))
    , clock_(clock ? std::move(clock) : std::make_shared<core::SteadyClock>())
    , logger_(logger ? std::move(logger) : std::make_shared<core::StructuredLogger>())
    , staleTimeout_(staleTimeout) {
}

void InMemoryCredentialStore::loadFromConfig(const std::vector<core::AccountConfig>& accounts) {
    for (const auto& account : accounts) {
        for (const auto& config : account.credentials) {
            Credential credential;
            credential.id = config.id;
            credential.accountId = account.id;
            credential.username = config.username;
            credential.password = config.password;
            credential.maxConnections = config.maxConnections;
            credential.enabled = config.enabled;
            upsertCredential(std::move(credential));
        }
    }
}

void InMemoryCredentialStore::upsertCredential(Credential credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    core::CredentialId id = credential.id;
    credentials_[id] = std::move(credential);
}

std::optional<Credential> InMemoryCredentialStore::getAvailableCredential(core::AccountId accountId) {
    auto account = accounts_->getAccount(accountId);
    if (!account || !account->enabled) {
        logger_->warning("Account " + std::to_string(accountId) + " not found or disabled",
                         "Admission");
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cleanupLocked(accountId, staleTimeout_);

    std::vector<const Credential*> enabled;
    for (const auto& entry : credentials_) {
        if (entry.second.accountId == accountId && entry.second.enabled) {
            enabled.push_back(&entry.second);
        }
    }

    if (enabled.empty()) {
        if (account->hasLegacyCredential()) {
            logger_->debug("Using legacy credentials for account " + std::to_string(accountId),
                           "Admission");
            Credential legacy;
            legacy.id = core::LEGACY_CREDENTIAL_ID;
            legacy.accountId = accountId;
            legacy.username = account->legacyUsername;
            legacy.password = account->legacyPassword;
            legacy.maxConnections = 1;
            return legacy;
        }
        return std::nullopt;
    }

    // Least loaded first; the map order breaks ties by lowest id.
    const Credential* selected = nullptr;
    std::size_t selectedLoad = 0;
    for (const Credential* credential : enabled) {
        std::size_t load = countLocked(credential->id);
        if (load >= std::max<uint32_t>(credential->maxConnections, 1)) {
            continue;
        }
        if (selected == nullptr || load < selectedLoad) {
            selected = credential;
            selectedLoad = load;
        }
    }

    if (selected == nullptr) {
        logger_->warning("No available credentials for account " + std::to_string(accountId),
                         "Admission");
        return std::nullopt;
    }

    logger_->debug("Selected credential " + std::to_string(selected->id) + " for account " +
                   std::to_string(accountId) + " (" + std::to_string(selectedLoad) + "/" +
                   std::to_string(selected->maxConnections) + " connections)", "Admission");
    return *selected;
}

core::Result<std::string, AdmissionError> InMemoryCredentialStore::acquireConnection(
    core::CredentialId credentialId,
    const std::string& streamId,
    const std::string& clientIp)
{
    using TokenResult = core::Result<std::string, AdmissionError>;

    auto token = core::generateSecureToken(core::SESSION_TOKEN_BYTES);
    if (token.isError()) {
        return TokenResult::error(AdmissionError(AdmissionError::Code::TokenGenerationFailed,
                                                 token.error().message));
    }

    if (credentialId == core::LEGACY_CREDENTIAL_ID) {
        // Legacy mode: no tracking.
        return TokenResult::success(std::move(token).value());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = credentials_.find(credentialId);
    if (it == credentials_.end()) {
        return TokenResult::error(AdmissionError(AdmissionError::Code::CredentialNotFound,
                                                 "Credential not found"));
    }
    const Credential& credential = it->second;
    if (!credential.enabled) {
        return TokenResult::error(AdmissionError(AdmissionError::Code::CredentialDisabled,
                                                 "Credential is disabled"));
    }
    if (countLocked(credentialId) >= std::max<uint32_t>(credential.maxConnections, 1)) {
        return TokenResult::error(AdmissionError(AdmissionError::Code::NoAvailableSlots,
                                                 "No available connection slots"));
    }

    core::TimePoint now = clock_->now();
    ConnectionRecord record;
    record.sessionToken = token.value();
    record.credentialId = credentialId;
    record.accountId = credential.accountId;
    record.streamId = streamId;
    record.clientIp = clientIp;
    record.startedAt = now;
    record.lastActivity = now;
    connections_[record.sessionToken] = record;

    core::LogContext ctx;
    ctx.accountId = credential.accountId;
    ctx.clientIP = clientIp;
    ctx.sessionToken = record.sessionToken;
    logger_->logStreamEvent(core::StreamEventType::CredentialAcquired, ctx,
                            "credential " + std::to_string(credentialId) + ", stream " + streamId);
    return TokenResult::success(std::move(token).value());
}

bool InMemoryCredentialStore::releaseConnection(const std::string& sessionToken) {
    if (sessionToken.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(sessionToken);
    if (it == connections_.end()) {
        logger_->debug("No active connection for session " + core::tokenPrefix(sessionToken),
                       "Admission");
        return false;
    }

    core::LogContext ctx;
    ctx.accountId = it->second.accountId;
    ctx.sessionToken = sessionToken;
    std::string detail = "credential " + std::to_string(it->second.credentialId);
    connections_.erase(it);

    logger_->logStreamEvent(core::StreamEventType::CredentialReleased, ctx, detail);
    return true;
}

bool InMemoryCredentialStore::updateActivity(const std::string& sessionToken) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(sessionToken);
    if (it == connections_.end()) {
        return false;
    }
    it->second.lastActivity = clock_->now();
    return true;
}

std::size_t InMemoryCredentialStore::cleanupStaleConnections(std::optional<core::AccountId> accountId,
                                                             std::chrono::seconds idleTimeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    return cleanupLocked(accountId, idleTimeout);
}

core::Result<ConnectionStatus, AdmissionError> InMemoryCredentialStore::getConnectionStatus(
    core::AccountId accountId) const
{
    using StatusResult = core::Result<ConnectionStatus, AdmissionError>;

    if (!accounts_->getAccount(accountId)) {
        return StatusResult::error(AdmissionError(AdmissionError::Code::AccountNotFound,
                                                  "Account not found"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ConnectionStatus status;
    for (const auto& entry : credentials_) {
        const Credential& credential = entry.second;
        if (credential.accountId != accountId) {
            continue;
        }
        CredentialStatus line;
        line.id = credential.id;
        line.username = credential.username;
        line.maxConnections = std::max<uint32_t>(credential.maxConnections, 1);
        line.activeConnections = static_cast<uint32_t>(countLocked(credential.id));
        line.enabled = credential.enabled;

        status.totalMaxConnections += line.maxConnections;
        status.totalActiveConnections += line.activeConnections;
        status.credentials.push_back(std::move(line));
    }

    if (status.credentials.empty()) {
        status.totalMaxConnections = 1;
        status.totalActiveConnections = 0;
        status.availableConnections = 1;
        status.legacyMode = true;
        return StatusResult::success(std::move(status));
    }

    status.availableConnections = status.totalMaxConnections > status.totalActiveConnections
        ? status.totalMaxConnections - status.totalActiveConnections : 0;
    return StatusResult::success(std::move(status));
}

std::vector<ConnectionRecord> InMemoryCredentialStore::getActiveConnections(
    std::optional<core::AccountId> accountId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConnectionRecord> result;
    for (const auto& entry : connections_) {
        if (!accountId || entry.second.accountId == *accountId) {
            result.push_back(entry.second);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const ConnectionRecord& a, const ConnectionRecord& b) {
                  return a.startedAt < b.startedAt;
              });
    return result;
}

std::size_t InMemoryCredentialStore::activeConnectionCount(core::CredentialId credentialId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return countLocked(credentialId);
}

std::size_t InMemoryCredentialStore::countLocked(core::CredentialId credentialId) const {
    return static_cast<std::size_t>(std::count_if(connections_.begin(), connections_.end(),
        [credentialId](const std::pair<const std::string, ConnectionRecord>& entry) {
            return entry.second.credentialId == credentialId;
        }));
}

std::size_t InMemoryCredentialStore::cleanupLocked(std::optional<core::AccountId> accountId,
                                                   std::chrono::seconds idleTimeout) {
    core::TimePoint cutoff = clock_->now() - idleTimeout;
    std::size_t removed = 0;

    for (auto it = connections_.begin(); it != connections_.end();) {
        const ConnectionRecord& record = it->second;
        bool inScope = !accountId || record.accountId == *accountId;
        if (inScope && record.lastActivity < cutoff) {
            it = connections_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        logger_->info("Cleaning up " + std::to_string(removed) + " stale connections", "Admission");
    }
    return removed;
}

} // namespace admission
} // namespace iptvmux
