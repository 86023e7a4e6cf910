// IptvMux - IPTV Stream Multiplexing Proxy
// Admin API Implementation

#include "iptvmux/proxy/admin_api.hpp"
#include "iptvmux/core/json_writer.hpp"
#include "iptvmux/core/secure_token.hpp"

namespace iptvmux {
namespace proxy {

namespace {

double ageSeconds(core::TimePoint since, core::TimePoint now) {
    if (now <= since) {
        return 0.0;
    }
    return std::chrono::duration<double>(now - since).count();
}

} // anonymous namespace

AdminResponse adminError(int status, const std::string& message) {
    core::JsonWriter json;
    json.beginObject();
    json.field("error", message);
    json.field("status", status);
    json.endObject();
    return AdminResponse{status, json.str()};
}

AdminApi::AdminApi(std::shared_ptr<admission::IAccountStore> accounts,
                   std::shared_ptr<admission::ICredentialStore> credentials,
                   std::shared_ptr<streaming::StreamRegistry> registry,
                   std::shared_ptr<core::IClock> clock,
                   std::shared_ptr<core::StructuredLogger> logger)
    : accounts_(std::move(accounts))
    , credentials_(std::move(credentials))
    , registry_(std::move(registry))
    , clock_(clock ? std::move(clock) : std::make_shared<core::SteadyClock>())
    , logger_(logger ? std::move(logger) : std::make_shared<core::StructuredLogger>()) {
}

AdminResponse AdminApi::accountStatus(core::AccountId accountId) const {
    if (!accounts_->getAccount(accountId)) {
        return adminError(404, "Account not found");
    }

    auto status = credentials_->getConnectionStatus(accountId);
    if (status.isError()) {
        return adminError(404, status.error().message);
    }
    const admission::ConnectionStatus& s = status.value();

    core::JsonWriter json;
    json.beginObject();
    json.field("account_id", accountId);
    json.field("total_max_connections", s.totalMaxConnections);
    json.field("total_active_connections", s.totalActiveConnections);
    json.field("available_connections", s.availableConnections);
    json.field("legacy_mode", s.legacyMode);
    json.field("idle_streams", static_cast<uint64_t>(registry_->getIdleStreamCount(accountId)));
    json.key("credentials").beginArray();
    for (const auto& credential : s.credentials) {
        json.beginObject();
        json.field("id", credential.id);
        json.field("username", credential.username);
        json.field("max_connections", credential.maxConnections);
        json.field("active_connections", credential.activeConnections);
        json.field("enabled", credential.enabled);
        json.endObject();
    }
    json.endArray();
    json.endObject();
    return AdminResponse{200, json.str()};
}

AdminResponse AdminApi::activeConnections(std::optional<core::AccountId> accountId) const {
    core::TimePoint now = clock_->now();
    std::vector<admission::ConnectionRecord> records = credentials_->getActiveConnections(accountId);

    core::JsonWriter json;
    json.beginObject();
    json.key("active_streams").beginArray();
    for (const auto& record : records) {
        json.beginObject();
        json.field("session_token", record.sessionToken);
        json.field("stream_id", record.streamId);
        json.field("credential_id", record.credentialId);
        json.field("account_id", record.accountId);
        json.field("client_ip", record.clientIp);
        json.field("age_seconds", ageSeconds(record.startedAt, now));
        json.field("idle_seconds", ageSeconds(record.lastActivity, now));
        json.endObject();
    }
    json.endArray();
    json.field("count", static_cast<uint64_t>(records.size()));
    json.endObject();
    return AdminResponse{200, json.str()};
}

AdminResponse AdminApi::multiplexerStats() const {
    streaming::RegistryStats stats = registry_->getStats();

    core::JsonWriter json;
    json.beginObject();
    json.field("active_streams", static_cast<uint64_t>(stats.activeStreams));
    json.field("total_subscribers", static_cast<uint64_t>(stats.totalSubscribers));
    json.key("streams").beginArray();
    for (const auto& stream : stats.streams) {
        json.beginObject();
        json.field("stream_key", stream.streamKey);
        json.field("account_id", stream.accountId);
        json.field("stream_id", stream.streamId);
        json.field("format", core::streamFormatToString(stream.format));
        json.field("credential_id", stream.credentialId);
        json.field("subscribers", static_cast<uint64_t>(stream.subscribers));
        json.field("bytes_received", stream.bytesReceived);
        json.field("is_active", stream.isActive);
        json.field("content_type", stream.contentType);
        json.field("uptime_seconds", stream.uptimeSeconds);
        json.field("idle_seconds", stream.idleSeconds);
        if (stream.error.empty()) {
            json.key("error").null();
        } else {
            json.field("error", stream.error);
        }
        json.endObject();
    }
    json.endArray();
    json.endObject();
    return AdminResponse{200, json.str()};
}

AdminResponse AdminApi::releaseConnection(const std::string& sessionToken) {
    if (!credentials_->releaseConnection(sessionToken)) {
        return adminError(404, "Session not found");
    }

    logger_->info("Connection " + core::tokenPrefix(sessionToken) + " released by operator",
                  "Admin");

    core::JsonWriter json;
    json.beginObject();
    json.field("success", true);
    json.field("message", "Connection released");
    json.endObject();
    return AdminResponse{200, json.str()};
}

AdminResponse AdminApi::cleanup(std::optional<core::AccountId> accountId, std::chrono::seconds idleTimeout) {
    std::size_t removed = credentials_->cleanupStaleConnections(accountId, idleTimeout);

    logger_->info("Operator cleanup removed " + std::to_string(removed) +
                  " stale connections (timeout " + std::to_string(idleTimeout.count()) + "s)",
                  "Admin");

    core::JsonWriter json;
    json.beginObject();
    json.field("success", true);
    json.field("message", "Cleanup completed");
    json.field("removed", static_cast<uint64_t>(removed));
    json.endObject();
    return AdminResponse{200, json.str()};
}

} // namespace proxy
} // namespace iptvmux
