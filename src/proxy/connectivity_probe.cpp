// IptvMux - IPTV Stream Multiplexing Proxy
// Connectivity Probe Implementation

#include "iptvmux/proxy/connectivity_probe.hpp"
#include "iptvmux/core/json_writer.hpp"
#include "iptvmux/core/url.hpp"

#include <vector>

namespace iptvmux {
namespace proxy {

std::string ProbeResult::toJson() const {
    core::JsonWriter json;
    json.beginObject();
    json.field("account_id", accountId);
    json.field("stream_id", streamId);
    json.field("success", success);

    json.key("checks").beginObject();
    if (checks.accountExists) json.field("account_exists", *checks.accountExists);
    if (checks.accountEnabled) json.field("account_enabled", *checks.accountEnabled);
    if (checks.server) json.field("server", *checks.server);
    if (checks.credentialAvailable) json.field("credential_available", *checks.credentialAvailable);
    if (checks.credentialId) json.field("credential_id", *checks.credentialId);
    if (checks.upstreamUrl) json.field("upstream_url", *checks.upstreamUrl);
    if (checks.headStatus) json.field("head_status", *checks.headStatus);
    if (checks.getStatus) json.field("get_status", *checks.getStatus);
    if (checks.receivedData) json.field("received_data", *checks.receivedData);
    if (checks.dataSize) json.field("data_size", *checks.dataSize);
    if (checks.timeout) json.field("timeout", *checks.timeout);
    if (checks.connectionError) json.field("connection_error", *checks.connectionError);
    json.endObject();

    json.field("error", error);
    json.endObject();
    return json.str();
}

ConnectivityProbeConfig ConnectivityProbeConfig::fromConfig(const core::Configuration& config) {
    ConnectivityProbeConfig result;
    result.timeout = std::chrono::seconds(config.upstream.probeTimeoutSeconds);
    result.maxRedirects = config.upstream.maxRedirects;
    result.defaultUserAgent = config.upstream.defaultUserAgent;
    return result;
}

ConnectivityProbe::ConnectivityProbe(ConnectivityProbeConfig config,
                                     std::shared_ptr<admission::IAccountStore> accounts,
                                     std::shared_ptr<admission::ICredentialStore> credentials,
                                     std::shared_ptr<net::IUpstreamClient> upstreamClient,
                                     std::shared_ptr<core::StructuredLogger> logger)
    : config_(std::move(config))
    , accounts_(std::move(accounts))
    , credentials_(std::move(credentials))
    , upstreamClient_(std::move(upstreamClient))
    , logger_(logger ? std::move(logger) : std::make_shared<core::StructuredLogger>()) {
}

ProbeResult ConnectivityProbe::probe(core::AccountId accountId, const std::string& streamId) {
    ProbeResult result;
    result.accountId = accountId;
    result.streamId = streamId;

    auto account = accounts_->getAccount(accountId);
    if (!account) {
        result.checks.accountExists = false;
        result.error = "Account " + std::to_string(accountId) + " not found";
        result.httpStatus = 404;
        return result;
    }
    result.checks.accountExists = true;
    result.checks.accountEnabled = account->enabled;
    if (!account->enabled) {
        result.error = "Account is disabled";
        result.httpStatus = 403;
        return result;
    }
    result.checks.server = account->server;

    auto credential = credentials_->getAvailableCredential(accountId);
    if (!credential) {
        result.checks.credentialAvailable = false;
        result.error = "No available credentials";
        result.httpStatus = 503;
        return result;
    }
    result.checks.credentialAvailable = true;
    result.checks.credentialId = credential->id;

    const std::string url = core::buildUpstreamUrl(account->server, credential->username,
                                                   credential->password, streamId,
                                                   core::StreamFormat::Ts);
    result.checks.upstreamUrl = core::maskUrlCredentials(url);

    net::UpstreamRequest request;
    request.url = url;
    request.method = "HEAD";
    request.userAgent = account->userAgent.empty() ? config_.defaultUserAgent : account->userAgent;
    request.connectTimeout = config_.timeout;
    request.readTimeout = config_.timeout;
    request.maxRedirects = config_.maxRedirects;

    logger_->info("Testing stream connectivity: " + *result.checks.upstreamUrl, "Probe");

    auto head = upstreamClient_->open(request);
    if (head.isError()) {
        recordFailure(result, head.error());
        return result;
    }

    int headStatus = head.value()->statusCode();
    result.checks.headStatus = headStatus;
    head.value().reset();

    if (headStatus != 405) {
        if (headStatus == 200) {
            result.success = true;
        } else {
            result.error = "Upstream returned HTTP " + std::to_string(headStatus);
        }
        return result;
    }

    logger_->info("HEAD not supported, trying GET", "Probe");
    request.method = "GET";
    auto get = upstreamClient_->open(request);
    if (get.isError()) {
        recordFailure(result, get.error());
        return result;
    }

    auto& response = get.value();
    int getStatus = response->statusCode();
    result.checks.getStatus = getStatus;

    std::vector<uint8_t> sample(config_.sampleBytes);
    auto read = response->read(sample.data(), sample.size());
    std::size_t bytes = read.isSuccess() ? read.value() : 0;
    result.checks.receivedData = bytes > 0;
    result.checks.dataSize = static_cast<uint64_t>(bytes);
    response->abort();

    if (getStatus == 200) {
        result.success = true;
    } else {
        result.error = "Upstream returned HTTP " + std::to_string(getStatus);
    }
    return result;
}

void ConnectivityProbe::recordFailure(ProbeResult& result, const net::UpstreamError& error) const {
    switch (error.code) {
        case net::UpstreamError::Code::Timeout:
            result.checks.timeout = true;
            result.error = "Connection timed out: " + error.message;
            break;
        case net::UpstreamError::Code::ConnectionFailed:
            result.checks.connectionError = true;
            result.error = "Connection failed: " + error.message;
            break;
        default:
            result.error = error.toString();
            break;
    }
    logger_->warning("Connectivity probe of account " + std::to_string(result.accountId) +
                     " stream " + result.streamId + " failed: " + *result.error, "Probe");
}

} // namespace proxy
} // namespace iptvmux
