// IptvMux - IPTV Stream Multiplexing Proxy
// ProxyServer Public API Implementation
//
// Wires configuration, admission, multiplexing and the HTTP front end
// together and owns their lifecycle.

#include "iptvmux/api/proxy_server.hpp"
#include "iptvmux/iptvmux.hpp"
#include "iptvmux/admission/account_store.hpp"
#include "iptvmux/core/log_sinks.hpp"
#include "iptvmux/net/http_server.hpp"
#include "iptvmux/net/curl_http_client.hpp"
#include "iptvmux/proxy/admin_api.hpp"
#include "iptvmux/proxy/connectivity_probe.hpp"
#include "iptvmux/proxy/proxy_router.hpp"
#include "iptvmux/proxy/stream_proxy.hpp"

#include <mutex>

namespace iptvmux {
namespace api {

namespace {

std::shared_ptr<core::StructuredLogger> buildLogger(const core::LoggingConfig& logging) {
    auto logger = std::make_shared<core::StructuredLogger>();
    logger->setLevel(logging.level);
    logger->setJsonFormat(logging.enableJson);

    if (logging.enableConsole) {
        logger->addSink(std::make_shared<core::ConsoleSink>());
    }
    if (logging.enableFile && !logging.filePath.empty()) {
        core::RotationPolicy policy;
        policy.maxFileSize = static_cast<uint64_t>(logging.maxFileSizeMB) * 1024 * 1024;
        policy.maxBackupFiles = logging.maxFiles;
        policy.compressionEnabled = logging.compressRotated;
        logger->addSink(std::make_shared<core::FileSink>(logging.filePath, policy));
    }
    if (logging.enableSyslog) {
        logger->addSink(std::make_shared<core::SyslogSink>("iptvmux"));
    }
    return logger;
}

} // anonymous namespace

// =============================================================================
// ProxyServer::Impl
// =============================================================================

class ProxyServer::Impl {
public:
    explicit Impl(ServerDependencies dependencies)
        : deps_(std::move(dependencies)) {}

    ~Impl() {
        stop();
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    core::Result<void, ServerError> initialize(const core::Configuration& config) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ != ServerState::Uninitialized) {
            return core::Result<void, ServerError>::error(
                ServerError(ServerError::Code::InvalidState,
                            std::string("Cannot initialize in state ") +
                            serverStateToString(state_)));
        }
        if (config.multiplexer.chunkSize == 0) {
            return core::Result<void, ServerError>::error(
                ServerError(ServerError::Code::InvalidConfiguration,
                            "multiplexer.chunk_size must be positive"));
        }
        if (config.multiplexer.subscriberQueueDepth == 0) {
            return core::Result<void, ServerError>::error(
                ServerError(ServerError::Code::InvalidConfiguration,
                            "multiplexer.subscriber_queue_depth must be positive"));
        }

        logger_ = deps_.logger ? deps_.logger : buildLogger(config.logging);
        clock_ = deps_.clock ? deps_.clock : std::make_shared<core::SteadyClock>();
        upstreamClient_ = deps_.upstreamClient
            ? deps_.upstreamClient
            : std::make_shared<net::CurlHttpClient>();

        accounts_ = std::make_shared<admission::InMemoryAccountStore>(config.accounts);
        credentials_ = std::make_shared<admission::InMemoryCredentialStore>(
            accounts_, clock_, logger_,
            std::chrono::seconds(config.multiplexer.staleConnectionSeconds));
        credentials_->loadFromConfig(config.accounts);

        registry_ = std::make_shared<streaming::StreamRegistry>(
            streaming::StreamRegistryConfig::fromConfig(config.multiplexer, config.upstream),
            upstreamClient_, credentials_, clock_, logger_);

        auto streamProxy = std::make_shared<proxy::StreamProxy>(
            proxy::StreamProxyConfig::fromConfig(config),
            accounts_, credentials_, registry_, logger_);
        auto adminApi = std::make_shared<proxy::AdminApi>(
            accounts_, credentials_, registry_, clock_, logger_);
        auto probe = std::make_shared<proxy::ConnectivityProbe>(
            proxy::ConnectivityProbeConfig::fromConfig(config),
            accounts_, credentials_, upstreamClient_, logger_);
        router_ = std::make_shared<proxy::ProxyRouter>(streamProxy, adminApi, probe, logger_);

        net::HttpServerConfig httpConfig;
        httpConfig.bindAddress = config.server.bindAddress;
        httpConfig.port = config.server.port;
        httpConfig.maxConnections = config.server.maxConnections;
        httpServer_ = std::make_unique<net::HttpServer>(httpConfig, router_->handler(), logger_);

        state_ = ServerState::Initialized;
        logger_->info("IptvMux " + std::string(IPTVMUX_VERSION_STRING) + " initialized with " +
                      std::to_string(config.accounts.size()) + " accounts", "Server");
        return core::Result<void, ServerError>::success();
    }

    core::Result<void, ServerError> start() {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ != ServerState::Initialized) {
            return core::Result<void, ServerError>::error(
                ServerError(ServerError::Code::InvalidState,
                            std::string("Cannot start in state ") + serverStateToString(state_)));
        }

        registry_->start();

        auto started = httpServer_->start();
        if (started.isError()) {
            registry_->stop();
            ServerError::Code code = started.error().code == net::HttpServerError::Code::BindFailed
                ? ServerError::Code::BindFailed
                : ServerError::Code::StartFailed;
            logger_->error("Failed to start HTTP listener: " + started.error().message, "Server");
            return core::Result<void, ServerError>::error(
                ServerError(code, started.error().message));
        }

        state_ = ServerState::Running;
        logger_->info("Listening on port " + std::to_string(httpServer_->port()), "Server");
        return core::Result<void, ServerError>::success();
    }

    core::Result<void, ServerError> stop() {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ != ServerState::Running) {
            if (state_ == ServerState::Initialized) {
                state_ = ServerState::Stopped;
            }
            return core::Result<void, ServerError>::success();
        }

        state_ = ServerState::Stopping;
        logger_->info("Shutting down", "Server");

        // Ending the streams first unblocks every client handler thread,
        // which the listener joins on stop.
        registry_->stop();
        httpServer_->stop();

        state_ = ServerState::Stopped;
        logger_->info("Shutdown complete", "Server");
        return core::Result<void, ServerError>::success();
    }

    ServerState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    uint16_t port() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return (state_ == ServerState::Running && httpServer_) ? httpServer_->port() : 0;
    }

    std::shared_ptr<streaming::StreamRegistry> registry() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return registry_;
    }

    std::shared_ptr<admission::InMemoryCredentialStore> credentialStore() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return credentials_;
    }

    std::shared_ptr<core::StructuredLogger> logger() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return logger_ ? logger_ : deps_.logger;
    }

private:
    ServerDependencies deps_;

    mutable std::mutex mutex_;
    ServerState state_ = ServerState::Uninitialized;

    std::shared_ptr<core::StructuredLogger> logger_;
    std::shared_ptr<core::IClock> clock_;
    std::shared_ptr<net::IUpstreamClient> upstreamClient_;
    std::shared_ptr<admission::InMemoryAccountStore> accounts_;
    std::shared_ptr<admission::InMemoryCredentialStore> credentials_;
    std::shared_ptr<streaming::StreamRegistry> registry_;
    std::shared_ptr<proxy::ProxyRouter> router_;

    // Declared last so it is destroyed first; the handler refers to router_.
    std::unique_ptr<net::HttpServer> httpServer_;
};

// =============================================================================
// ProxyServer
// =============================================================================

ProxyServer::ProxyServer(ServerDependencies dependencies)
    : impl_(std::make_unique<Impl>(std::move(dependencies))) {
}

ProxyServer::~ProxyServer() = default;

core::Result<void, ServerError> ProxyServer::initialize(const core::Configuration& config) {
    return impl_->initialize(config);
}

core::Result<void, ServerError> ProxyServer::start() {
    return impl_->start();
}

core::Result<void, ServerError> ProxyServer::stop() {
    return impl_->stop();
}

ServerState ProxyServer::state() const {
    return impl_->state();
}

bool ProxyServer::isRunning() const {
    return impl_->state() == ServerState::Running;
}

uint16_t ProxyServer::port() const {
    return impl_->port();
}

std::shared_ptr<streaming::StreamRegistry> ProxyServer::registry() const {
    return impl_->registry();
}

std::shared_ptr<admission::InMemoryCredentialStore> ProxyServer::credentialStore() const {
    return impl_->credentialStore();
}

std::shared_ptr<core::StructuredLogger> ProxyServer::logger() const {
    return impl_->logger();
}

std::string ProxyServer::getVersion() {
    return IPTVMUX_VERSION_STRING;
}

} // namespace api
} // namespace iptvmux
