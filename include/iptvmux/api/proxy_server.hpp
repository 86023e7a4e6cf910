// IptvMux - IPTV Stream Multiplexing Proxy
// Proxy Server Public API - Main interface for running the proxy
//
// Responsibilities:
// - Build the logger sinks, stores, registry and HTTP front end from a
//   Configuration
// - Provide lifecycle methods (initialize, start, stop)
// - Expose the registry and credential store for embedding and tests
// - Order shutdown so upstream readers end before the listener closes

#ifndef IPTVMUX_API_PROXY_SERVER_HPP
#define IPTVMUX_API_PROXY_SERVER_HPP

#include "iptvmux/admission/in_memory_credential_store.hpp"
#include "iptvmux/core/clock.hpp"
#include "iptvmux/core/config_manager.hpp"
#include "iptvmux/core/result.hpp"
#include "iptvmux/core/structured_logger.hpp"
#include "iptvmux/net/upstream_client.hpp"
#include "iptvmux/streaming/stream_registry.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace iptvmux {
namespace api {

// =============================================================================
// Server State
// =============================================================================

/**
 * @brief Server lifecycle states.
 */
enum class ServerState {
    Uninitialized,  ///< Created but initialize() not called
    Initialized,    ///< Components built, not listening
    Running,        ///< Accepting client requests
    Stopping,       ///< Shutdown in progress
    Stopped         ///< Stopped, may not be restarted
};

/**
 * @brief Convert ServerState to string for logging.
 */
inline const char* serverStateToString(ServerState state) {
    switch (state) {
        case ServerState::Uninitialized: return "Uninitialized";
        case ServerState::Initialized:   return "Initialized";
        case ServerState::Running:       return "Running";
        case ServerState::Stopping:      return "Stopping";
        case ServerState::Stopped:       return "Stopped";
        default:                         return "Unknown";
    }
}

// =============================================================================
// Error Types
// =============================================================================

/**
 * @brief Error information for server operations.
 */
struct ServerError {
    /**
     * @brief Error codes for server operations.
     */
    enum class Code {
        InvalidConfiguration,   ///< Configuration is invalid
        InvalidState,           ///< Operation not allowed in current state
        BindFailed,             ///< Failed to bind the listener
        StartFailed,            ///< Failed to start a component
        InternalError           ///< Internal error occurred
    };

    Code code;              ///< Error code
    std::string message;    ///< Human-readable error message

    ServerError(Code c = Code::InternalError, std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Optional collaborators replacing the defaults.
 *
 * Unset members are created by initialize(): a logger with sinks from the
 * logging section, a CurlHttpClient and a SteadyClock.
 */
struct ServerDependencies {
    std::shared_ptr<core::StructuredLogger> logger;
    std::shared_ptr<net::IUpstreamClient> upstreamClient;
    std::shared_ptr<core::IClock> clock;
};

// =============================================================================
// ProxyServer
// =============================================================================

/**
 * @brief IPTV multiplexing proxy public API.
 *
 * Typical usage:
 * @code
 * core::ConfigManager manager;
 * manager.loadFromFile("iptvmux.json");
 *
 * ProxyServer server;
 * if (server.initialize(manager.getConfig()).isSuccess() &&
 *     server.start().isSuccess()) {
 *     // Serving...
 *     server.stop();
 * }
 * @endcode
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - stop() is idempotent and also runs from the destructor
 */
class ProxyServer {
public:
    explicit ProxyServer(ServerDependencies dependencies = ServerDependencies());
    ~ProxyServer();

    // Non-copyable
    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle Methods
    // -------------------------------------------------------------------------

    /**
     * @brief Build every component from the configuration.
     *
     * Must be called once, before start().
     */
    core::Result<void, ServerError> initialize(const core::Configuration& config);

    /**
     * @brief Start the reclamation sweep and the HTTP listener.
     */
    core::Result<void, ServerError> start();

    /**
     * @brief Stop the registry, ending every shared stream, then the listener.
     */
    core::Result<void, ServerError> stop();

    // -------------------------------------------------------------------------
    // State Queries
    // -------------------------------------------------------------------------

    ServerState state() const;

    bool isRunning() const;

    /**
     * @brief Bound port, valid while running.
     */
    uint16_t port() const;

    // -------------------------------------------------------------------------
    // Components
    // -------------------------------------------------------------------------

    /// Null before initialize()
    std::shared_ptr<streaming::StreamRegistry> registry() const;

    /// Null before initialize()
    std::shared_ptr<admission::InMemoryCredentialStore> credentialStore() const;

    std::shared_ptr<core::StructuredLogger> logger() const;

    /**
     * @brief Library version string.
     */
    static std::string getVersion();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace api

using api::ProxyServer;
using api::ServerDependencies;
using api::ServerError;
using api::ServerState;

} // namespace iptvmux

#endif // IPTVMUX_API_PROXY_SERVER_HPP
