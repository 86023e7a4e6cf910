// IptvMux - IPTV Stream Multiplexing Proxy
// Configuration Manager - Handles configuration loading and validation
//
// Responsibilities:
// - Parse the JSON configuration file (server, logging, multiplexer,
//   upstream and account sections)
// - Support IPTVMUX_* environment variable overrides for containerized
//   deployments, then command line overrides on top
// - Validate the configuration with field-level error messages
// - Apply defaults when no configuration file is given
// - Log effective configuration values during initialization

#ifndef IPTVMUX_CORE_CONFIG_MANAGER_HPP
#define IPTVMUX_CORE_CONFIG_MANAGER_HPP

#include "iptvmux/core/result.hpp"
#include "iptvmux/core/structured_logger.hpp"
#include "iptvmux/core/types.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace iptvmux {
namespace core {

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief HTTP listener section.
 */
struct ServerConfig {
    std::string bindAddress = "0.0.0.0";  ///< Listen address
    uint16_t port = 8080;                 ///< Listen port
    uint32_t maxConnections = 1024;       ///< Concurrent client connections
};

/**
 * @brief Logging section.
 */
struct LoggingConfig {
    LogLevelConfig level = LogLevelConfig::Info;
    bool enableConsole = true;            ///< Write to stderr
    bool enableFile = false;              ///< Write to filePath
    std::string filePath;                 ///< Log file path
    bool enableJson = false;              ///< JSON line format
    bool enableSyslog = false;            ///< Forward to syslog
    uint32_t maxFileSizeMB = 100;         ///< Rotation threshold
    uint32_t maxFiles = 5;                ///< Rotated backups kept
    bool compressRotated = true;          ///< gzip rotated backups
};

/**
 * @brief Stream multiplexer tuning.
 */
struct MultiplexerConfig {
    uint32_t chunkSize = 65536;           ///< Upstream read size in bytes
    uint32_t subscriberQueueDepth = 50;   ///< Chunks buffered per subscriber
    uint32_t connectTimeoutSeconds = 60;  ///< Upstream connect timeout
    uint32_t readTimeoutSeconds = 120;    ///< Max gap between upstream bytes
    uint32_t idleTimeoutSeconds = 30;     ///< Zero-subscriber grace period
    uint32_t subscriberWaitSeconds = 5;   ///< Single queue wait in ChunkStream
    uint32_t reclaimIntervalMs = 1000;    ///< Reclamation sweep period
    uint32_t idleReleasePauseMs = 500;    ///< Pause before admission retry
    uint32_t staleConnectionSeconds = 30; ///< Slot considered stale after this
};

/**
 * @brief Upstream provider access.
 */
struct UpstreamConfig {
    std::string defaultUserAgent = "okhttp/3.14.9";
    uint32_t maxRedirects = 5;
    uint32_t probeTimeoutSeconds = 10;    ///< Connectivity probe timeout
};

/**
 * @brief One provider credential.
 */
struct CredentialConfig {
    CredentialId id = 0;
    std::string username;
    std::string password;
    uint32_t maxConnections = 1;
    bool enabled = true;
};

/**
 * @brief One provider account.
 *
 * username and password are the legacy single credential, used only when
 * the credentials list is empty.
 */
struct AccountConfig {
    AccountId id = 0;
    std::string name;
    std::string server;
    bool enabled = true;
    std::string userAgent;
    std::string username;
    std::string password;
    std::vector<CredentialConfig> credentials;
};

/**
 * @brief Complete configuration.
 */
struct Configuration {
    ServerConfig server;
    LoggingConfig logging;
    MultiplexerConfig multiplexer;
    UpstreamConfig upstream;
    std::vector<AccountConfig> accounts;
};

/**
 * @brief Overrides supplied on the command line.
 *
 * Only populated fields are applied.
 */
struct ConfigOverrides {
    std::optional<std::string> bindAddress;
    std::optional<uint16_t> port;
    std::optional<LogLevelConfig> logLevel;
    std::optional<bool> jsonLogs;
};

// =============================================================================
// Configuration Error
// =============================================================================

/**
 * @brief Configuration error with location information.
 */
struct ConfigError {
    enum class Code {
        None,
        FileNotFound,
        ParseError,
        ValidationError,
        IOError
    };

    Code code = Code::None;
    std::string message;
    std::string field;   ///< Dotted field path for validation errors
    int line = 0;        ///< 1-based line for parse errors, 0 if unknown

    ConfigError() = default;
    ConfigError(Code c, std::string msg, std::string f = "", int l = 0)
        : code(c), message(std::move(msg)), field(std::move(f)), line(l) {}
};

/**
 * @brief Callback receiving configuration log lines.
 */
using ConfigLogCallback = std::function<void(const std::string&)>;

// =============================================================================
// ConfigManager
// =============================================================================

/**
 * @brief Loads, overrides and validates the configuration.
 *
 * Load order: defaults, then file (loadFromFile / loadFromJsonString),
 * then applyEnvironmentOverrides(), then applyOverrides(), then validate().
 *
 * ## Thread Safety
 * All methods are thread-safe; getConfig() returns a snapshot copy.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * @brief Load a JSON configuration file.
     */
    Result<void, ConfigError> loadFromFile(const std::string& filePath);

    /**
     * @brief Load configuration from a JSON document.
     *
     * Fields absent from the document keep their current values. The
     * accounts array, when present, replaces the account list.
     */
    Result<void, ConfigError> loadFromJsonString(const std::string& jsonContent);

    /**
     * @brief Reset every section to its default.
     */
    void loadDefaults();

    /**
     * @brief Apply IPTVMUX_* environment variables.
     *
     * Invalid values are reported through the log callback and ignored.
     */
    void applyEnvironmentOverrides();

    /**
     * @brief Apply command line overrides.
     */
    void applyOverrides(const ConfigOverrides& overrides);

    /**
     * @brief Validate the current configuration.
     */
    Result<void, ConfigError> validate() const;

    /**
     * @brief Snapshot of the current configuration.
     */
    Configuration getConfig() const;

    /**
     * @brief Render the effective configuration as JSON, passwords masked.
     */
    std::string dumpConfig() const;

    /**
     * @brief Set the receiver of configuration log lines.
     */
    void setLogCallback(ConfigLogCallback callback);

private:
    Result<void, ConfigError> parseJson(const std::string& content);
    Result<std::string, ConfigError> readFile(const std::string& filePath) const;
    void log(const std::string& message) const;
    void logEffectiveConfig() const;
    std::optional<std::string> getEnvVar(const std::string& name) const;

    mutable std::shared_mutex configMutex_;
    Configuration config_;

    mutable std::mutex logMutex_;
    ConfigLogCallback logCallback_;
};

} // namespace core
} // namespace iptvmux

#endif // IPTVMUX_CORE_CONFIG_MANAGER_HPP
