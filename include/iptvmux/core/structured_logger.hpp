// IptvMux - IPTV Stream Multiplexing Proxy
// Structured Logging Component
//
// Provides leveled logging in plain text or JSON lines, with stream and
// session context attached to records so a single viewer can be traced
// from admission through fan-out to teardown.
//
// Responsibilities:
// - Configurable minimum level (debug, info, warning, error)
// - ISO 8601 UTC timestamps with millisecond precision
// - JSON line output for log aggregation systems
// - Stream lifecycle events with stream key, client IP and token prefixes
// - Dispatch to any number of pal::ILogSink instances

#ifndef IPTVMUX_CORE_STRUCTURED_LOGGER_HPP
#define IPTVMUX_CORE_STRUCTURED_LOGGER_HPP

#include "iptvmux/core/error_codes.hpp"
#include "iptvmux/core/types.hpp"
#include "iptvmux/pal/log_pal.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace iptvmux {
namespace core {

/**
 * @brief Configurable log levels.
 *
 * Messages below the configured level are dropped before formatting.
 */
enum class LogLevelConfig {
    Debug = 0,    ///< Per-chunk and per-decision detail
    Info = 1,     ///< Stream and connection lifecycle
    Warning = 2,  ///< Degraded but recoverable conditions
    Error = 3     ///< Failed operations
};

/**
 * @brief Convert log level to its lower case name.
 */
std::string logLevelToString(LogLevelConfig level);

/**
 * @brief Parse a log level name (case-insensitive, "warn" accepted).
 * @return Level, or std::nullopt for unknown names
 */
std::optional<LogLevelConfig> parseLogLevel(const std::string& str);

/**
 * @brief Lifecycle events of the multiplexer.
 */
enum class StreamEventType {
    StreamCreated,       ///< New shared upstream stream registered
    StreamConnected,     ///< Upstream answered, bytes are flowing
    StreamClosed,        ///< Shared stream removed from the registry
    SubscriberJoined,    ///< Client attached to a shared stream
    SubscriberLeft,      ///< Client detached normally
    SubscriberDropped,   ///< Client evicted as slow consumer
    CredentialAcquired,  ///< Connection slot charged to a credential
    CredentialReleased   ///< Connection slot returned
};

/**
 * @brief Convert stream event type to its snake_case name.
 */
std::string streamEventTypeToString(StreamEventType eventType);

/**
 * @brief Context fields attached to a log record.
 *
 * Empty fields are omitted from the output. Session tokens are always
 * truncated before being written.
 */
struct LogContext {
    std::string streamKey;               ///< "account:stream:format"
    std::string clientIP;                ///< Downstream client address
    std::string subscriberId;            ///< Subscriber id (truncated in output)
    std::string sessionToken;            ///< Session token (truncated in output)
    std::optional<AccountId> accountId;  ///< Account the record belongs to
    ErrorCode errorCode = ErrorCode::Success;

    LogContext() = default;
};

/**
 * @brief Thread-safe structured logger.
 *
 * ## Usage Example
 * @code
 * auto logger = std::make_shared<StructuredLogger>();
 * logger->setLevel(LogLevelConfig::Info);
 * logger->addSink(std::make_shared<ConsoleSink>());
 *
 * LogContext ctx;
 * ctx.streamKey = "1:12345:ts";
 * ctx.clientIP = "10.0.0.7";
 * logger->logStreamEvent(StreamEventType::SubscriberJoined, ctx);
 * @endcode
 */
class StructuredLogger {
public:
    StructuredLogger();
    ~StructuredLogger();

    // Non-copyable, non-movable
    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&) = delete;
    StructuredLogger& operator=(StructuredLogger&&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    void setLevel(LogLevelConfig level);
    LogLevelConfig getLevel() const;

    /**
     * @brief Switch between JSON lines and plain text output.
     */
    void setJsonFormat(bool enabled);
    bool isJsonFormat() const;

    /**
     * @brief Check whether a record at this level would be emitted.
     */
    bool isEnabled(LogLevelConfig level) const;

    // =========================================================================
    // Basic Logging
    // =========================================================================

    void debug(const std::string& message, const std::string& category = "IptvMux");
    void info(const std::string& message, const std::string& category = "IptvMux");
    void warning(const std::string& message, const std::string& category = "IptvMux");
    void error(const std::string& message, const std::string& category = "IptvMux");

    // =========================================================================
    // Contextual Logging
    // =========================================================================

    void infoWithContext(const std::string& message, const LogContext& context,
                         const std::string& category = "IptvMux");
    void warningWithContext(const std::string& message, const LogContext& context,
                            const std::string& category = "IptvMux");
    void errorWithContext(const std::string& message, const LogContext& context,
                          const std::string& category = "IptvMux");

    /**
     * @brief Log a multiplexer lifecycle event at info level.
     *
     * @param eventType Event kind
     * @param context Stream and client identification
     * @param detail Optional free text appended to the record
     */
    void logStreamEvent(StreamEventType eventType,
                        const LogContext& context,
                        const std::string& detail = "");

    // =========================================================================
    // Sink Management
    // =========================================================================

    void addSink(std::shared_ptr<pal::ILogSink> sink);
    void removeSink(const std::shared_ptr<pal::ILogSink>& sink);
    std::size_t sinkCount() const;
    void flush();

private:
    void log(LogLevelConfig level, const std::string& message,
             const std::string& category, const LogContext* context);

    std::string formatJson(LogLevelConfig level, const std::string& message,
                           const std::string& category, const LogContext* context) const;
    std::string formatPlainText(LogLevelConfig level, const std::string& message,
                                const std::string& category, const LogContext* context) const;

    void dispatch(LogLevelConfig level, const std::string& formatted, const std::string& category);

    static std::string getTimestamp();
    static std::string escapeJson(const std::string& str);
    static pal::LogLevel toPalLogLevel(LogLevelConfig level);

    std::atomic<LogLevelConfig> level_{LogLevelConfig::Info};
    std::atomic<bool> jsonFormat_{false};
    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<pal::ILogSink>> sinks_;
};

} // namespace core
} // namespace iptvmux

#endif // IPTVMUX_CORE_STRUCTURED_LOGGER_HPP
