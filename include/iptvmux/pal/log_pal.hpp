// IptvMux - IPTV Stream Multiplexing Proxy
// Platform Abstraction Layer - Log output interface
//
// Log sinks are the boundary between the structured logger and the
// platform: stderr, rotating files and syslog all implement ILogSink.

#ifndef IPTVMUX_PAL_LOG_PAL_HPP
#define IPTVMUX_PAL_LOG_PAL_HPP

#include <cstdint>
#include <string>

namespace iptvmux {
namespace pal {

/**
 * @brief Severity of a log record as seen by sinks.
 */
enum class LogLevel : uint32_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief Upper case level name ("INFO", "WARNING", ...).
 */
inline const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
        default:                 return "INFO";
    }
}

/**
 * @brief Source location attached to a log record.
 */
struct LogSource {
    const char* file = nullptr;      ///< Source file name
    int line = 0;                    ///< Source line number
    const char* function = nullptr;  ///< Function name
};

/**
 * @brief Destination for formatted log records.
 *
 * Implementations must accept concurrent write() calls.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Write one formatted record.
     *
     * @param level Severity of the record
     * @param message Fully formatted record (plain text or JSON line)
     * @param category Component that produced it ("Registry", "Proxy", ...)
     * @param source Source location, may be empty
     */
    virtual void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogSource& source
    ) = 0;

    /**
     * @brief Flush buffered output.
     */
    virtual void flush() = 0;

    /**
     * @brief Sink name for diagnostics.
     */
    virtual std::string getName() const = 0;
};

} // namespace pal
} // namespace iptvmux

#endif // IPTVMUX_PAL_LOG_PAL_HPP
