// IptvMux - IPTV Stream Multiplexing Proxy
// Log Sinks
//
// Concrete pal::ILogSink implementations used by the server binary:
// - ConsoleSink: stderr, optionally colourised
// - FileSink: append-only file with size based rotation and gzip
//   compression of rotated backups (zlib)
// - SyslogSink: POSIX syslog

#ifndef IPTVMUX_CORE_LOG_SINKS_HPP
#define IPTVMUX_CORE_LOG_SINKS_HPP

#include "iptvmux/core/result.hpp"
#include "iptvmux/pal/log_pal.hpp"

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace iptvmux {
namespace core {

/**
 * @brief Error codes for log file operations.
 */
enum class LogRotationErrorCode {
    Success = 0,
    FileOpenFailed,
    RotationFailed,
    CompressionFailed,
    Unknown
};

/**
 * @brief Error information for log file operations.
 */
struct LogRotationError {
    LogRotationErrorCode code;
    std::string message;

    LogRotationError(LogRotationErrorCode c = LogRotationErrorCode::Unknown,
                     std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief When and how a FileSink rotates.
 *
 * A maxFileSize of 0 disables rotation. Backups are named
 * "<file>.1" (newest) to "<file>.<maxBackupFiles>", with a ".gz" suffix
 * when compression is enabled.
 */
struct RotationPolicy {
    uint64_t maxFileSize = 0;
    uint32_t maxBackupFiles = 5;
    bool compressionEnabled = false;
};

/**
 * @brief Compress a file into gzip format using zlib.
 *
 * @param inputPath File to compress
 * @param outputPath Destination, overwritten if present
 */
Result<void, LogRotationError> gzipFile(const std::string& inputPath,
                                        const std::string& outputPath);

/**
 * @brief Writes records to stderr, one per line.
 */
class ConsoleSink : public pal::ILogSink {
public:
    explicit ConsoleSink(bool useColors = false);

    void write(pal::LogLevel level, const std::string& message,
               const std::string& category, const pal::LogSource& source) override;
    void flush() override;
    std::string getName() const override;

private:
    bool useColors_;
    std::mutex mutex_;
};

/**
 * @brief Appends records to a file, rotating by size.
 *
 * ## Usage Example
 * @code
 * RotationPolicy policy;
 * policy.maxFileSize = 100 * 1024 * 1024;
 * policy.maxBackupFiles = 5;
 * policy.compressionEnabled = true;
 * auto sink = std::make_shared<FileSink>("/var/log/iptvmux.log", policy);
 * logger->addSink(sink);
 * @endcode
 */
class FileSink : public pal::ILogSink {
public:
    explicit FileSink(const std::string& filePath,
                      const RotationPolicy& policy = RotationPolicy());
    ~FileSink() override;

    // Non-copyable, non-movable
    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;
    FileSink(FileSink&&) = delete;
    FileSink& operator=(FileSink&&) = delete;

    void write(pal::LogLevel level, const std::string& message,
               const std::string& category, const pal::LogSource& source) override;
    void flush() override;
    std::string getName() const override;

    bool isOpen() const;
    uint64_t getCurrentFileSize() const;

    /**
     * @brief Rotate now regardless of the current size.
     */
    Result<void, LogRotationError> forceRotation();

    /**
     * @brief Error of the most recent failed rotation, empty if none.
     */
    std::string lastRotationError() const;

private:
    bool shouldRotate() const;
    Result<void, LogRotationError> performRotation();
    void shiftBackups();
    bool openFile();
    std::string backupName(uint32_t index) const;

    std::string filePath_;
    RotationPolicy policy_;
    std::ofstream file_;
    uint64_t currentSize_ = 0;
    std::string lastRotationError_;
    mutable std::mutex mutex_;
};

/**
 * @brief Forwards records to syslog(3).
 */
class SyslogSink : public pal::ILogSink {
public:
    explicit SyslogSink(const std::string& ident = "iptvmux");
    ~SyslogSink() override;

    SyslogSink(const SyslogSink&) = delete;
    SyslogSink& operator=(const SyslogSink&) = delete;

    void write(pal::LogLevel level, const std::string& message,
               const std::string& category, const pal::LogSource& source) override;
    void flush() override;
    std::string getName() const override;

private:
    static int toSyslogPriority(pal::LogLevel level);

    // openlog keeps the pointer, so the ident must outlive the sink.
    std::string ident_;
};

} // namespace core
} // namespace iptvmux

#endif // IPTVMUX_CORE_LOG_SINKS_HPP
