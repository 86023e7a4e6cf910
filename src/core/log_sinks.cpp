// IptvMux - IPTV Stream Multiplexing Proxy
// Log Sinks Implementation

#include "iptvmux/core/log_sinks.hpp"

#include <syslog.h>
#include <zlib.h>

#include <filesystem>
#include <iostream>
#include <system_error>
#include <vector>

namespace iptvmux {
namespace core {

namespace fs = std::filesystem;

// =============================================================================
// Gzip Compression
// =============================================================================

Result<void, LogRotationError> gzipFile(const std::string& inputPath,
                                        const std::string& outputPath)
{
    std::ifstream inFile(inputPath, std::ios::binary);
    if (!inFile) {
        return Result<void, LogRotationError>::error(
            LogRotationError(LogRotationErrorCode::FileOpenFailed,
                             "Cannot open input file: " + inputPath));
    }

    gzFile gzOut = gzopen(outputPath.c_str(), "wb9");
    if (!gzOut) {
        return Result<void, LogRotationError>::error(
            LogRotationError(LogRotationErrorCode::FileOpenFailed,
                             "Cannot create gzip file: " + outputPath));
    }

    std::vector<char> buffer(64 * 1024);
    bool ok = true;
    while (inFile) {
        inFile.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = inFile.gcount();
        if (got <= 0) {
            break;
        }
        if (gzwrite(gzOut, buffer.data(), static_cast<unsigned>(got)) != static_cast<int>(got)) {
            ok = false;
            break;
        }
    }

    if (gzclose(gzOut) != Z_OK || !ok) {
        return Result<void, LogRotationError>::error(
            LogRotationError(LogRotationErrorCode::CompressionFailed,
                             "gzwrite failed for: " + outputPath));
    }
    return Result<void, LogRotationError>::success();
}

// =============================================================================
// ConsoleSink Implementation
// =============================================================================

ConsoleSink::ConsoleSink(bool useColors)
    : useColors_(useColors) {
}

void ConsoleSink::write(pal::LogLevel level, const std::string& message,
                        const std::string& category, const pal::LogSource& source)
{
    (void)category;  // already part of the formatted record
    (void)source;

    const char* colorCode = "";
    const char* resetCode = "";
    if (useColors_) {
        resetCode = "\033[0m";
        switch (level) {
            case pal::LogLevel::Trace:
            case pal::LogLevel::Debug:
                colorCode = "\033[36m";
                break;
            case pal::LogLevel::Info:
                colorCode = "\033[32m";
                break;
            case pal::LogLevel::Warning:
                colorCode = "\033[33m";
                break;
            case pal::LogLevel::Error:
            case pal::LogLevel::Critical:
                colorCode = "\033[31m";
                break;
            default:
                break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << colorCode << message << resetCode << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

std::string ConsoleSink::getName() const {
    return "ConsoleSink";
}

// =============================================================================
// FileSink Implementation
// =============================================================================

FileSink::FileSink(const std::string& filePath, const RotationPolicy& policy)
    : filePath_(filePath)
    , policy_(policy) {
    openFile();
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::write(pal::LogLevel level, const std::string& message,
                     const std::string& category, const pal::LogSource& source)
{
    (void)level;
    (void)category;
    (void)source;

    std::lock_guard<std::mutex> lock(mutex_);

    if (shouldRotate()) {
        auto result = performRotation();
        if (result.isError()) {
            // Keep writing to whatever file is open; the failure is
            // reported through lastRotationError().
            lastRotationError_ = result.error().message;
        }
    }

    if (!file_.is_open()) {
        return;
    }

    file_ << message << '\n';
    currentSize_ += message.size() + 1;
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

std::string FileSink::getName() const {
    return "FileSink";
}

bool FileSink::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

uint64_t FileSink::getCurrentFileSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentSize_;
}

Result<void, LogRotationError> FileSink::forceRotation() {
    std::lock_guard<std::mutex> lock(mutex_);
    return performRotation();
}

std::string FileSink::lastRotationError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastRotationError_;
}

bool FileSink::shouldRotate() const {
    return policy_.maxFileSize > 0 && currentSize_ >= policy_.maxFileSize;
}

std::string FileSink::backupName(uint32_t index) const {
    std::string name = filePath_ + "." + std::to_string(index);
    if (policy_.compressionEnabled) {
        name += ".gz";
    }
    return name;
}

void FileSink::shiftBackups() {
    std::error_code ec;
    if (policy_.maxBackupFiles == 0) {
        return;
    }

    // Oldest backup falls off the end.
    fs::remove(backupName(policy_.maxBackupFiles), ec);

    for (uint32_t i = policy_.maxBackupFiles - 1; i >= 1; --i) {
        std::string from = backupName(i);
        if (fs::exists(from, ec)) {
            fs::rename(from, backupName(i + 1), ec);
        }
    }
}

Result<void, LogRotationError> FileSink::performRotation() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }

    std::error_code ec;
    if (policy_.maxBackupFiles == 0) {
        fs::remove(filePath_, ec);
    } else {
        shiftBackups();

        std::string rotated = filePath_ + ".1";
        fs::rename(filePath_, rotated, ec);
        if (ec) {
            openFile();
            return Result<void, LogRotationError>::error(
                LogRotationError(LogRotationErrorCode::RotationFailed,
                                 "Failed to rename log file: " + ec.message()));
        }

        if (policy_.compressionEnabled) {
            auto compressed = gzipFile(rotated, rotated + ".gz");
            fs::remove(rotated, ec);
            if (compressed.isError()) {
                openFile();
                return compressed;
            }
        }
    }

    if (!openFile()) {
        return Result<void, LogRotationError>::error(
            LogRotationError(LogRotationErrorCode::FileOpenFailed,
                             "Failed to open new log file after rotation"));
    }
    return Result<void, LogRotationError>::success();
}

bool FileSink::openFile() {
    std::error_code ec;
    fs::path path(filePath_);
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }

    file_.open(filePath_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        return false;
    }

    auto size = fs::file_size(filePath_, ec);
    currentSize_ = ec ? 0 : static_cast<uint64_t>(size);
    return true;
}

// =============================================================================
// SyslogSink Implementation
// =============================================================================

SyslogSink::SyslogSink(const std::string& ident)
    : ident_(ident) {
    openlog(ident_.c_str(), LOG_PID | LOG_NDELAY, LOG_DAEMON);
}

SyslogSink::~SyslogSink() {
    closelog();
}

void SyslogSink::write(pal::LogLevel level, const std::string& message,
                       const std::string& category, const pal::LogSource& source)
{
    (void)category;
    (void)source;
    syslog(toSyslogPriority(level), "%s", message.c_str());
}

void SyslogSink::flush() {
    // syslog(3) is unbuffered
}

std::string SyslogSink::getName() const {
    return "SyslogSink";
}

int SyslogSink::toSyslogPriority(pal::LogLevel level) {
    switch (level) {
        case pal::LogLevel::Trace:
        case pal::LogLevel::Debug:
            return LOG_DEBUG;
        case pal::LogLevel::Info:
            return LOG_INFO;
        case pal::LogLevel::Warning:
            return LOG_WARNING;
        case pal::LogLevel::Error:
            return LOG_ERR;
        case pal::LogLevel::Critical:
            return LOG_CRIT;
        default:
            return LOG_INFO;
    }
}

} // namespace core
} // namespace iptvmux
