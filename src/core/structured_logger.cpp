// IptvMux - IPTV Stream Multiplexing Proxy
// Structured Logging Component Implementation

#include "iptvmux/core/structured_logger.hpp"
#include "iptvmux/core/secure_token.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace iptvmux {
namespace core {

// =============================================================================
// Helper Functions
// =============================================================================

std::string logLevelToString(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return "debug";
        case LogLevelConfig::Info:
            return "info";
        case LogLevelConfig::Warning:
            return "warning";
        case LogLevelConfig::Error:
            return "error";
        default:
            return "info";
    }
}

std::optional<LogLevelConfig> parseLogLevel(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevelConfig::Debug;
    } else if (lower == "info") {
        return LogLevelConfig::Info;
    } else if (lower == "warning" || lower == "warn") {
        return LogLevelConfig::Warning;
    } else if (lower == "error") {
        return LogLevelConfig::Error;
    }
    return std::nullopt;
}

std::string streamEventTypeToString(StreamEventType eventType) {
    switch (eventType) {
        case StreamEventType::StreamCreated:
            return "stream_created";
        case StreamEventType::StreamConnected:
            return "stream_connected";
        case StreamEventType::StreamClosed:
            return "stream_closed";
        case StreamEventType::SubscriberJoined:
            return "subscriber_joined";
        case StreamEventType::SubscriberLeft:
            return "subscriber_left";
        case StreamEventType::SubscriberDropped:
            return "subscriber_dropped";
        case StreamEventType::CredentialAcquired:
            return "credential_acquired";
        case StreamEventType::CredentialReleased:
            return "credential_released";
        default:
            return "unknown";
    }
}

// =============================================================================
// StructuredLogger Implementation
// =============================================================================

StructuredLogger::StructuredLogger()
    : level_(LogLevelConfig::Info)
    , jsonFormat_(false) {
}

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::setLevel(LogLevelConfig level) {
    level_.store(level);
}

LogLevelConfig StructuredLogger::getLevel() const {
    return level_.load();
}

void StructuredLogger::setJsonFormat(bool enabled) {
    jsonFormat_.store(enabled);
}

bool StructuredLogger::isJsonFormat() const {
    return jsonFormat_.load();
}

bool StructuredLogger::isEnabled(LogLevelConfig level) const {
    return static_cast<int>(level) >= static_cast<int>(level_.load());
}

void StructuredLogger::debug(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Debug, message, category, nullptr);
}

void StructuredLogger::info(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Info, message, category, nullptr);
}

void StructuredLogger::warning(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Warning, message, category, nullptr);
}

void StructuredLogger::error(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Error, message, category, nullptr);
}

void StructuredLogger::infoWithContext(const std::string& message, const LogContext& context,
                                       const std::string& category) {
    log(LogLevelConfig::Info, message, category, &context);
}

void StructuredLogger::warningWithContext(const std::string& message, const LogContext& context,
                                          const std::string& category) {
    log(LogLevelConfig::Warning, message, category, &context);
}

void StructuredLogger::errorWithContext(const std::string& message, const LogContext& context,
                                        const std::string& category) {
    log(LogLevelConfig::Error, message, category, &context);
}

void StructuredLogger::logStreamEvent(StreamEventType eventType,
                                      const LogContext& context,
                                      const std::string& detail)
{
    if (!isEnabled(LogLevelConfig::Info)) {
        return;
    }

    const std::string category = "Stream";
    std::string formatted;

    if (jsonFormat_.load()) {
        // Reuse the context rendering and splice the event name in.
        formatted = formatJson(LogLevelConfig::Info, detail, category, &context);
        formatted.insert(formatted.size() - 1,
                         ",\"event\":\"" + streamEventTypeToString(eventType) + "\"");
    } else {
        std::string message = "Event: " + streamEventTypeToString(eventType);
        if (!detail.empty()) {
            message += ", " + detail;
        }
        formatted = formatPlainText(LogLevelConfig::Info, message, category, &context);
    }

    dispatch(LogLevelConfig::Info, formatted, category);
}

void StructuredLogger::addSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void StructuredLogger::removeSink(const std::shared_ptr<pal::ILogSink>& sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

std::size_t StructuredLogger::sinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void StructuredLogger::log(LogLevelConfig level, const std::string& message,
                           const std::string& category, const LogContext* context) {
    if (!isEnabled(level)) {
        return;
    }

    std::string formatted = jsonFormat_.load()
        ? formatJson(level, message, category, context)
        : formatPlainText(level, message, category, context);

    dispatch(level, formatted, category);
}

void StructuredLogger::dispatch(LogLevelConfig level, const std::string& formatted,
                                const std::string& category) {
    pal::LogSource source;
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->write(toPalLogLevel(level), formatted, category, source);
    }
}

std::string StructuredLogger::formatJson(LogLevelConfig level, const std::string& message,
                                         const std::string& category,
                                         const LogContext* context) const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"timestamp\":\"" << getTimestamp() << "\"";
    oss << ",\"level\":\"" << logLevelToString(level) << "\"";
    oss << ",\"category\":\"" << escapeJson(category) << "\"";
    oss << ",\"message\":\"" << escapeJson(message) << "\"";

    if (context) {
        if (!context->streamKey.empty()) {
            oss << ",\"stream_key\":\"" << escapeJson(context->streamKey) << "\"";
        }
        if (context->accountId) {
            oss << ",\"account_id\":" << *context->accountId;
        }
        if (!context->clientIP.empty()) {
            oss << ",\"client_ip\":\"" << escapeJson(context->clientIP) << "\"";
        }
        if (!context->subscriberId.empty()) {
            oss << ",\"subscriber\":\"" << escapeJson(tokenPrefix(context->subscriberId)) << "\"";
        }
        if (!context->sessionToken.empty()) {
            oss << ",\"session\":\"" << escapeJson(tokenPrefix(context->sessionToken)) << "\"";
        }
        if (context->errorCode != ErrorCode::Success) {
            oss << ",\"error_code\":" << static_cast<uint32_t>(context->errorCode);
        }
    }

    oss << "}";
    return oss.str();
}

std::string StructuredLogger::formatPlainText(LogLevelConfig level, const std::string& message,
                                              const std::string& category,
                                              const LogContext* context) const {
    std::ostringstream oss;
    oss << "[" << getTimestamp() << "] ";
    oss << "[" << logLevelToString(level) << "] ";
    oss << "[" << category << "] ";
    oss << message;

    if (context) {
        if (!context->streamKey.empty()) {
            oss << ", StreamKey: " << context->streamKey;
        }
        if (context->accountId) {
            oss << ", Account: " << *context->accountId;
        }
        if (!context->clientIP.empty()) {
            oss << ", Client: " << context->clientIP;
        }
        if (!context->subscriberId.empty()) {
            oss << ", Subscriber: " << tokenPrefix(context->subscriberId);
        }
        if (!context->sessionToken.empty()) {
            oss << ", Session: " << tokenPrefix(context->sessionToken);
        }
        if (context->errorCode != ErrorCode::Success) {
            oss << ", Error: " << errorCodeToString(context->errorCode);
        }
    }
    return oss.str();
}

std::string StructuredLogger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeNow = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tmBuf;
    gmtime_r(&timeNow, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    oss << "Z";
    return oss.str();
}

std::string StructuredLogger::escapeJson(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':
                oss << "\\\"";
                break;
            case '\\':
                oss << "\\\\";
                break;
            case '\n':
                oss << "\\n";
                break;
            case '\r':
                oss << "\\r";
                break;
            case '\t':
                oss << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

pal::LogLevel StructuredLogger::toPalLogLevel(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return pal::LogLevel::Debug;
        case LogLevelConfig::Info:
            return pal::LogLevel::Info;
        case LogLevelConfig::Warning:
            return pal::LogLevel::Warning;
        case LogLevelConfig::Error:
            return pal::LogLevel::Error;
        default:
            return pal::LogLevel::Info;
    }
}

} // namespace core
} // namespace iptvmux
