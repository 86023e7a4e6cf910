// IptvMux - IPTV Stream Multiplexing Proxy
// Upstream Reader - Per-stream upstream read loop
//
// Responsibilities:
// - Open the upstream response for one SharedStream
// - Publish the upstream content type and wake connection waiters
// - Read fixed-size chunks and fan them out to the stream's subscribers
// - Keep the stream's credential slot fresh while bytes flow
// - Classify and record the terminating error, end every subscriber
//   and return the credential slot exactly once

#ifndef IPTVMUX_STREAMING_UPSTREAM_READER_HPP
#define IPTVMUX_STREAMING_UPSTREAM_READER_HPP

#include "iptvmux/admission/credential_store.hpp"
#include "iptvmux/core/clock.hpp"
#include "iptvmux/core/structured_logger.hpp"
#include "iptvmux/net/upstream_client.hpp"
#include "iptvmux/streaming/shared_stream.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace iptvmux {
namespace streaming {

/**
 * @brief Reader progress. Completed and Failed are terminal.
 */
enum class ReaderState {
    Connecting,
    Streaming,
    Completed,
    Failed
};

std::string readerStateToString(ReaderState state);

/**
 * @brief Upstream read tuning.
 */
struct UpstreamReaderConfig {
    std::size_t chunkSize = 65536;
    std::chrono::milliseconds connectTimeout{60000};
    std::chrono::milliseconds readTimeout{120000};
    uint32_t maxRedirects = 5;
    std::chrono::milliseconds activityReportInterval{1000};
};

/**
 * @brief Read loop of one SharedStream.
 *
 * run() executes on the stream's dedicated thread and returns when the
 * upstream ends, fails, or the stream is marked inactive from outside.
 * It is never restarted: a new SharedStream gets a new reader.
 */
class UpstreamReader {
public:
    UpstreamReader(std::shared_ptr<SharedStream> stream,
                   std::shared_ptr<net::IUpstreamClient> client,
                   std::shared_ptr<admission::ICredentialStore> credentialStore,
                   std::shared_ptr<core::IClock> clock,
                   std::shared_ptr<core::StructuredLogger> logger,
                   UpstreamReaderConfig config);

    UpstreamReader(const UpstreamReader&) = delete;
    UpstreamReader& operator=(const UpstreamReader&) = delete;

    /**
     * @brief Run the stream to completion on the calling thread.
     */
    void run();

    ReaderState state() const { return state_.load(); }

private:
    void readLoop(net::IUpstreamResponse& response);
    void fail(const net::UpstreamError& error);
    void finish();
    void reportActivity(core::TimePoint now);
    core::LogContext logContext() const;

    std::shared_ptr<SharedStream> stream_;
    std::shared_ptr<net::IUpstreamClient> client_;
    std::shared_ptr<admission::ICredentialStore> credentialStore_;
    std::shared_ptr<core::IClock> clock_;
    std::shared_ptr<core::StructuredLogger> logger_;
    UpstreamReaderConfig config_;

    std::atomic<ReaderState> state_{ReaderState::Connecting};
    core::TimePoint lastActivityReport_;
};

} // namespace streaming
} // namespace iptvmux

#endif // IPTVMUX_STREAMING_UPSTREAM_READER_HPP
