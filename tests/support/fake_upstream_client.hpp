// IptvMux - IPTV Stream Multiplexing Proxy
// Scripted upstream client for tests
//
// Every open() is counted and answered from the configured script. Bodies
// serve the initial chunks, then block until more chunks are pushed, the
// body is ended or failed, or the response is aborted. holdOpens() makes
// open() itself block, ignoring cancellation, like a stuck name lookup.

#ifndef IPTVMUX_TESTS_SUPPORT_FAKE_UPSTREAM_CLIENT_HPP
#define IPTVMUX_TESTS_SUPPORT_FAKE_UPSTREAM_CLIENT_HPP

#include "iptvmux/net/upstream_client.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace iptvmux {
namespace test {

struct FakeBodyState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> pending;
    bool ended = false;
    bool aborted = false;
    std::optional<net::UpstreamError> readError;
};

class FakeUpstreamResponse : public net::IUpstreamResponse {
public:
    FakeUpstreamResponse(int status, net::HttpHeaders headers, std::shared_ptr<FakeBodyState> body)
        : status_(status)
        , headers_(std::move(headers))
        , body_(std::move(body)) {}

    int statusCode() const override { return status_; }

    std::optional<std::string> header(const std::string& name) const override {
        return headers_.get(name);
    }

    core::Result<std::size_t, net::UpstreamError> read(uint8_t* buffer, std::size_t capacity) override {
        using ReadResult = core::Result<std::size_t, net::UpstreamError>;

        std::unique_lock<std::mutex> lock(body_->mutex);
        body_->cv.wait(lock, [this] {
            return body_->aborted || !body_->pending.empty() || body_->ended ||
                   body_->readError.has_value();
        });

        if (body_->aborted) {
            return ReadResult::error(
                net::UpstreamError(net::UpstreamError::Code::Cancelled, "aborted"));
        }
        if (!body_->pending.empty()) {
            std::string& front = body_->pending.front();
            std::size_t n = std::min(capacity, front.size());
            std::memcpy(buffer, front.data(), n);
            if (n == front.size()) {
                body_->pending.pop_front();
            } else {
                front.erase(0, n);
            }
            return ReadResult::success(n);
        }
        if (body_->readError) {
            return ReadResult::error(*body_->readError);
        }
        return ReadResult::success(0);
    }

    void abort() override {
        std::lock_guard<std::mutex> lock(body_->mutex);
        body_->aborted = true;
        body_->cv.notify_all();
    }

private:
    int status_;
    net::HttpHeaders headers_;
    std::shared_ptr<FakeBodyState> body_;
};

class FakeUpstreamClient : public net::IUpstreamClient {
public:
    void setStatus(int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
    }

    void setMethodStatus(const std::string& method, int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        methodStatus_[method] = status;
    }

    void setContentType(std::string contentType) {
        std::lock_guard<std::mutex> lock(mutex_);
        contentType_ = std::move(contentType);
    }

    void setOpenError(std::optional<net::UpstreamError> error) {
        std::lock_guard<std::mutex> lock(mutex_);
        openError_ = std::move(error);
    }

    void setInitialChunks(std::vector<std::string> chunks, bool endAfter = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        initialChunks_ = std::move(chunks);
        endAfterInitial_ = endAfter;
    }

    void holdOpens() {
        std::lock_guard<std::mutex> lock(mutex_);
        holdOpens_ = true;
    }

    void releaseOpens() {
        std::lock_guard<std::mutex> lock(mutex_);
        holdOpens_ = false;
        openCv_.notify_all();
    }

    core::Result<std::unique_ptr<net::IUpstreamResponse>, net::UpstreamError>
    open(const net::UpstreamRequest& request) override {
        using OpenResult = core::Result<std::unique_ptr<net::IUpstreamResponse>, net::UpstreamError>;

        std::unique_lock<std::mutex> lock(mutex_);
        requests_.push_back(request);
        openCv_.notify_all();
        openCv_.wait(lock, [this] { return !holdOpens_; });

        if (openError_) {
            return OpenResult::error(*openError_);
        }

        auto body = std::make_shared<FakeBodyState>();
        body->pending.assign(initialChunks_.begin(), initialChunks_.end());
        body->ended = endAfterInitial_;
        bodies_.push_back(body);

        net::HttpHeaders headers;
        headers.set("Content-Type", contentType_);
        auto it = methodStatus_.find(request.method);
        int status = it != methodStatus_.end() ? it->second : status_;

        std::unique_ptr<net::IUpstreamResponse> response =
            std::make_unique<FakeUpstreamResponse>(status, std::move(headers), body);
        return OpenResult::success(std::move(response));
    }

    /// Queue a chunk on every body that is still open.
    void pushChunk(const std::string& data) {
        forEachBody([&data](FakeBodyState& body) { body.pending.push_back(data); });
    }

    /// End every body after its pending chunks.
    void endAll() {
        forEachBody([](FakeBodyState& body) { body.ended = true; });
    }

    void failAll(const net::UpstreamError& error) {
        forEachBody([&error](FakeBodyState& body) { body.readError = error; });
    }

    std::size_t openCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::vector<net::UpstreamRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::size_t abortedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (const auto& body : bodies_) {
            std::lock_guard<std::mutex> bodyLock(body->mutex);
            if (body->aborted) {
                ++count;
            }
        }
        return count;
    }

    bool waitForOpenCount(std::size_t count, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return openCv_.wait_for(lock, timeout, [this, count] { return requests_.size() >= count; });
    }

private:
    template<typename Fn>
    void forEachBody(Fn fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& body : bodies_) {
            std::lock_guard<std::mutex> bodyLock(body->mutex);
            if (!body->aborted) {
                fn(*body);
                body->cv.notify_all();
            }
        }
    }

    mutable std::mutex mutex_;
    mutable std::condition_variable openCv_;
    int status_ = 200;
    std::map<std::string, int> methodStatus_;
    std::string contentType_ = "video/mp2t";
    std::optional<net::UpstreamError> openError_;
    std::vector<std::string> initialChunks_;
    bool endAfterInitial_ = false;
    bool holdOpens_ = false;
    std::vector<net::UpstreamRequest> requests_;
    std::vector<std::shared_ptr<FakeBodyState>> bodies_;
};

} // namespace test
} // namespace iptvmux

#endif // IPTVMUX_TESTS_SUPPORT_FAKE_UPSTREAM_CLIENT_HPP
