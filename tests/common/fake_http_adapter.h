#pragma once

#include <omnifetch/transfer/transfer.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace omnifetch::tests {

/**
 * A resource served by FakeHttpAdapter.
 */
struct FakeResource {
    std::string body;
    bool honorRange{true};
    std::size_t deliveryChunk{16 * 1024};
    std::chrono::milliseconds chunkDelay{0};
    // Connection reset once delivery reaches this offset (one shot)
    std::optional<std::uint64_t> dropAt{};
    // Delivery blocks at this offset until release() or cancellation (one shot)
    std::optional<std::uint64_t> holdAt{};
};

struct RecordedRequest {
    std::string url;
    std::optional<std::uint64_t> rangeStart;
    std::vector<transfer::Header> headers;
    std::chrono::steady_clock::time_point at;
    bool followRedirects{true};
    std::optional<std::string> proxy;
    transfer::TlsConfig tls;
};

/**
 * In-memory IHttpAdapter: serves registered bodies (404 otherwise), honors or ignores Range,
 * replays scripted statuses before serving, drops or holds connections at byte offsets, and
 * tracks how many requests run at once.
 */
class FakeHttpAdapter final : public transfer::IHttpAdapter {
public:
    void setResource(const std::string& url, FakeResource resource) {
        std::lock_guard lk(mu_);
        resources_[url] = State{std::move(resource)};
    }

    void setBody(const std::string& url, std::string body) {
        FakeResource r;
        r.body = std::move(body);
        setResource(url, std::move(r));
    }

    // Answer the next request for `url` with `status` (no body), ahead of the resource itself
    void scriptStatus(const std::string& url, int status,
                      std::optional<std::string> retryAfter = std::nullopt) {
        std::lock_guard lk(mu_);
        scripted_[url].push_back({status, std::move(retryAfter)});
    }

    void release(const std::string& url) {
        {
            std::lock_guard lk(mu_);
            if (auto it = resources_.find(url); it != resources_.end())
                it->second.released = true;
        }
        cv_.notify_all();
    }

    bool waitUntilHeld(const std::string& url,
                       std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        std::unique_lock lk(mu_);
        return cv_.wait_for(lk, timeout, [&] {
            auto it = resources_.find(url);
            return it != resources_.end() && it->second.held;
        });
    }

    std::vector<RecordedRequest> requests() const {
        std::lock_guard lk(mu_);
        return requests_;
    }

    std::vector<RecordedRequest> requestsFor(const std::string& url) const {
        std::lock_guard lk(mu_);
        std::vector<RecordedRequest> out;
        for (const auto& r : requests_)
            if (r.url == url)
                out.push_back(r);
        return out;
    }

    int maxConcurrent() const { return maxActive_.load(); }

    Result<transfer::HttpOutcome> get(const transfer::HttpRequest& request,
                                      const transfer::HeadCallback& onHead,
                                      const transfer::BodySink& sink,
                                      const transfer::ShouldCancel& shouldCancel) override {
        ActiveGuard guard(*this);
        transfer::HttpOutcome outcome;
        FakeResource resource;
        std::optional<Scripted> scripted;
        bool known = false;
        {
            std::lock_guard lk(mu_);
            requests_.push_back({request.url, request.rangeStart, request.headers,
                                 std::chrono::steady_clock::now(), request.followRedirects,
                                 request.proxy, request.tls});
            if (auto s = scripted_.find(request.url); s != scripted_.end() && !s->second.empty()) {
                scripted = s->second.front();
                s->second.pop_front();
            }
            if (auto it = resources_.find(request.url); it != resources_.end()) {
                known = true;
                resource = it->second.resource;
            }
        }

        auto& head = outcome.head;
        if (scripted || !known) {
            head.status = scripted ? scripted->status : 404;
            if (scripted && scripted->retryAfter)
                head.headers.push_back({"Retry-After", *scripted->retryAfter});
            outcome.bodyAbandoned = !onHead(head);
            return outcome;
        }

        const std::uint64_t size = resource.body.size();
        std::uint64_t offset = 0;
        if (request.rangeStart && resource.honorRange) {
            if (*request.rangeStart >= size) {
                head.status = 416;
                head.headers.push_back({"Content-Range", "bytes */" + std::to_string(size)});
                outcome.bodyAbandoned = !onHead(head);
                return outcome;
            }
            offset = *request.rangeStart;
            head.status = 206;
            head.headers.push_back({"Content-Range", "bytes " + std::to_string(offset) + "-" +
                                                         std::to_string(size - 1) + "/" +
                                                         std::to_string(size)});
            head.headers.push_back({"Content-Length", std::to_string(size - offset)});
        } else {
            head.status = 200;
            head.headers.push_back({"Content-Length", std::to_string(size)});
        }
        if (!onHead(head)) {
            outcome.bodyAbandoned = true;
            return outcome;
        }

        while (offset < size) {
            if (shouldCancel && shouldCancel())
                return Error{ErrorCode::OperationCancelled, "Request cancelled"};
            if (auto r = maybeHold(request.url, offset, shouldCancel); !r)
                return r.error();

            std::uint64_t end = std::min<std::uint64_t>(size, offset + resource.deliveryChunk);
            const bool drop = resource.dropAt && offset < *resource.dropAt &&
                              end >= *resource.dropAt && !dropped(request.url);
            if (drop)
                end = *resource.dropAt;
            if (end > offset) {
                const auto* p = reinterpret_cast<const std::byte*>(resource.body.data() + offset);
                if (auto r = sink(ByteSpan{p, static_cast<std::size_t>(end - offset)}); !r)
                    return r.error();
                outcome.bodyBytes += end - offset;
                offset = end;
            }
            if (drop) {
                markDropped(request.url);
                return Error{ErrorCode::NetworkError, "Connection reset by peer"};
            }
            if (resource.chunkDelay.count() > 0)
                std::this_thread::sleep_for(resource.chunkDelay);
        }
        return outcome;
    }

private:
    struct Scripted {
        int status;
        std::optional<std::string> retryAfter;
    };

    struct State {
        FakeResource resource;
        bool dropped{false};
        bool held{false};
        bool released{false};
    };

    struct ActiveGuard {
        explicit ActiveGuard(FakeHttpAdapter& a) : adapter(a) {
            const int now = ++adapter.active_;
            int seen = adapter.maxActive_.load();
            while (now > seen && !adapter.maxActive_.compare_exchange_weak(seen, now)) {
            }
        }
        ~ActiveGuard() { --adapter.active_; }
        FakeHttpAdapter& adapter;
    };

    bool dropped(const std::string& url) {
        std::lock_guard lk(mu_);
        return resources_[url].dropped;
    }

    void markDropped(const std::string& url) {
        std::lock_guard lk(mu_);
        resources_[url].dropped = true;
    }

    Result<void> maybeHold(const std::string& url, std::uint64_t offset,
                           const transfer::ShouldCancel& shouldCancel) {
        std::unique_lock lk(mu_);
        auto& st = resources_[url];
        if (!st.resource.holdAt || offset < *st.resource.holdAt || st.released)
            return {};
        st.held = true;
        cv_.notify_all();
        while (!st.released) {
            if (shouldCancel && shouldCancel())
                return Error{ErrorCode::OperationCancelled, "Request cancelled"};
            cv_.wait_for(lk, std::chrono::milliseconds(5));
        }
        return {};
    }

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::map<std::string, State> resources_;
    std::map<std::string, std::deque<Scripted>> scripted_;
    std::vector<RecordedRequest> requests_;
    std::atomic<int> active_{0};
    std::atomic<int> maxActive_{0};
};

} // namespace omnifetch::tests
