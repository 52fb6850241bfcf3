/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Single streaming GET per call using the libcurl easy API (one handle per call, so calls from
 *   different worker threads never share curl state).
 * - Honors connect timeout, stall timeout (low-speed limit), TLS verify/CA, proxy, headers,
 *   redirects and an open-ended Range.
 * - Cancellation is polled from the transfer-info callback as well as the write callback, so an
 *   idle connection is torn down without waiting for the next body byte.
 */

#include <omnifetch/transfer/transfer.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace omnifetch::transfer {

namespace {

std::string trimmed(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

Error makeCurlError(CURLcode code, std::string_view url) {
    std::string message = std::string(curl_easy_strerror(code)) + " (" + std::string(url) + ")";
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return Error{ErrorCode::Timeout, std::move(message)};
        case CURLE_OUT_OF_MEMORY:
            return Error{ErrorCode::ResourceExhausted, std::move(message)};
        default:
            // Resolve/connect/recv/send failures, TLS failures and truncated bodies all mean
            // "this attempt did not get the bytes"; the health controller treats them alike.
            return Error{ErrorCode::NetworkError, std::move(message)};
    }
}

struct RequestContext {
    const HeadCallback* onHead{nullptr};
    const BodySink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};

    HttpResponseHead head;
    bool headDelivered{false};
    bool bodyAbandoned{false};
    bool cancelled{false};
    std::optional<Error> sinkError;
    std::uint64_t bodyBytes{0};

    bool cancelRequested() {
        if (!cancelled && shouldCancel && *shouldCancel && (*shouldCancel)()) {
            cancelled = true;
        }
        return cancelled;
    }

    void deliverHead() {
        if (headDelivered)
            return;
        headDelivered = true;
        if (onHead && *onHead && !(*onHead)(head)) {
            bodyAbandoned = true;
        }
    }
};

// Each response in a redirect chain starts with a status line; only the last one is kept.
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* ctx = static_cast<RequestContext*>(userdata);
    if (ctx == nullptr)
        return 0;

    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    if (line.empty())
        return total;

    if (line.size() > 5 && line.substr(0, 5) == "HTTP/") {
        ctx->head.headers.clear();
        ctx->head.status = 0;
        auto sp = line.find(' ');
        if (sp != std::string_view::npos) {
            auto code = line.substr(sp + 1, 3);
            int status = 0;
            auto [p, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
            if (ec == std::errc()) {
                ctx->head.status = status;
            }
        }
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;
    ctx->head.headers.push_back({trimmed(line.substr(0, colon)), trimmed(line.substr(colon + 1))});
    return total;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* ctx = static_cast<RequestContext*>(userdata);
    if (ctx == nullptr || total == 0)
        return 0;

    if (ctx->cancelRequested()) {
        return 0; // CURLE_WRITE_ERROR
    }
    ctx->deliverHead();
    if (ctx->bodyAbandoned) {
        return 0;
    }

    ByteSpan bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r) {
        ctx->sinkError = r.error();
        return 0;
    }
    ctx->bodyBytes += static_cast<std::uint64_t>(total);
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<RequestContext*>(userdata);
    return (ctx != nullptr && ctx->cancelRequested()) ? 1 : 0;
}

curl_slist* build_header_list(const HttpRequest& request) {
    curl_slist* list = nullptr;
    for (const auto& h : request.headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    if (request.rangeStart) {
        std::string range = "Range: bytes=" + std::to_string(*request.rangeStart) + "-";
        list = curl_slist_append(list, range.c_str());
    }
    return list;
}

void configure_common(CURL* curl, const HttpRequest& request) {
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Timeouts: no overall cap (large files), but abort when the stream stalls
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.connectTimeout.count()));
    const long stallSeconds =
        std::max<long>(1, static_cast<long>((request.stallTimeout.count() + 999) / 1000));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stallSeconds);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.tls.insecure ? 0L : 2L);
    if (!request.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, request.tls.caPath.c_str());
    }

    // Proxy
    if (request.proxy && !request.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, request.proxy->c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() {
        static std::once_flag once;
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }
    ~CurlHttpAdapter() override = default;

    Result<HttpOutcome> get(const HttpRequest& request, const HeadCallback& onHead,
                            const BodySink& sink, const ShouldCancel& shouldCancel) override {
        if (request.url.empty()) {
            return Error{ErrorCode::InvalidArgument, "HTTP GET without URL"};
        }
        if (!sink) {
            return Error{ErrorCode::InvalidArgument, "HTTP GET without body sink"};
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        RequestContext ctx;
        ctx.onHead = &onHead;
        ctx.sink = &sink;
        ctx.shouldCancel = &shouldCancel;

        curl_slist* list = build_header_list(request);

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
        configure_common(curl, request);

        spdlog::debug("GET {}{}", request.url,
                      request.rangeStart ? " from offset " + std::to_string(*request.rangeStart)
                                         : std::string{});

        CURLcode rc = curl_easy_perform(curl);

        if (ctx.head.status == 0) {
            long httpStatus = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpStatus);
            ctx.head.status = static_cast<int>(httpStatus);
        }

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (ctx.cancelled) {
            return Error{ErrorCode::OperationCancelled, "Transfer cancelled: " + request.url};
        }
        if (ctx.sinkError) {
            return *ctx.sinkError;
        }
        if (ctx.bodyAbandoned) {
            return HttpOutcome{std::move(ctx.head), true, ctx.bodyBytes};
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, request.url);
        }

        // Bodyless responses (416, 204, HEAD-like errors) still get their head delivered
        ctx.deliverHead();
        return HttpOutcome{std::move(ctx.head), ctx.bodyAbandoned, ctx.bodyBytes};
    }
};

} // namespace

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace omnifetch::transfer
