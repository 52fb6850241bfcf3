/*
 * TransferEngine: single-stream resumable transfer.
 *
 * Flow per call:
 *   1) Reconcile any sidecar with the partial file (truncate longer partials, discard shorter or
 *      digest-mismatched ones) and persist the starting state.
 *   2) GET the endpoint, with "Range: bytes=N-" when N > 0.
 *        206 -> Content-Range start must equal N, otherwise restart from zero
 *        200 after a ranged request -> server ignored Range, truncate and restart in place
 *        416 -> complete if the recorded total equals N, otherwise restart from zero
 *   3) Buffer body bytes; each full chunk is rate-limited, appended, fdatasync'ed, hashed, then
 *      the sidecar is replaced. Crash loss is bounded by one buffer.
 *   4) Verify total size and the expected checksum, fsync, rename .part -> dest, drop sidecar.
 */

#include "disk_io.h"

#include <omnifetch/transfer/transfer.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <system_error>
#include <vector>

namespace omnifetch::transfer {

namespace fs = std::filesystem;

namespace {

ErrorCode codeForStatus(int status) {
    switch (status) {
        case 0:
            return ErrorCode::NetworkError;
        case 401:
        case 403:
        case 407:
            return ErrorCode::AuthRequired;
        case 408:
            return ErrorCode::Timeout;
        case 429:
            return ErrorCode::RateLimited;
        default:
            return ErrorCode::EndpointDown;
    }
}

bool hasHeader(const std::vector<Header>& headers, std::string_view name) {
    return std::any_of(headers.begin(), headers.end(), [&](const Header& h) {
        return h.name.size() == name.size() &&
               std::equal(h.name.begin(), h.name.end(), name.begin(), [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) ==
                          std::tolower(static_cast<unsigned char>(b));
               });
    });
}

// Offset the prior sidecar lets us resume from, or 0. Leaves `hasher` holding the digest of the
// reusable prefix when the result is non-zero.
std::uint64_t reconcilePartial(const TransferState& prior, const TransferRequest& req,
                               ChecksumAlgorithm algo, const fs::path& partial, Hasher& hasher) {
    if (prior.url != req.sourceUrl) {
        spdlog::info("Sidecar for {} belongs to {}; restarting", req.destination.string(),
                     prior.url);
        return 0;
    }
    if (prior.endpointUrl != req.endpointUrl) {
        spdlog::info("Endpoint changed for {} ({} -> {}); restarting partial", req.sourceUrl,
                     prior.endpointUrl, req.endpointUrl);
        return 0;
    }
    if (prior.checksumAlgorithm != algo) {
        spdlog::info("Checksum algorithm changed for {}; restarting partial", req.sourceUrl);
        return 0;
    }
    if (prior.downloadedBytes == 0) {
        return 0;
    }

    std::error_code ec;
    const auto onDisk = fs::file_size(partial, ec);
    if (ec) {
        spdlog::warn("Sidecar present but partial file missing for {}; restarting",
                     req.destination.string());
        return 0;
    }
    if (onDisk < prior.downloadedBytes) {
        spdlog::warn("Partial file shorter than recorded ({} < {}); restarting", onDisk,
                     prior.downloadedBytes);
        return 0;
    }
    if (onDisk > prior.downloadedBytes) {
        spdlog::debug("Partial file has {} unrecorded bytes; truncating",
                      onDisk - prior.downloadedBytes);
    }

    hasher.reset();
    if (auto r = hasher.updateFromFile(partial, prior.downloadedBytes); !r) {
        spdlog::warn("Cannot re-hash partial for {}: {}", req.sourceUrl, r.error().message);
        return 0;
    }
    if (hasher.hexDigest() != prior.partialDigest) {
        spdlog::warn("Partial digest mismatch for {}; discarding {} bytes", req.sourceUrl,
                     prior.downloadedBytes);
        return 0;
    }
    return prior.downloadedBytes;
}

} // namespace

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Completed:
            return "completed";
        case TransferStatus::Cancelled:
            return "cancelled";
        case TransferStatus::Failed:
            return "failed";
    }
    return "failed";
}

TransferOptions TransferOptions::fromConfig(const config::OrchestratorConfig& cfg) {
    TransferOptions o;
    o.chunkSizeBytes = cfg.chunkSizeBytes;
    o.algorithm = cfg.checksumAlgorithm;
    o.connectTimeout = cfg.connectTimeout;
    o.stallTimeout = cfg.stallTimeout;
    o.userAgent = cfg.userAgent;
    o.followRedirects = cfg.followRedirects;
    o.proxy = cfg.proxy;
    o.tls.insecure = cfg.tlsInsecure;
    o.tls.caPath = cfg.caPath.string();
    return o;
}

TransferEngine::TransferEngine(std::shared_ptr<IHttpAdapter> http,
                               std::shared_ptr<IResumeStore> store,
                               std::shared_ptr<IRateLimiter> limiter, TransferOptions options)
    : http_(std::move(http)), store_(std::move(store)), limiter_(std::move(limiter)),
      options_(std::move(options)) {
    if (!store_) {
        store_ = makeSidecarStore();
    }
    if (options_.chunkSizeBytes == 0) {
        options_.chunkSizeBytes = TransferOptions{}.chunkSizeBytes;
    }
}

TransferResult TransferEngine::transfer(const TransferRequest& req, const CancellationToken& token,
                                        const ProgressCallback& onProgress) {
    TransferResult result;
    result.finalPath = req.destination;

    TransferState state;
    state.url = req.sourceUrl;
    state.endpointUrl = req.endpointUrl;
    state.endpointIndex = req.endpointIndex;
    state.attempt = req.attempt;
    state.checksumAlgorithm = options_.algorithm;
    state.job = req.job;

    auto finish = [&](TransferStatus status, std::optional<Error> error) {
        result.status = status;
        result.error = std::move(error);
        result.downloadedBytes = state.downloadedBytes;
        result.totalBytes = state.totalBytes;
        return result;
    };
    auto fail = [&](Error e) {
        spdlog::warn("Transfer of {} failed: {}", req.endpointUrl, e.message);
        return finish(TransferStatus::Failed, std::move(e));
    };
    auto cancelled = [&] {
        spdlog::info("Transfer of {} cancelled at {} bytes", req.endpointUrl,
                     state.downloadedBytes);
        return finish(TransferStatus::Cancelled,
                      Error{ErrorCode::OperationCancelled, "Transfer cancelled"});
    };

    if (!http_) {
        return fail(Error{ErrorCode::InvalidState, "TransferEngine has no HTTP adapter"});
    }
    if (req.endpointUrl.empty() || req.destination.empty()) {
        return fail(Error{ErrorCode::InvalidArgument, "Transfer needs an endpoint and a path"});
    }

    const fs::path partial = partialPathFor(req.destination);
    if (req.destination.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(req.destination.parent_path(), ec);
        if (ec) {
            return fail(Error{ErrorCode::IoError, "Cannot create " +
                                                      req.destination.parent_path().string() +
                                                      ": " + ec.message()});
        }
    }

    // 1) Reconcile
    Hasher hasher(options_.algorithm);
    std::uint64_t offset = 0;
    auto prior = store_->load(req.destination);
    if (!prior) {
        spdlog::warn("Ignoring unreadable sidecar: {}", prior.error().message);
    } else if (prior.value()) {
        offset = reconcilePartial(*prior.value(), req, options_.algorithm, partial, hasher);
        if (offset > 0) {
            state.totalBytes = prior.value()->totalBytes;
            result.resumed = true;
            spdlog::info("Resuming {} from offset {}", req.sourceUrl, offset);
        }
    }
    if (offset == 0) {
        hasher.reset();
    }

    detail::PartialFile file;
    if (auto r = file.open(partial, offset); !r) {
        return fail(r.error());
    }
    state.downloadedBytes = offset;

    auto persist = [&]() -> Result<void> {
        state.partialDigest = hasher.hexDigest();
        return store_->save(req.destination, state);
    };
    auto emit = [&](TransferStage stage) {
        if (onProgress) {
            onProgress(TransferProgress{state.downloadedBytes, state.totalBytes, stage});
        }
    };
    auto restartFromZero = [&]() -> Result<void> {
        if (auto r = file.reset(); !r)
            return r;
        hasher.reset();
        state.downloadedBytes = 0;
        state.totalBytes.reset();
        result.resumed = false;
        return persist();
    };

    if (auto r = persist(); !r) {
        return fail(r.error());
    }
    if (token.isCancelled()) {
        return cancelled();
    }

    // 3) Chunk buffer
    std::vector<std::byte> buffer;
    buffer.reserve(options_.chunkSizeBytes);
    const ShouldCancel shouldCancel = [&token] { return token.isCancelled(); };

    auto flush = [&](bool throttle) -> Result<void> {
        if (buffer.empty())
            return {};
        if (throttle && limiter_) {
            // A cancel while waiting still writes what is already buffered
            (void)limiter_->acquire(buffer.size(), shouldCancel);
        }
        const ByteSpan chunk{buffer.data(), buffer.size()};
        if (auto r = file.append(chunk); !r)
            return r;
        if (auto r = file.sync(); !r)
            return r;
        hasher.update(chunk);
        state.downloadedBytes += chunk.size();
        buffer.clear();
        if (auto r = persist(); !r)
            return r;
        emit(TransferStage::Downloading);
        return {};
    };

    std::vector<Header> headers = req.headers;
    if (!options_.userAgent.empty() && !hasHeader(headers, "User-Agent")) {
        headers.push_back({"User-Agent", options_.userAgent});
    }

    // 2) Request, at most twice: a refused resume restarts once from zero
    bool complete = false;
    for (int pass = 0; pass < 2 && !complete; ++pass) {
        const std::uint64_t requested = state.downloadedBytes;

        HttpRequest hreq;
        hreq.url = req.endpointUrl;
        hreq.headers = headers;
        if (requested > 0)
            hreq.rangeStart = requested;
        hreq.connectTimeout = options_.connectTimeout;
        hreq.stallTimeout = options_.stallTimeout;
        hreq.followRedirects = options_.followRedirects;
        hreq.proxy = options_.proxy;
        hreq.tls = options_.tls;

        bool rangeMismatch = false;
        std::optional<Error> headError;
        std::optional<HttpResponseHead> seenHead;

        auto onHead = [&](const HttpResponseHead& head) -> bool {
            seenHead = head;
            if (head.status == 206) {
                auto value = head.header("Content-Range");
                auto cr = value ? parseContentRange(*value) : std::nullopt;
                if (!cr || cr->start != requested) {
                    rangeMismatch = true;
                    return false;
                }
                if (cr->total)
                    state.totalBytes = cr->total;
                return true;
            }
            if (head.status >= 200 && head.status < 300) {
                if (requested > 0) {
                    spdlog::warn("{} ignored Range (status {}); discarding {} partial bytes",
                                 req.endpointUrl, head.status, requested);
                    if (auto r = restartFromZero(); !r) {
                        headError = r.error();
                        return false;
                    }
                }
                auto len = head.header("Content-Length");
                state.totalBytes = len ? parseContentLength(*len) : std::nullopt;
                return true;
            }
            return false;
        };

        auto sink = [&](ByteSpan data) -> Result<void> {
            if (token.isCancelled()) {
                return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
            }
            while (!data.empty()) {
                const auto room = options_.chunkSizeBytes - buffer.size();
                const auto take = std::min<std::size_t>(room, data.size());
                buffer.insert(buffer.end(), data.begin(), data.begin() + take);
                data = data.subspan(take);
                if (buffer.size() >= options_.chunkSizeBytes) {
                    if (auto r = flush(true); !r)
                        return r;
                }
            }
            return {};
        };

        emit(TransferStage::Connecting);
        auto got = http_->get(hreq, onHead, sink, shouldCancel);
        if (seenHead) {
            result.httpStatus = seenHead->status;
        }

        if (headError) {
            return fail(*headError);
        }
        if (!got) {
            if (auto r = flush(false); !r) {
                spdlog::warn("Could not flush buffered bytes: {}", r.error().message);
            }
            if (token.isCancelled() || got.error().code == ErrorCode::OperationCancelled) {
                return cancelled();
            }
            return fail(got.error());
        }

        const auto& outcome = got.value();
        const int status = outcome.head.status;
        result.httpStatus = status;

        bool restart = rangeMismatch;
        if (rangeMismatch) {
            spdlog::warn("{} returned a range not starting at {}; restarting", req.endpointUrl,
                         requested);
        } else if (status == 416 && requested > 0) {
            std::optional<std::uint64_t> total = state.totalBytes;
            if (auto value = outcome.head.header("Content-Range")) {
                if (auto cr = parseContentRange(*value); cr && cr->total)
                    total = cr->total;
            }
            if (total && *total == requested) {
                spdlog::info("{} already complete at {} bytes", req.sourceUrl, requested);
                state.totalBytes = total;
                complete = true;
            } else {
                spdlog::warn("{} rejected resume offset {}; restarting", req.endpointUrl,
                             requested);
                restart = true;
            }
        } else if (status < 200 || status >= 300) {
            Error e{codeForStatus(status), "HTTP " + std::to_string(status) + " from " +
                                               req.endpointUrl};
            if (auto ra = outcome.head.header("Retry-After")) {
                result.retryAfter = parseRetryAfter(*ra);
            }
            return fail(std::move(e));
        } else {
            if (auto r = flush(false); !r) {
                return fail(r.error());
            }
            complete = true;
        }

        if (restart) {
            if (pass == 1) {
                return fail(Error{ErrorCode::EndpointDown,
                                  "Inconsistent range handling by " + req.endpointUrl});
            }
            if (auto r = restartFromZero(); !r) {
                return fail(r.error());
            }
        }
    }

    // 4) Size, checksum, finalize
    if (state.totalBytes && state.downloadedBytes != *state.totalBytes) {
        return fail(Error{ErrorCode::TransferIncomplete,
                          "Received " + std::to_string(state.downloadedBytes) + " of " +
                              std::to_string(*state.totalBytes) + " bytes"});
    }

    emit(TransferStage::Verifying);
    const std::string digest = hasher.hexDigest();
    if (digest.empty()) {
        return fail(Error{ErrorCode::IoError, "Failed to compute checksum"});
    }
    if (req.expectedChecksum && !req.expectedChecksum->empty()) {
        const auto expected = normalizeChecksum(*req.expectedChecksum);
        if (expected != digest) {
            file.close();
            std::error_code ec;
            fs::remove(partial, ec);
            store_->remove(req.destination);
            state.downloadedBytes = 0;
            state.totalBytes.reset();
            return fail(Error{ErrorCode::ChecksumMismatch,
                              "Checksum mismatch (expected " + expected + ", got " + digest +
                                  ")"});
        }
    }

    emit(TransferStage::Finalizing);
    if (auto r = file.sync(); !r) {
        return fail(r.error());
    }
    file.close();
    std::error_code ec;
    fs::rename(partial, req.destination, ec);
    if (ec) {
        return fail(Error{ErrorCode::IoError, "Failed to move " + partial.string() + " to " +
                                                  req.destination.string() + ": " +
                                                  ec.message()});
    }
    if (req.destination.has_parent_path()) {
        if (auto r = detail::fsync_dir(req.destination.parent_path()); !r) {
            spdlog::warn("{}", r.error().message);
        }
    }
    store_->remove(req.destination);

    result.checksumHex = digest;
    spdlog::info("Completed {} -> {} ({} bytes{})", req.sourceUrl, req.destination.string(),
                 state.downloadedBytes, result.resumed ? ", resumed" : "");
    return finish(TransferStatus::Completed, std::nullopt);
}

} // namespace omnifetch::transfer
