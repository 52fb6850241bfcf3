#pragma once

/*
 * omnifetch transfer engine - public types and interfaces (C++20)
 *
 * A transfer moves the bytes of one logical file from one endpoint URL into
 * `<dest>.part`, persisting a JSON sidecar (`<dest>.part.meta`) after every
 * flushed chunk so an interrupted transfer resumes with a Range request.
 *
 * Separation of concerns:
 * - IHttpAdapter: streaming GET with optional Range (libcurl implementation)
 * - Hasher: running digest over OpenSSL EVP
 * - IRateLimiter: token bucket shared by all transfers
 * - IResumeStore: sidecar persistence (write temp, fsync, rename)
 * - TransferEngine: the resume/verify/finalize algorithm over the above
 */

#include <omnifetch/config/config.h>
#include <omnifetch/core/cancellation.h>
#include <omnifetch/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace omnifetch::transfer {

using config::ChecksumAlgorithm;

// ===================
// HTTP plumbing
// ===================

struct Header {
    std::string name;
    std::string value;
};

struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

struct HttpRequest {
    std::string url;
    std::vector<Header> headers;
    std::optional<std::uint64_t> rangeStart; // sends "Range: bytes=N-" when set
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::milliseconds stallTimeout{30000}; // max time without receiving a byte
    bool followRedirects{true};
    std::optional<std::string> proxy;
    TlsConfig tls{};
};

/**
 * Status line and headers of the final response (after redirects).
 */
struct HttpResponseHead {
    int status{0};
    std::vector<Header> headers;

    /**
     * Case-insensitive lookup; first occurrence wins.
     */
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

/**
 * Invoked once with the final response head before any body byte is delivered.
 * Return false to abandon the body (the request ends without an error).
 */
using HeadCallback = std::function<bool(const HttpResponseHead&)>;

/**
 * Receives body bytes in arrival order. An error aborts the request and is returned by get().
 */
using BodySink = std::function<Result<void>(ByteSpan)>;

using ShouldCancel = std::function<bool()>;

struct HttpOutcome {
    HttpResponseHead head;
    bool bodyAbandoned{false}; // HeadCallback returned false
    std::uint64_t bodyBytes{0};
};

/**
 * HTTP adapter abstraction. Implementations must abort promptly once shouldCancel() returns
 * true, reporting OperationCancelled.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Issue a GET and stream the body to `sink`.
     * Errors: NetworkError, Timeout, OperationCancelled, or whatever `sink` returned.
     */
    virtual Result<HttpOutcome> get(const HttpRequest& request, const HeadCallback& onHead,
                                    const BodySink& sink, const ShouldCancel& shouldCancel) = 0;
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();

struct ContentRange {
    std::uint64_t start{0};
    std::uint64_t end{0};                // inclusive
    std::optional<std::uint64_t> total;  // absent for "*"
};

// "bytes 100-199/1000", "bytes 100-199/*". Unsatisfied ranges ("bytes */1000") yield start=end=0
// with total set.
std::optional<ContentRange> parseContentRange(std::string_view value);

std::optional<std::uint64_t> parseContentLength(std::string_view value);

/**
 * Retry-After as delta-seconds or HTTP-date (relative to `now`). Past dates yield zero.
 */
std::optional<std::chrono::seconds>
parseRetryAfter(std::string_view value,
                std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// ===================
// Integrity
// ===================

/**
 * Streaming digest over OpenSSL EVP. hexDigest() reads the digest of everything fed so far
 * without ending the stream, so callers can checkpoint a running digest per chunk.
 */
class Hasher {
public:
    explicit Hasher(ChecksumAlgorithm algo = ChecksumAlgorithm::Sha256);
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&&) noexcept;
    Hasher& operator=(Hasher&&) noexcept;

    void reset();
    void update(ByteSpan data);

    /**
     * Feed the first `bytes` bytes of `path`. IoError if the file is shorter or unreadable.
     */
    Result<void> updateFromFile(const std::filesystem::path& path, std::uint64_t bytes);

    /**
     * Lower-case hex digest of the data fed so far; empty on an OpenSSL failure.
     */
    [[nodiscard]] std::string hexDigest() const;

    [[nodiscard]] ChecksumAlgorithm algorithm() const noexcept { return algo_; }

private:
    struct Impl;
    ChecksumAlgorithm algo_;
    std::unique_ptr<Impl> impl_;
};

/**
 * Normalize an expected checksum: lower-case, optional "algo:" prefix stripped.
 */
std::string normalizeChecksum(std::string_view value);

/**
 * Sets `name` to `value`, replacing every existing header of that name (case-insensitive).
 */
void setHeader(std::vector<Header>& headers, std::string_view name, std::string value);

// ===================
// Rate limiting
// ===================

/**
 * Token-bucket style limiter interface.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /**
     * Block until `bytes` tokens are available.
     * @return false if shouldCancel() became true while waiting
     */
    virtual bool acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) = 0;

    /**
     * Set the rate in bytes per second (0 = unlimited).
     */
    virtual void setRate(std::uint64_t bytesPerSecond) = 0;
};

std::unique_ptr<IRateLimiter> makeTokenBucketLimiter(std::uint64_t bytesPerSecond);

// ===================
// Resumability sidecar
// ===================

struct JobMeta {
    std::string id;
    std::string platformId;
    std::string contentType;
    int priority{0};
};

/**
 * Persisted per in-progress transfer. `downloadedBytes` equals the size of the partial file and
 * `partialDigest` is the digest of exactly those bytes.
 */
struct TransferState {
    int version{1};
    std::string url;         // source URL the job was submitted with
    std::string endpointUrl; // expanded endpoint the bytes came from
    std::optional<std::uint64_t> totalBytes;
    std::uint64_t downloadedBytes{0};
    ChecksumAlgorithm checksumAlgorithm{ChecksumAlgorithm::Sha256};
    std::string partialDigest;
    std::size_t endpointIndex{0};
    int attempt{0};
    JobMeta job;
};

std::filesystem::path partialPathFor(const std::filesystem::path& destination);
std::filesystem::path sidecarPathFor(const std::filesystem::path& destination);

/**
 * Resume persistence keyed by destination path.
 */
class IResumeStore {
public:
    virtual ~IResumeStore() = default;

    virtual Result<std::optional<TransferState>> load(const std::filesystem::path& destination) = 0;
    virtual Result<void> save(const std::filesystem::path& destination,
                              const TransferState& state) = 0;
    virtual void remove(const std::filesystem::path& destination) noexcept = 0;
};

/**
 * JSON sidecar at sidecarPathFor(dest), replaced atomically (temp file, fsync, rename).
 */
std::unique_ptr<IResumeStore> makeSidecarStore();

/**
 * Destinations under `directory` (non-recursive) that have a sidecar.
 */
std::vector<std::filesystem::path> findSidecarDestinations(const std::filesystem::path& directory);

// ===================
// Transfer engine
// ===================

enum class TransferStage { Connecting, Downloading, Verifying, Finalizing };

enum class TransferStatus { Completed, Cancelled, Failed };

const char* to_string(TransferStatus status);

struct TransferProgress {
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    TransferStage stage{TransferStage::Downloading};
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

struct TransferRequest {
    std::string sourceUrl;
    std::string endpointUrl;
    std::size_t endpointIndex{0};
    int attempt{0};
    std::filesystem::path destination;
    std::vector<Header> headers;
    std::optional<std::string> expectedChecksum;
    JobMeta job;
};

struct TransferOptions {
    std::size_t chunkSizeBytes{256 * 1024};
    ChecksumAlgorithm algorithm{ChecksumAlgorithm::Sha256};
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::milliseconds stallTimeout{30000};
    std::string userAgent{"omnifetch/1.0"};
    bool followRedirects{true};
    std::optional<std::string> proxy;
    TlsConfig tls{};

    static TransferOptions fromConfig(const config::OrchestratorConfig& cfg);
};

struct TransferResult {
    TransferStatus status{TransferStatus::Failed};
    std::filesystem::path finalPath;
    std::string checksumHex;
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    bool resumed{false};
    std::optional<Error> error{};
    std::optional<int> httpStatus{};
    std::optional<std::chrono::seconds> retryAfter{};
};

/**
 * Executes single transfers. One instance may serve many jobs concurrently; per-transfer state
 * lives on the calling thread's stack.
 */
class TransferEngine {
public:
    TransferEngine(std::shared_ptr<IHttpAdapter> http, std::shared_ptr<IResumeStore> store,
                   std::shared_ptr<IRateLimiter> limiter, TransferOptions options);

    /**
     * Transfer `request.endpointUrl` into `request.destination`, resuming from a valid sidecar.
     * Cancellation yields TransferStatus::Cancelled with the sidecar matching the partial file.
     */
    TransferResult transfer(const TransferRequest& request, const CancellationToken& token,
                            const ProgressCallback& onProgress = {});

    [[nodiscard]] const TransferOptions& options() const noexcept { return options_; }

private:
    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<IResumeStore> store_;
    std::shared_ptr<IRateLimiter> limiter_;
    TransferOptions options_;
};

/**
 * Final path for a job: `hint` (a directory hint gets a derived file name), else
 * `downloadDir / filenameFromUrl(url)`.
 */
std::filesystem::path resolveDestination(const std::filesystem::path& downloadDir,
                                         const std::optional<std::filesystem::path>& hint,
                                         std::string_view url);

/**
 * `dir/stem (n).ext` for n > 0; `path` itself for n == 0.
 */
std::filesystem::path withCollisionSuffix(const std::filesystem::path& path, int n);

/**
 * Last path segment of `url` (query and fragment dropped, percent-decoded, unsafe characters
 * replaced), or `download_<epoch ms>` when the URL has none.
 */
std::string filenameFromUrl(std::string_view url);

} // namespace omnifetch::transfer
