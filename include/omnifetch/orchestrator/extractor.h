#pragma once

#include <omnifetch/core/cancellation.h>
#include <omnifetch/core/types.h>
#include <omnifetch/transfer/transfer.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace omnifetch::orchestrator {

struct ExtractionRequest {
    JobId jobId;
    std::string sourceUrl;
    std::string platformId;
    std::string contentType;
    std::string endpointUrl; // candidate endpoint already expanded for sourceUrl
    std::size_t endpointIndex{0};
};

/**
 * Where the bytes for a job actually live.
 */
struct MediaLocation {
    std::string url;
    std::optional<std::string> expectedChecksum;
    std::vector<transfer::Header> headers;
};

/**
 * Per-platform extraction seam: turns an endpoint into a downloadable location.
 *
 * Errors with a transport code (NetworkError, Timeout, RateLimited, EndpointDown, AuthRequired)
 * are healed like transfer failures. Any other error means the content could not be located
 * and is reported as PatternStale.
 */
class IContentExtractor {
public:
    virtual ~IContentExtractor() = default;

    virtual Result<MediaLocation> locate(const ExtractionRequest& request,
                                         const CancellationToken& token) = 0;
};

/**
 * Treats the expanded endpoint as the media URL.
 */
class DirectExtractor final : public IContentExtractor {
public:
    Result<MediaLocation> locate(const ExtractionRequest& request,
                                 const CancellationToken& token) override;
};

/**
 * Error a failed locate() is handled as.
 */
Error normalizeExtractionError(const Error& error);

} // namespace omnifetch::orchestrator
