#include <omnifetch/orchestrator/extractor.h>

namespace omnifetch::orchestrator {

Result<MediaLocation> DirectExtractor::locate(const ExtractionRequest& request,
                                              const CancellationToken& token) {
    if (token.isCancelled()) {
        return Error{ErrorCode::OperationCancelled, "Cancelled before extraction"};
    }
    if (request.endpointUrl.empty()) {
        return Error{ErrorCode::PatternStale,
                     "Endpoint " + std::to_string(request.endpointIndex) + " of " +
                         request.platformId + " expanded to an empty URL"};
    }
    MediaLocation loc;
    loc.url = request.endpointUrl;
    return loc;
}

Error normalizeExtractionError(const Error& error) {
    switch (error.code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::RateLimited:
        case ErrorCode::EndpointDown:
        case ErrorCode::AuthRequired:
        case ErrorCode::OperationCancelled:
        case ErrorCode::PatternStale:
            return error;
        default:
            return Error{ErrorCode::PatternStale, "Content not located: " + error.message};
    }
}

} // namespace omnifetch::orchestrator
