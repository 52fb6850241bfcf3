#include <omnifetch/health/health.h>

#include <algorithm>
#include <array>
#include <cstdint>

namespace omnifetch::health {

namespace {

template <typename E, std::size_t N>
std::optional<E> parse_enum(std::string_view name, const std::array<E, N>& values,
                            const char* (*namer)(E)) {
    for (E v : values) {
        if (name == namer(v))
            return v;
    }
    return std::nullopt;
}

constexpr std::array kErrorClasses = {
    ErrorClass::Network,          ErrorClass::Timeout,        ErrorClass::RateLimited,
    ErrorClass::EndpointDown,     ErrorClass::AuthRequired,   ErrorClass::ChecksumMismatch,
    ErrorClass::PatternStale,     ErrorClass::PlatformUnresolved,
    ErrorClass::AllEndpointsExhausted};

constexpr std::array kActions = {ActionKind::Retry,        ActionKind::RateLimitWait,
                                 ActionKind::SwitchEndpoint, ActionKind::CleanRestart,
                                 ActionKind::ManualReviewRequired, ActionKind::GiveUp};

constexpr std::array kOutcomes = {HealingOutcome::RetryScheduled, HealingOutcome::Recovered,
                                  HealingOutcome::Failed};

} // namespace

const char* to_string(ErrorClass cls) {
    switch (cls) {
        case ErrorClass::Network:
            return "Network";
        case ErrorClass::Timeout:
            return "Timeout";
        case ErrorClass::RateLimited:
            return "RateLimited";
        case ErrorClass::EndpointDown:
            return "EndpointDown";
        case ErrorClass::AuthRequired:
            return "AuthRequired";
        case ErrorClass::ChecksumMismatch:
            return "ChecksumMismatch";
        case ErrorClass::PatternStale:
            return "PatternStale";
        case ErrorClass::PlatformUnresolved:
            return "PlatformUnresolved";
        case ErrorClass::AllEndpointsExhausted:
            return "AllEndpointsExhausted";
    }
    return "Network";
}

std::optional<ErrorClass> parse_error_class(std::string_view name) {
    return parse_enum<ErrorClass>(name, kErrorClasses, &to_string);
}

const char* to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::Retry:
            return "Retry";
        case ActionKind::RateLimitWait:
            return "RateLimitWait";
        case ActionKind::SwitchEndpoint:
            return "SwitchEndpoint";
        case ActionKind::CleanRestart:
            return "CleanRestart";
        case ActionKind::ManualReviewRequired:
            return "ManualReviewRequired";
        case ActionKind::GiveUp:
            return "GiveUp";
    }
    return "GiveUp";
}

std::optional<ActionKind> parse_action_kind(std::string_view name) {
    return parse_enum<ActionKind>(name, kActions, &to_string);
}

const char* to_string(HealingOutcome outcome) {
    switch (outcome) {
        case HealingOutcome::RetryScheduled:
            return "RetryScheduled";
        case HealingOutcome::Recovered:
            return "Recovered";
        case HealingOutcome::Failed:
            return "Failed";
    }
    return "Failed";
}

std::optional<HealingOutcome> parse_healing_outcome(std::string_view name) {
    return parse_enum<HealingOutcome>(name, kOutcomes, &to_string);
}

ErrorCode toErrorCode(ErrorClass cls) {
    switch (cls) {
        case ErrorClass::Network:
            return ErrorCode::NetworkError;
        case ErrorClass::Timeout:
            return ErrorCode::Timeout;
        case ErrorClass::RateLimited:
            return ErrorCode::RateLimited;
        case ErrorClass::EndpointDown:
            return ErrorCode::EndpointDown;
        case ErrorClass::AuthRequired:
            return ErrorCode::AuthRequired;
        case ErrorClass::ChecksumMismatch:
            return ErrorCode::ChecksumMismatch;
        case ErrorClass::PatternStale:
            return ErrorCode::PatternStale;
        case ErrorClass::PlatformUnresolved:
            return ErrorCode::PlatformUnresolved;
        case ErrorClass::AllEndpointsExhausted:
            return ErrorCode::AllEndpointsExhausted;
    }
    return ErrorCode::Unknown;
}

ErrorClass classify(const FailureInfo& failure) {
    // The HTTP status is the most specific signal when the server answered at all
    if (failure.httpStatus) {
        const int s = *failure.httpStatus;
        if (s == 429)
            return ErrorClass::RateLimited;
        if (s == 401 || s == 403 || s == 407)
            return ErrorClass::AuthRequired;
        if (s == 408)
            return ErrorClass::Timeout;
        if (s >= 400 && failure.error.code != ErrorCode::ChecksumMismatch &&
            failure.error.code != ErrorCode::NetworkError &&
            failure.error.code != ErrorCode::Timeout &&
            failure.error.code != ErrorCode::TransferIncomplete) {
            return ErrorClass::EndpointDown;
        }
    }

    switch (failure.error.code) {
        case ErrorCode::Timeout:
            return ErrorClass::Timeout;
        case ErrorCode::RateLimited:
            return ErrorClass::RateLimited;
        case ErrorCode::EndpointDown:
            return ErrorClass::EndpointDown;
        case ErrorCode::AuthRequired:
            return ErrorClass::AuthRequired;
        case ErrorCode::ChecksumMismatch:
            return ErrorClass::ChecksumMismatch;
        case ErrorCode::PatternStale:
            return ErrorClass::PatternStale;
        case ErrorCode::PlatformUnresolved:
            return ErrorClass::PlatformUnresolved;
        case ErrorCode::AllEndpointsExhausted:
            return ErrorClass::AllEndpointsExhausted;
        default:
            // NetworkError, TransferIncomplete, IoError and anything unexpected
            return ErrorClass::Network;
    }
}

std::chrono::milliseconds backoffCeiling(const BackoffPolicy& policy, int attempt) {
    const auto base = std::max<std::int64_t>(0, policy.baseDelay.count());
    const auto cap = std::max<std::int64_t>(base, policy.maxDelay.count());
    if (attempt < 0)
        attempt = 0;
    std::int64_t delay = base;
    for (int i = 0; i < attempt && delay > 0 && delay < cap; ++i) {
        if (delay > cap / 2) {
            delay = cap;
            break;
        }
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, cap));
}

} // namespace omnifetch::health
