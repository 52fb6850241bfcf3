#include <omnifetch/health/health.h>

#include <spdlog/spdlog.h>

namespace omnifetch::health {

EndpointHealthStore::EndpointHealthStore(std::chrono::milliseconds cooldown)
    : cooldown_(cooldown) {}

void EndpointHealthStore::recordSuccess(const std::string& platformId, std::size_t index,
                                        TimePoint now) {
    std::unique_lock lock(mutex_);
    auto& h = entries_[{platformId, index}];
    if (!h.lastKnownGood) {
        spdlog::info("Endpoint {}#{} healthy again", platformId, index);
    }
    h.consecutiveFailures = 0;
    h.lastKnownGood = true;
    h.lastCheckedAt = now;
}

void EndpointHealthStore::recordFailure(const std::string& platformId, std::size_t index,
                                        bool markUnhealthy, TimePoint now) {
    std::unique_lock lock(mutex_);
    auto& h = entries_[{platformId, index}];
    ++h.consecutiveFailures;
    h.lastCheckedAt = now;
    if (markUnhealthy) {
        h.lastKnownGood = false;
    }
    spdlog::debug("Endpoint {}#{} failure #{}{}", platformId, index, h.consecutiveFailures,
                  markUnhealthy ? " (marked unhealthy)" : "");
}

EndpointHealth EndpointHealthStore::get(const std::string& platformId, std::size_t index) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find({platformId, index});
    return it == entries_.end() ? EndpointHealth{} : it->second;
}

bool EndpointHealthStore::isHealthy(const std::string& platformId, std::size_t index,
                                    TimePoint now) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find({platformId, index});
    if (it == entries_.end() || it->second.lastKnownGood) {
        return true;
    }
    // Unhealthy marks are advisory and expire so a recovered endpoint gets tried again
    return it->second.lastCheckedAt && now - *it->second.lastCheckedAt >= cooldown_;
}

std::size_t EndpointHealthStore::preferredIndex(const std::string& platformId,
                                                std::size_t endpointCount, TimePoint now) const {
    for (std::size_t i = 0; i < endpointCount; ++i) {
        if (isHealthy(platformId, i, now)) {
            return i;
        }
    }
    return 0;
}

std::map<std::pair<std::string, std::size_t>, EndpointHealth>
EndpointHealthStore::snapshot() const {
    std::shared_lock lock(mutex_);
    return entries_;
}

} // namespace omnifetch::health
