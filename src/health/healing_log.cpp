/*
 * HealingLog: in-memory append-only records, mirrored one JSON object per line when a
 * persistence path is configured:
 *   {"timestamp_ms":..., "job_id":"...", "platform_id":"...", "endpoint_index":0,
 *    "error_class":"EndpointDown", "action":"SwitchEndpoint", "outcome":"RetryScheduled",
 *    "message":"HTTP 404 from ..."}
 */

#include <omnifetch/health/health.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace omnifetch::health {

using nlohmann::json;

namespace {

json toJson(const HealingRecord& r) {
    return json{{"timestamp_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                                     r.timestamp.time_since_epoch())
                                     .count()},
                {"job_id", r.jobId},
                {"platform_id", r.platformId},
                {"endpoint_index", r.endpointIndex},
                {"error_class", to_string(r.errorClass)},
                {"action", to_string(r.actionTaken)},
                {"outcome", to_string(r.outcome)},
                {"message", r.message}};
}

std::optional<HealingRecord> fromJson(const json& j) {
    if (!j.is_object())
        return std::nullopt;
    try {
        auto cls = parse_error_class(j.value("error_class", std::string{}));
        auto action = parse_action_kind(j.value("action", std::string{}));
        auto outcome = parse_healing_outcome(j.value("outcome", std::string{}));
        if (!cls || !action || !outcome)
            return std::nullopt;
        HealingRecord r;
        r.timestamp =
            TimePoint(std::chrono::milliseconds(j.value("timestamp_ms", std::int64_t{0})));
        r.jobId = j.value("job_id", std::string{});
        r.platformId = j.value("platform_id", std::string{});
        r.endpointIndex = j.value("endpoint_index", std::size_t{0});
        r.errorClass = *cls;
        r.actionTaken = *action;
        r.outcome = *outcome;
        r.message = j.value("message", std::string{});
        return r;
    } catch (const json::exception&) {
        // wrong-typed field
        return std::nullopt;
    }
}

} // namespace

HealingLog::HealingLog(std::optional<std::filesystem::path> persistPath)
    : persistPath_(std::move(persistPath)) {
    if (persistPath_ && persistPath_->has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(persistPath_->parent_path(), ec);
        if (ec) {
            spdlog::warn("Cannot create healing log directory {}: {}",
                         persistPath_->parent_path().string(), ec.message());
        }
    }
}

Result<std::size_t> HealingLog::load() {
    if (!persistPath_) {
        return Error{ErrorCode::NotFound, "Healing log has no persistence path"};
    }
    std::ifstream in(*persistPath_);
    if (!in) {
        std::error_code ec;
        if (!std::filesystem::exists(*persistPath_, ec)) {
            return std::size_t{0};
        }
        return Error{ErrorCode::IoError, "Cannot read " + persistPath_->string()};
    }

    std::vector<HealingRecord> loaded;
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty())
            continue;
        auto j = json::parse(line, nullptr, /*allow_exceptions=*/false);
        auto rec = j.is_discarded() ? std::nullopt : fromJson(j);
        if (!rec) {
            spdlog::warn("Skipping malformed healing record at {}:{}", persistPath_->string(),
                         lineNo);
            continue;
        }
        loaded.push_back(std::move(*rec));
    }

    std::lock_guard lock(mutex_);
    records_.insert(records_.begin(), loaded.begin(), loaded.end());
    spdlog::debug("Loaded {} healing records from {}", loaded.size(), persistPath_->string());
    return loaded.size();
}

void HealingLog::append(HealingRecord record) {
    std::lock_guard lock(mutex_);
    if (persistPath_) {
        std::ofstream out(*persistPath_, std::ios::app);
        if (out) {
            out << toJson(record).dump() << '\n';
        }
        if (!out) {
            spdlog::warn("Failed to persist healing record to {}", persistPath_->string());
        }
    }
    records_.push_back(std::move(record));
}

std::vector<HealingRecord> HealingLog::records() const {
    std::lock_guard lock(mutex_);
    return records_;
}

std::vector<HealingRecord> HealingLog::recordsForJob(const JobId& jobId) const {
    std::lock_guard lock(mutex_);
    std::vector<HealingRecord> out;
    for (const auto& r : records_) {
        if (r.jobId == jobId)
            out.push_back(r);
    }
    return out;
}

HealingStatistics HealingLog::statistics() const {
    std::lock_guard lock(mutex_);
    HealingStatistics s;
    s.totalRecords = records_.size();
    for (const auto& r : records_) {
        if (r.outcome == HealingOutcome::Recovered) {
            ++s.recovered;
            continue; // success marker, not a failure sample
        }
        if (r.outcome == HealingOutcome::Failed)
            ++s.failed;
        ++s.byErrorClass[r.errorClass];
        ++s.byPlatform[r.platformId];
    }
    const auto decided = s.recovered + s.failed;
    s.successRate = decided == 0 ? 0.0
                                 : static_cast<double>(s.recovered) / static_cast<double>(decided);
    return s;
}

std::size_t HealingLog::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

} // namespace omnifetch::health
