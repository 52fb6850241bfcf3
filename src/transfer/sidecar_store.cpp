/*
 * Persistent JSON resume sidecar, one file per in-progress transfer.
 *
 * File layout (<dest>.part.meta):
 * {
 *   "version": 1,
 *   "url": "https://example.com/file.bin",
 *   "endpoint_url": "https://mirror.example.com/file.bin",
 *   "total_bytes": 1048576,            // or null while unknown
 *   "downloaded_bytes": 524288,
 *   "checksum_algorithm": "sha256",
 *   "partial_digest": "<hex of the first downloaded_bytes bytes>",
 *   "endpoint_index": 1,
 *   "attempt": 2,
 *   "job": {"id": "...", "platform_id": "...", "content_type": "...", "priority": 0}
 * }
 *
 * Saves go to <dest>.part.meta.tmp, are fsynced and renamed over the live sidecar, so a crash
 * leaves either the previous or the new state, never a torn one.
 */

#include "disk_io.h"

#include <omnifetch/transfer/transfer.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace omnifetch::transfer {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr const char* kPartSuffix = ".part";
constexpr const char* kMetaSuffix = ".part.meta";

json toJson(const TransferState& st) {
    json j;
    j["version"] = st.version;
    j["url"] = st.url;
    j["endpoint_url"] = st.endpointUrl;
    j["total_bytes"] = st.totalBytes ? json(*st.totalBytes) : json(nullptr);
    j["downloaded_bytes"] = st.downloadedBytes;
    j["checksum_algorithm"] = config::to_string(st.checksumAlgorithm);
    j["partial_digest"] = st.partialDigest;
    j["endpoint_index"] = st.endpointIndex;
    j["attempt"] = st.attempt;
    j["job"] = {{"id", st.job.id},
                {"platform_id", st.job.platformId},
                {"content_type", st.job.contentType},
                {"priority", st.job.priority}};
    return j;
}

Result<TransferState> fromJson(const json& j) {
    if (!j.is_object() || !j.contains("url") || !j["url"].is_string() ||
        !j.contains("downloaded_bytes") || !j["downloaded_bytes"].is_number_unsigned()) {
        return Error{ErrorCode::InvalidArgument, "Sidecar missing url/downloaded_bytes"};
    }
    TransferState st;
    try {
        st.version = j.value("version", 1);
        st.url = j["url"].get<std::string>();
        st.endpointUrl = j.value("endpoint_url", std::string{});
        if (j.contains("total_bytes") && j["total_bytes"].is_number_unsigned()) {
            st.totalBytes = j["total_bytes"].get<std::uint64_t>();
        }
        st.downloadedBytes = j["downloaded_bytes"].get<std::uint64_t>();
        auto algo =
            config::parse_checksum_algorithm(j.value("checksum_algorithm", std::string{}));
        if (!algo) {
            return Error{ErrorCode::InvalidArgument, "Sidecar has unknown checksum_algorithm"};
        }
        st.checksumAlgorithm = *algo;
        st.partialDigest = j.value("partial_digest", std::string{});
        st.endpointIndex = j.value("endpoint_index", std::size_t{0});
        st.attempt = j.value("attempt", 0);
        if (j.contains("job") && j["job"].is_object()) {
            const auto& job = j["job"];
            st.job.id = job.value("id", std::string{});
            st.job.platformId = job.value("platform_id", std::string{});
            st.job.contentType = job.value("content_type", std::string{});
            st.job.priority = job.value("priority", 0);
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidArgument, std::string("Sidecar field has wrong type: ") +
                                                     e.what()};
    }
    return st;
}

class JsonSidecarStore final : public IResumeStore {
public:
    Result<std::optional<TransferState>> load(const fs::path& destination) override {
        const auto path = sidecarPathFor(destination);
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return std::optional<TransferState>{};
        }
        std::ifstream in(path);
        if (!in) {
            return Error{ErrorCode::IoError, "Failed to open sidecar " + path.string()};
        }
        json root;
        try {
            in >> root;
        } catch (const json::exception& e) {
            return Error{ErrorCode::InvalidArgument,
                         "Corrupt sidecar " + path.string() + ": " + e.what()};
        }
        auto st = fromJson(root);
        if (!st) {
            return Error{st.error().code, st.error().message + " (" + path.string() + ")"};
        }
        return std::optional<TransferState>{std::move(st).value()};
    }

    Result<void> save(const fs::path& destination, const TransferState& state) override {
        const auto path = sidecarPathFor(destination);
        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                return Error{ErrorCode::IoError, "Failed to open " + tmp.string()};
            }
            out << toJson(state).dump();
            out.flush();
            if (!out) {
                return Error{ErrorCode::IoError, "Failed to write " + tmp.string()};
            }
        }
        if (auto r = detail::fsync_file(tmp); !r) {
            return r;
        }
        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to rename sidecar into place: " + ec.message()};
        }
        return {};
    }

    void remove(const fs::path& destination) noexcept override {
        std::error_code ec;
        fs::remove(sidecarPathFor(destination), ec);
        if (ec) {
            spdlog::warn("Failed to remove sidecar for {}: {}", destination.string(),
                         ec.message());
        }
        auto tmp = sidecarPathFor(destination);
        tmp += ".tmp";
        fs::remove(tmp, ec);
    }
};

} // namespace

fs::path partialPathFor(const fs::path& destination) {
    auto p = destination;
    p += kPartSuffix;
    return p;
}

fs::path sidecarPathFor(const fs::path& destination) {
    auto p = destination;
    p += kMetaSuffix;
    return p;
}

std::unique_ptr<IResumeStore> makeSidecarStore() {
    return std::make_unique<JsonSidecarStore>();
}

std::vector<fs::path> findSidecarDestinations(const fs::path& directory) {
    std::vector<fs::path> out;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return out;
    }
    const std::string suffix = kMetaSuffix;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fileEc;
        if (!it->is_regular_file(fileEc))
            continue;
        const auto name = it->path().filename().string();
        if (name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            out.push_back(directory / name.substr(0, name.size() - suffix.size()));
        }
    }
    if (ec) {
        spdlog::warn("Sidecar scan of {} stopped early: {}", directory.string(), ec.message());
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace omnifetch::transfer
