#include <omnifetch/platform/platform.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <regex>

namespace omnifetch::platform {

using nlohmann::json;

Result<std::vector<std::shared_ptr<const PlatformDescriptor>>>
parseDescriptors(std::string_view jsonText) {
    json root;
    try {
        root = json::parse(jsonText.begin(), jsonText.end());
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidArgument, std::string("Descriptor JSON: ") + e.what()};
    }
    if (!root.is_object() || !root.contains("platforms") || !root["platforms"].is_array()) {
        return Error{ErrorCode::InvalidArgument, "Descriptor JSON must hold a 'platforms' array"};
    }

    std::vector<std::shared_ptr<const PlatformDescriptor>> out;
    for (const auto& entry : root["platforms"]) {
        if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
            return Error{ErrorCode::InvalidArgument, "Platform entry without string 'id'"};
        }
        const auto id = entry["id"].get<std::string>();

        std::vector<UrlPattern> patterns;
        if (entry.contains("patterns") && entry["patterns"].is_array()) {
            for (const auto& p : entry["patterns"]) {
                if (!p.contains("pattern") || !p["pattern"].is_string()) {
                    return Error{ErrorCode::InvalidArgument,
                                 "Platform " + id + ": pattern entry without 'pattern'"};
                }
                patterns.push_back({p["pattern"].get<std::string>(),
                                    p.value("content_type", std::string{})});
            }
        }

        std::vector<CandidateEndpoint> endpoints;
        if (entry.contains("endpoints") && entry["endpoints"].is_array()) {
            int rank = 0;
            for (const auto& e : entry["endpoints"]) {
                if (e.is_string()) {
                    endpoints.push_back({e.get<std::string>(), rank++});
                } else if (e.is_object() && e.contains("url") && e["url"].is_string()) {
                    endpoints.push_back({e["url"].get<std::string>(), e.value("priority", rank)});
                    ++rank;
                } else {
                    return Error{ErrorCode::InvalidArgument,
                                 "Platform " + id + ": malformed endpoint entry"};
                }
            }
        }
        if (endpoints.empty()) {
            return Error{ErrorCode::InvalidArgument, "Platform " + id + " has no endpoints"};
        }

        try {
            out.push_back(std::make_shared<const PlatformDescriptor>(
                id, std::move(patterns), std::move(endpoints), entry.value("requires_auth", false),
                entry.value("name", id)));
        } catch (const std::regex_error& e) {
            return Error{ErrorCode::InvalidArgument,
                         "Platform " + id + ": invalid pattern (" + e.what() + ")"};
        }
    }
    return out;
}

Result<std::vector<std::shared_ptr<const PlatformDescriptor>>>
loadDescriptorFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open descriptor file: " + path.string()};
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto parsed = parseDescriptors(text);
    if (parsed) {
        spdlog::info("Loaded {} platform descriptors from {}", parsed.value().size(),
                     path.string());
    }
    return parsed;
}

} // namespace omnifetch::platform
