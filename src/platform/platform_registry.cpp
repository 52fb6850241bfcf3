#include <omnifetch/platform/platform.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace omnifetch::platform {

namespace {

void replaceAll(std::string& s, std::string_view from, std::string_view to) {
    if (from.empty())
        return;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

PlatformDescriptor::PlatformDescriptor(std::string id, std::vector<UrlPattern> patterns,
                                       std::vector<CandidateEndpoint> endpoints, bool requiresAuth,
                                       std::string displayName)
    : id_(std::move(id)), displayName_(std::move(displayName)), patterns_(std::move(patterns)),
      endpoints_(std::move(endpoints)), requiresAuth_(requiresAuth) {
    if (displayName_.empty()) {
        displayName_ = id_;
    }
    compiled_.reserve(patterns_.size());
    for (const auto& p : patterns_) {
        // Throws std::regex_error on a malformed pattern; loaders catch it
        compiled_.emplace_back(p.pattern, std::regex::ECMAScript | std::regex::icase);
    }
    // Rank order; stable so equal ranks keep declaration order
    std::stable_sort(endpoints_.begin(), endpoints_.end(),
                     [](const CandidateEndpoint& a, const CandidateEndpoint& b) {
                         return a.priority < b.priority;
                     });
}

int PlatformDescriptor::matchPattern(std::string_view url) const {
    for (size_t i = 0; i < compiled_.size(); ++i) {
        if (std::regex_search(url.begin(), url.end(), compiled_[i])) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

Result<std::string> PlatformDescriptor::endpointUrl(std::size_t index,
                                                    std::string_view sourceUrl) const {
    if (index >= endpoints_.size()) {
        return Error{ErrorCode::InvalidArgument, "Endpoint index " + std::to_string(index) +
                                                     " out of range for platform " + id_};
    }
    std::string out = endpoints_[index].urlTemplate;
    replaceAll(out, "{url}", percentEncode(sourceUrl));
    replaceAll(out, "{raw}", sourceUrl);
    return out;
}

Result<void> PlatformRegistry::registerPlatform(std::shared_ptr<const PlatformDescriptor> descriptor) {
    if (!descriptor || descriptor->id().empty()) {
        return Error{ErrorCode::InvalidArgument, "Descriptor must have an id"};
    }
    if (descriptor->endpoints().empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "Descriptor " + descriptor->id() + " has no candidate endpoints"};
    }
    if (byId_.count(descriptor->id()) != 0) {
        return Error{ErrorCode::AlreadyExists,
                     "Platform already registered: " + descriptor->id()};
    }
    byId_.emplace(descriptor->id(), descriptor);
    order_.push_back(std::move(descriptor));
    spdlog::debug("Registered platform '{}' ({} patterns, {} endpoints)", order_.back()->id(),
                  order_.back()->patterns().size(), order_.back()->endpoints().size());
    return {};
}

Result<Resolution> PlatformRegistry::resolve(std::string_view url) const {
    if (url.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty URL"};
    }
    for (const auto& desc : order_) {
        int idx = desc->matchPattern(url);
        if (idx < 0)
            continue;
        Resolution r;
        r.platformId = desc->id();
        const auto& tag = desc->patterns()[static_cast<size_t>(idx)].contentType;
        r.contentType = tag.empty() ? detectContentType(url) : tag;
        return r;
    }
    return Error{ErrorCode::NotFound, "No platform matches " + std::string(url)};
}

std::shared_ptr<const PlatformDescriptor> PlatformRegistry::find(std::string_view id) const {
    auto it = byId_.find(std::string(id));
    return it == byId_.end() ? nullptr : it->second;
}

Result<std::vector<std::string>>
PlatformRegistry::candidateEndpoints(std::string_view id, std::string_view sourceUrl) const {
    auto desc = find(id);
    if (!desc) {
        return Error{ErrorCode::NotFound, "Unknown platform: " + std::string(id)};
    }
    std::vector<std::string> out;
    out.reserve(desc->endpoints().size());
    for (size_t i = 0; i < desc->endpoints().size(); ++i) {
        auto url = desc->endpointUrl(i, sourceUrl);
        if (!url)
            return url.error();
        out.push_back(std::move(url).value());
    }
    return out;
}

std::vector<std::string> PlatformRegistry::platformIds() const {
    std::vector<std::string> ids;
    ids.reserve(order_.size());
    for (const auto& d : order_) {
        ids.push_back(d->id());
    }
    return ids;
}

std::string percentEncode(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[(c >> 4) & 0xF]);
            out.push_back(kHex[c & 0xF]);
        }
    }
    return out;
}

std::shared_ptr<PlatformRegistry> makeBuiltinRegistry() {
    auto registry = std::make_shared<PlatformRegistry>();
    for (auto& desc : builtinPlatforms()) {
        auto r = registry->registerPlatform(desc);
        if (!r) {
            spdlog::warn("Skipping built-in platform: {}", r.error().message);
        }
    }
    return registry;
}

} // namespace omnifetch::platform
