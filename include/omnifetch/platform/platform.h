#pragma once

#include <omnifetch/core/types.h>

#include <filesystem>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace omnifetch::platform {

/**
 * A URL pattern and the content-type tag it implies. An empty tag defers to
 * detectContentType() on the matched URL.
 */
struct UrlPattern {
    std::string pattern; // ECMAScript regex, matched case-insensitively (search, not full match)
    std::string contentType;
};

/**
 * One service endpoint able to serve a platform's content. `urlTemplate` may contain
 * `{url}` (percent-encoded source URL) and `{raw}` (source URL verbatim).
 */
struct CandidateEndpoint {
    std::string urlTemplate;
    int priority{0}; // lower rank is tried first
};

/**
 * Immutable platform description. Endpoints are kept sorted by priority rank; indices into
 * `endpoints` are what jobs and health records refer to.
 */
class PlatformDescriptor {
public:
    PlatformDescriptor(std::string id, std::vector<UrlPattern> patterns,
                       std::vector<CandidateEndpoint> endpoints, bool requiresAuth = false,
                       std::string displayName = {});

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& displayName() const noexcept { return displayName_; }
    [[nodiscard]] const std::vector<UrlPattern>& patterns() const noexcept { return patterns_; }
    [[nodiscard]] const std::vector<CandidateEndpoint>& endpoints() const noexcept {
        return endpoints_;
    }
    [[nodiscard]] bool requiresAuth() const noexcept { return requiresAuth_; }

    /**
     * Index of the first pattern matching `url`, or -1.
     */
    [[nodiscard]] int matchPattern(std::string_view url) const;

    /**
     * Expand candidate endpoint `index` for `sourceUrl`. InvalidArgument when out of range.
     */
    [[nodiscard]] Result<std::string> endpointUrl(std::size_t index,
                                                  std::string_view sourceUrl) const;

private:
    std::string id_;
    std::string displayName_;
    std::vector<UrlPattern> patterns_;
    std::vector<std::regex> compiled_;
    std::vector<CandidateEndpoint> endpoints_;
    bool requiresAuth_{false};
};

struct Resolution {
    std::string platformId;
    std::string contentType;
};

/**
 * Registry of platform descriptors. Registration happens at startup; once handed to the
 * orchestrator the registry is only read, so resolve() takes no lock.
 */
class PlatformRegistry {
public:
    PlatformRegistry() = default;

    /**
     * Add a descriptor. AlreadyExists if the id is taken.
     */
    Result<void> registerPlatform(std::shared_ptr<const PlatformDescriptor> descriptor);

    /**
     * First registered descriptor with a matching pattern wins (declaration order within a
     * descriptor, registration order across descriptors). NotFound when nothing matches.
     */
    [[nodiscard]] Result<Resolution> resolve(std::string_view url) const;

    [[nodiscard]] std::shared_ptr<const PlatformDescriptor> find(std::string_view id) const;

    /**
     * Expanded endpoint URLs for platform `id` and `sourceUrl`, in rank order.
     */
    [[nodiscard]] Result<std::vector<std::string>> candidateEndpoints(std::string_view id,
                                                                      std::string_view sourceUrl) const;

    [[nodiscard]] std::vector<std::string> platformIds() const;
    [[nodiscard]] std::size_t size() const noexcept { return order_.size(); }

private:
    std::vector<std::shared_ptr<const PlatformDescriptor>> order_;
    std::unordered_map<std::string, std::shared_ptr<const PlatformDescriptor>> byId_;
};

/**
 * Content-type tag derived from file extension and path shape
 * (image, video, audio, model, archive, document, gallery, profile, article, post,
 * repository, gist, unknown).
 */
std::string detectContentType(std::string_view url);

/**
 * Percent-encode every byte outside the RFC 3986 unreserved set.
 */
std::string percentEncode(std::string_view s);

/**
 * Built-in descriptors in registration order; `generic` (catch-all) is last.
 */
std::vector<std::shared_ptr<const PlatformDescriptor>> builtinPlatforms();

/**
 * Registry pre-populated with builtinPlatforms().
 */
std::shared_ptr<PlatformRegistry> makeBuiltinRegistry();

/**
 * Parse descriptors from a JSON document:
 * {"platforms":[{"id","name","requires_auth","patterns":[{"pattern","content_type"}],
 *                "endpoints":[{"url","priority"}]}]}
 */
Result<std::vector<std::shared_ptr<const PlatformDescriptor>>>
parseDescriptors(std::string_view jsonText);

Result<std::vector<std::shared_ptr<const PlatformDescriptor>>>
loadDescriptorFile(const std::filesystem::path& path);

} // namespace omnifetch::platform
