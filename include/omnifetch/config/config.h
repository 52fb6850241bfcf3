#pragma once

#include <omnifetch/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace omnifetch::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() <= 2) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a single value from a TOML-style config file. Returns "" when absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse every key/value pair of one section.
std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section);

// Get standard config path ($XDG_CONFIG_HOME/omnifetch/config.toml or ~/.config/...)
std::filesystem::path get_config_path(const std::string& override_path = "");

// Default download directory ($XDG_DATA_HOME/omnifetch/downloads or ~/.local/share/...)
std::filesystem::path get_default_download_dir();

enum class ChecksumAlgorithm { Sha256, Sha512, Md5 };

const char* to_string(ChecksumAlgorithm algo);
std::optional<ChecksumAlgorithm> parse_checksum_algorithm(std::string_view name);

/**
 * Recognized orchestration options.
 *
 * Precedence when loading: environment (OMNIFETCH_<UPPER_KEY>) > [downloader] section of the
 * config file > defaults below.
 */
struct OrchestratorConfig {
    int maxConcurrency{4};
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{60000};
    int maxAttemptsPerJob{6};
    std::optional<std::uint64_t> bandwidthLimitBytesPerSec{};

    std::filesystem::path downloadDir{"downloads"};
    std::size_t chunkSizeBytes{256 * 1024};
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::milliseconds stallTimeout{30000};
    ChecksumAlgorithm checksumAlgorithm{ChecksumAlgorithm::Sha256};
    std::string userAgent{"omnifetch/1.0"};
    bool allowDirectFallback{true};
    std::chrono::seconds jobRetention{3600};
    std::chrono::milliseconds progressInterval{500};
    std::optional<std::filesystem::path> healingLogPath{};
    std::chrono::milliseconds healthCooldown{300000};
    std::string logLevel{"info"};

    // Transport
    std::optional<std::string> proxy{};
    bool tlsInsecure{false};
    std::filesystem::path caPath{}; // empty = system bundle
    bool followRedirects{true};
};

/**
 * Check option consistency. Returns InvalidArgument describing the first violation.
 */
Result<void> validate(const OrchestratorConfig& config);

/**
 * Load configuration from `configPath` (missing file means defaults) and the environment.
 * An empty `configPath` reads the standard location from get_config_path().
 */
Result<OrchestratorConfig> load_config(const std::filesystem::path& configPath);

// trace, debug, info, warn (warning), error, off
bool is_log_level(std::string_view level);

/**
 * Apply `logLevel` to the default spdlog logger.
 */
void apply_log_level(const std::string& level);

} // namespace omnifetch::config
