#include <omnifetch/config/config.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <functional>
#include <limits>
#include <string>
#include <system_error>

namespace omnifetch::config {

namespace {

// Strip an inline "# comment" that follows whitespace and sits outside quotes.
std::string strip_inline_comment(const std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(v[i - 1])))) {
            std::string out = v.substr(0, i);
            trim(out);
            return out;
        }
    }
    return v;
}

template <typename Fn> void for_each_entry(const std::filesystem::path& config_path, Fn&& fn) {
    std::ifstream file(config_path);
    if (!file) {
        return;
    }

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);
        v = strip_inline_comment(v);

        // Support both "downloader.max_concurrency" and "[downloader] max_concurrency"
        std::string section = currentSection;
        if (auto dot = k.find('.'); dot != std::string::npos && currentSection.empty()) {
            section = k.substr(0, dot);
            k = k.substr(dot + 1);
        }
        fn(section, k, unquote(v));
    }
}

std::optional<long long> to_integer(const std::string& s) {
    if (s.empty())
        return std::nullopt;
    try {
        size_t pos = 0;
        long long v = std::stoll(s, &pos);
        if (pos != s.size())
            return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> to_bool(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "1" || s == "yes" || s == "on")
        return true;
    if (s == "false" || s == "0" || s == "no" || s == "off")
        return false;
    return std::nullopt;
}

std::string env_name_for(const std::string& key) {
    std::string name = "OMNIFETCH_";
    for (unsigned char c : key) {
        name.push_back(static_cast<char>(std::toupper(c)));
    }
    return name;
}

} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::string found;
    bool have = false;
    for_each_entry(config_path,
                   [&](const std::string& sec, const std::string& k, const std::string& v) {
                       if (!have && (section.empty() || sec == section) && k == key) {
                           found = v;
                           have = true;
                       }
                   });
    return found;
}

std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section) {
    std::map<std::string, std::string> out;
    for_each_entry(config_path,
                   [&](const std::string& sec, const std::string& k, const std::string& v) {
                       if (sec == section) {
                           out[k] = v;
                       }
                   });
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv && *homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "omnifetch" / "config.toml";
    }
    return configHome / "omnifetch" / "config.toml";
}

std::filesystem::path get_default_download_dir() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    const char* homeEnv = std::getenv("HOME");
    if (xdgDataHome && *xdgDataHome) {
        return std::filesystem::path(xdgDataHome) / "omnifetch" / "downloads";
    }
    if (homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".local" / "share" / "omnifetch" / "downloads";
    }
    return std::filesystem::current_path() / "downloads";
}

const char* to_string(ChecksumAlgorithm algo) {
    switch (algo) {
        case ChecksumAlgorithm::Sha256:
            return "sha256";
        case ChecksumAlgorithm::Sha512:
            return "sha512";
        case ChecksumAlgorithm::Md5:
            return "md5";
    }
    return "sha256";
}

std::optional<ChecksumAlgorithm> parse_checksum_algorithm(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "sha256" || lower == "sha-256")
        return ChecksumAlgorithm::Sha256;
    if (lower == "sha512" || lower == "sha-512")
        return ChecksumAlgorithm::Sha512;
    if (lower == "md5")
        return ChecksumAlgorithm::Md5;
    return std::nullopt;
}

Result<void> validate(const OrchestratorConfig& config) {
    if (config.maxConcurrency <= 0) {
        return Error{ErrorCode::InvalidArgument, "max_concurrency must be positive"};
    }
    if (config.baseDelay.count() < 0) {
        return Error{ErrorCode::InvalidArgument, "base_delay_ms must not be negative"};
    }
    if (config.maxDelay < config.baseDelay) {
        return Error{ErrorCode::InvalidArgument, "max_delay_ms must be >= base_delay_ms"};
    }
    if (config.maxAttemptsPerJob <= 0) {
        return Error{ErrorCode::InvalidArgument, "max_attempts_per_job must be positive"};
    }
    if (config.chunkSizeBytes == 0) {
        return Error{ErrorCode::InvalidArgument, "chunk_size_bytes must be positive"};
    }
    if (config.bandwidthLimitBytesPerSec && *config.bandwidthLimitBytesPerSec == 0) {
        return Error{ErrorCode::InvalidArgument,
                     "bandwidth_limit_bytes_per_sec must be positive when set"};
    }
    if (config.downloadDir.empty()) {
        return Error{ErrorCode::InvalidArgument, "download_dir must not be empty"};
    }
    if (!is_log_level(config.logLevel)) {
        return Error{ErrorCode::InvalidArgument, "Unknown log_level '" + config.logLevel + "'"};
    }
    return {};
}

Result<OrchestratorConfig> load_config(const std::filesystem::path& configPath) {
    OrchestratorConfig cfg;
    cfg.downloadDir = get_default_download_dir();

    const auto path = get_config_path(configPath.string());
    std::map<std::string, std::string> values;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        values = parse_config_section(path, "downloader");
        spdlog::debug("Loaded {} [downloader] keys from {}", values.size(), path.string());
    }

    // Environment overrides file values
    static const char* kKeys[] = {"max_concurrency",
                                  "base_delay_ms",
                                  "max_delay_ms",
                                  "max_attempts_per_job",
                                  "bandwidth_limit_bytes_per_sec",
                                  "download_dir",
                                  "chunk_size_bytes",
                                  "connect_timeout_ms",
                                  "stall_timeout_ms",
                                  "checksum_algorithm",
                                  "user_agent",
                                  "allow_direct_fallback",
                                  "job_retention_seconds",
                                  "progress_interval_ms",
                                  "healing_log_path",
                                  "health_cooldown_ms",
                                  "log_level",
                                  "proxy",
                                  "tls_insecure",
                                  "ca_path",
                                  "follow_redirects"};
    for (const char* key : kKeys) {
        if (const char* env = std::getenv(env_name_for(key).c_str()); env && *env) {
            values[key] = env;
        }
    }

    auto bad = [](const std::string& key, const std::string& value) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid value for " + key + ": '" + value + "'"};
    };

    // Setters return false when the value does not fit the option
    auto toInt = [](long long v, int& out) {
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
            return false;
        out = static_cast<int>(v);
        return true;
    };
    auto toMillis = [](long long v, std::chrono::milliseconds& out) {
        out = std::chrono::milliseconds(v);
        return true;
    };
    using IntSetter = std::function<bool(long long)>;
    const std::map<std::string, IntSetter> intKeys = {
        {"max_concurrency", [&](long long v) { return toInt(v, cfg.maxConcurrency); }},
        {"base_delay_ms", [&](long long v) { return toMillis(v, cfg.baseDelay); }},
        {"max_delay_ms", [&](long long v) { return toMillis(v, cfg.maxDelay); }},
        {"max_attempts_per_job", [&](long long v) { return toInt(v, cfg.maxAttemptsPerJob); }},
        {"bandwidth_limit_bytes_per_sec",
         [&](long long v) {
             if (v > 0)
                 cfg.bandwidthLimitBytesPerSec = static_cast<std::uint64_t>(v);
             else
                 cfg.bandwidthLimitBytesPerSec.reset();
             return true;
         }},
        {"chunk_size_bytes",
         [&](long long v) {
             cfg.chunkSizeBytes = v > 0 ? static_cast<std::size_t>(v) : 0;
             return true;
         }},
        {"connect_timeout_ms", [&](long long v) { return toMillis(v, cfg.connectTimeout); }},
        {"stall_timeout_ms", [&](long long v) { return toMillis(v, cfg.stallTimeout); }},
        {"job_retention_seconds",
         [&](long long v) {
             cfg.jobRetention = std::chrono::seconds(v);
             return true;
         }},
        {"progress_interval_ms", [&](long long v) { return toMillis(v, cfg.progressInterval); }},
        {"health_cooldown_ms", [&](long long v) { return toMillis(v, cfg.healthCooldown); }},
    };

    for (const auto& [key, value] : values) {
        if (auto it = intKeys.find(key); it != intKeys.end()) {
            auto parsed = to_integer(value);
            if (!parsed || !it->second(*parsed)) {
                return bad(key, value);
            }
        } else if (key == "download_dir") {
            cfg.downloadDir = expand_tilde(value);
        } else if (key == "checksum_algorithm") {
            auto algo = parse_checksum_algorithm(value);
            if (!algo) {
                return bad(key, value);
            }
            cfg.checksumAlgorithm = *algo;
        } else if (key == "user_agent") {
            cfg.userAgent = value;
        } else if (key == "allow_direct_fallback") {
            auto b = to_bool(value);
            if (!b) {
                return bad(key, value);
            }
            cfg.allowDirectFallback = *b;
        } else if (key == "healing_log_path") {
            if (value.empty())
                cfg.healingLogPath.reset();
            else
                cfg.healingLogPath = expand_tilde(value);
        } else if (key == "log_level") {
            cfg.logLevel = value;
        } else if (key == "proxy") {
            if (value.empty())
                cfg.proxy.reset();
            else
                cfg.proxy = value;
        } else if (key == "tls_insecure" || key == "follow_redirects") {
            auto b = to_bool(value);
            if (!b) {
                return bad(key, value);
            }
            (key == "tls_insecure" ? cfg.tlsInsecure : cfg.followRedirects) = *b;
        } else if (key == "ca_path") {
            cfg.caPath = value.empty() ? std::filesystem::path{} : expand_tilde(value);
        } else {
            spdlog::warn("Ignoring unknown [downloader] key '{}'", key);
        }
    }

    if (auto v = validate(cfg); !v) {
        return v.error();
    }
    return cfg;
}

bool is_log_level(std::string_view level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
           level == "warning" || level == "error" || level == "off";
}

void apply_log_level(const std::string& level) {
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "warn" || level == "warning") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

} // namespace omnifetch::config
