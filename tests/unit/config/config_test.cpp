#include <gtest/gtest.h>

#include <omnifetch/config/config.h>
#include <spdlog/spdlog.h>

#include "../../common/test_helpers.h"

#include <cstdlib>

using namespace omnifetch;
using namespace omnifetch::config;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name))
            old_ = old;
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() {
        if (old_)
            ::setenv(name_.c_str(), old_->c_str(), 1);
        else
            ::unsetenv(name_.c_str());
    }

private:
    std::string name_;
    std::optional<std::string> old_;
};

} // namespace

TEST(ConfigParseTest, ReadsSectionValuesAndStripsCommentsAndQuotes) {
    tests::TempDir dir;
    auto path = tests::write_file(dir / "config.toml", R"(# top comment
[other]
max_concurrency = 99

[downloader]
max_concurrency = 8   # inline comment
user_agent = "agent # not a comment"
download_dir = '/tmp/x'
)");

    EXPECT_EQ(parse_config_value(path, "downloader", "max_concurrency"), "8");
    EXPECT_EQ(parse_config_value(path, "other", "max_concurrency"), "99");
    EXPECT_EQ(parse_config_value(path, "downloader", "user_agent"), "agent # not a comment");
    EXPECT_EQ(parse_config_value(path, "downloader", "missing"), "");

    auto section = parse_config_section(path, "downloader");
    EXPECT_EQ(section.size(), 3u);
    EXPECT_EQ(section["download_dir"], "/tmp/x");
}

TEST(ConfigParseTest, DottedKeysOutsideSections) {
    tests::TempDir dir;
    auto path = tests::write_file(dir / "c.toml", "downloader.max_attempts_per_job = 3\n");
    EXPECT_EQ(parse_config_value(path, "downloader", "max_attempts_per_job"), "3");
}

TEST(ConfigLoadTest, MissingFileYieldsDefaults) {
    tests::TempDir dir;
    auto cfg = load_config(dir / "nope.toml");
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().maxConcurrency, 4);
    EXPECT_EQ(cfg.value().baseDelay.count(), 1000);
    EXPECT_EQ(cfg.value().maxDelay.count(), 60000);
    EXPECT_EQ(cfg.value().maxAttemptsPerJob, 6);
    EXPECT_FALSE(cfg.value().bandwidthLimitBytesPerSec.has_value());
    EXPECT_EQ(cfg.value().checksumAlgorithm, ChecksumAlgorithm::Sha256);
}

TEST(ConfigLoadTest, FileValuesAndEnvironmentPrecedence) {
    tests::TempDir dir;
    auto path = tests::write_file(dir / "config.toml", R"([downloader]
max_concurrency = 2
base_delay_ms = 250
max_delay_ms = 4000
bandwidth_limit_bytes_per_sec = 1048576
checksum_algorithm = "sha512"
allow_direct_fallback = false
healing_log_path = "/tmp/heal.jsonl"
)");
    ScopedEnv env("OMNIFETCH_MAX_CONCURRENCY", "6");

    auto cfg = load_config(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().maxConcurrency, 6);
    EXPECT_EQ(cfg.value().baseDelay.count(), 250);
    EXPECT_EQ(cfg.value().maxDelay.count(), 4000);
    ASSERT_TRUE(cfg.value().bandwidthLimitBytesPerSec.has_value());
    EXPECT_EQ(*cfg.value().bandwidthLimitBytesPerSec, 1048576u);
    EXPECT_EQ(cfg.value().checksumAlgorithm, ChecksumAlgorithm::Sha512);
    EXPECT_FALSE(cfg.value().allowDirectFallback);
    ASSERT_TRUE(cfg.value().healingLogPath.has_value());
    EXPECT_EQ(cfg.value().healingLogPath->string(), "/tmp/heal.jsonl");
}

TEST(ConfigLoadTest, RejectsMalformedAndInconsistentValues) {
    tests::TempDir dir;
    auto notNumber = tests::write_file(dir / "a.toml", "[downloader]\nmax_concurrency = lots\n");
    auto r1 = load_config(notNumber);
    ASSERT_FALSE(r1);
    EXPECT_EQ(r1.error().code, ErrorCode::InvalidArgument);

    auto inverted =
        tests::write_file(dir / "b.toml", "[downloader]\nbase_delay_ms = 500\nmax_delay_ms = 100\n");
    auto r2 = load_config(inverted);
    ASSERT_FALSE(r2);
    EXPECT_NE(r2.error().message.find("max_delay_ms"), std::string::npos);

    auto badAlgo = tests::write_file(dir / "c.toml", "[downloader]\nchecksum_algorithm = crc32\n");
    EXPECT_FALSE(load_config(badAlgo));
}

TEST(ConfigValidateTest, Bounds) {
    OrchestratorConfig cfg;
    EXPECT_TRUE(validate(cfg));

    cfg.maxConcurrency = 0;
    EXPECT_FALSE(validate(cfg));
    cfg.maxConcurrency = 1;

    cfg.maxAttemptsPerJob = 0;
    EXPECT_FALSE(validate(cfg));
    cfg.maxAttemptsPerJob = 1;

    cfg.chunkSizeBytes = 0;
    EXPECT_FALSE(validate(cfg));
    cfg.chunkSizeBytes = 1;

    cfg.bandwidthLimitBytesPerSec = 0;
    EXPECT_FALSE(validate(cfg));
}

TEST(ConfigTest, ChecksumAlgorithmNames) {
    EXPECT_EQ(parse_checksum_algorithm("SHA-256"), ChecksumAlgorithm::Sha256);
    EXPECT_EQ(parse_checksum_algorithm("sha512"), ChecksumAlgorithm::Sha512);
    EXPECT_EQ(parse_checksum_algorithm("md5"), ChecksumAlgorithm::Md5);
    EXPECT_FALSE(parse_checksum_algorithm("blake3").has_value());
    EXPECT_STREQ(to_string(ChecksumAlgorithm::Sha512), "sha512");
}

TEST(ConfigTest, ExpandTildeUsesHome) {
    ScopedEnv home("HOME", "/home/tester");
    EXPECT_EQ(expand_tilde("~/dl").string(), "/home/tester/dl");
    EXPECT_EQ(expand_tilde("/abs").string(), "/abs");
}

TEST(ConfigLoadTest, LogLevelIsReadValidatedAndApplied) {
    tests::TempDir dir;
    {
        ScopedEnv level("OMNIFETCH_LOG_LEVEL", "debug");
        auto cfg = load_config(dir / "none.toml");
        ASSERT_TRUE(cfg) << cfg.error().message;
        EXPECT_EQ(cfg.value().logLevel, "debug");
        apply_log_level(cfg.value().logLevel);
        EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    }
    apply_log_level("warning");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    apply_log_level("info");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);

    auto loud = tests::write_file(dir / "loud.toml", "[downloader]\nlog_level = loud\n");
    auto r = load_config(loud);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(r.error().message.find("log_level"), std::string::npos);
}

TEST(ConfigLoadTest, EmptyPathReadsStandardLocation) {
    tests::TempDir dir;
    ScopedEnv xdg("XDG_CONFIG_HOME", dir.path().c_str());
    EXPECT_EQ(get_config_path(), dir / "omnifetch" / "config.toml");
    EXPECT_EQ(get_config_path("/etc/of.toml").string(), "/etc/of.toml");

    tests::write_file(dir / "omnifetch" / "config.toml", "[downloader]\nmax_attempts_per_job = 9\n");
    auto cfg = load_config({});
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().maxAttemptsPerJob, 9);
}

TEST(ConfigLoadTest, RejectsIntegersThatDoNotFit) {
    tests::TempDir dir;
    auto wide = tests::write_file(dir / "wide.toml", "[downloader]\nmax_concurrency = 4294967297\n");
    auto r1 = load_config(wide);
    ASSERT_FALSE(r1);
    EXPECT_EQ(r1.error().code, ErrorCode::InvalidArgument);

    auto attempts =
        tests::write_file(dir / "attempts.toml", "[downloader]\nmax_attempts_per_job = -4294967295\n");
    EXPECT_FALSE(load_config(attempts));
}

TEST(ConfigLoadTest, TransportKeys) {
    tests::TempDir dir;
    auto path = tests::write_file(dir / "net.toml", R"([downloader]
proxy = "socks5h://127.0.0.1:9050"
tls_insecure = true
ca_path = "/etc/ssl/mirror.pem"
follow_redirects = no
)");
    auto cfg = load_config(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    ASSERT_TRUE(cfg.value().proxy.has_value());
    EXPECT_EQ(*cfg.value().proxy, "socks5h://127.0.0.1:9050");
    EXPECT_TRUE(cfg.value().tlsInsecure);
    EXPECT_EQ(cfg.value().caPath.string(), "/etc/ssl/mirror.pem");
    EXPECT_FALSE(cfg.value().followRedirects);

    auto bad = tests::write_file(dir / "bad.toml", "[downloader]\nfollow_redirects = sometimes\n");
    EXPECT_FALSE(load_config(bad));
}
