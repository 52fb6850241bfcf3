/*
 * Running digest over OpenSSL EVP (sha256, sha512, md5).
 *
 * hexDigest() finalizes a copy of the context (EVP_MD_CTX_copy_ex), leaving the live context
 * open for further update() calls.
 */

#include <omnifetch/transfer/transfer.hpp>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <vector>

namespace omnifetch::transfer {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

const EVP_MD* resolve_algo(ChecksumAlgorithm algo) {
    switch (algo) {
        case ChecksumAlgorithm::Sha256:
            return EVP_sha256();
        case ChecksumAlgorithm::Sha512:
            return EVP_sha512();
        case ChecksumAlgorithm::Md5:
            return EVP_md5();
    }
    return EVP_sha256();
}

std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

} // namespace

struct Hasher::Impl {
    EvpMdCtx md;
    bool ok{false};
};

Hasher::Hasher(ChecksumAlgorithm algo) : algo_(algo), impl_(std::make_unique<Impl>()) {
    reset();
}

Hasher::~Hasher() = default;
Hasher::Hasher(Hasher&&) noexcept = default;
Hasher& Hasher::operator=(Hasher&&) noexcept = default;

void Hasher::reset() {
    impl_->ok = impl_->md && EVP_DigestInit_ex(impl_->md.ctx, resolve_algo(algo_), nullptr) == 1;
    if (!impl_->ok) {
        spdlog::error("EVP_DigestInit_ex failed for {}", config::to_string(algo_));
    }
}

void Hasher::update(ByteSpan data) {
    if (!impl_->ok || data.empty())
        return;
    if (EVP_DigestUpdate(impl_->md.ctx, data.data(), data.size()) != 1) {
        impl_->ok = false;
        spdlog::error("EVP_DigestUpdate failed");
    }
}

Result<void> Hasher::updateFromFile(const std::filesystem::path& path, std::uint64_t bytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Cannot open for hashing: " + path.string()};
    }
    std::vector<char> buf(64 * 1024);
    std::uint64_t remaining = bytes;
    while (remaining > 0) {
        const auto want = static_cast<std::streamsize>(
            std::min<std::uint64_t>(remaining, static_cast<std::uint64_t>(buf.size())));
        in.read(buf.data(), want);
        const auto got = in.gcount();
        if (got <= 0) {
            return Error{ErrorCode::IoError, "Short read while hashing " + path.string()};
        }
        update(ByteSpan{reinterpret_cast<const std::byte*>(buf.data()),
                        static_cast<std::size_t>(got)});
        remaining -= static_cast<std::uint64_t>(got);
    }
    return {};
}

std::string Hasher::hexDigest() const {
    if (!impl_->ok)
        return {};
    EvpMdCtx copy;
    if (!copy || EVP_MD_CTX_copy_ex(copy.ctx, impl_->md.ctx) != 1) {
        return {};
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
    unsigned md_len = 0;
    if (EVP_DigestFinal_ex(copy.ctx, md_buf.data(), &md_len) != 1) {
        return {};
    }
    return to_hex_lower(md_buf.data(), md_len);
}

} // namespace omnifetch::transfer
