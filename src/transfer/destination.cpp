#include <omnifetch/transfer/transfer.hpp>

#include <chrono>
#include <cctype>
#include <string>
#include <system_error>

namespace omnifetch::transfer {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string percentDecode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

} // namespace

std::string filenameFromUrl(std::string_view url) {
    auto cut = url.find_first_of("?#");
    std::string_view path = url.substr(0, cut);
    if (auto scheme = path.find("://"); scheme != std::string_view::npos) {
        path = path.substr(scheme + 3);
        auto slash = path.find('/');
        path = slash == std::string_view::npos ? std::string_view{} : path.substr(slash);
    }
    while (!path.empty() && path.back() == '/')
        path.remove_suffix(1);
    auto lastSlash = path.rfind('/');
    std::string name =
        percentDecode(lastSlash == std::string_view::npos ? path : path.substr(lastSlash + 1));

    for (auto& c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || uc < 0x20 || c == ':' || c == '*' || c == '?' || c == '"' ||
            c == '<' || c == '>' || c == '|') {
            c = '_';
        }
    }
    if (name.empty() || name == "." || name == "..") {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
        name = "download_" + std::to_string(ms);
    }
    return name;
}

std::filesystem::path resolveDestination(const std::filesystem::path& downloadDir,
                                         const std::optional<std::filesystem::path>& hint,
                                         std::string_view url) {
    if (!hint || hint->empty()) {
        return downloadDir / filenameFromUrl(url);
    }
    std::filesystem::path base = hint->is_absolute() ? *hint : downloadDir / *hint;
    std::error_code ec;
    const auto hintString = hint->string();
    const bool dirHint = std::filesystem::is_directory(base, ec) ||
                         (!hintString.empty() && (hintString.back() == '/'));
    if (dirHint) {
        return base / filenameFromUrl(url);
    }
    return base;
}

std::filesystem::path withCollisionSuffix(const std::filesystem::path& path, int n) {
    if (n <= 0) {
        return path;
    }
    auto name = path.stem().string() + " (" + std::to_string(n) + ")" + path.extension().string();
    return path.parent_path() / name;
}

} // namespace omnifetch::transfer
