#include <omnifetch/transfer/transfer.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace omnifetch::transfer {

namespace {

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::optional<std::uint64_t> parseUnsigned(std::string_view s) {
    s = trimView(s);
    if (s.empty())
        return std::nullopt;
    std::uint64_t v = 0;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || p != s.data() + s.size())
        return std::nullopt;
    return v;
}

} // namespace

void setHeader(std::vector<Header>& headers, std::string_view name, std::string value) {
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [&](const Header& h) { return iequals(h.name, name); }),
                  headers.end());
    headers.push_back({std::string(name), std::move(value)});
}

std::optional<std::string> HttpResponseHead::header(std::string_view name) const {
    for (const auto& h : headers) {
        if (iequals(h.name, name))
            return h.value;
    }
    return std::nullopt;
}

std::optional<ContentRange> parseContentRange(std::string_view value) {
    value = trimView(value);
    constexpr std::string_view kUnit = "bytes";
    if (value.size() <= kUnit.size() || !iequals(value.substr(0, kUnit.size()), kUnit))
        return std::nullopt;
    value = trimView(value.substr(kUnit.size()));

    auto slash = value.find('/');
    if (slash == std::string_view::npos)
        return std::nullopt;
    auto range = trimView(value.substr(0, slash));
    auto total = trimView(value.substr(slash + 1));

    ContentRange out;
    if (total != "*") {
        auto t = parseUnsigned(total);
        if (!t)
            return std::nullopt;
        out.total = *t;
    }

    if (range == "*") {
        if (!out.total)
            return std::nullopt;
        return out;
    }
    auto dash = range.find('-');
    if (dash == std::string_view::npos)
        return std::nullopt;
    auto start = parseUnsigned(range.substr(0, dash));
    auto end = parseUnsigned(range.substr(dash + 1));
    if (!start || !end || *end < *start)
        return std::nullopt;
    out.start = *start;
    out.end = *end;
    return out;
}

std::optional<std::uint64_t> parseContentLength(std::string_view value) {
    return parseUnsigned(value);
}

std::optional<std::chrono::seconds> parseRetryAfter(std::string_view value,
                                                    std::chrono::system_clock::time_point now) {
    value = trimView(value);
    if (value.empty())
        return std::nullopt;
    if (auto secs = parseUnsigned(value)) {
        return std::chrono::seconds(static_cast<std::int64_t>(*secs));
    }
    const std::string date(value);
    const time_t at = curl_getdate(date.c_str(), nullptr);
    if (at == -1)
        return std::nullopt;
    const auto when = std::chrono::system_clock::from_time_t(at);
    if (when <= now)
        return std::chrono::seconds(0);
    return std::chrono::ceil<std::chrono::seconds>(when - now);
}

std::string normalizeChecksum(std::string_view value) {
    value = trimView(value);
    if (auto colon = value.find(':'); colon != std::string_view::npos) {
        value = value.substr(colon + 1);
    }
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace omnifetch::transfer
