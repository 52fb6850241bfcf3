#include <omnifetch/platform/platform.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace omnifetch::platform {

namespace {

std::shared_ptr<const PlatformDescriptor> make(std::string id, std::string name,
                                               std::vector<UrlPattern> patterns,
                                               std::vector<CandidateEndpoint> endpoints,
                                               bool requiresAuth = false) {
    return std::make_shared<const PlatformDescriptor>(std::move(id), std::move(patterns),
                                                      std::move(endpoints), requiresAuth,
                                                      std::move(name));
}

} // namespace

std::vector<std::shared_ptr<const PlatformDescriptor>> builtinPlatforms() {
    std::vector<std::shared_ptr<const PlatformDescriptor>> out;

    out.push_back(make("github", "GitHub",
                       {{R"(github\.com/[^/]+/[^/]+/releases/)", "archive"},
                        {R"(gist\.github\.com)", "gist"},
                        {R"(raw\.githubusercontent\.com)", ""},
                        {R"(github\.com)", "repository"}},
                       {{"{raw}", 0}, {"https://ghproxy.net/{raw}", 1}}));

    out.push_back(make("huggingface", "Hugging Face",
                       {{R"((huggingface|hf)\.co/.+/resolve/)", "model"},
                        {R"((huggingface|hf)\.co)", "repository"}},
                       {{"{raw}", 0}, {"https://hf-mirror.com/{raw}", 1}}));

    out.push_back(make("civitai", "CivitAI",
                       {{R"(civitai\.com/api/download/models/)", "model"},
                        {R"(civitai\.com/models/)", "model"},
                        {R"(civitai\.com/images/)", "image"},
                        {R"(civitai\.com)", ""}},
                       {{"{raw}", 0}, {"https://civitai.com/api/v1/models?url={url}", 1}}));

    out.push_back(make("youtube", "YouTube",
                       {{R"((youtube\.com/(watch|shorts)|youtu\.be/))", "video"},
                        {R"(youtube\.com/(playlist|@|channel/))", "gallery"}},
                       {{"https://www.youtube.com/oembed?url={url}", 0},
                        {"https://noembed.com/embed?url={url}", 1},
                        {"https://www.youtube.com/get_video_info?url={url}", 2}}));

    out.push_back(make("instagram", "Instagram",
                       {{R"((instagram\.com|instagr\.am)/(p|reel|tv)/)", "post"},
                        {R"((instagram\.com|instagr\.am))", "profile"}},
                       {{"https://api.igram.io/api/convert?url={url}", 0},
                        {"https://snapinsta.app/api/convert?url={url}", 1},
                        {"https://saveig.app/api/ajaxSearch?url={url}", 2},
                        {"https://fastdl.app/api/convert?url={url}", 3},
                        {"https://instadownloader.co/api?url={url}", 4},
                        {"https://instasave.io/api?url={url}", 5}}));

    out.push_back(make("tiktok", "TikTok", {{R"(tiktok\.com/.+/video/)", "video"},
                                            {R"(tiktok\.com)", "profile"}},
                       {{"https://tikwm.com/api/?url={url}", 0},
                        {"https://tiktokdownloader.io/api?url={url}", 1},
                        {"https://snaptik.app/api?url={url}", 2},
                        {"https://musicaldown.com/api?url={url}", 3}}));

    out.push_back(make("twitter", "Twitter / X",
                       {{R"(^https?://(www\.|mobile\.)?(twitter\.com|x\.com)/[^/]+/status/)", "post"},
                        {R"(^https?://(www\.|mobile\.)?(twitter\.com|x\.com))", "profile"}},
                       {{"https://twitsave.com/api?url={url}", 0},
                        {"https://twittervideodownloader.com/api?url={url}", 1},
                        {"https://ssstwitter.com/api?url={url}", 2}}));

    out.push_back(make("reddit", "Reddit",
                       {{R"((reddit\.com|redd\.it)/r/[^/]+/comments/)", "post"},
                        {R"(v\.redd\.it|i\.redd\.it)", ""},
                        {R"((reddit\.com|redd\.it))", "gallery"}},
                       {{"{raw}.json", 0}, {"{raw}", 1}}));

    out.push_back(make("telegram", "Telegram", {{R"(^https?://(t\.me|telegram\.(me|org))/)", ""}},
                       {{"{raw}?embed=1", 0}, {"{raw}", 1}},
                       /*requiresAuth=*/true));

    out.push_back(make("archive", "Internet Archive",
                       {{R"(archive\.org/download/)", ""}, {R"(archive\.org/details/)", "gallery"}},
                       {{"{raw}", 0}, {"https://ia800000.us.archive.org/fetch?url={url}", 1}}));

    // Catch-all; must stay last so specific platforms win
    out.push_back(make("generic", "Generic", {{R"(^https?://)", ""}}, {{"{raw}", 0}}));

    return out;
}

std::string detectContentType(std::string_view url) {
    static const std::regex kQueryCut(R"([?#].*$)");
    static const std::vector<std::pair<std::regex, const char*>> kExtensions = {
        {std::regex(R"(\.(jpg|jpeg|png|gif|webp|avif|bmp|svg|ico)$)", std::regex::icase), "image"},
        {std::regex(R"(\.(mp4|webm|mkv|avi|mov|wmv|flv|m4v)$)", std::regex::icase), "video"},
        {std::regex(R"(\.(mp3|wav|flac|aac|ogg|m4a|wma)$)", std::regex::icase), "audio"},
        {std::regex(R"(\.(safetensors|ckpt|pt|pth|bin|onnx|gguf)$)", std::regex::icase), "model"},
        {std::regex(R"(\.(zip|rar|7z|tar|gz|bz2|xz|tgz)$)", std::regex::icase), "archive"},
        {std::regex(R"(\.(pdf|doc|docx|txt|md|rtf|epub)$)", std::regex::icase), "document"},
    };
    static const std::vector<std::pair<std::regex, const char*>> kPaths = {
        {std::regex(R"(/models?/)", std::regex::icase), "model"},
        {std::regex(R"(/images?/)", std::regex::icase), "image"},
        {std::regex(R"(/videos?/)", std::regex::icase), "video"},
        {std::regex(R"(/gallery)", std::regex::icase), "gallery"},
        {std::regex(R"(/(user|profile|@))", std::regex::icase), "profile"},
        {std::regex(R"(/articles?/)", std::regex::icase), "article"},
        {std::regex(R"(/(posts?|status))", std::regex::icase), "post"},
        {std::regex(R"(/(repo|repository))", std::regex::icase), "repository"},
        {std::regex(R"(/gist/)", std::regex::icase), "gist"},
    };

    const std::string full(url);
    const std::string path = std::regex_replace(full, kQueryCut, "");
    for (const auto& [re, tag] : kExtensions) {
        if (std::regex_search(path, re))
            return tag;
    }
    for (const auto& [re, tag] : kPaths) {
        if (std::regex_search(path, re))
            return tag;
    }
    return "unknown";
}

} // namespace omnifetch::platform
