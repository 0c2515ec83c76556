#include "url.hpp"
#include <sstream>
#include <string_view>
#include <vector>
#include "../text/string_utils.hpp"

namespace Harvest {
namespace Utils {

namespace {

std::string authority_of(const UrlParsed& p) {
    return p.port.empty() ? p.host : p.host + ":" + p.port;
}

// Collapses "." and ".." segments, keeping a trailing slash.
std::string normalize_path(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment.empty() || segment == ".")
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string out = "/" + Text::join(segments, "/");
    if (path.size() > 1 && path.back() == '/' && out.back() != '/')
        out += '/';
    return out;
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed        parsed;
    std::string_view sv = url;

    size_t colon = sv.find(':');
    size_t stop  = sv.find_first_of("/?#");
    if (colon != std::string_view::npos && (stop == std::string_view::npos || colon < stop)) {
        parsed.scheme = Text::to_lower(std::string(sv.substr(0, colon)));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t           end       = sv.find_first_of("/?#");
        std::string_view authority = sv.substr(0, end);
        sv                         = end == std::string_view::npos ? "" : sv.substr(end);

        size_t at = authority.rfind('@');
        if (at != std::string_view::npos)
            authority.remove_prefix(at + 1);

        size_t bracket = authority.find(']');
        size_t port    = authority.rfind(':');
        if (port != std::string_view::npos
            && (bracket == std::string_view::npos || port > bracket)) {
            parsed.host = std::string(authority.substr(0, port));
            parsed.port = std::string(authority.substr(port + 1));
        }
        else {
            parsed.host = std::string(authority);
        }
    }

    size_t path_end = sv.find_first_of("?#");
    parsed.path     = std::string(sv.substr(0, path_end));
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    std::string rel = Text::trim(relative);
    if (rel.empty() || rel[0] == '#')
        return "";

    if (rel.find("://") != std::string::npos)
        return is_http(rel) ? rel : "";

    // mailto:, javascript:, tel: ...
    size_t colon = rel.find(':');
    if (colon != std::string::npos && colon < rel.find_first_of("/?#"))
        return "";

    UrlParsed b = parse(base);
    if (b.host.empty())
        return "";

    if (Text::starts_with(rel, "//"))
        return b.scheme + ":" + rel;

    std::string target;
    if (rel[0] == '?') {
        target = b.path + rel;
    }
    else if (rel[0] == '/') {
        target = rel;
    }
    else {
        std::string dir = b.path.substr(0, b.path.find_last_of('/') + 1);
        target          = dir + rel;
    }

    size_t      qf    = target.find_first_of("?#");
    std::string path  = target.substr(0, qf);
    std::string query = qf == std::string::npos ? "" : target.substr(qf);
    return b.scheme + "://" + authority_of(b) + normalize_path(path) + query;
}

bool Url::is_http(const std::string& url) {
    return Text::starts_with(Text::to_lower(url), "http://")
           || Text::starts_with(Text::to_lower(url), "https://");
}

}  // namespace Utils
}  // namespace Harvest
