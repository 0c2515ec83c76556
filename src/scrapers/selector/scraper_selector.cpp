#include "scraper_selector.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Harvest {
namespace Scrapers {

std::optional<ScraperKind> parse_kind(const std::string& type) {
    std::string key = Utils::Text::to_lower(Utils::Text::trim(type));
    if (key == "news")
        return ScraperKind::News;
    if (key == "rss")
        return ScraperKind::Rss;
    if (key == "blog")
        return ScraperKind::Blog;
    return std::nullopt;
}

std::string to_string(ScraperKind kind) {
    switch (kind) {
        case ScraperKind::News: return "news";
        case ScraperKind::Rss: return "rss";
        case ScraperKind::Blog: return "blog";
    }
    return "unknown";
}

const std::vector<ScraperKind>& all_kinds() {
    static const std::vector<ScraperKind> kinds = {
        ScraperKind::News, ScraperKind::Rss, ScraperKind::Blog};
    return kinds;
}

std::string supported_kinds() {
    std::vector<std::string> names;
    for (auto kind : all_kinds())
        names.push_back(to_string(kind));
    return Utils::Text::join(names, ", ");
}

Resolution Resolution::resolved(std::unique_ptr<Scraper> scraper) {
    Resolution r;
    r.scraper = std::move(scraper);
    return r;
}

Resolution Resolution::failure(std::string error) {
    Resolution r;
    r.error = std::move(error);
    return r;
}

}  // namespace Scrapers
}  // namespace Harvest
