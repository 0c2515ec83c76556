#include "../../utils/html/document.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"
#include "http_scraper.hpp"

namespace Harvest {
namespace Scrapers {

using Harvest::Utils::Url;
using Harvest::Utils::Html::Document;

BlogScraper::BlogScraper(std::unique_ptr<Network::Http::HttpClient> client,
                         std::string                                default_url)
    : HttpScraper(std::move(client)), default_url_(std::move(default_url)) {
}

std::string BlogScraper::target_url(const std::string& url,
                                    const std::optional<std::string>& /*search_word*/) const {
    std::string trimmed = Utils::Text::trim(url);
    return trimmed.empty() ? default_url_ : trimmed;
}

FetchResponse BlogScraper::parse(const std::string& body, const std::string& page_url) const {
    Document doc(body);
    if (!doc.root())
        return FetchResponse::failure(ErrorType::Structure, "Unparseable HTML: " + page_url);

    Core::Records records;
    for (const GumboNode* article : doc.find_all({GUMBO_TAG_ARTICLE})) {
        const GumboNode* heading =
            Document::find_first(article, {GUMBO_TAG_H1, GUMBO_TAG_H2, GUMBO_TAG_H3});
        if (!heading)
            continue;

        std::string title = Document::text(heading);
        if (title.empty())
            continue;

        Core::Record record{{"title", title}};

        const GumboNode* link = Document::find_first(heading, {GUMBO_TAG_A});
        if (!link)
            link = Document::find_first(article, {GUMBO_TAG_A});
        std::string url = Url::resolve(page_url, Document::attribute(link, "href"));
        if (!url.empty())
            record["url"] = url;

        if (const GumboNode* p = Document::find_first(article, {GUMBO_TAG_P})) {
            std::string summary = Document::text(p);
            if (!summary.empty())
                record["summary"] = summary;
        }

        if (const GumboNode* time = Document::find_first(article, {GUMBO_TAG_TIME})) {
            std::string published = Document::attribute(time, "datetime");
            record["published"]   = published.empty() ? Document::text(time) : published;
        }

        records.push_back(std::move(record));
    }

    return FetchResponse::ok(std::move(records));
}

}  // namespace Scrapers
}  // namespace Harvest
