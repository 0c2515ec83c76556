#include <pugixml.hpp>

#include "../../core/types/constants.hpp"
#include "../../utils/html/document.hpp"
#include "../../utils/text/string_utils.hpp"
#include "http_scraper.hpp"

namespace Harvest {
namespace Scrapers {

using namespace Harvest::Utils;

namespace {

std::string child_text(const pugi::xml_node& parent, const char* name) {
    return Text::squash_whitespace(parent.child(name).text().get());
}

// Descriptions carry an HTML fragment once the XML escapes are undone.
std::string description_text(const std::string& fragment) {
    if (fragment.find('<') == std::string::npos && fragment.find('&') == std::string::npos)
        return Text::squash_whitespace(fragment);
    Html::Document doc(fragment);
    return Html::Document::text(doc.root());
}

}  // namespace

std::string RssScraper::target_url(const std::string&                url,
                                   const std::optional<std::string>& search_word) const {
    std::string trimmed = Text::trim(url);
    if (!trimmed.empty())
        return trimmed;

    std::string term = search_word ? Text::trim(*search_word) : "";
    if (term.empty())
        term = Core::Constants::DEFAULT_RSS_TERM;
    return std::string(Core::Constants::RSS_SEARCH_URL) + Text::url_encode(term)
           + Core::Constants::RSS_SEARCH_SUFFIX;
}

bool RssScraper::filters_records(const std::string& url) const {
    return !Text::trim(url).empty();
}

FetchResponse RssScraper::parse(const std::string& body, const std::string& page_url) const {
    pugi::xml_document     doc;
    pugi::xml_parse_result result = doc.load_buffer(body.data(), body.size());
    if (!result) {
        return FetchResponse::failure(ErrorType::Structure,
                                      "XML parsing error in " + page_url + ": "
                                          + result.description() + " at #"
                                          + std::to_string(result.offset));
    }

    pugi::xml_node root = doc.document_element();
    std::string    root_name = root.name();
    pugi::xml_node channel;
    if (root_name == "rss")
        channel = root.child("channel");
    else if (root_name == "channel")
        channel = root;
    if (!channel)
        return FetchResponse::failure(ErrorType::Structure, "Not an RSS feed: " + page_url);

    Core::Records records;
    for (pugi::xml_node item : channel.children("item")) {
        std::string title = child_text(item, "title");
        if (title.empty())
            continue;

        Core::Record record{{"title", title}};
        if (std::string link = child_text(item, "link"); !link.empty())
            record["url"] = link;

        std::string published = child_text(item, "pubDate");
        if (published.empty())
            published = child_text(item, "dc:date");
        if (!published.empty())
            record["published"] = published;

        if (std::string summary = description_text(item.child("description").text().get());
            !summary.empty())
            record["summary"] = summary;
        if (std::string source = child_text(item, "source"); !source.empty())
            record["source"] = source;

        records.push_back(std::move(record));
    }

    return FetchResponse::ok(std::move(records));
}

}  // namespace Scrapers
}  // namespace Harvest
