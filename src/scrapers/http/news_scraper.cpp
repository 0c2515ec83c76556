#include <set>

#include "../../utils/html/document.hpp"
#include "../../utils/url/url.hpp"
#include "http_scraper.hpp"

namespace Harvest {
namespace Scrapers {

using Harvest::Utils::Url;
using Harvest::Utils::Html::Document;

namespace {

// First element following `node` among its siblings, if it is a paragraph.
const GumboNode* next_paragraph(const GumboNode* node) {
    const GumboNode* parent = node->parent;
    if (!parent || parent->type != GUMBO_NODE_ELEMENT)
        return nullptr;

    const GumboVector* siblings = &parent->v.element.children;
    for (size_t i = node->index_within_parent + 1; i < siblings->length; ++i) {
        auto* sibling = static_cast<const GumboNode*>(siblings->data[i]);
        if (sibling->type != GUMBO_NODE_ELEMENT)
            continue;
        return sibling->v.element.tag == GUMBO_TAG_P ? sibling : nullptr;
    }
    return nullptr;
}

}  // namespace

// Every h1-h3 headline that carries a link (inside it or around it) becomes a
// record. A paragraph directly after the headline is its summary.
FetchResponse NewsScraper::parse(const std::string& body, const std::string& page_url) const {
    Document doc(body);
    if (!doc.root())
        return FetchResponse::failure(ErrorType::Structure, "Unparseable HTML: " + page_url);

    Core::Records         records;
    std::set<std::string> seen;

    for (const GumboNode* heading : doc.find_all({GUMBO_TAG_H1, GUMBO_TAG_H2, GUMBO_TAG_H3})) {
        const GumboNode* link    = Document::find_first(heading, {GUMBO_TAG_A});
        const GumboNode* wrapper = heading;
        if (!link) {
            link    = Document::closest(heading, GUMBO_TAG_A);
            wrapper = link;
        }
        if (!link)
            continue;

        std::string url   = Url::resolve(page_url, Document::attribute(link, "href"));
        std::string title = Document::text(heading);
        if (url.empty() || title.empty() || !seen.insert(url).second)
            continue;

        Core::Record record{{"title", title}, {"url", url}};
        if (const GumboNode* p = next_paragraph(wrapper)) {
            std::string summary = Document::text(p);
            if (!summary.empty())
                record["summary"] = summary;
        }
        records.push_back(std::move(record));
    }

    return FetchResponse::ok(std::move(records));
}

}  // namespace Scrapers
}  // namespace Harvest
