#include "http_scraper.hpp"
#include <algorithm>

#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Harvest {
namespace Scrapers {

using namespace Harvest::Utils;

namespace {

ErrorType map_error(Network::Http::ErrorType type) {
    switch (type) {
        case Network::Http::ErrorType::Timeout: return ErrorType::Timeout;
        case Network::Http::ErrorType::Http: return ErrorType::Http;
        case Network::Http::ErrorType::Network:
        case Network::Http::ErrorType::Proxy: return ErrorType::Network;
        default: return ErrorType::Other;
    }
}

bool matches(const Core::Record& record, const std::string& word) {
    for (const char* field : {"title", "summary"}) {
        auto it = record.find(field);
        if (it != record.end() && Text::icontains(it->second, word))
            return true;
    }
    return false;
}

}  // namespace

HttpScraper::HttpScraper(std::unique_ptr<Network::Http::HttpClient> client)
    : client_(std::move(client)) {
}

std::string HttpScraper::target_url(const std::string& url,
                                    const std::optional<std::string>& /*search_word*/) const {
    return Text::trim(url);
}

bool HttpScraper::filters_records(const std::string& /*url*/) const {
    return true;
}

FetchResponse HttpScraper::fetch(const std::string&                url,
                                 const std::optional<std::string>& search_word) {
    std::string target = target_url(url, search_word);
    if (target.empty())
        return FetchResponse::failure(ErrorType::Other, "No URL to fetch");
    if (!Url::is_http(target))
        return FetchResponse::failure(ErrorType::Other, "Not an http(s) URL: " + target);

    Network::Http::Response res = client_->get(target);
    if (!res.success) {
        std::string error = res.error.empty() ? "request failed" : res.error;
        return FetchResponse::failure(map_error(res.error_type), error + " (" + target + ")");
    }

    std::string page = res.effective_url.empty() ? target : res.effective_url;
    if (Text::trim(res.body).empty())
        return FetchResponse::failure(ErrorType::Structure, "Empty response body: " + page);

    FetchResponse out = parse(res.body, page);
    if (!out.success)
        return out;

    std::string word = search_word ? Text::trim(*search_word) : "";
    if (!word.empty() && filters_records(url)) {
        out.records.erase(std::remove_if(out.records.begin(),
                                         out.records.end(),
                                         [&](const Core::Record& r) { return !matches(r, word); }),
                          out.records.end());
    }

    std::string host = Url::parse(page).host;
    for (auto& record : out.records) {
        record["source_type"] = source_type();
        record.emplace("source", host);
    }
    return out;
}

}  // namespace Scrapers
}  // namespace Harvest
