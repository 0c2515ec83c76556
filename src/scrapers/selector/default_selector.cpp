#include "default_selector.hpp"

#include "../../network/http/curl_client.hpp"
#include "../http/http_scraper.hpp"

namespace Harvest {
namespace Scrapers {

using Harvest::Network::Http::CurlClient;
using Harvest::Network::Http::HttpClient;

DefaultScraperSelector::DefaultScraperSelector(ScraperSettings settings, ClientFactory factory)
    : settings_(std::move(settings)), factory_(std::move(factory)), rng_(std::random_device{}()) {
}

std::string DefaultScraperSelector::pick(const std::vector<std::string>& choices) {
    if (choices.empty())
        return "";
    std::lock_guard<std::mutex>           lock(rng_mutex_);
    std::uniform_int_distribution<size_t> dist(0, choices.size() - 1);
    return choices[dist(rng_)];
}

std::unique_ptr<HttpClient> DefaultScraperSelector::make_client() {
    std::unique_ptr<HttpClient> client;
    if (factory_) {
        client = factory_();
    }
    else {
        auto curl = std::make_unique<CurlClient>();
        if (!curl->valid())
            return nullptr;
        client = std::move(curl);
    }
    if (!client)
        return nullptr;

    std::string agent = pick(settings_.user_agents);
    client->set_user_agent(agent.empty() ? Core::Constants::USER_AGENT : agent);
    client->set_timeout(settings_.timeout);

    std::string proxy = pick(settings_.proxies);
    if (!proxy.empty())
        client->set_proxy(proxy);
    return client;
}

Resolution DefaultScraperSelector::resolve(ScraperKind kind,
                                           const std::optional<std::string>& /*search_word*/) {
    try {
        auto client = make_client();
        if (!client)
            return Resolution::failure("Failed to initialize HTTP client for "
                                       + to_string(kind));

        switch (kind) {
            case ScraperKind::News:
                return Resolution::resolved(std::make_unique<NewsScraper>(std::move(client)));
            case ScraperKind::Rss:
                return Resolution::resolved(std::make_unique<RssScraper>(std::move(client)));
            case ScraperKind::Blog:
                return Resolution::resolved(
                    std::make_unique<BlogScraper>(std::move(client), settings_.blog_url));
        }
        return Resolution::failure("No scraper registered for " + to_string(kind));
    }
    catch (const std::exception& e) {
        return Resolution::failure("Failed to build " + to_string(kind)
                                   + " scraper: " + e.what());
    }
}

}  // namespace Scrapers
}  // namespace Harvest
