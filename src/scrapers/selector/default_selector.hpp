#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../network/http/http_client.hpp"
#include "scraper_selector.hpp"

namespace Harvest {
namespace Scrapers {

struct ScraperSettings {
    std::vector<std::string> user_agents;
    std::vector<std::string> proxies;
    std::chrono::seconds     timeout{Core::Constants::REQUEST_TIMEOUT_SECONDS};
    std::string              blog_url = Core::Constants::DEFAULT_BLOG_URL;
};

// Builds a fresh scraper, with its own HTTP client, for every resolve() call.
// Each client gets a user agent and proxy drawn at random from the settings.
class DefaultScraperSelector : public ScraperSelector {
public:
    using ClientFactory = std::function<std::unique_ptr<Network::Http::HttpClient>()>;

    // An empty factory means libcurl clients.
    explicit DefaultScraperSelector(ScraperSettings settings, ClientFactory factory = {});

    Resolution resolve(ScraperKind kind, const std::optional<std::string>& search_word) override;

private:
    ScraperSettings settings_;
    ClientFactory   factory_;
    std::mutex      rng_mutex_;
    std::mt19937    rng_;

    std::unique_ptr<Network::Http::HttpClient> make_client();
    std::string pick(const std::vector<std::string>& choices);
};

}  // namespace Scrapers
}  // namespace Harvest
