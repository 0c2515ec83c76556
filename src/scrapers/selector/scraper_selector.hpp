#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../scraper.hpp"

namespace Harvest {
namespace Scrapers {

enum class ScraperKind { News, Rss, Blog };

std::optional<ScraperKind>      parse_kind(const std::string& type);
std::string                     to_string(ScraperKind kind);
const std::vector<ScraperKind>& all_kinds();

// "news, rss, blog", for error messages.
std::string supported_kinds();

struct Resolution {
    std::unique_ptr<Scraper> scraper;
    std::string              error;

    explicit operator bool() const {
        return scraper != nullptr;
    }

    static Resolution resolved(std::unique_ptr<Scraper> scraper);
    static Resolution failure(std::string error);
};

// Maps a task kind to a Scraper. resolve() is called concurrently by every
// worker and must not share mutable state between the scrapers it returns.
class ScraperSelector {
public:
    virtual ~ScraperSelector() = default;

    virtual Resolution resolve(ScraperKind kind, const std::optional<std::string>& search_word) = 0;
};

}  // namespace Scrapers
}  // namespace Harvest
