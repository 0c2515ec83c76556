#pragma once
#include <memory>
#include <optional>
#include <string>

#include "../../network/http/http_client.hpp"
#include "../scraper.hpp"

namespace Harvest {
namespace Scrapers {

// Shared fetch path for document-based scrapers: resolve the target URL,
// download it, map transport errors, hand the body to parse(), then apply
// the search-word filter and stamp source fields on every record.
class HttpScraper : public Scraper {
public:
    explicit HttpScraper(std::unique_ptr<Network::Http::HttpClient> client);

    FetchResponse fetch(const std::string&                url,
                        const std::optional<std::string>& search_word) override;

    virtual const char* source_type() const = 0;

protected:
    virtual std::string target_url(const std::string&                url,
                                   const std::optional<std::string>& search_word) const;

    // false when the search word was already consumed to build the target URL.
    virtual bool filters_records(const std::string& url) const;

    virtual FetchResponse parse(const std::string& body, const std::string& page_url) const = 0;

private:
    std::unique_ptr<Network::Http::HttpClient> client_;
};

class NewsScraper : public HttpScraper {
public:
    using HttpScraper::HttpScraper;

    const char* source_type() const override {
        return "news";
    }

protected:
    FetchResponse parse(const std::string& body, const std::string& page_url) const override;
};

class BlogScraper : public HttpScraper {
public:
    BlogScraper(std::unique_ptr<Network::Http::HttpClient> client, std::string default_url);

    const char* source_type() const override {
        return "blog";
    }

protected:
    std::string   target_url(const std::string&                url,
                             const std::optional<std::string>& search_word) const override;
    FetchResponse parse(const std::string& body, const std::string& page_url) const override;

private:
    std::string default_url_;
};

class RssScraper : public HttpScraper {
public:
    using HttpScraper::HttpScraper;

    const char* source_type() const override {
        return "rss";
    }

protected:
    std::string   target_url(const std::string&                url,
                             const std::optional<std::string>& search_word) const override;
    bool          filters_records(const std::string& url) const override;
    FetchResponse parse(const std::string& body, const std::string& page_url) const override;
};

}  // namespace Scrapers
}  // namespace Harvest
