#pragma once
#include <curl/curl.h>
#include <memory>
#include <string>
#include "http_client.hpp"

namespace Harvest {
namespace Network {
namespace Http {

class CurlClient : public HttpClient {
public:
    CurlClient();
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    bool valid() const {
        return curl_ != nullptr;
    }

    void     set_proxy(const std::string& proxy) override;
    void     set_user_agent(const std::string& agent) override;
    void     set_timeout(std::chrono::seconds timeout) override;
    Response get(const std::string& url) override;

private:
    struct RequestContext {
        std::string* body         = nullptr;
        std::string* content_type = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    std::unique_ptr<CURL, CurlDeleter> curl_;
    std::string                        proxy_;
    std::string                        user_agent_;
    long                               timeout_seconds_;

    void     setup_curl_options(CURL* curl, const std::string& url, RequestContext& ctx) const;
    Response create_error_response(const std::string& msg) const;

    // Callbacks must be static. userp is guaranteed to be RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Harvest
