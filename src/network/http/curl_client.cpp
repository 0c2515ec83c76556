#include "curl_client.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>
#include "../../core/types/constants.hpp"

namespace Harvest {
namespace Network {
namespace Http {

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type:";

std::string_view trim_view(std::string_view s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool istarts_with(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char c1, char c2) {
        return std::tolower(static_cast<unsigned char>(c1))
               == std::tolower(static_cast<unsigned char>(c2));
    });
}

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY: return ErrorType::Proxy;
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        default: return ErrorType::Network;
    }
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto*            ctx = static_cast<CurlClient::RequestContext*>(userp);
    std::string_view header(buffer, size * nitems);

    if (ctx && ctx->content_type && istarts_with(header, CONTENT_TYPE_HEADER)) {
        *ctx->content_type = std::string(trim_view(header.substr(CONTENT_TYPE_HEADER.size())));
    }
    return size * nitems;
}

CurlClient::CurlClient()
    : curl_(curl_easy_init()),
      user_agent_(Core::Constants::USER_AGENT),
      timeout_seconds_(Core::Constants::REQUEST_TIMEOUT_SECONDS) {
}

void CurlClient::set_proxy(const std::string& proxy) {
    proxy_ = proxy;
}

void CurlClient::set_user_agent(const std::string& agent) {
    user_agent_ = agent;
}

void CurlClient::set_timeout(std::chrono::seconds timeout) {
    timeout_seconds_ = static_cast<long>(timeout.count());
}

Response CurlClient::create_error_response(const std::string& msg) const {
    Response r;
    r.success    = false;
    r.error      = msg;
    r.error_type = ErrorType::Network;
    return r;
}

void CurlClient::setup_curl_options(CURL*              curl,
                                    const std::string& url,
                                    RequestContext&    ctx) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);

    if (!user_agent_.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    if (!proxy_.empty())
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy_.c_str());
}

Response CurlClient::get(const std::string& url) {
    if (!curl_)
        return create_error_response("Failed to initialize CURL handle");

    std::string    body;
    std::string    content_type;
    RequestContext ctx{&body, &content_type};

    setup_curl_options(curl_.get(), url, ctx);
    CURLcode code = curl_easy_perform(curl_.get());

    Response response;
    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    char* effective = nullptr;
    curl_easy_getinfo(curl_.get(), CURLINFO_EFFECTIVE_URL, &effective);
    response.effective_url = effective ? std::string(effective) : url;
    response.content_type  = content_type;

    if (code != CURLE_OK) {
        response.error      = curl_easy_strerror(code);
        response.error_type = map_curl_code_to_error_type(code);
        return response;
    }

    response.body    = std::move(body);
    response.success = response.status_code >= 200 && response.status_code < 400;
    if (!response.success) {
        response.error      = "HTTP " + std::to_string(response.status_code);
        response.error_type = ErrorType::Http;
    }
    return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Harvest
