#pragma once

#include <chrono>
#include <string>

namespace Harvest {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Proxy, Timeout, Http, Other };

struct Response {
    std::string effective_url;
    long        status_code = 0;
    std::string content_type;
    std::string body;
    std::string error;
    bool        success    = false;
    ErrorType   error_type = ErrorType::None;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void     set_proxy(const std::string& proxy)           = 0;
    virtual void     set_user_agent(const std::string& /*agent*/) {};
    virtual void     set_timeout(std::chrono::seconds /*timeout*/) {};
    virtual Response get(const std::string& url)                   = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Harvest
