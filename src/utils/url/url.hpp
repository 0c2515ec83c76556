#pragma once
#include <string>

namespace Harvest {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);
    static bool        is_http(const std::string& url);
};

}  // namespace Utils
}  // namespace Harvest
