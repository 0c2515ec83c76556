#include "scraper.hpp"

namespace Harvest {
namespace Scrapers {

const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::Network: return "network";
        case ErrorType::Timeout: return "timeout";
        case ErrorType::Http: return "http";
        case ErrorType::Structure: return "structure";
        case ErrorType::Other: return "other";
    }
    return "other";
}

FetchResponse FetchResponse::ok(Core::Records records) {
    FetchResponse res;
    res.records = std::move(records);
    res.success = true;
    return res;
}

FetchResponse FetchResponse::failure(ErrorType type, std::string error) {
    FetchResponse res;
    res.error      = std::move(error);
    res.error_type = type;
    return res;
}

}  // namespace Scrapers
}  // namespace Harvest
