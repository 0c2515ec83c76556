#pragma once
#include <optional>
#include <string>

#include "../core/types/record.hpp"

namespace Harvest {
namespace Scrapers {

enum class ErrorType { None, Network, Timeout, Http, Structure, Other };

const char* to_string(ErrorType type);

struct FetchResponse {
    Core::Records records;
    std::string   error;
    bool          success    = false;
    ErrorType     error_type = ErrorType::None;

    static FetchResponse ok(Core::Records records);
    static FetchResponse failure(ErrorType type, std::string error);
};

// A fetch implementation for one source kind. Failures are reported through
// FetchResponse; an exception escaping fetch() is treated as a worker fault.
class Scraper {
public:
    virtual ~Scraper() = default;

    virtual FetchResponse fetch(const std::string&                url,
                                const std::optional<std::string>& search_word) = 0;
};

}  // namespace Scrapers
}  // namespace Harvest
