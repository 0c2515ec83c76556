#pragma once

#include <string>
#include <vector>

namespace Harvest {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        icontains(const std::string& haystack, const std::string& needle);

// Collapses runs of whitespace into one space and trims the ends.
std::string squash_whitespace(const std::string& str);

// Percent-encodes everything outside the RFC 3986 unreserved set; spaces become '+'.
std::string url_encode(const std::string& str);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

}  // namespace Text
}  // namespace Utils
}  // namespace Harvest
