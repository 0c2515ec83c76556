#pragma once
#include <map>
#include <string>
#include <vector>

namespace Harvest {
namespace Core {

// One scraped item: field name -> value ("title", "url", "summary", ...).
using Record  = std::map<std::string, std::string>;
using Records = std::vector<Record>;

}  // namespace Core
}  // namespace Harvest
