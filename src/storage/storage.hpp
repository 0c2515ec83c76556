#pragma once
#include <string>

namespace Harvest {
namespace Storage {

class Storage {
public:
    virtual ~Storage() = default;

    // Stores `content` under `key`. Returns false when it could not be written.
    virtual bool save(const std::string& key, const std::string& content) = 0;
};

}  // namespace Storage
}  // namespace Harvest
