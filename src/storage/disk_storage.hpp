#pragma once
#include <string>
#include "storage.hpp"

namespace Harvest {
namespace Storage {

// Keys are relative paths under base_path; parent directories are created on demand.
class DiskStorage : public Storage {
public:
    explicit DiskStorage(const std::string& base_path);
    ~DiskStorage() override = default;

    bool save(const std::string& key, const std::string& content) override;

    const std::string& base_path() const {
        return base_path_;
    }

private:
    std::string base_path_;
};

}  // namespace Storage
}  // namespace Harvest
