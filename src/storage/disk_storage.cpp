#include "disk_storage.hpp"
#include <filesystem>
#include <fstream>
#include "../core/logger/logger.hpp"

namespace Harvest {
namespace Storage {

using Harvest::Core::Logger;

DiskStorage::DiskStorage(const std::string& base_path) : base_path_(base_path) {
    if (!base_path_.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(base_path_, ec);
        if (ec)
            Logger::error("Failed to create storage directory " + base_path_ + ": " + ec.message());
    }
}

bool DiskStorage::save(const std::string& key, const std::string& content) {
    try {
        std::filesystem::path path(base_path_);
        path /= key;

        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            Logger::error("Write Error: " + path.string());
            return false;
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            Logger::error("Write Error: " + path.string());
            return false;
        }
        Logger::success("Saved: " + path.string());
        return true;
    } catch (const std::exception& e) {
        Logger::error("FS Error: " + std::string(e.what()));
        return false;
    }
}

}  // namespace Storage
}  // namespace Harvest
