#pragma once
#include <fstream>
#include <mutex>
#include <string>

namespace Harvest {
namespace Core {

enum LogLevel {
    LOG_NONE    = 0,
    LOG_INFO    = 1 << 0,
    LOG_WARN    = 1 << 1,
    LOG_ERROR   = 1 << 2,
    LOG_SUCCESS = 1 << 3,
    LOG_ALL     = LOG_INFO | LOG_WARN | LOG_ERROR | LOG_SUCCESS
};

class Logger {
public:
    static void set_level(int level);
    static int  level();

    // Mirrors every emitted line into `path` (appending). An empty path closes the file.
    static bool set_file(const std::string& path);

    static void info(const std::string& message);
    static void success(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

private:
    static void write(int level, const char* tag, const char* color, const std::string& message);

    static int           level_;
    static std::ofstream file_;
    static std::mutex    mutex_;
};

}  // namespace Core
}  // namespace Harvest
