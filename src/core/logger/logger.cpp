#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Harvest {
namespace Core {

int Logger::level_ = LogLevel::LOG_ALL;

std::ofstream Logger::file_;

std::mutex Logger::mutex_;

namespace {
const char* const RESET  = "\033[0m";
const char* const RED    = "\033[31m";
const char* const GREEN  = "\033[32m";
const char* const YELLOW = "\033[33m";
const char* const BLUE   = "\033[34m";

std::string timestamp() {
    auto        now = std::chrono::system_clock::now();
    std::time_t t   = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms.count();
    return out.str();
}
}  // namespace

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open())
        file_.close();
    if (path.empty())
        return true;

    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::write(int level, const char* tag, const char* color, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!(level_ & level))
        return;

    std::string stamp = timestamp();
    std::ostream& out = (level == LOG_WARN || level == LOG_ERROR) ? std::cerr : std::cout;
    out << stamp << ' ' << color << '[' << tag << "] " << RESET << message << std::endl;

    if (file_.is_open()) {
        file_ << stamp << " [" << tag << "] " << message << '\n';
        file_.flush();
    }
}

void Logger::info(const std::string& message) {
    write(LOG_INFO, "INFO", BLUE, message);
}

void Logger::success(const std::string& message) {
    write(LOG_SUCCESS, "SUCCESS", GREEN, message);
}

void Logger::warn(const std::string& message) {
    write(LOG_WARN, "WARN", YELLOW, message);
}

void Logger::error(const std::string& message) {
    write(LOG_ERROR, "ERROR", RED, message);
}

}  // namespace Core
}  // namespace Harvest
