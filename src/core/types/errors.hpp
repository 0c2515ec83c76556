#pragma once
#include <stdexcept>
#include <string>

namespace Harvest {
namespace Core {

// Invalid task list, worker bounds or configuration file. Raised before any work starts.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {
    }
};

// The pool could not reach its minimum size.
class PoolExhaustionError : public std::runtime_error {
public:
    PoolExhaustionError(int started, int required)
        : std::runtime_error("Started " + std::to_string(started) + " of "
                             + std::to_string(required) + " required workers"),
          started_(started),
          required_(required) {
    }

    int started() const {
        return started_;
    }
    int required() const {
        return required_;
    }

private:
    int started_;
    int required_;
};

}  // namespace Core
}  // namespace Harvest
