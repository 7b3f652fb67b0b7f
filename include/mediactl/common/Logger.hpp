#pragma once

#include <memory>
#include <mutex>
#include <string>

namespace mediactl {
namespace common {

/**
 * @brief Interface for logging
 * Single responsibility: Logging operations
 */
class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void info(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    virtual void debug(const std::string& message) = 0;
};

/**
 * @brief Console logger implementation
 * Implements ILogger with timestamped console output. Errors go to stderr.
 */
class ConsoleLogger : public ILogger {
public:
    ConsoleLogger() = default;
    explicit ConsoleLogger(bool verbose) : verbose_(verbose) {}

    void info(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void debug(const std::string& message) override;

private:
    void log(const char* level, const std::string& message, bool to_stderr);

    bool verbose_ = false;
    std::mutex mutex_;
};

/**
 * @brief Null logger for testing or disabled logging
 */
class NullLogger : public ILogger {
public:
    void info(const std::string&) override {}
    void warn(const std::string&) override {}
    void error(const std::string&) override {}
    void debug(const std::string&) override {}
};

// Shared ConsoleLogger used when a component is given no logger
std::shared_ptr<ILogger> default_logger();

} // namespace common
} // namespace mediactl
