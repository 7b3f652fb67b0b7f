#include "mediactl/common/Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace mediactl {
namespace common {

void ConsoleLogger::info(const std::string& message) {
    log("INFO", message, false);
}

void ConsoleLogger::warn(const std::string& message) {
    log("WARN", message, false);
}

void ConsoleLogger::error(const std::string& message) {
    log("ERROR", message, true);
}

void ConsoleLogger::debug(const std::string& message) {
    if (!verbose_) return;
    log("DEBUG", message, false);
}

void ConsoleLogger::log(const char* level, const std::string& message, bool to_stderr) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    // Lines from IPC threads and dispatch threads must not interleave
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = to_stderr ? std::cerr : std::cout;
    out << "[" << std::put_time(&local_tm, "%H:%M:%S")
        << "] [" << level << "] " << message << "\n";
}

std::shared_ptr<ILogger> default_logger() {
    static std::shared_ptr<ILogger> instance = std::make_shared<ConsoleLogger>();
    return instance;
}

} // namespace common
} // namespace mediactl
