#include "mediactl/core/CapabilityLevel.hpp"
#include <cstdlib>
#include <iostream>

namespace mediactl {
namespace core {

const char* capability_level_name(CapabilityLevel level) noexcept {
    switch (level) {
        case CapabilityLevel::Legacy:            return "Legacy";
        case CapabilityLevel::ExtendedChannel:   return "ExtendedChannel";
        case CapabilityLevel::NativePlayFromUri: return "NativePlayFromUri";
        case CapabilityLevel::NativePrepare:     return "NativePrepare";
    }
    return "Unknown";
}

std::optional<CapabilityLevel> parse_capability_level(const std::string& text) {
    if (text == "0" || text == "Legacy")            return CapabilityLevel::Legacy;
    if (text == "1" || text == "ExtendedChannel")   return CapabilityLevel::ExtendedChannel;
    if (text == "2" || text == "NativePlayFromUri") return CapabilityLevel::NativePlayFromUri;
    if (text == "3" || text == "NativePrepare")     return CapabilityLevel::NativePrepare;
    return std::nullopt;
}

// ============================================================================
// Singleton Instance
// ============================================================================

Environment& Environment::instance() {
    static Environment instance;
    return instance;
}

// ============================================================================
// Level Access
// ============================================================================

bool Environment::set_capability_level(CapabilityLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frozen_) {
        std::cerr << "[Environment] WARNING: capability level already in use, ignoring override to "
                  << capability_level_name(level) << std::endl;
        return false;
    }
    level_ = level;
    return true;
}

CapabilityLevel Environment::capability_level() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!level_) {
        level_ = detect();
    }
    frozen_ = true;
    return *level_;
}

bool Environment::is_frozen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frozen_;
}

CapabilityLevel Environment::detect() {
    const char* env = std::getenv("MEDIACTL_CAPABILITY_LEVEL");
    if (env && *env) {
        auto parsed = parse_capability_level(env);
        if (parsed) {
            std::cout << "[Environment] Capability level from environment: "
                      << capability_level_name(*parsed) << std::endl;
            return *parsed;
        }
        std::cerr << "[Environment] WARNING: unrecognized MEDIACTL_CAPABILITY_LEVEL '"
                  << env << "'" << std::endl;
    }
    return kHighestCapabilityLevel;
}

} // namespace core
} // namespace mediactl
