#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace mediactl {
namespace core {

// Ordered: every tier is a strict superset of the tiers below it
enum class CapabilityLevel : uint8_t {
    Legacy            = 0, // Single channel, native queue methods
    ExtendedChannel   = 1, // Negotiates the extended channel
    NativePlayFromUri = 2, // + native play-from-uri
    NativePrepare     = 3  // + native prepare primitives
};

constexpr CapabilityLevel kHighestCapabilityLevel = CapabilityLevel::NativePrepare;

const char* capability_level_name(CapabilityLevel level) noexcept;

// Accepts "0".."3" or a level name; nullopt otherwise
std::optional<CapabilityLevel> parse_capability_level(const std::string& text);

// ============================================================================
// Environment - Process-wide capability level
// ============================================================================
// The level is detected from MEDIACTL_CAPABILITY_LEVEL (highest level when
// unset or unparsable) or overridden once at startup. It is frozen on first
// read and never changes afterwards.
//
// Usage:
//   // At startup (in main.cpp):
//   core::Environment::instance().set_capability_level(CapabilityLevel::ExtendedChannel);
//
//   // Later:
//   auto level = core::Environment::instance().capability_level();
//
// Thread Safety: all methods are thread-safe.
// ============================================================================

class Environment {
public:
    static Environment& instance();

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;
    Environment(Environment&&) = delete;
    Environment& operator=(Environment&&) = delete;

    // Returns false (and changes nothing) once the level has been read
    bool set_capability_level(CapabilityLevel level);

    CapabilityLevel capability_level();

    bool is_frozen() const;

private:
    Environment() = default;

    static CapabilityLevel detect();

    mutable std::mutex mutex_;
    std::optional<CapabilityLevel> level_;
    bool frozen_ = false;
};

} // namespace core
} // namespace mediactl
