// ============================================================================
// Capability tier test program
// ============================================================================
// Covers:
// - select_tier_profile() tables for every level
// - Higher tiers keep every operation of lower tiers
// - Capability level parsing and Environment freezing
//
// Run with: ./tier_profile_test
// ============================================================================

#include <iostream>
#include <string>
#include "TestHarness.hpp"
#include "mediactl/core/CapabilityLevel.hpp"
#include "mediactl/core/SessionProtocol.hpp"
#include "mediactl/core/TierProfile.hpp"

using namespace mediactl;
using core::CapabilityLevel;
using core::QueueEncoding;
using core::QuerySource;
using core::TransportVerb;
using core::VerbRoute;
using interfaces::SessionMethod;

namespace {

const CapabilityLevel kAllLevels[] = {
    CapabilityLevel::Legacy,
    CapabilityLevel::ExtendedChannel,
    CapabilityLevel::NativePlayFromUri,
    CapabilityLevel::NativePrepare
};

bool is_native(const core::TierProfile& p, TransportVerb verb, SessionMethod method) {
    const VerbRoute& r = p.route(verb);
    return r.kind == VerbRoute::Kind::NativeMethod && r.method == method;
}

bool is_action(const core::TierProfile& p, TransportVerb verb, const char* action) {
    const VerbRoute& r = p.route(verb);
    return r.kind == VerbRoute::Kind::CustomAction && r.action && std::string(r.action) == action;
}

} // namespace

// ============================================================================
// Test: tables
// ============================================================================

void test_legacy_profile() {
    std::cout << "\n=== Testing Legacy tier ===" << std::endl;

    auto p = core::select_tier_profile(CapabilityLevel::Legacy);
    log_test("Legacy: no negotiation", !p.negotiates_extended_channel);
    log_test("Legacy: native queue methods", p.queue_encoding == QueueEncoding::NativeMethods);
    log_test("Legacy: playback state from base", p.playback_state_source == QuerySource::BaseChannel);

    bool all_native = true;
    for (size_t i = 0; i < core::kTransportVerbCount; ++i) {
        if (p.verb_routes[i].kind != VerbRoute::Kind::NativeMethod) all_native = false;
    }
    log_test("Legacy: every verb native", all_native);
    log_test("Legacy: skip_to_next maps to Next", is_native(p, TransportVerb::SkipToNext, SessionMethod::Next));
    log_test("Legacy: set_rating maps to Rate", is_native(p, TransportVerb::SetRating, SessionMethod::Rate));
}

void test_extended_channel_profile() {
    std::cout << "\n=== Testing ExtendedChannel tier ===" << std::endl;

    auto p = core::select_tier_profile(CapabilityLevel::ExtendedChannel);
    log_test("Tier1: negotiates", p.negotiates_extended_channel);
    log_test("Tier1: queue via generic commands", p.queue_encoding == QueueEncoding::GenericCommands);
    log_test("Tier1: playback state prefers extended", p.playback_state_source == QuerySource::PreferExtended);
    log_test("Tier1: rating type prefers extended", p.rating_type_source == QuerySource::PreferExtended);
    log_test("Tier1: repeat/shuffle from extended only", p.repeat_shuffle_source == QuerySource::ExtendedOnly);
    log_test("Tier1: prepare is a custom action",
             is_action(p, TransportVerb::Prepare, core::protocol::kActionPrepare));
    log_test("Tier1: prepare_from_uri is a custom action",
             is_action(p, TransportVerb::PrepareFromUri, core::protocol::kActionPrepareFromUri));
    log_test("Tier1: play_from_uri is a custom action",
             is_action(p, TransportVerb::PlayFromUri, core::protocol::kActionPlayFromUri));
    log_test("Tier1: set_repeat_mode is a custom action",
             is_action(p, TransportVerb::SetRepeatMode, core::protocol::kActionSetRepeatMode));
    log_test("Tier1: play stays native", is_native(p, TransportVerb::Play, SessionMethod::Play));
}

void test_upper_profiles() {
    std::cout << "\n=== Testing NativePlayFromUri / NativePrepare tiers ===" << std::endl;

    auto p2 = core::select_tier_profile(CapabilityLevel::NativePlayFromUri);
    log_test("Tier2: play_from_uri native", is_native(p2, TransportVerb::PlayFromUri, SessionMethod::PlayFromUri));
    log_test("Tier2: prepare still custom action",
             is_action(p2, TransportVerb::Prepare, core::protocol::kActionPrepare));
    log_test("Tier2: rating type from base", p2.rating_type_source == QuerySource::BaseChannel);
    log_test("Tier2: still negotiates", p2.negotiates_extended_channel);

    auto p3 = core::select_tier_profile(CapabilityLevel::NativePrepare);
    log_test("Tier3: prepare native", is_native(p3, TransportVerb::Prepare, SessionMethod::Prepare));
    log_test("Tier3: prepare_from_search native",
             is_native(p3, TransportVerb::PrepareFromSearch, SessionMethod::PrepareFromSearch));
    log_test("Tier3: set_shuffle still custom action",
             is_action(p3, TransportVerb::SetShuffleModeEnabled, core::protocol::kActionSetShuffleModeEnabled));
    log_test("Tier3: level recorded", p3.level == CapabilityLevel::NativePrepare);
}

void test_superset() {
    std::cout << "\n=== Testing tier superset property ===" << std::endl;

    // Every verb has a route at every level, and negotiation never goes away
    bool ok = true;
    bool negotiated = false;
    for (CapabilityLevel level : kAllLevels) {
        auto p = core::select_tier_profile(level);
        for (size_t i = 0; i < core::kTransportVerbCount; ++i) {
            const VerbRoute& r = p.verb_routes[i];
            if (r.kind == VerbRoute::Kind::CustomAction && !r.action) ok = false;
        }
        if (negotiated && !p.negotiates_extended_channel) ok = false;
        negotiated = negotiated || p.negotiates_extended_channel;
    }
    log_test("Every tier routes every verb", ok);

    auto a = core::select_tier_profile(CapabilityLevel::ExtendedChannel);
    auto b = core::select_tier_profile(CapabilityLevel::ExtendedChannel);
    bool same = true;
    for (size_t i = 0; i < core::kTransportVerbCount; ++i) {
        if (a.verb_routes[i].kind != b.verb_routes[i].kind || a.verb_routes[i].method != b.verb_routes[i].method) {
            same = false;
        }
    }
    log_test("select_tier_profile is deterministic", same);
}

// ============================================================================
// Test: level parsing / Environment
// ============================================================================

void test_levels() {
    std::cout << "\n=== Testing capability levels ===" << std::endl;

    log_test("parse '0'", core::parse_capability_level("0") == CapabilityLevel::Legacy);
    log_test("parse name", core::parse_capability_level("NativePlayFromUri") == CapabilityLevel::NativePlayFromUri);
    log_test("parse garbage", !core::parse_capability_level("9").has_value());
    log_test("levels are ordered", CapabilityLevel::Legacy < CapabilityLevel::ExtendedChannel
                                   && CapabilityLevel::NativePlayFromUri < CapabilityLevel::NativePrepare);

    auto& env = core::Environment::instance();
    bool set_before = env.set_capability_level(CapabilityLevel::ExtendedChannel);
    CapabilityLevel read = env.capability_level();
    bool set_after = env.set_capability_level(CapabilityLevel::Legacy);

    log_test("Environment override before first read", set_before && read == CapabilityLevel::ExtendedChannel);
    log_test("Environment frozen after first read", env.is_frozen() && !set_after);
    log_test("Environment level unchanged after rejected override",
             env.capability_level() == CapabilityLevel::ExtendedChannel);
}

int main() {
    std::cout << "mediactl Tier Profile Test Suite" << std::endl;
    std::cout << "================================" << std::endl;

    run_case("legacy profile", test_legacy_profile);
    run_case("extended channel profile", test_extended_channel_profile);
    run_case("upper profiles", test_upper_profiles);
    run_case("superset", test_superset);
    run_case("levels", test_levels);

    return print_summary();
}
