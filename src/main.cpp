/**
 * mediactl demo
 *
 * Drives a MediaController against an in-process fake session:
 *
 *   ┌──────────────────┐   invoke / one-way   ┌───────────────────────┐
 *   │  MediaController │ ───────────────────► │  FakeSessionChannel   │
 *   │  (tier selected  │                      │  (base + extended)    │
 *   │   at startup)    │ ◄─────────────────── │  transport thread     │
 *   └────────┬─────────┘   events / death     └───────────────────────┘
 *            │
 *            ▼
 *   ┌──────────────────┐
 *   │   LooperThread   │  callbacks run here, in order
 *   └──────────────────┘
 */

#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <string>

#include "mediactl/common/Logger.hpp"
#include "mediactl/core/CapabilityLevel.hpp"
#include "mediactl/core/LooperThread.hpp"
#include "mediactl/core/MediaController.hpp"
#include "mediactl/testing/FakeSessionChannel.hpp"

using namespace mediactl;

namespace {

class LoggingCallback : public core::MediaControllerCallback {
public:
    LoggingCallback(std::shared_ptr<common::ILogger> logger, std::promise<void> destroyed)
        : logger_(std::move(logger))
        , destroyed_(std::move(destroyed))
    {
    }

    void on_session_destroyed() override {
        logger_->info("[Callback] Session destroyed");
        destroyed_.set_value();
    }

    void on_session_event(const std::string& event, const common::Bundle& extras) override {
        logger_->info("[Callback] Session event '" + event + "' (" + std::to_string(extras.size()) + " extras)");
    }

    void on_playback_state_changed(const std::optional<common::PlaybackState>& state) override {
        if (!state) {
            logger_->info("[Callback] Playback state cleared");
            return;
        }
        logger_->info("[Callback] Playback state " + std::to_string(static_cast<int>(state->state))
                      + " at " + std::to_string(state->position_ms) + "ms");
    }

    void on_metadata_changed(const std::optional<common::MediaMetadata>& metadata) override {
        logger_->info("[Callback] Now playing: "
                      + (metadata ? metadata->get_text(common::kMetadataTitle) : std::string("<none>")));
    }

    void on_repeat_mode_changed(common::RepeatMode mode) override {
        logger_->info("[Callback] Repeat mode " + std::to_string(static_cast<int>(mode)));
    }

private:
    std::shared_ptr<common::ILogger> logger_;
    std::promise<void> destroyed_;
};

} // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [capability-level]\n";
        std::cerr << "Example: " << argv[0] << " 1\n";
        return 1;
    }

    auto logger = std::make_shared<common::ConsoleLogger>(true);

    if (argc == 2) {
        auto level = core::parse_capability_level(argv[1]);
        if (!level) {
            std::cerr << "Unknown capability level: " << argv[1] << "\n";
            return 1;
        }
        core::Environment::instance().set_capability_level(*level);
    }

    try {
        auto extended = std::make_shared<testing::FakeSessionChannel>();
        auto base = std::make_shared<testing::FakeSessionChannel>();
        base->set_negotiation(testing::FakeSessionChannel::NegotiationMode::Respond, extended);
        base->set_flags(common::kFlagHandlesQueueCommands | common::kFlagHandlesTransportControls);
        base->set_value(interfaces::SessionMethod::GetPackageName, std::string("org.example.player"));

        core::ControllerConfig config;
        config.logger = logger;
        core::MediaController controller(core::SessionToken("demo-session", base), config);
        base->flush();

        logger->info(std::string("[Demo] Level ") + core::capability_level_name(controller.capability_level())
                     + ", extended channel " + (controller.is_extended_channel_ready() ? "ready" : "absent"));
        logger->info("[Demo] Package " + controller.get_package_name().value_or("<unknown>"));

        std::promise<void> destroyed;
        auto destroyed_future = destroyed.get_future();
        auto looper = std::make_shared<core::LooperThread>("callbacks");
        auto callback = std::make_shared<LoggingCallback>(logger, std::move(destroyed));
        controller.register_callback(callback, looper);

        // Commands
        auto& controls = controller.get_transport_controls();
        controls.prepare_from_uri("file:///music/track01.flac");
        controls.play();
        controls.set_repeat_mode(common::RepeatMode::All);

        common::MediaDescription next;
        next.media_id = "track02";
        next.title = "Track 02";
        controller.add_queue_item(next);

        // Events from the session
        common::MediaMetadata metadata;
        metadata.text[common::kMetadataTitle] = "Track 01";
        common::PlaybackState playing;
        playing.state = common::PlaybackStateKind::Playing;
        playing.position_ms = 1200;

        base->emit_async([metadata](interfaces::ISessionEventSink& s) { s.on_metadata_changed(metadata); });
        base->emit_async([playing](interfaces::ISessionEventSink& s) { s.on_playback_state_changed(playing); });
        extended->emit_async([playing](interfaces::ISessionEventSink& s) { s.on_playback_state_changed(playing); });
        extended->emit_async([](interfaces::ISessionEventSink& s) { s.on_repeat_mode_changed(common::RepeatMode::All); });
        base->emit_async([](interfaces::ISessionEventSink& s) { s.on_event("demo.HELLO", common::Bundle()); });
        base->flush();
        extended->flush();

        logger->info("[Demo] Session " + std::to_string(base->invocations().size()) + " calls recorded; killing it");
        base->kill();

        if (destroyed_future.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
            logger->error("[Demo] No destroyed notification");
            return 1;
        }

        controller.unregister_callback(callback);
        looper->stop();

    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
