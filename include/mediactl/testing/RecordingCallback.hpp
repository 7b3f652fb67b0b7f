#pragma once
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "mediactl/core/MediaControllerCallback.hpp"
#include "mediactl/core/SessionEvent.hpp"

namespace mediactl {
namespace testing {

    // Records every delivered event together with the thread it ran on
    class RecordingCallback : public core::MediaControllerCallback {
    public:
        struct Record {
            core::SessionEvent event;
            std::thread::id thread;

            std::string name() const { return core::session_event_name(event); }
        };

        void on_session_destroyed() override {
            record(core::events::SessionDestroyed{});
        }

        void on_session_event(const std::string& event, const common::Bundle& extras) override {
            record(core::events::Custom{event, extras});
        }

        void on_playback_state_changed(const std::optional<common::PlaybackState>& state) override {
            record(core::events::PlaybackStateChanged{state});
        }

        void on_metadata_changed(const std::optional<common::MediaMetadata>& metadata) override {
            record(core::events::MetadataChanged{metadata});
        }

        void on_queue_changed(const std::optional<std::vector<common::QueueItem>>& queue) override {
            record(core::events::QueueChanged{queue});
        }

        void on_queue_title_changed(const std::optional<std::string>& title) override {
            record(core::events::QueueTitleChanged{title});
        }

        void on_extras_changed(const common::Bundle& extras) override {
            record(core::events::ExtrasChanged{extras});
        }

        void on_audio_info_changed(const std::optional<common::PlaybackInfo>& info) override {
            record(core::events::VolumeChanged{info});
        }

        void on_repeat_mode_changed(common::RepeatMode mode) override {
            record(core::events::RepeatModeChanged{mode});
        }

        void on_shuffle_mode_changed(bool enabled) override {
            record(core::events::ShuffleModeChanged{enabled});
        }

        // ========== Inspection ==========

        std::vector<Record> records() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return records_;
        }

        std::vector<std::string> names() const {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<std::string> out;
            for (const auto& r : records_) out.push_back(r.name());
            return out;
        }

        size_t count() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return records_.size();
        }

        size_t count(const std::string& name) const {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t n = 0;
            for (const auto& r : records_) {
                if (r.name() == name) n++;
            }
            return n;
        }

        // True if every record ran on `thread`
        bool all_on(std::thread::id thread) const {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& r : records_) {
                if (r.thread != thread) return false;
            }
            return true;
        }

    private:
        void record(core::SessionEvent event) {
            std::lock_guard<std::mutex> lock(mutex_);
            records_.push_back(Record{std::move(event), std::this_thread::get_id()});
        }

        mutable std::mutex mutex_;
        std::vector<Record> records_;
    };

} // namespace testing
} // namespace mediactl
