#pragma once
#include <cstdint>
#include <string>
#include "mediactl/common/Bundle.hpp"
#include "mediactl/common/MediaTypes.hpp"

namespace mediactl {
namespace core {

class ControllerProxy;

/**
 * @brief Transport verbs of a MediaController.
 *
 * Obtained from MediaController::get_transport_controls() and valid for
 * the controller's lifetime. Every verb is asynchronous; failures on a
 * dead session are logged and ignored.
 */
class TransportControls {
public:
    explicit TransportControls(ControllerProxy& proxy);

    TransportControls(const TransportControls&) = delete;
    TransportControls& operator=(const TransportControls&) = delete;

    // ========== Prepare ==========

    void prepare();
    void prepare_from_media_id(const std::string& media_id, const common::Bundle& extras = common::Bundle());
    void prepare_from_search(const std::string& query, const common::Bundle& extras = common::Bundle());
    void prepare_from_uri(const std::string& uri, const common::Bundle& extras = common::Bundle());

    // ========== Play ==========

    void play();
    void play_from_media_id(const std::string& media_id, const common::Bundle& extras = common::Bundle());
    void play_from_search(const std::string& query, const common::Bundle& extras = common::Bundle());

    /**
     * @throws InvalidArgumentError if `uri` is empty
     */
    void play_from_uri(const std::string& uri, const common::Bundle& extras = common::Bundle());

    void skip_to_queue_item(int64_t queue_id);
    void pause();
    void stop();
    void seek_to(int64_t position_ms);
    void fast_forward();
    void rewind();
    void skip_to_next();
    void skip_to_previous();

    // ========== Modes ==========

    void set_rating(const common::Rating& rating);
    void set_repeat_mode(common::RepeatMode mode);
    void set_shuffle_mode_enabled(bool enabled);

    // ========== Custom Actions ==========

    /**
     * @throws InvalidArgumentError if the action name is empty
     */
    void send_custom_action(const common::CustomAction& action, const common::Bundle& args = common::Bundle());
    void send_custom_action(const std::string& action, const common::Bundle& args = common::Bundle());

private:
    ControllerProxy& proxy_;
};

} // namespace core
} // namespace mediactl
