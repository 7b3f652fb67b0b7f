#pragma once
#include <memory>
#include <string>
#include "mediactl/interfaces/ISessionChannel.hpp"

namespace mediactl {
namespace core {

/**
 * @brief Opaque handle identifying one remote session.
 *
 * Carries the base channel to the session. Two tokens are equal when
 * they name the same session.
 */
class SessionToken {
public:
    SessionToken() = default;

    SessionToken(std::string session_id, std::shared_ptr<interfaces::ISessionChannel> channel)
        : session_id_(std::move(session_id))
        , channel_(std::move(channel))
    {
    }

    const std::string& session_id() const { return session_id_; }
    const std::shared_ptr<interfaces::ISessionChannel>& channel() const { return channel_; }

    bool is_valid() const { return channel_ != nullptr; }

    bool operator==(const SessionToken& other) const { return session_id_ == other.session_id_; }
    bool operator!=(const SessionToken& other) const { return !(*this == other); }

private:
    std::string session_id_;
    std::shared_ptr<interfaces::ISessionChannel> channel_;
};

} // namespace core
} // namespace mediactl
