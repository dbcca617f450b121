//
// RecordingConnection.hpp
//

#ifndef GRIDDUEL_RECORDINGCONNECTION_HPP
#define GRIDDUEL_RECORDINGCONNECTION_HPP

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../net/Connection.hpp"

namespace gridduel::net::debug
{
    // Captures every frame a session sends so tests can inspect the JSON.
    class RecordingConnection final : public Connection
    {
    public:
        explicit RecordingConnection(ConnectionId id) :
            id_(id) {}

        auto Id() const noexcept -> ConnectionId override { return id_; }

        auto Send(std::string const& text) -> bool override
        {
            std::scoped_lock lock(mx_);
            if (!open_) return false;
            frames_.push_back(nlohmann::json::parse(text));
            return true;
        }

        auto Close(std::string const& reason) -> void override
        {
            std::scoped_lock lock(mx_);
            open_ = false;
            close_reason_ = reason;
        }

        auto IsOpen() const -> bool
        {
            std::scoped_lock lock(mx_);
            return open_;
        }

        auto CloseReason() const -> std::optional<std::string>
        {
            std::scoped_lock lock(mx_);
            return close_reason_;
        }

        auto Frames() const -> std::vector<nlohmann::json>
        {
            std::scoped_lock lock(mx_);
            return frames_;
        }

        auto OfType(std::string_view type) const -> std::vector<nlohmann::json>
        {
            std::scoped_lock lock(mx_);
            std::vector<nlohmann::json> out;
            for (auto const& f : frames_)
            {
                if (f.value("type", "") == type) out.push_back(f);
            }
            return out;
        }

        auto Last(std::string_view type) const -> std::optional<nlohmann::json>
        {
            std::scoped_lock lock(mx_);
            for (auto it = frames_.rbegin(); it != frames_.rend(); ++it)
            {
                if (it->value("type", "") == type) return *it;
            }
            return std::nullopt;
        }

        auto Clear() -> void
        {
            std::scoped_lock lock(mx_);
            frames_.clear();
        }

    private:
        ConnectionId id_;
        mutable std::mutex mx_;
        bool open_{true};
        std::optional<std::string> close_reason_{};
        std::vector<nlohmann::json> frames_;
    };
}

#endif //GRIDDUEL_RECORDINGCONNECTION_HPP
