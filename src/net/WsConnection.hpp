//
// WsConnection.hpp
//

#ifndef GRIDDUEL_WSCONNECTION_HPP
#define GRIDDUEL_WSCONNECTION_HPP

#include <memory>
#include <optional>
#include <print>
#include <string>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "../core/Types.hpp"
#include "Connection.hpp"

namespace gridduel::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    // A WebSocket++ socket as seen by a match session. Text frames only.
    class WsConnection final : public Connection
    {
    public:
        WsConnection(ConnectionId id, std::weak_ptr<WsServer> ep, Hdl hdl, core::PlayerId user) :
            id_(id),
            ep_(std::move(ep)),
            hdl_(std::move(hdl)),
            user_(std::move(user)) {}

        auto Id() const noexcept -> ConnectionId override { return id_; }
        auto User() const noexcept -> core::PlayerId const& { return user_; }
        auto Handle() const -> Hdl const& { return hdl_; }

        // the match this socket last joined, if any
        auto Match() const -> std::optional<core::MatchId> const& { return match_; }
        auto SetMatch(core::MatchId match) -> void { match_ = std::move(match); }

        auto Send(std::string const& text) -> bool override
        {
            auto ep_sp = ep_.lock();
            if (!ep_sp)
            {
                return false;
            }

            websocketpp::lib::error_code ec;
            ep_sp->send(hdl_, text, websocketpp::frame::opcode::text, ec);
            if (ec)
            {
                std::print("[Conn {}] send failed: {}\n", id_, ec.message());
            }
            return !ec;
        }

        auto Close(std::string const& reason) -> void override
        {
            auto ep_sp = ep_.lock();
            if (!ep_sp)
            {
                return;
            }

            websocketpp::lib::error_code ec;
            ep_sp->close(hdl_, websocketpp::close::status::normal, reason, ec);
            if (ec)
            {
                std::print("[Conn {}] close failed: {}\n", id_, ec.message());
            }
        }

    private:
        ConnectionId id_;
        std::weak_ptr<WsServer> ep_;
        Hdl hdl_;
        core::PlayerId user_;
        std::optional<core::MatchId> match_{};
    };

    using WsConnectionSP = std::shared_ptr<WsConnection>;
}

#endif //GRIDDUEL_WSCONNECTION_HPP
