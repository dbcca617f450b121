//
// protocol.hpp
//

#ifndef GRIDDUEL_PROTOCOL_HPP
#define GRIDDUEL_PROTOCOL_HPP

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "../core/Actions.hpp"
#include "../core/Events.hpp"
#include "../core/GameState.hpp"
#include "codec.hpp"
#include "Rewards.hpp"

// JSON text frames exchanged over the match socket. Every frame is an object with a "type".
namespace gridduel::net::protocol
{
    struct JoinGame
    {
        core::MatchId match_id;
    };

    struct Action
    {
        core::MatchId match_id;
        core::PlayerAction action;
    };

    struct AnimationsComplete
    {
        core::MatchId match_id;
    };

    using ClientMessage = std::variant<JoinGame, Action, AnimationsComplete>;

    auto ParseClientMessage(std::string_view text) -> std::expected<ClientMessage, ParseError>;

    // State as one viewer may see it: opponent hand reduced to a count, cache limited
    // to board cards and the viewer's own hand.
    auto StateToJson(core::GameState const& state, core::PlayerId const& viewer) -> nlohmann::json;
    auto EventToJson(core::GameEvent const& e) -> nlohmann::json;

    // ----- server -> client -----
    auto MakeJoined(core::GameState const& state, core::PlayerId const& viewer, int player_slot) -> std::string;
    auto MakeStartTurn(core::PlayerId const& current, int time_allowed_seconds) -> std::string;
    auto MakeEvents(std::span<core::GameEvent const> events, core::GameState const& state,
                    core::PlayerId const& viewer, bool server_forced) -> std::string;
    auto MakeGameEnd(std::optional<core::PlayerId> const& winner, TerminationReason reason) -> std::string;
    auto MakeError(std::string_view message) -> std::string;
    auto MakePlayerJoined(core::PlayerId const& user, int player_slot) -> std::string;
    auto MakePlayerDisconnected(core::PlayerId const& user) -> std::string;
    auto MakeSessionReplaced() -> std::string;
    auto MakeMatched(core::MatchId const& match) -> std::string;

    // ----- client -> server (used by test clients) -----
    auto BuildJoinGame(core::MatchId const& match) -> std::string;
    auto BuildPlaceCard(core::MatchId const& match, core::CardInstanceId const& card, core::Position pos) -> std::string;
    auto BuildEndTurn(core::MatchId const& match) -> std::string;
    auto BuildSurrender(core::MatchId const& match) -> std::string;
    auto BuildAnimationsComplete(core::MatchId const& match) -> std::string;
}

#endif //GRIDDUEL_PROTOCOL_HPP
