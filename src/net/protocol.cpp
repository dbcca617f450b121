//
// protocol.cpp
//

#include "protocol.hpp"

#include <format>

#include "../core/Catalog.hpp"

using json = nlohmann::json;

namespace gridduel::net::protocol
{
    using namespace gridduel::core;

    namespace
    {
        auto Frame(std::string_view type) -> json
        {
            return json{{"type", std::string{type}}};
        }

        auto PositionToJson(Position p) -> json
        {
            return json{{"x", p.x}, {"y", p.y}};
        }

        auto TileToJson(TileEffect const& t) -> json
        {
            return json{
                {"status", std::string{to_string(t.status)}},
                {"magnitude", t.magnitude},
                {"turnsLeft", {t.turns_left[0], t.turns_left[1]}}
            };
        }

        auto CellToJson(BoardCell const& c) -> json
        {
            json out{
                {"owner", c.owner},
                {"cardInstanceId", c.card},
                {"power", PowerToJson(c.power)},
                {"hydratedPower", PowerToJson(c.hydrated)},
                {"level", c.level},
                {"state", std::string{to_string(c.state)}},
                {"immuneTurns", c.immune_turns}
            };
            if (c.tile) out["tile"] = TileToJson(*c.tile);
            return out;
        }

        auto CardToJson(InGameCard const& c) -> json
        {
            json out{
                {"instanceId", c.instance_id},
                {"baseCardId", c.base_card_id},
                {"name", c.name},
                {"rarity", std::string{to_string(c.rarity)}},
                {"basePower", PowerToJson(c.base_power)},
                {"currentPower", PowerToJson(c.current_power)},
                {"level", c.level},
                {"tags", c.tags},
                {"owner", c.owner}
            };
            out["ability"] = c.ability ? AbilityToJson(*c.ability) : json(nullptr);
            return out;
        }

        auto PlayerToJson(PlayerState const& p, bool reveal_hand) -> json
        {
            json out{
                {"userId", p.user_id},
                {"handCount", p.hand.size()},
                {"deckCount", p.deck.size()},
                {"discardCount", p.discard.size()},
                {"score", p.score}
            };
            if (reveal_hand) out["hand"] = p.hand;
            return out;
        }

        auto Dump(json const& j) -> std::string
        {
            return j.dump();
        }

        auto ParseAction(json const& j) -> std::expected<PlayerAction, ParseError>
        {
            std::string const kind = j.at("actionType").get<std::string>();
            if (kind == "placeCard")
            {
                if (!j.contains("cardInstanceId") || !j.contains("position"))
                    return std::unexpected(ParseError{"placeCard needs cardInstanceId and position"});
                json const& pos = j["position"];
                return PlaceCardAction{j["cardInstanceId"].get<std::string>(),
                                       Position{pos.at("x").get<int>(), pos.at("y").get<int>()}};
            }
            if (kind == "endTurn") return EndTurnAction{};
            if (kind == "surrender") return SurrenderAction{};
            return std::unexpected(ParseError{std::format("unknown actionType '{}'", kind)});
        }
    }

    auto ParseClientMessage(std::string_view text) -> std::expected<ClientMessage, ParseError>
    {
        json const j = json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return std::unexpected(ParseError{"malformed JSON"});

        try
        {
            std::string const type = j.at("type").get<std::string>();
            std::string match_id = j.at("matchId").get<std::string>();

            if (type == "join_game") return JoinGame{std::move(match_id)};
            if (type == "animations_complete") return AnimationsComplete{std::move(match_id)};
            if (type == "action")
            {
                auto action = ParseAction(j);
                if (!action) return std::unexpected(action.error());
                return Action{std::move(match_id), std::move(*action)};
            }
            return std::unexpected(ParseError{std::format("unknown message type '{}'", type)});
        }
        catch (json::exception const& e)
        {
            return std::unexpected(ParseError{std::format("bad message: {}", e.what())});
        }
    }

    auto StateToJson(GameState const& state, PlayerId const& viewer) -> json
    {
        json board = json::array();
        for (auto const& cell : state.board) board.push_back(cell ? CellToJson(*cell) : json(nullptr));

        json tiles = json::array();
        for (TileEffect const& t : state.tiles) tiles.push_back(TileToJson(t));

        json cards = json::object();
        auto reveal = [&](CardInstanceId const& id)
        {
            if (InGameCardCSP const c = state.Card(id)) cards[id] = CardToJson(*c);
        };
        for (auto const& cell : state.board)
        {
            if (cell) reveal(cell->card);
        }
        if (PlayerState const* me = state.Player(viewer))
        {
            for (CardInstanceId const& id : me->hand) reveal(id);
        }

        return json{
            {"board", std::move(board)},
            {"tiles", std::move(tiles)},
            {"player1", PlayerToJson(state.player1, state.player1.user_id == viewer)},
            {"player2", PlayerToJson(state.player2, state.player2.user_id == viewer)},
            {"currentPlayerId", state.current_player_id},
            {"turnNumber", state.turn_number},
            {"status", std::string{to_string(state.status)}},
            {"maxHandSize", state.max_hand_size},
            {"winner", state.winner ? json(*state.winner) : json(nullptr)},
            {"cards", std::move(cards)}
        };
    }

    auto EventToJson(GameEvent const& e) -> json
    {
        json out{{"seq", e.seq}, {"type", std::string{to_string(e.type)}}};
        if (e.position) out["position"] = PositionToJson(*e.position);
        if (e.card) out["cardInstanceId"] = *e.card;
        if (e.player) out["playerId"] = *e.player;
        if (!e.detail.empty()) out["detail"] = e.detail;
        return out;
    }

    auto MakeJoined(GameState const& state, PlayerId const& viewer, int player_slot) -> std::string
    {
        json j = Frame("joined");
        j["gameState"] = StateToJson(state, viewer);
        j["playerSlot"] = player_slot;
        return Dump(j);
    }

    auto MakeStartTurn(PlayerId const& current, int time_allowed_seconds) -> std::string
    {
        json j = Frame("start_turn");
        j["currentPlayerId"] = current;
        j["timeAllowedSeconds"] = time_allowed_seconds;
        return Dump(j);
    }

    auto MakeEvents(std::span<GameEvent const> events, GameState const& state,
                    PlayerId const& viewer, bool server_forced) -> std::string
    {
        json applied = json::array();
        for (GameEvent const& e : events) applied.push_back(EventToJson(e));

        json j = Frame("events");
        j["appliedEvents"] = std::move(applied);
        j["gameState"] = StateToJson(state, viewer);
        if (server_forced) j["serverForced"] = true;
        return Dump(j);
    }

    auto MakeGameEnd(std::optional<PlayerId> const& winner, TerminationReason reason) -> std::string
    {
        json j = Frame("game_end");
        j["winnerId"] = winner ? json(*winner) : json(nullptr);
        j["reason"] = std::string{to_string(reason)};
        return Dump(j);
    }

    auto MakeError(std::string_view message) -> std::string
    {
        json j = Frame("error");
        j["message"] = std::string{message};
        return Dump(j);
    }

    auto MakePlayerJoined(PlayerId const& user, int player_slot) -> std::string
    {
        json j = Frame("player_joined");
        j["userId"] = user;
        j["playerSlot"] = player_slot;
        return Dump(j);
    }

    auto MakePlayerDisconnected(PlayerId const& user) -> std::string
    {
        json j = Frame("player_disconnected");
        j["userId"] = user;
        return Dump(j);
    }

    auto MakeSessionReplaced() -> std::string
    {
        json j = Frame("session_replaced");
        j["message"] = "Connected from another session";
        return Dump(j);
    }

    auto MakeMatched(MatchId const& match) -> std::string
    {
        json j = Frame("matched");
        j["matchId"] = match;
        return Dump(j);
    }

    auto BuildJoinGame(MatchId const& match) -> std::string
    {
        json j = Frame("join_game");
        j["matchId"] = match;
        return Dump(j);
    }

    auto BuildPlaceCard(MatchId const& match, CardInstanceId const& card, Position pos) -> std::string
    {
        json j = Frame("action");
        j["matchId"] = match;
        j["actionType"] = "placeCard";
        j["cardInstanceId"] = card;
        j["position"] = PositionToJson(pos);
        return Dump(j);
    }

    auto BuildEndTurn(MatchId const& match) -> std::string
    {
        json j = Frame("action");
        j["matchId"] = match;
        j["actionType"] = "endTurn";
        return Dump(j);
    }

    auto BuildSurrender(MatchId const& match) -> std::string
    {
        json j = Frame("action");
        j["matchId"] = match;
        j["actionType"] = "surrender";
        return Dump(j);
    }

    auto BuildAnimationsComplete(MatchId const& match) -> std::string
    {
        json j = Frame("animations_complete");
        j["matchId"] = match;
        return Dump(j);
    }
}
