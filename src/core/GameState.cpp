//
// GameState.cpp
//

#include "GameState.hpp"

#include <algorithm>
#include <ranges>

#include "Exception.hpp"

namespace gridduel::core
{
    auto BoardCell::Resolve() -> void
    {
        Power raw = hydrated + permanent;
        for (TimedModifier const& m : timed) raw += m.delta;
        for (auto& side : raw.v) side = std::max(side, 0);
        power = raw;

        if (immune_turns > 0) state = CardState::Immune;
        else if (power.Sum() > hydrated.Sum()) state = CardState::Buffed;
        else if (power.Sum() < hydrated.Sum()) state = CardState::Debuffed;
        else state = CardState::Normal;
    }

    auto GameState::SlotOf(PlayerId const& id) const -> std::optional<std::size_t>
    {
        if (id == player1.user_id) return 0;
        if (id == player2.user_id) return 1;
        return std::nullopt;
    }

    auto GameState::Player(PlayerId const& id) -> PlayerState*
    {
        if (id == player1.user_id) return &player1;
        if (id == player2.user_id) return &player2;
        return nullptr;
    }

    auto GameState::Player(PlayerId const& id) const -> PlayerState const*
    {
        if (id == player1.user_id) return &player1;
        if (id == player2.user_id) return &player2;
        return nullptr;
    }

    auto GameState::OpponentOf(PlayerId const& id) const -> PlayerId const&
    {
        if (id == player1.user_id) return player2.user_id;
        if (id == player2.user_id) return player1.user_id;
        GDL_THROW(error::Code::State, "OpponentOf: unknown player " + id);
    }

    auto GameState::Card(CardInstanceId const& id) const -> InGameCardCSP
    {
        auto const it = cache.find(id);
        return it == cache.end() ? nullptr : it->second;
    }

    auto GameState::OccupiedCount() const -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(board, [](auto const& c) { return c.has_value(); }));
    }

    auto GameState::EmptyCells() const -> std::vector<Position>
    {
        std::vector<Position> out;
        for (std::size_t i{}; i < board.size(); ++i)
        {
            if (!board[i]) out.push_back(Position::FromIndex(i));
        }
        return out;
    }

    auto GameState::CountOwned(PlayerId const& id) const -> std::uint32_t
    {
        return static_cast<std::uint32_t>(std::ranges::count_if(board, [&id](auto const& c)
        {
            return c && c->owner == id;
        }));
    }

    auto WinnerFor(GameState const& s) -> std::optional<PlayerId>
    {
        switch (s.status)
        {
        case GameStatus::Player1Win: return s.player1.user_id;
        case GameStatus::Player2Win: return s.player2.user_id;
        default: return std::nullopt;
        }
    }
}
