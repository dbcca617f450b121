//
// GameState.hpp
//

#ifndef GRIDDUEL_GAMESTATE_HPP
#define GRIDDUEL_GAMESTATE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "Card.hpp"
#include "Types.hpp"

namespace gridduel::core
{
    struct TimedModifier
    {
        Power delta{};
        std::uint8_t turns_left{};

        auto operator==(TimedModifier const&) const -> bool = default;
    };

    // turns_left is counted per player slot (0 = player1) and ticks at the end of
    // that player's own turn. The tile reverts once both counters reach zero.
    struct TileEffect
    {
        TileStatus status{TileStatus::Normal};
        int magnitude{};
        std::array<std::uint8_t, 2> turns_left{};

        [[nodiscard]]
        auto Active() const noexcept -> bool
        {
            return status != TileStatus::Normal && (turns_left[0] > 0 || turns_left[1] > 0);
        }

        [[nodiscard]]
        auto Delta() const noexcept -> int
        {
            if (status == TileStatus::Cursed) return -magnitude;
            if (status == TileStatus::Blessed) return magnitude;
            return 0;
        }

        auto operator==(TileEffect const&) const -> bool = default;
    };

    struct BoardCell
    {
        PlayerId owner;
        CardInstanceId card;
        Power hydrated{};
        Power permanent{};
        std::vector<TimedModifier> timed;
        Power power{}; // resolved, never below zero
        std::uint8_t level{1};
        std::uint8_t immune_turns{};
        CardState state{CardState::Normal};
        std::optional<TileEffect> tile{}; // tile effect absorbed on placement

        // Recomputes power and state from hydrated + modifiers.
        auto Resolve() -> void;

        [[nodiscard]]
        auto Immune() const noexcept -> bool { return immune_turns > 0; }

        auto operator==(BoardCell const&) const -> bool = default;
    };

    using Board = std::array<std::optional<BoardCell>, constants::CellCount>;
    using Tiles = std::array<TileEffect, constants::CellCount>;

    struct PlayerState
    {
        PlayerId user_id;
        std::vector<CardInstanceId> hand;
        std::vector<CardInstanceId> deck;
        std::vector<CardInstanceId> discard;
        std::uint32_t score{};
    };

    // Value type: every engine operation takes one by const& and returns a new one.
    struct GameState
    {
        Board board{};
        Tiles tiles{};
        PlayerState player1;
        PlayerState player2;
        PlayerId current_player_id;
        std::uint32_t turn_number{1};
        GameStatus status{GameStatus::Active};
        std::uint8_t max_hand_size{constants::MaxHandSize};
        std::optional<PlayerId> winner{};
        // hydration cache keyed by instance id; entries are immutable and shared
        std::unordered_map<CardInstanceId, InGameCardCSP> cache;

        [[nodiscard]]
        auto IsActive() const noexcept -> bool { return status == GameStatus::Active; }

        [[nodiscard]]
        auto Cell(Position p) const -> std::optional<BoardCell> const& { return board.at(p.Index()); }
        auto Cell(Position p) -> std::optional<BoardCell>& { return board.at(p.Index()); }

        // 0 for player1, 1 for player2, nullopt for strangers
        [[nodiscard]]
        auto SlotOf(PlayerId const& id) const -> std::optional<std::size_t>;
        auto Player(PlayerId const& id) -> PlayerState*;
        [[nodiscard]]
        auto Player(PlayerId const& id) const -> PlayerState const*;
        [[nodiscard]]
        auto OpponentOf(PlayerId const& id) const -> PlayerId const&;

        [[nodiscard]]
        auto Card(CardInstanceId const& id) const -> InGameCardCSP;

        [[nodiscard]]
        auto OccupiedCount() const -> std::size_t;
        [[nodiscard]]
        auto EmptyCells() const -> std::vector<Position>;
        [[nodiscard]]
        auto IsBoardFull() const -> bool { return OccupiedCount() == constants::CellCount; }
        [[nodiscard]]
        auto CountOwned(PlayerId const& id) const -> std::uint32_t;
    };

    // Winner implied by a terminal status, if any.
    auto WinnerFor(GameState const& s) -> std::optional<PlayerId>;
}

#endif //GRIDDUEL_GAMESTATE_HPP
