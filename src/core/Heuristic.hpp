//
// Heuristic.hpp
//

#ifndef GRIDDUEL_HEURISTIC_HPP
#define GRIDDUEL_HEURISTIC_HPP

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <vector>

#include "Card.hpp"
#include "Game.hpp"
#include "GameState.hpp"
#include "Types.hpp"

namespace gridduel::core
{
    struct ScoredMove
    {
        CardInstanceId card;
        Position position;
        int score{};
    };

    // Positional bonus by cell index: corners first, then the centre block.
    inline constexpr std::array<int, constants::CellCount> PositionalBonus{
        50, 0, 0, 50,
        0, 30, 30, 0,
        0, 30, 30, 0,
        50, 0, 0, 50
    };

    // How many of the best candidates a difficulty chooses from.
    constexpr auto CandidatePool(Difficulty d) noexcept -> std::size_t
    {
        switch (d)
        {
        case Difficulty::Hard: return 1;
        case Difficulty::Medium: return 3;
        case Difficulty::Easy: return 5;
        }
        return 1;
    }

    // Greedy one-ply placement scorer. Abilities are not simulated.
    class Heuristic
    {
    public:
        explicit Heuristic(std::uint64_t rng_seed);

        // +100 per flip, plus the card's power sum, plus the positional bonus.
        auto Score(GameState const& state, Rules const& rules, InGameCard const& card,
                   Position position, PlayerId const& player) const -> int;

        // Every hand card x empty cell, best first. Ties keep hand order then board-scan order.
        auto Candidates(GameState const& state, GameEngine const& engine, PlayerId const& player) const
            -> std::vector<ScoredMove>;

        // nullopt when the player has nothing to place.
        auto Choose(GameState const& state, GameEngine const& engine, PlayerId const& player,
                    Difficulty difficulty) -> std::optional<ScoredMove>;

    private:
        std::mt19937_64 rng_;
        std::mutex rng_mx_;
    };
}

#endif //GRIDDUEL_HEURISTIC_HPP
