//
// Heuristic.cpp
//

#include "Heuristic.hpp"

#include <algorithm>
#include <print>
#include <ranges>

namespace gridduel::core
{
    Heuristic::Heuristic(std::uint64_t rng_seed) :
        rng_(rng_seed) {}

    auto Heuristic::Score(GameState const& state, Rules const& rules, InGameCard const& card,
                          Position const position, PlayerId const& player) const -> int
    {
        BoardCell probe{};
        probe.owner = player;
        probe.card = card.instance_id;
        probe.hydrated = card.current_power;
        probe.level = card.level;
        probe.Resolve();

        int flips = 0;
        for (Direction const d : AllDirections)
        {
            Position const n = Step(position, d);
            if (!n.InBounds()) continue;
            auto const& neighbour = state.Cell(n);
            if (!neighbour || neighbour->owner == player) continue;
            if (rules.Beats(probe, *neighbour, d)) ++flips;
        }
        return flips * 100 + probe.power.Sum() + PositionalBonus[position.Index()];
    }

    auto Heuristic::Candidates(GameState const& state, GameEngine const& engine, PlayerId const& player) const
        -> std::vector<ScoredMove>
    {
        std::vector<ScoredMove> out;
        PlayerState const* me = state.Player(player);
        if (!me) return out;

        std::vector<Position> const empty = state.EmptyCells();
        for (CardInstanceId const& id : me->hand)
        {
            auto card = engine.ResolveCard(state, id, player);
            if (!card)
            {
                std::print("[AI] skipping unresolvable card {}: {}\n", id, card.error().message);
                continue;
            }
            for (Position const p : empty)
            {
                out.push_back(ScoredMove{id, p, Score(state, engine.GetRules(), **card, p, player)});
            }
        }
        std::ranges::stable_sort(out, std::ranges::greater{}, &ScoredMove::score);
        return out;
    }

    auto Heuristic::Choose(GameState const& state, GameEngine const& engine, PlayerId const& player,
                           Difficulty const difficulty) -> std::optional<ScoredMove>
    {
        std::vector<ScoredMove> candidates = Candidates(state, engine, player);
        if (candidates.empty()) return std::nullopt;

        std::size_t const pool = std::min(CandidatePool(difficulty), candidates.size());
        std::size_t pick{};
        {
            std::scoped_lock lock(rng_mx_);
            pick = std::uniform_int_distribution<std::size_t>{0, pool - 1}(rng_);
        }
        return std::move(candidates[pick]);
    }
}
