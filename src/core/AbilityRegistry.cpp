//
// AbilityRegistry.cpp
//

#include "AbilityRegistry.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <ranges>

#include "Exception.hpp"

namespace gridduel::core
{
    namespace
    {
        auto Neighbours(Position p) -> std::vector<Position>
        {
            std::vector<Position> out;
            for (Direction const d : AllDirections)
            {
                Position const n = Step(p, d);
                if (n.InBounds()) out.push_back(n);
            }
            return out;
        }

        auto IsCorner(Position p) -> bool
        {
            constexpr int last = static_cast<int>(constants::BoardSize) - 1;
            return (p.x == 0 || p.x == last) && (p.y == 0 || p.y == last);
        }

        auto IsEdge(Position p) -> bool
        {
            constexpr int last = static_cast<int>(constants::BoardSize) - 1;
            return p.x == 0 || p.y == 0 || p.x == last || p.y == last;
        }
    }

    auto ConditionHolds(GameState const& s, Position const pos, PlayerId const& owner, Condition const& c) -> bool
    {
        switch (c.kind)
        {
        case ConditionKind::Always:
            return true;
        case ConditionKind::OnCorner:
            return IsCorner(pos);
        case ConditionKind::OnEdge:
            return IsEdge(pos);
        case ConditionKind::AdjacentAllyTag:
            return std::ranges::any_of(Neighbours(pos), [&](Position const n)
            {
                auto const& cell = s.Cell(n);
                if (!cell || cell->owner != owner) return false;
                InGameCardCSP const card = s.Card(cell->card);
                return card && card->HasTag(c.tag);
            });
        case ConditionKind::AdjacentEnemiesAtLeast:
            {
                auto const enemies = std::ranges::count_if(Neighbours(pos), [&](Position const n)
                {
                    auto const& cell = s.Cell(n);
                    return cell && cell->owner != owner;
                });
                return enemies >= static_cast<std::ptrdiff_t>(c.count);
            }
        }
        return false;
    }

    auto ResolveScope(GameState const& s, AbilityContext const& ctx, Scope const scope) -> std::vector<Position>
    {
        std::vector<Position> out;
        auto occupied_by = [&](Position const p, bool ally) -> bool
        {
            auto const& cell = s.Cell(p);
            return cell && ((cell->owner == ctx.owner) == ally);
        };

        switch (scope)
        {
        case Scope::Self:
            if (s.Cell(ctx.position)) out.push_back(ctx.position);
            break;
        case Scope::AdjacentAllies:
        case Scope::AdjacentEnemies:
            for (Position const n : Neighbours(ctx.position))
            {
                if (occupied_by(n, scope == Scope::AdjacentAllies)) out.push_back(n);
            }
            std::ranges::sort(out, {}, &Position::Index);
            break;
        case Scope::AllAllies:
        case Scope::AllEnemies:
            for (std::size_t i{}; i < constants::CellCount; ++i)
            {
                Position const p = Position::FromIndex(i);
                if (p == ctx.position) continue;
                if (occupied_by(p, scope == Scope::AllAllies)) out.push_back(p);
            }
            break;
        case Scope::FlipTarget:
            if (ctx.counterpart && s.Cell(*ctx.counterpart)) out.push_back(*ctx.counterpart);
            break;
        }
        return out;
    }

    auto AbilityRegistry::MissingHandlers() const -> std::vector<std::string_view>
    {
        std::vector<std::string_view> missing;
        [&]<std::size_t... I>(std::index_sequence<I...>)
        {
            ((handlers_[I] ? void() : missing.push_back(EffectName(Effect{std::in_place_index<I>}))), ...);
        }(std::make_index_sequence<std::variant_size_v<Effect>>{});
        return missing;
    }

    auto AbilityRegistry::Dispatch(GameState state,
                                   std::string_view const moment,
                                   std::vector<Position> cells,
                                   PlayerId const& acting_player,
                                   EventLog& log,
                                   std::optional<Position> const counterpart) const -> GameState
    {
        std::ranges::sort(cells, {}, &Position::Index);
        for (Position const pos : cells)
        {
            if (!state.IsActive()) break;

            auto const& cell = state.Cell(pos);
            if (!cell) continue;
            InGameCardCSP const card = state.Card(cell->card);
            if (!card || !card->ability || !card->ability->HasTrigger(moment)) continue;

            AbilitySpec const& ability = *card->ability;
            AbilityContext const ctx{pos, cell->owner, acting_player, moment, counterpart};
            if (!ConditionHolds(state, pos, ctx.owner, ability.condition)) continue;

            log.Push(EventType::AbilityTriggered, pos, card->instance_id, ctx.owner,
                     std::format("{}:{}", ability.name, moment));

            for (Effect const& effect : ability.effects)
            {
                Handler const& handler = handlers_[effect.index()];
                if (!handler)
                {
                    GDL_THROW(error::Code::Rules,
                              std::format("No handler registered for effect '{}'", EffectName(effect)));
                }

                GameState const before = state;
                state = handler(std::move(state), ctx, effect);

                // Emit the observable differences so clients can animate them.
                for (std::size_t i{}; i < constants::CellCount; ++i)
                {
                    auto const& was = before.board[i];
                    auto const& now = state.board[i];
                    if (was && now && was->power != now->power)
                    {
                        log.Push(EventType::PowerChanged, Position::FromIndex(i), now->card, now->owner,
                                 std::format("{},{},{},{}", now->power.v[0], now->power.v[1],
                                             now->power.v[2], now->power.v[3]));
                    }
                    if (before.tiles[i] != state.tiles[i])
                    {
                        log.Push(EventType::TileChanged, Position::FromIndex(i), std::nullopt, ctx.owner,
                                 std::string{to_string(state.tiles[i].status)});
                    }
                }
                for (auto const* side : {&state.player1, &state.player2})
                {
                    PlayerState const* prev = before.Player(side->user_id);
                    for (std::size_t k = prev->hand.size(); k < side->hand.size(); ++k)
                    {
                        log.Push(EventType::CardDrawn, std::nullopt, side->hand[k], side->user_id);
                    }
                    for (std::size_t k = prev->discard.size(); k < side->discard.size(); ++k)
                    {
                        log.Push(EventType::CardDiscarded, std::nullopt, side->discard[k], side->user_id);
                    }
                }
                if (!state.IsActive())
                {
                    if (!state.winner) state.winner = WinnerFor(state);
                    log.Push(EventType::GameOver, pos, card->instance_id, state.winner,
                             std::string{to_string(state.status)});
                    break;
                }
            }
        }
        return state;
    }

    auto AbilityRegistry::DispatchAll(GameState state,
                                      std::string_view const moment,
                                      PlayerId const& acting_player,
                                      EventLog& log) const -> GameState
    {
        std::vector<Position> cells;
        for (std::size_t i{}; i < constants::CellCount; ++i)
        {
            if (state.board[i]) cells.push_back(Position::FromIndex(i));
        }
        return Dispatch(std::move(state), moment, std::move(cells), acting_player, log);
    }
}
