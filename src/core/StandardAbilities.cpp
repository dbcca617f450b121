//
// StandardAbilities.cpp
//

#include <algorithm>
#include <format>
#include <ranges>

#include "AbilityRegistry.hpp"
#include "Exception.hpp"

namespace gridduel::core
{
    namespace
    {
        auto ModifierDelta(int magnitude, std::optional<Direction> side) -> Power
        {
            if (!side) return Power::Uniform(magnitude);
            Power p{};
            p[*side] = magnitude;
            return p;
        }

        auto ApplyModifier(GameState s, AbilityContext const& ctx, Scope scope, Power const delta,
                           std::uint8_t duration, bool is_debuff) -> GameState
        {
            for (Position const target : ResolveScope(s, ctx, scope))
            {
                BoardCell& cell = *s.Cell(target);
                if (is_debuff && cell.Immune()) continue;
                if (duration == 0) cell.permanent += delta;
                else cell.timed.push_back(TimedModifier{delta, duration});
                cell.Resolve();
            }
            return s;
        }

        auto MarkTiles(GameState s, AbilityContext const& ctx, TileStatus status, int magnitude,
                       std::uint8_t turns) -> GameState
        {
            for (Direction const d : AllDirections)
            {
                Position const n = Step(ctx.position, d);
                if (!n.InBounds() || s.Cell(n)) continue;
                s.tiles[n.Index()] = TileEffect{status, magnitude, {turns, turns}};
            }
            return s;
        }
    }

    auto MakeStandardRegistry() -> AbilityRegistry
    {
        AbilityRegistry reg;

        reg.Register<effects::Buff>([](GameState s, AbilityContext const& ctx, effects::Buff const& e)
        {
            return ApplyModifier(std::move(s), ctx, e.scope, ModifierDelta(e.magnitude, e.side), e.duration, false);
        });

        reg.Register<effects::Debuff>([](GameState s, AbilityContext const& ctx, effects::Debuff const& e)
        {
            return ApplyModifier(std::move(s), ctx, e.scope, ModifierDelta(-e.magnitude, e.side), e.duration, true);
        });

        reg.Register<effects::GrantImmunity>(
            [](GameState s, AbilityContext const& ctx, effects::GrantImmunity const& e)
            {
                for (Position const target : ResolveScope(s, ctx, e.scope))
                {
                    BoardCell& cell = *s.Cell(target);
                    cell.immune_turns = std::max(cell.immune_turns, e.turns);
                    cell.Resolve();
                }
                return s;
            });

        reg.Register<effects::HexTiles>([](GameState s, AbilityContext const& ctx, effects::HexTiles const& e)
        {
            return MarkTiles(std::move(s), ctx, TileStatus::Cursed, e.magnitude, e.turns);
        });

        reg.Register<effects::BlessTiles>([](GameState s, AbilityContext const& ctx, effects::BlessTiles const& e)
        {
            return MarkTiles(std::move(s), ctx, TileStatus::Blessed, e.magnitude, e.turns);
        });

        // Draws into the ability owner's hand, never past the hand limit.
        reg.Register<effects::DrawCards>([](GameState s, AbilityContext const& ctx, effects::DrawCards const& e)
        {
            PlayerState* p = s.Player(ctx.owner);
            if (!p) return s;
            for (std::uint8_t i{}; i < e.count; ++i)
            {
                if (p->deck.empty() || p->hand.size() >= s.max_hand_size) break;
                p->hand.push_back(std::move(p->deck.front()));
                p->deck.erase(p->deck.begin());
            }
            return s;
        });

        reg.Register<effects::EndMatch>([](GameState s, AbilityContext const& ctx, effects::EndMatch const& e)
        {
            if (e.by_score)
            {
                // board ownership, not the score fields: those are recounted after dispatch
                std::uint32_t const p1 = s.CountOwned(s.player1.user_id);
                std::uint32_t const p2 = s.CountOwned(s.player2.user_id);
                if (p1 > p2) s.status = GameStatus::Player1Win;
                else if (p2 > p1) s.status = GameStatus::Player2Win;
                else s.status = GameStatus::Draw;
            }
            else
            {
                s.status = s.SlotOf(ctx.owner) == 0u ? GameStatus::Player1Win : GameStatus::Player2Win;
            }
            s.winner = WinnerFor(s);
            return s;
        });

        reg.Register<effects::Discard>([](GameState s, AbilityContext const& ctx, effects::Discard const& e)
        {
            if (!s.SlotOf(ctx.owner)) return s;
            PlayerState* p = s.Player(e.opponent ? s.OpponentOf(ctx.owner) : ctx.owner);
            for (std::uint8_t i{}; i < e.count && !p->hand.empty(); ++i)
            {
                p->discard.push_back(std::move(p->hand.back()));
                p->hand.pop_back();
            }
            return s;
        });

        if (auto const missing = reg.MissingHandlers(); !missing.empty())
        {
            GDL_THROW(error::Code::Rules, std::format("Standard registry misses handler for '{}'", missing.front()));
        }
        return reg;
    }
}
