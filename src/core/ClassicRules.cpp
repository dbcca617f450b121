//
// ClassicRules.cpp
//

#include "ClassicRules.hpp"

#include <algorithm>
#include <ranges>
#include <type_traits>

namespace
{
    inline auto Viol(gridduel::core::error::RuleViolationCode code) -> gridduel::core::error::RuleViolation
    {
        return gridduel::core::error::RuleViolation{.code = code};
    }
}

namespace gridduel::core
{
    auto ClassicRules::Beats(BoardCell const& attacker, BoardCell const& defender, Direction const towards) const
        -> bool
    {
        if (defender.Immune()) return false;
        return attacker.power[towards] > defender.power[Opposite(towards)];
    }

    auto ClassicRules::Outcome(GameState const& game) const -> GameStatus
    {
        if (game.player1.score > game.player2.score) return GameStatus::Player1Win;
        if (game.player2.score > game.player1.score) return GameStatus::Player2Win;
        return GameStatus::Draw;
    }

    auto ClassicRules::Validate(GameState const& game, PlayerId const& actor, PlayerAction const& a) const
        -> CheckResult
    {
        using RVC = ::gridduel::core::error::RuleViolationCode;

        if (!game.IsActive())
            return std::unexpected(Viol(RVC::GameNotActive).with_player(actor).with_turn(game.turn_number));

        PlayerState const* me = game.Player(actor);
        if (!me)
            return std::unexpected(Viol(RVC::UnknownPlayer).with_player(actor));

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, SurrenderAction>)
            {
                // allowed out of turn
                return {};
            }
            else
            {
                if (game.current_player_id != actor)
                    return std::unexpected(Viol(RVC::NotYourTurn)
                                           .with_player(actor)
                                           .with_current(game.current_player_id)
                                           .with_turn(game.turn_number));

                if constexpr (std::is_same_v<T, PlaceCardAction>)
                {
                    if (!act.position.InBounds())
                        return std::unexpected(Viol(RVC::Place_OutOfBounds)
                                               .with_player(actor).with_position(act.position));

                    if (game.Cell(act.position))
                        return std::unexpected(Viol(RVC::Place_CellOccupied)
                                               .with_player(actor).with_position(act.position));

                    if (std::ranges::find(me->hand, act.card) == me->hand.end())
                        return std::unexpected(Viol(RVC::Place_CardNotInHand)
                                               .with_player(actor).with_card(act.card));

                    if (InGameCardCSP const card = game.Card(act.card); card && card->owner != actor)
                        return std::unexpected(Viol(RVC::Place_CardNotOwned)
                                               .with_player(actor).with_card(act.card));
                    return {};
                }
                else if constexpr (std::is_same_v<T, EndTurnAction>)
                {
                    return {};
                }
                else
                {
                    GDL_THROW(error::Code::Unknown, "Unreachable variant in Validate");
                }
            }
        }, a);
    }
} // gridduel
