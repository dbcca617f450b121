//
// ClassicRules.hpp
//

#ifndef GRIDDUEL_CLASSICRULES_HPP
#define GRIDDUEL_CLASSICRULES_HPP
#include "Rules.hpp"

namespace gridduel::core
{
    class ClassicRules final : public Rules
    {
    public:
        auto Validate(GameState const& game, PlayerId const& actor, PlayerAction const& a) const
            -> CheckResult override;
        auto Beats(BoardCell const& attacker, BoardCell const& defender, Direction towards) const
            -> bool override;
        auto Outcome(GameState const& game) const -> GameStatus override;
    };
}

#endif //GRIDDUEL_CLASSICRULES_HPP
