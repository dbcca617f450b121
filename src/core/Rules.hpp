//
// Rules.hpp
//

#ifndef GRIDDUEL_RULES_HPP
#define GRIDDUEL_RULES_HPP

#include "Actions.hpp"
#include "Exception.hpp"
#include "GameState.hpp"
#include "Types.hpp"

namespace gridduel::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameState const& game, PlayerId const& actor, PlayerAction const& a) const
            -> CheckResult = 0;

        // True when `attacker`, facing `towards`, captures `defender` on the opposite side.
        virtual auto Beats(BoardCell const& attacker, BoardCell const& defender, Direction towards) const
            -> bool = 0;

        // Terminal status of a full board.
        virtual auto Outcome(GameState const& game) const -> GameStatus = 0;
    };
}

#endif //GRIDDUEL_RULES_HPP
