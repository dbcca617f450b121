//
// Actions.hpp
//

#ifndef GRIDDUEL_ACTIONS_HPP
#define GRIDDUEL_ACTIONS_HPP

#include <cstdint>
#include <string_view>
#include <variant>

#include "Types.hpp"

namespace gridduel::core
{
    struct PlaceCardAction
    {
        CardInstanceId card;
        Position position;
    };

    struct EndTurnAction {};
    struct SurrenderAction {};

    using PlayerAction = std::variant<PlaceCardAction, EndTurnAction, SurrenderAction>;

    inline auto ActionName(PlayerAction const& a) -> std::string_view
    {
        switch (a.index())
        {
        case 0: return "placeCard";
        case 1: return "endTurn";
        default: return "surrender";
        }
    }
} // namespace gridduel::core

#endif //GRIDDUEL_ACTIONS_HPP
