//
// Hydrator.hpp
//

#ifndef GRIDDUEL_HYDRATOR_HPP
#define GRIDDUEL_HYDRATOR_HPP

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "Card.hpp"
#include "Exception.hpp"

namespace gridduel::core
{
    // Source of battle-ready cards. When `owner` is given an instance owned by someone
    // else resolves to NotFound.
    class CardHydrator
    {
    public:
        virtual ~CardHydrator() = default;
        virtual auto Resolve(CardInstanceId const& id, std::optional<PlayerId> const& owner) const
            -> std::expected<InGameCardCSP, error::ActionError> = 0;
    };

    class DeckProvider
    {
    public:
        virtual ~DeckProvider() = default;
        // Ordered instance ids of a player's deck.
        virtual auto DeckCards(std::string const& deck_ref, PlayerId const& owner) const
            -> std::expected<std::vector<CardInstanceId>, error::ActionError> = 0;
    };
}

#endif //GRIDDUEL_HYDRATOR_HPP
