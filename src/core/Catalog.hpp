//
// Catalog.hpp
//

#ifndef GRIDDUEL_CATALOG_HPP
#define GRIDDUEL_CATALOG_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "Ability.hpp"
#include "Card.hpp"
#include "Hydrator.hpp"

namespace gridduel::core
{
    struct CardDefinition
    {
        std::string id;
        std::string name;
        Rarity rarity{Rarity::Common};
        Power base_power{};
        std::vector<std::string> tags;
        std::optional<AbilitySpec> ability{};
    };

    struct CardInstanceRecord
    {
        CardInstanceId id;
        std::string card_id;
        PlayerId owner;
        std::uint8_t level{1};
        Power enhancements{};
    };

    struct DeckRecord
    {
        std::string ref;
        PlayerId owner;
        std::vector<CardInstanceId> cards;
    };

    // Read-only after loading; lookups need no locking.
    class Catalog final : public CardHydrator, public DeckProvider
    {
    public:
        explicit Catalog(std::uint8_t level_step = 2);

        // Throws error::SerializationError on malformed documents or dangling references.
        static auto FromJson(nlohmann::json const& doc, std::uint8_t level_step) -> std::shared_ptr<Catalog>;
        static auto LoadFile(std::string const& path, std::uint8_t level_step) -> std::shared_ptr<Catalog>;

        auto AddCard(CardDefinition def) -> void;
        auto AddInstance(CardInstanceRecord rec) -> void;
        auto AddDeck(DeckRecord deck) -> void;

        auto Resolve(CardInstanceId const& id, std::optional<PlayerId> const& owner) const
            -> std::expected<InGameCardCSP, error::ActionError> override;
        auto DeckCards(std::string const& deck_ref, PlayerId const& owner) const
            -> std::expected<std::vector<CardInstanceId>, error::ActionError> override;

        auto CardCount() const noexcept -> std::size_t { return cards_.size(); }
        auto InstanceCount() const noexcept -> std::size_t { return instances_.size(); }
        auto DeckCount() const noexcept -> std::size_t { return decks_.size(); }

    private:
        std::uint8_t level_step_;
        std::unordered_map<std::string, CardDefinition> cards_;
        std::unordered_map<CardInstanceId, CardInstanceRecord> instances_;
        std::unordered_map<std::string, DeckRecord> decks_;
    };

    auto PowerFromJson(nlohmann::json const& j) -> Power;
    auto PowerToJson(Power const& p) -> nlohmann::json;
    auto AbilityFromJson(nlohmann::json const& j) -> AbilitySpec;
    auto AbilityToJson(AbilitySpec const& a) -> nlohmann::json;
}

#endif //GRIDDUEL_CATALOG_HPP
