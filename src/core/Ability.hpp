//
// Ability.hpp
//

#ifndef GRIDDUEL_ABILITY_HPP
#define GRIDDUEL_ABILITY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Types.hpp"

namespace gridduel::core
{
    // Trigger moments are open-ended tags. The engine only ever fires the ones below,
    // cards may list others which a caller can fire through AbilityRegistry::Dispatch.
    namespace moments
    {
        inline constexpr std::string_view OnPlace = "OnPlace";
        inline constexpr std::string_view OnFlip = "OnFlip";
        inline constexpr std::string_view OnFlipped = "OnFlipped";
        inline constexpr std::string_view OnTurnStart = "OnTurnStart";
        inline constexpr std::string_view OnTurnEnd = "OnTurnEnd";
        inline constexpr std::string_view OnRoundStart = "OnRoundStart";
        inline constexpr std::string_view OnRoundEnd = "OnRoundEnd";
    }

    enum class Scope : std::uint8_t
    {
        Self = 0,
        AdjacentAllies,
        AdjacentEnemies,
        AllAllies, // excludes the trigger cell
        AllEnemies,
        FlipTarget // the other cell of an OnFlip/OnFlipped pair
    };

    enum class ConditionKind : std::uint8_t
    {
        Always = 0,
        OnCorner,
        OnEdge,
        AdjacentAllyTag,
        AdjacentEnemiesAtLeast
    };

    struct Condition
    {
        ConditionKind kind{ConditionKind::Always};
        std::string tag{};
        std::uint8_t count{};
    };

    namespace effects
    {
        // duration 0 = permanent while the card stays on the board
        struct Buff
        {
            Scope scope{Scope::Self};
            int magnitude{1};
            std::optional<Direction> side{};
            std::uint8_t duration{0};
        };

        struct Debuff
        {
            Scope scope{Scope::AdjacentEnemies};
            int magnitude{1};
            std::optional<Direction> side{};
            std::uint8_t duration{0};
        };

        struct GrantImmunity
        {
            Scope scope{Scope::Self};
            std::uint8_t turns{1};
        };

        // Tile effects target the empty tiles orthogonally adjacent to the trigger cell.
        struct HexTiles
        {
            int magnitude{1};
            std::uint8_t turns{2};
        };

        struct BlessTiles
        {
            int magnitude{1};
            std::uint8_t turns{2};
        };

        struct DrawCards
        {
            std::uint8_t count{1};
        };

        // Forces a terminal status: the ability owner wins, or by score when by_score.
        struct EndMatch
        {
            bool by_score{false};
        };

        // Moves the newest cards of a hand to its owner's discard pile.
        struct Discard
        {
            std::uint8_t count{1};
            bool opponent{true}; // false discards from the ability owner's own hand
        };
    }

    using Effect = std::variant<effects::Buff,
                                effects::Debuff,
                                effects::GrantImmunity,
                                effects::HexTiles,
                                effects::BlessTiles,
                                effects::DrawCards,
                                effects::EndMatch,
                                effects::Discard>;

    auto EffectName(Effect const& e) -> std::string_view;
    auto to_string(Scope s) -> std::string_view;
    auto to_string(ConditionKind k) -> std::string_view;
    auto ParseScope(std::string_view s) -> std::optional<Scope>;
    auto ParseConditionKind(std::string_view s) -> std::optional<ConditionKind>;
    auto ParseDirection(std::string_view s) -> std::optional<Direction>;

    struct AbilitySpec
    {
        std::string name;
        std::string description;
        std::vector<std::string> triggers;
        Condition condition{};
        std::vector<Effect> effects;

        [[nodiscard]]
        auto HasTrigger(std::string_view moment) const -> bool;
    };
}

#endif //GRIDDUEL_ABILITY_HPP
