//
// Types.cpp
//

#include "Types.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include <type_traits>

#include "Ability.hpp"
#include "Exception.hpp"

namespace gridduel::core
{
    namespace
    {
        template <typename E, std::size_t N>
        auto ParseName(std::string_view s, std::array<std::string_view, N> const& names) -> std::optional<E>
        {
            auto const it = std::ranges::find(names, s);
            if (it == names.end()) return std::nullopt;
            return static_cast<E>(std::distance(names.begin(), it));
        }

        constexpr std::array<std::string_view, 5> RarityNames{"common", "uncommon", "rare", "epic", "legendary"};
        constexpr std::array<std::string_view, 3> DifficultyNames{"easy", "medium", "hard"};
        constexpr std::array<std::string_view, 4> DirectionNames{"top", "right", "bottom", "left"};
        constexpr std::array<std::string_view, 6> ScopeNames{
            "self", "adjacentAllies", "adjacentEnemies", "allAllies", "allEnemies", "flipTarget"
        };
        constexpr std::array<std::string_view, 5> ConditionNames{
            "always", "onCorner", "onEdge", "adjacentAllyTag", "adjacentEnemiesAtLeast"
        };
    }

    auto to_string(GameStatus s) -> std::string_view
    {
        switch (s)
        {
        case GameStatus::Active: return "active";
        case GameStatus::Player1Win: return "player1_win";
        case GameStatus::Player2Win: return "player2_win";
        case GameStatus::Draw: return "draw";
        case GameStatus::Aborted: return "aborted";
        }
        return "unknown";
    }

    auto to_string(CardState s) -> std::string_view
    {
        switch (s)
        {
        case CardState::Normal: return "normal";
        case CardState::Buffed: return "buffed";
        case CardState::Debuffed: return "debuffed";
        case CardState::Immune: return "immune";
        }
        return "unknown";
    }

    auto to_string(TileStatus s) -> std::string_view
    {
        switch (s)
        {
        case TileStatus::Normal: return "normal";
        case TileStatus::Cursed: return "cursed";
        case TileStatus::Blessed: return "blessed";
        }
        return "unknown";
    }

    auto to_string(Rarity r) -> std::string_view { return RarityNames.at(static_cast<std::size_t>(r)); }
    auto to_string(Direction d) -> std::string_view { return DirectionNames.at(static_cast<std::size_t>(d)); }
    auto to_string(Difficulty d) -> std::string_view { return DifficultyNames.at(static_cast<std::size_t>(d)); }
    auto to_string(Scope s) -> std::string_view { return ScopeNames.at(static_cast<std::size_t>(s)); }
    auto to_string(ConditionKind k) -> std::string_view { return ConditionNames.at(static_cast<std::size_t>(k)); }

    auto ParseRarity(std::string_view s) -> std::optional<Rarity> { return ParseName<Rarity>(s, RarityNames); }

    auto ParseDifficulty(std::string_view s) -> std::optional<Difficulty>
    {
        return ParseName<Difficulty>(s, DifficultyNames);
    }

    auto ParseDirection(std::string_view s) -> std::optional<Direction>
    {
        return ParseName<Direction>(s, DirectionNames);
    }

    auto ParseScope(std::string_view s) -> std::optional<Scope> { return ParseName<Scope>(s, ScopeNames); }

    auto ParseConditionKind(std::string_view s) -> std::optional<ConditionKind>
    {
        return ParseName<ConditionKind>(s, ConditionNames);
    }

    auto EffectName(Effect const& e) -> std::string_view
    {
        return std::visit([]<typename T0>(T0 const&) -> std::string_view
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, effects::Buff>) return "buff";
            else if constexpr (std::is_same_v<T, effects::Debuff>) return "debuff";
            else if constexpr (std::is_same_v<T, effects::GrantImmunity>) return "grantImmunity";
            else if constexpr (std::is_same_v<T, effects::HexTiles>) return "hexTiles";
            else if constexpr (std::is_same_v<T, effects::BlessTiles>) return "blessTiles";
            else if constexpr (std::is_same_v<T, effects::DrawCards>) return "drawCards";
            else if constexpr (std::is_same_v<T, effects::EndMatch>) return "endMatch";
            else return "discard";
        }, e);
    }

    auto AbilitySpec::HasTrigger(std::string_view moment) const -> bool
    {
        return std::ranges::find(triggers, moment) != triggers.end();
    }
}

namespace gridduel::core::error
{
    auto to_string(Code c) -> std::string_view
    {
        switch (c)
        {
        case Code::Unknown: return "unknown";
        case Code::Rules: return "rules";
        case Code::State: return "state";
        case Code::InvalidAction: return "illegal_move";
        case Code::NotFound: return "not_found";
        case Code::Timeout: return "timeout";
        case Code::Network: return "network";
        case Code::Serialization: return "serialization";
        case Code::Persistence: return "persistence";
        case Code::Assertion: return "assertion";
        }
        return "unknown";
    }
}
