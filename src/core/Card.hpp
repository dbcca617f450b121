//
// Card.hpp
//

#ifndef GRIDDUEL_CARD_HPP
#define GRIDDUEL_CARD_HPP

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Ability.hpp"
#include "Types.hpp"

namespace gridduel::core
{
    // Battle-ready view of one card instance. Built once by a hydrator and shared
    // read-only between every snapshot of a match.
    struct InGameCard
    {
        CardInstanceId instance_id;
        std::string base_card_id;
        std::string name;
        Rarity rarity{Rarity::Common};
        Power base_power{};
        Power enhancements{};
        std::uint8_t level{1};
        Power current_power{};
        std::vector<std::string> tags;
        std::optional<AbilitySpec> ability{};
        PlayerId owner;

        [[nodiscard]]
        auto HasTag(std::string_view tag) const -> bool
        {
            return std::ranges::find(tags, tag) != tags.end();
        }
    };

    using InGameCardCSP = std::shared_ptr<InGameCard const>;

    // base + enhancements + one point per level_step levels above 1
    inline auto LevelAdjusted(Power const& base, Power const& enhancements,
                              std::uint8_t level, std::uint8_t level_step) -> Power
    {
        int const bonus = (level > 1 && level_step > 0) ? (level - 1) / level_step : 0;
        return base + enhancements + Power::Uniform(bonus);
    }
}

#endif //GRIDDUEL_CARD_HPP
