//
// Rewards.hpp
//

#ifndef GRIDDUEL_REWARDS_HPP
#define GRIDDUEL_REWARDS_HPP

#include <cstdint>
#include <string_view>

#include "../core/GameState.hpp"
#include "../core/Types.hpp"

namespace gridduel::net
{
    enum class TerminationReason : std::uint8_t
    {
        Completed,
        Surrender,
        Disconnect,
        Aborted
    };

    inline auto to_string(TerminationReason r) -> std::string_view
    {
        switch (r)
        {
        case TerminationReason::Completed: return "completed";
        case TerminationReason::Surrender: return "surrender";
        case TerminationReason::Disconnect: return "disconnect";
        case TerminationReason::Aborted: return "aborted";
        }
        return "completed";
    }

    // Fire-and-forget: implementations must not block or throw back into the session.
    class RewardsSink
    {
    public:
        virtual ~RewardsSink() = default;
        virtual auto Submit(core::MatchId const& match, core::GameState const& final_state,
                            TerminationReason reason) noexcept -> void = 0;
    };

    class LoggingRewardsSink final : public RewardsSink
    {
    public:
        auto Submit(core::MatchId const& match, core::GameState const& final_state,
                    TerminationReason reason) noexcept -> void override;
    };
}

#endif //GRIDDUEL_REWARDS_HPP
