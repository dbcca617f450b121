//
// Rewards.cpp
//

#include "Rewards.hpp"

#include <print>

namespace gridduel::net
{
    auto LoggingRewardsSink::Submit(core::MatchId const& match, core::GameState const& final_state,
                                    TerminationReason reason) noexcept -> void
    {
        std::print("[Rewards] match={} status={} reason={} winner={} score={}:{}\n",
                   match,
                   core::to_string(final_state.status),
                   to_string(reason),
                   final_state.winner.value_or("none"),
                   final_state.player1.score,
                   final_state.player2.score);
    }
}
