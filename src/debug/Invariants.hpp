//
// Invariants.hpp
//

#ifndef GRIDDUEL_INVARIANTS_HPP
#define GRIDDUEL_INVARIANTS_HPP

#include <cstddef>
#include <format>
#include <optional>
#include <unordered_set>

#include "../core/Exception.hpp"
#include "../core/GameState.hpp"

namespace gridduel::core::debug
{
    // A second layer of checks run by the tests after every transition. Throws
    // error::AssertionError on the first violation.
    inline auto CheckInvariants(GameState const& s, std::optional<std::size_t> expected_cards = std::nullopt) -> void
    {
#if !defined(GDL_ENABLE_TEST_HOOKS) || GDL_ENABLE_TEST_HOOKS == 0
        (void)s;
        (void)expected_cards;
#else
        // 1) Scores are owned-cell counts
        GDL_ASSERT(s.player1.score == s.CountOwned(s.player1.user_id),
                   std::format("player1 score {} != owned {}", s.player1.score, s.CountOwned(s.player1.user_id)));
        GDL_ASSERT(s.player2.score == s.CountOwned(s.player2.user_id),
                   std::format("player2 score {} != owned {}", s.player2.score, s.CountOwned(s.player2.user_id)));

        // 2) Hand limit
        GDL_ASSERT(s.player1.hand.size() <= s.max_hand_size, "player1 hand over the limit");
        GDL_ASSERT(s.player2.hand.size() <= s.max_hand_size, "player2 hand over the limit");

        // 3) Turn owner and winner agree with the status
        if (s.IsActive())
        {
            GDL_ASSERT(s.SlotOf(s.current_player_id).has_value(), "current player is not seated");
            GDL_ASSERT(!s.winner.has_value(), "winner set on an active game");
        }
        else
        {
            GDL_ASSERT(s.winner == WinnerFor(s), "winner does not match the terminal status");
        }

        // 4) A full board is always terminal
        GDL_ASSERT(!s.IsBoardFull() || !s.IsActive(), "board full but game still active");

        // 5) Cells: seated owner, cached card, non-negative power
        for (std::size_t i{}; i < s.board.size(); ++i)
        {
            auto const& cell = s.board[i];
            if (!cell) continue;

            GDL_ASSERT(s.SlotOf(cell->owner).has_value(), std::format("cell {} owned by a stranger", i));
            GDL_ASSERT(s.cache.contains(cell->card), std::format("cell {} card {} not cached", i, cell->card));
            for (int const v : cell->power.v)
            {
                GDL_ASSERT(v >= 0, std::format("cell {} has negative power", i));
            }
        }

        // 6) Every instance lives in exactly one zone
        std::unordered_set<CardInstanceId> seen;
        auto push_unique = [&](CardInstanceId const& id)
        {
            bool const inserted = seen.insert(id).second;
            GDL_ASSERT(inserted, std::format("card {} present in two zones", id));
        };

        for (PlayerState const* p : {&s.player1, &s.player2})
        {
            for (auto const& id : p->hand) push_unique(id);
            for (auto const& id : p->deck) push_unique(id);
            for (auto const& id : p->discard) push_unique(id);
        }
        for (auto const& cell : s.board)
        {
            if (cell) push_unique(cell->card);
        }

        if (expected_cards)
        {
            GDL_ASSERT(seen.size() == *expected_cards,
                       std::format("{} cards in play, expected {}", seen.size(), *expected_cards));
        }
#endif // GDL_ENABLE_TEST_HOOKS
    }
}

#endif //GRIDDUEL_INVARIANTS_HPP
