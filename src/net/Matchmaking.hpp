//
// Matchmaking.hpp
//

#ifndef GRIDDUEL_MATCHMAKING_HPP
#define GRIDDUEL_MATCHMAKING_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Game.hpp"
#include "../core/Hydrator.hpp"
#include "../core/Types.hpp"
#include "GameStore.hpp"
#include "SessionManager.hpp"

namespace gridduel::net
{
    struct MatchmakingConfig
    {
        std::size_t min_deck_size{10};
        std::string ai_deck{"ai-main"}; // the server's deck when a solo request names none
    };

    enum class QueueStatus : std::uint8_t
    {
        Idle,
        Queued,
        Matched
    };

    auto to_string(QueueStatus s) -> std::string_view;

    struct JoinResult
    {
        QueueStatus status{QueueStatus::Idle};
        std::optional<core::MatchId> match_id{};
    };

    // FIFO pairing of players that asked for a match. The newcomer takes the player1 seat.
    // Solo requests skip the queue and start at once against the server.
    class MatchmakingQueue
    {
    public:
        // Called once per paired player, after the match exists. Never under the queue lock.
        using MatchedFn = std::function<void(core::PlayerId const&, core::MatchId const&)>;

        MatchmakingQueue(std::shared_ptr<core::GameEngine const> engine,
                         std::shared_ptr<core::DeckProvider const> decks,
                         std::shared_ptr<GameStore> store,
                         std::shared_ptr<SessionManager> sessions,
                         MatchmakingConfig cfg = {});

        auto OnMatched(MatchedFn fn) -> void;

        auto Start() -> void;
        // Drops everyone still waiting.
        auto Stop() -> void;

        auto Join(core::PlayerId const& user, std::string const& deck_ref)
            -> std::expected<JoinResult, core::error::ActionError>;
        // Empty `ai_deck_ref` falls back to the configured server deck.
        auto StartSolo(core::PlayerId const& user, std::string const& deck_ref, core::Difficulty difficulty,
                       std::string const& ai_deck_ref = {}) -> std::expected<JoinResult, core::error::ActionError>;
        auto Status(core::PlayerId const& user) const -> JoinResult;
        // False when the user was not queued.
        auto Leave(core::PlayerId const& user) -> bool;

        auto QueueLength() const -> std::size_t;

    private:
        struct Entry
        {
            core::PlayerId user;
            std::string deck_ref;
            std::vector<core::CardInstanceId> cards;
            std::chrono::steady_clock::time_point joined_at;
        };

        auto ValidDeck(core::PlayerId const& user, std::string const& deck_ref) const
            -> std::expected<std::vector<core::CardInstanceId>, core::error::ActionError>;
        auto EnqueueLocked(Entry entry, bool front) -> void;
        auto PopLocked() -> Entry;

    private:
        std::shared_ptr<core::GameEngine const> engine_;
        std::shared_ptr<core::DeckProvider const> decks_;
        std::shared_ptr<GameStore> store_;
        std::shared_ptr<SessionManager> sessions_;
        MatchmakingConfig cfg_;

        MatchedFn on_matched_{};

        mutable std::mutex mx_;
        bool running_{false};
        std::list<Entry> queue_;
        std::unordered_map<core::PlayerId, std::list<Entry>::iterator> index_;
    };
}

#endif //GRIDDUEL_MATCHMAKING_HPP
