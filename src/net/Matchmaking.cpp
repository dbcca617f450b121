//
// Matchmaking.cpp
//

#include "Matchmaking.hpp"

#include <format>
#include <print>

namespace gridduel::net
{
    using namespace gridduel::core;

    auto to_string(QueueStatus s) -> std::string_view
    {
        switch (s)
        {
        case QueueStatus::Idle: return "idle";
        case QueueStatus::Queued: return "queued";
        case QueueStatus::Matched: return "matched";
        }
        return "idle";
    }

    MatchmakingQueue::MatchmakingQueue(std::shared_ptr<GameEngine const> engine,
                                       std::shared_ptr<DeckProvider const> decks,
                                       std::shared_ptr<GameStore> store,
                                       std::shared_ptr<SessionManager> sessions,
                                       MatchmakingConfig cfg) :
        engine_(std::move(engine)),
        decks_(std::move(decks)),
        store_(std::move(store)),
        sessions_(std::move(sessions)),
        cfg_(cfg)
    {
        GDL_ASSERT(engine_ && decks_ && store_ && sessions_, "matchmaking is missing a collaborator");
    }

    auto MatchmakingQueue::OnMatched(MatchedFn fn) -> void
    {
        std::scoped_lock lock(mx_);
        on_matched_ = std::move(fn);
    }

    auto MatchmakingQueue::Start() -> void
    {
        std::scoped_lock lock(mx_);
        running_ = true;
    }

    auto MatchmakingQueue::Stop() -> void
    {
        std::scoped_lock lock(mx_);
        running_ = false;
        if (!queue_.empty()) std::print("[Matchmaking] stopping, dropping {} waiting player(s)\n", queue_.size());
        queue_.clear();
        index_.clear();
    }

    auto MatchmakingQueue::ValidDeck(PlayerId const& user, std::string const& deck_ref) const
        -> std::expected<std::vector<CardInstanceId>, error::ActionError>
    {
        if (deck_ref.empty())
            return std::unexpected(error::ActionError{error::Code::InvalidAction, "deckRef is required"});

        auto cards = decks_->DeckCards(deck_ref, user);
        if (!cards)
            return std::unexpected(cards.error());
        if (cards->size() < cfg_.min_deck_size)
        {
            return std::unexpected(error::ActionError{
                error::Code::InvalidAction,
                std::format("Deck {} has {} cards, at least {} required", deck_ref, cards->size(), cfg_.min_deck_size)
            });
        }
        return cards;
    }

    auto MatchmakingQueue::Join(PlayerId const& user, std::string const& deck_ref)
        -> std::expected<JoinResult, error::ActionError>
    {
        if (user == AiPlayerId)
            return std::unexpected(error::ActionError{error::Code::InvalidAction, "Reserved player id"});
        auto cards = ValidDeck(user, deck_ref);
        if (!cards)
            return std::unexpected(cards.error());

        MatchedFn notify;
        PlayerId opponent_id;
        MatchId match;
        {
            std::scoped_lock lock(mx_);
            if (!running_)
                return std::unexpected(error::ActionError{error::Code::State, "Matchmaking is not running"});
            if (index_.contains(user))
                return std::unexpected(error::ActionError{error::Code::InvalidAction, "Already queued"});
            if (sessions_->MatchOf(user))
                return std::unexpected(error::ActionError{error::Code::InvalidAction, "Already in an active match"});

            Entry self{user, deck_ref, std::move(*cards), std::chrono::steady_clock::now()};
            if (queue_.empty())
            {
                EnqueueLocked(std::move(self), false);
                std::print("[Matchmaking] {} queued with deck {}\n", user, deck_ref);
                return JoinResult{QueueStatus::Queued, std::nullopt};
            }

            Entry opponent = PopLocked();
            match = sessions_->NextMatchId();

            auto state = engine_->InitializeGame(self.cards, opponent.cards, user, opponent.user);
            if (!state)
            {
                EnqueueLocked(std::move(opponent), true);
                return std::unexpected(state.error());
            }
            if (auto saved = store_->Save(match, *state); !saved)
            {
                EnqueueLocked(std::move(opponent), true);
                return std::unexpected(saved.error());
            }
            if (auto session = sessions_->CreateMatch(match, user, opponent.user); !session)
            {
                store_->Erase(match);
                EnqueueLocked(std::move(opponent), true);
                return std::unexpected(session.error());
            }

            auto const waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - opponent.joined_at);
            std::print("[Matchmaking] paired {} with {} after {}ms -> {}\n", user, opponent.user, waited.count(), match);

            notify = on_matched_;
            opponent_id = std::move(opponent.user);
        }

        if (notify)
        {
            notify(opponent_id, match);
            notify(user, match);
        }
        return JoinResult{QueueStatus::Matched, match};
    }

    auto MatchmakingQueue::StartSolo(PlayerId const& user, std::string const& deck_ref, Difficulty const difficulty,
                                     std::string const& ai_deck_ref) -> std::expected<JoinResult, error::ActionError>
    {
        if (user == AiPlayerId)
            return std::unexpected(error::ActionError{error::Code::InvalidAction, "Reserved player id"});
        auto cards = ValidDeck(user, deck_ref);
        if (!cards)
            return std::unexpected(cards.error());

        std::string const& ai_ref = ai_deck_ref.empty() ? cfg_.ai_deck : ai_deck_ref;
        auto ai_cards = decks_->DeckCards(ai_ref, AiPlayerId);
        if (!ai_cards)
            return std::unexpected(ai_cards.error());

        MatchedFn notify;
        MatchId match;
        {
            std::scoped_lock lock(mx_);
            if (!running_)
                return std::unexpected(error::ActionError{error::Code::State, "Matchmaking is not running"});
            if (index_.contains(user))
                return std::unexpected(error::ActionError{error::Code::InvalidAction, "Already queued"});
            if (sessions_->MatchOf(user))
                return std::unexpected(error::ActionError{error::Code::InvalidAction, "Already in an active match"});

            match = sessions_->NextMatchId();
            auto state = engine_->InitializeGame(*cards, *ai_cards, user, AiPlayerId);
            if (!state)
                return std::unexpected(state.error());
            if (auto saved = store_->Save(match, *state); !saved)
                return std::unexpected(saved.error());
            if (auto session = sessions_->CreateSoloMatch(match, user, difficulty); !session)
            {
                store_->Erase(match);
                return std::unexpected(session.error());
            }

            std::print("[Matchmaking] {} starts solo ({}, deck {}) -> {}\n", user, to_string(difficulty), ai_ref, match);
            notify = on_matched_;
        }

        if (notify) notify(user, match);
        return JoinResult{QueueStatus::Matched, match};
    }

    auto MatchmakingQueue::Status(PlayerId const& user) const -> JoinResult
    {
        {
            std::scoped_lock lock(mx_);
            if (index_.contains(user)) return JoinResult{QueueStatus::Queued, std::nullopt};
        }
        if (auto match = sessions_->MatchOf(user)) return JoinResult{QueueStatus::Matched, std::move(match)};
        return JoinResult{QueueStatus::Idle, std::nullopt};
    }

    auto MatchmakingQueue::Leave(PlayerId const& user) -> bool
    {
        std::scoped_lock lock(mx_);
        auto const it = index_.find(user);
        if (it == index_.end()) return false;

        queue_.erase(it->second);
        index_.erase(it);
        std::print("[Matchmaking] {} left the queue\n", user);
        return true;
    }

    auto MatchmakingQueue::QueueLength() const -> std::size_t
    {
        std::scoped_lock lock(mx_);
        return queue_.size();
    }

    auto MatchmakingQueue::EnqueueLocked(Entry entry, bool front) -> void
    {
        PlayerId const user = entry.user;
        auto const it = front ? queue_.insert(queue_.begin(), std::move(entry))
                              : queue_.insert(queue_.end(), std::move(entry));
        index_.insert_or_assign(user, it);
    }

    auto MatchmakingQueue::PopLocked() -> Entry
    {
        Entry e = std::move(queue_.front());
        queue_.pop_front();
        index_.erase(e.user);
        return e;
    }
}
