//
// SessionManager.hpp
//

#ifndef GRIDDUEL_SESSIONMANAGER_HPP
#define GRIDDUEL_SESSIONMANAGER_HPP

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "../core/Exception.hpp"
#include "../core/Types.hpp"
#include "MatchSession.hpp"

namespace gridduel::net
{
    // Live room table: match id -> session, user -> match id.
    // Never calls into a session while holding its own lock.
    class SessionManager : public std::enable_shared_from_this<SessionManager>
    {
    public:
        SessionManager(SessionDeps deps, SessionConfig cfg);

        auto Start() -> void;
        // Aborts every live match.
        auto Stop() -> void;
        auto Running() const -> bool;

        auto NextMatchId() -> core::MatchId;

        // The snapshot for `match` must already be stored.
        auto CreateMatch(core::MatchId const& match, core::PlayerId const& player1, core::PlayerId const& player2)
            -> std::expected<MatchSessionSP, core::error::ActionError>;
        // `user` against the server, which holds the player2 seat as AiPlayerId.
        auto CreateSoloMatch(core::MatchId const& match, core::PlayerId const& user, core::Difficulty difficulty)
            -> std::expected<MatchSessionSP, core::error::ActionError>;

        auto Find(core::MatchId const& match) const -> MatchSessionSP;
        auto MatchOf(core::PlayerId const& user) const -> std::optional<core::MatchId>;
        auto ActiveCount() const -> std::size_t;

        auto Deps() const noexcept -> SessionDeps const& { return deps_; }

    private:
        auto Create(core::MatchId const& match, core::PlayerId const& player1, core::PlayerId const& player2,
                    std::optional<core::Difficulty> ai) -> std::expected<MatchSessionSP, core::error::ActionError>;
        auto OnFinished(core::MatchId const& match) -> void;

    private:
        SessionDeps deps_;
        SessionConfig cfg_;

        mutable std::mutex mx_;
        bool running_{false};
        std::unordered_map<core::MatchId, MatchSessionSP> sessions_;
        std::unordered_map<core::PlayerId, core::MatchId> user_to_match_;
        std::atomic<std::uint64_t> next_id_{1};
    };
}

#endif //GRIDDUEL_SESSIONMANAGER_HPP
