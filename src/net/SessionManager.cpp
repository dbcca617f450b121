//
// SessionManager.cpp
//

#include "SessionManager.hpp"

#include <format>
#include <print>
#include <vector>

namespace gridduel::net
{
    using namespace gridduel::core;

    SessionManager::SessionManager(SessionDeps deps, SessionConfig cfg) :
        deps_(std::move(deps)),
        cfg_(std::move(cfg)) {}

    auto SessionManager::Start() -> void
    {
        std::scoped_lock lock(mx_);
        running_ = true;
    }

    auto SessionManager::Stop() -> void
    {
        std::vector<MatchSessionSP> live;
        {
            std::scoped_lock lock(mx_);
            running_ = false;
            live.reserve(sessions_.size());
            for (auto const& [id, session] : sessions_) live.push_back(session);
        }

        if (!live.empty()) std::print("[Sessions] stopping, aborting {} match(es)\n", live.size());
        for (MatchSessionSP const& session : live) session->Abort();
    }

    auto SessionManager::Running() const -> bool
    {
        std::scoped_lock lock(mx_);
        return running_;
    }

    auto SessionManager::NextMatchId() -> MatchId
    {
        return std::format("m-{}", next_id_.fetch_add(1));
    }

    auto SessionManager::CreateMatch(MatchId const& match, PlayerId const& player1, PlayerId const& player2)
        -> std::expected<MatchSessionSP, error::ActionError>
    {
        if (player1 == AiPlayerId || player2 == AiPlayerId)
            return std::unexpected(error::ActionError{error::Code::InvalidAction, "Reserved player id"});
        return Create(match, player1, player2, std::nullopt);
    }

    auto SessionManager::CreateSoloMatch(MatchId const& match, PlayerId const& user, Difficulty const difficulty)
        -> std::expected<MatchSessionSP, error::ActionError>
    {
        if (user == AiPlayerId)
            return std::unexpected(error::ActionError{error::Code::InvalidAction, "Reserved player id"});
        return Create(match, user, AiPlayerId, difficulty);
    }

    auto SessionManager::Create(MatchId const& match, PlayerId const& player1, PlayerId const& player2,
                                std::optional<Difficulty> const ai) -> std::expected<MatchSessionSP, error::ActionError>
    {
        // the server seat may sit in any number of matches at once
        auto const tracked = [&ai](PlayerId const& p) { return !ai || p != AiPlayerId; };

        MatchSessionSP session;
        {
            std::scoped_lock lock(mx_);
            if (!running_)
                return std::unexpected(error::ActionError{error::Code::State, "Server is shutting down"});
            if (sessions_.contains(match))
                return std::unexpected(error::ActionError{error::Code::State,
                                                          std::format("Match {} already exists", match)});
            for (PlayerId const* p : {&player1, &player2})
            {
                if (tracked(*p) && user_to_match_.contains(*p))
                    return std::unexpected(error::ActionError{error::Code::InvalidAction,
                                                              std::format("{} is already in a match", *p)});
            }

            std::weak_ptr<SessionManager> weak = weak_from_this();
            session = std::make_shared<MatchSession>(match, player1, player2, deps_, cfg_,
                                                     [weak](MatchId const& id)
                                                     {
                                                         if (auto self = weak.lock()) self->OnFinished(id);
                                                     }, ai);
            sessions_.emplace(match, session);
            for (PlayerId const* p : {&player1, &player2})
            {
                if (tracked(*p)) user_to_match_.insert_or_assign(*p, match);
            }
        }

        // outside our lock: the session calls back into OnFinished under its own
        session->Start();
        if (ai)
            std::print("[Sessions] created {} for {} vs the server ({})\n", match, player1, to_string(*ai));
        else
            std::print("[Sessions] created {} for {} vs {}\n", match, player1, player2);
        return session;
    }

    auto SessionManager::Find(MatchId const& match) const -> MatchSessionSP
    {
        std::scoped_lock lock(mx_);
        auto const it = sessions_.find(match);
        return it == sessions_.end() ? nullptr : it->second;
    }

    auto SessionManager::MatchOf(PlayerId const& user) const -> std::optional<MatchId>
    {
        std::scoped_lock lock(mx_);
        auto const it = user_to_match_.find(user);
        if (it == user_to_match_.end()) return std::nullopt;
        return it->second;
    }

    auto SessionManager::ActiveCount() const -> std::size_t
    {
        std::scoped_lock lock(mx_);
        return sessions_.size();
    }

    auto SessionManager::OnFinished(MatchId const& match) -> void
    {
        std::scoped_lock lock(mx_);
        auto const it = sessions_.find(match);
        if (it == sessions_.end()) return;

        for (PlayerId const& p : it->second->Players())
        {
            auto const u = user_to_match_.find(p);
            if (u != user_to_match_.end() && u->second == match) user_to_match_.erase(u);
        }
        // the caller still holds a reference, so the session outlives this erase
        sessions_.erase(it);
    }
}
