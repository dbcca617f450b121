//
// MatchSession.cpp
//

#include "MatchSession.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <variant>

#include "../core/Exception.hpp"
#include "protocol.hpp"

namespace gridduel::net
{
    using namespace gridduel::core;

    auto to_string(SessionPhase p) -> std::string_view
    {
        switch (p)
        {
        case SessionPhase::AwaitingPlayers: return "awaiting_players";
        case SessionPhase::Active: return "active";
        case SessionPhase::Completed: return "completed";
        case SessionPhase::Aborted: return "aborted";
        }
        return "unknown";
    }

    namespace
    {
        auto Terminal(SessionPhase p) -> bool
        {
            return p == SessionPhase::Completed || p == SessionPhase::Aborted;
        }
    }

    MatchSession::MatchSession(MatchId id,
                               PlayerId player1,
                               PlayerId player2,
                               SessionDeps deps,
                               SessionConfig cfg,
                               FinishedFn on_finished,
                               std::optional<Difficulty> ai) :
        id_(std::move(id)),
        deps_(std::move(deps)),
        cfg_(std::move(cfg)),
        on_finished_(std::move(on_finished))
    {
        GDL_ASSERT(!cfg_.turn_durations.empty(), "turn duration list is empty");
        GDL_ASSERT(deps_.engine && deps_.heuristic && deps_.store && deps_.rewards && deps_.scheduler,
                   "match session is missing a collaborator");
        seats_[0].user = std::move(player1);
        seats_[1].user = std::move(player2);
        if (ai)
        {
            seats_[1].ai = ai;
            seats_[1].ever_joined = true;
        }
    }

    MatchSession::~MatchSession() = default;

    auto MatchSession::Start() -> void
    {
        std::scoped_lock lock(mx_);

        auto const state = LoadLocked();
        if (!state)
            std::print("[Match {}] starting without a readable snapshot: {}\n", id_, state.error().message);

        if (!cfg_.audit_dir.empty())
        {
            audit_ = std::make_unique<debug::AuditLogger>(std::format("{}/{}.log", cfg_.audit_dir, id_));
            if (!audit_->IsOpen())
            {
                std::print("[Match {}] cannot open transcript in {}\n", id_, cfg_.audit_dir);
                audit_.reset();
            }
            else if (state)
            {
                audit_->start(id_, *state);
            }
        }

        // players that never show up are treated like a dropped connection
        for (Seat& seat : seats_)
        {
            if (!seat.ai) StartGraceLocked(seat);
        }
    }

    auto MatchSession::Join(PlayerId const& user, ConnectionSP conn) -> void
    {
        std::scoped_lock lock(mx_);

        Seat* seat = SeatOf(user);
        if (!seat || seat->ai)
        {
            if (!conn->Send(protocol::MakeError("Not a participant of this match")))
                std::print("[Match {}] could not reject {}\n", id_, user);
            return;
        }
        if (Terminal(phase_))
        {
            if (!conn->Send(protocol::MakeError("Match has ended")))
                std::print("[Match {}] could not reject {}\n", id_, user);
            return;
        }

        auto const state = LoadLocked();
        if (!state)
        {
            if (!conn->Send(protocol::MakeError(state.error().message)))
                std::print("[Match {}] could not reject {}\n", id_, user);
            return;
        }

        if (seat->conn && seat->conn->Id() != conn->Id())
        {
            std::print("[Match {}] {} connected again, dropping connection {}\n", id_, user, seat->conn->Id());
            SendTo(*seat, protocol::MakeSessionReplaced());
            seat->conn->Close("session replaced");
        }

        if (seat->grace)
        {
            if (seat->ever_joined) std::print("[Match {}] {} reconnected\n", id_, user);
            seat->grace.reset();
            ++seat->grace_gen;
        }

        seat->conn = std::move(conn);
        seat->ever_joined = true;

        int const slot = seat == &seats_[0] ? 1 : 2;
        SendTo(*seat, protocol::MakeJoined(*state, user, slot));
        SendTo(OtherSeat(*seat), protocol::MakePlayerJoined(user, slot));

        if (phase_ == SessionPhase::AwaitingPlayers)
        {
            if (Present(seats_[0]) && Present(seats_[1]))
            {
                phase_ = SessionPhase::Active;
                std::print("[Match {}] both players present, {} to move\n", id_, state->current_player_id);
                StartTurnLocked(state->current_player_id);
            }
            return;
        }

        // mid-match: only the newcomer needs the clock
        auto const left = std::max(
            std::chrono::ceil<std::chrono::seconds>(turn_deadline_ - deps_.scheduler->Now()),
            std::chrono::seconds{0});
        SendTo(*seat, protocol::MakeStartTurn(state->current_player_id, static_cast<int>(left.count())));
    }

    auto MatchSession::Disconnect(PlayerId const& user, ConnectionId conn) -> void
    {
        std::scoped_lock lock(mx_);

        Seat* seat = SeatOf(user);
        if (!seat || !seat->conn || seat->conn->Id() != conn)
            return; // an evicted socket closing late

        seat->conn.reset();
        if (Terminal(phase_))
            return;

        std::print("[Match {}] {} disconnected, {}ms to return\n", id_, user, cfg_.grace.count());
        SendTo(OtherSeat(*seat), protocol::MakePlayerDisconnected(user));
        StartGraceLocked(*seat);
    }

    auto MatchSession::HandleAction(PlayerId const& user, ConnectionId conn, PlayerAction const& action) -> void
    {
        std::scoped_lock lock(mx_);

        Seat* seat = SeatOf(user);
        if (!seat)
        {
            std::print("[Match {}] action from non-participant {}\n", id_, user);
            return;
        }
        if (!seat->conn || seat->conn->Id() != conn)
        {
            std::print("[Match {}] {} acted on stale connection {}, ignored\n", id_, user, conn);
            return;
        }
        if (phase_ != SessionPhase::Active)
        {
            SendTo(*seat, protocol::MakeError(phase_ == SessionPhase::AwaitingPlayers
                                                  ? "Match has not started"
                                                  : "Match has ended"));
            return;
        }

        auto const state = LoadLocked();
        if (!state)
        {
            SendTo(*seat, protocol::MakeError(state.error().message));
            return;
        }

        auto result = deps_.engine->Apply(*state, user, action);
        if (!result)
        {
            if (audit_) audit_->rejected(user, result.error().message);
            SendTo(*seat, protocol::MakeError(result.error().message));
            return;
        }

        if (audit_) audit_->turn(*state, user, action, false);
        if (!CommitLocked(user, action, std::move(*result), false) && audit_)
            audit_->rejected(user, "not persisted");
    }

    auto MatchSession::HandleAnimationsComplete(PlayerId const& user) -> void
    {
        std::scoped_lock lock(mx_);
        if (!SeatOf(user))
            std::print("[Match {}] animations_complete from non-participant {}\n", id_, user);
    }

    auto MatchSession::Abort() -> void
    {
        std::scoped_lock lock(mx_);
        if (Terminal(phase_))
            return;

        GameState final_state = SnapshotLocked();
        final_state.status = GameStatus::Aborted;
        final_state.winner.reset();
        if (auto saved = deps_.store->Save(id_, final_state); !saved)
            std::print("[Match {}] could not persist abort: {}\n", id_, saved.error().message);

        FinalizeLocked(final_state, TerminationReason::Aborted);
    }

    auto MatchSession::Phase() const -> SessionPhase
    {
        std::scoped_lock lock(mx_);
        return phase_;
    }

    auto MatchSession::Players() const -> std::array<PlayerId, 2>
    {
        return {seats_[0].user, seats_[1].user};
    }

    auto MatchSession::HasParticipant(PlayerId const& user) const -> bool
    {
        return seats_[0].user == user || seats_[1].user == user;
    }

    auto MatchSession::IsConnected(PlayerId const& user) const -> bool
    {
        std::scoped_lock lock(mx_);
        Seat const* seat = SeatOf(user);
        return seat && Present(*seat);
    }

    auto MatchSession::Strikes(PlayerId const& user) const -> std::uint32_t
    {
        std::scoped_lock lock(mx_);
        Seat const* seat = SeatOf(user);
        return seat ? seat->strikes : 0;
    }

    auto MatchSession::AllowedFor(PlayerId const& user) const -> std::chrono::seconds
    {
        std::scoped_lock lock(mx_);
        Seat const* seat = SeatOf(user);
        return seat ? AllowedLocked(*seat) : cfg_.turn_durations.front();
    }

    auto MatchSession::SeatOf(PlayerId const& user) -> Seat*
    {
        for (Seat& s : seats_)
        {
            if (s.user == user) return &s;
        }
        return nullptr;
    }

    auto MatchSession::SeatOf(PlayerId const& user) const -> Seat const*
    {
        for (Seat const& s : seats_)
        {
            if (s.user == user) return &s;
        }
        return nullptr;
    }

    auto MatchSession::OtherSeat(Seat const& seat) -> Seat&
    {
        return &seat == &seats_[0] ? seats_[1] : seats_[0];
    }

    auto MatchSession::LoadLocked() -> std::expected<GameState, error::ActionError>
    {
        auto state = deps_.store->Load(id_);
        if (state) last_state_ = *state;
        return state;
    }

    auto MatchSession::SnapshotLocked() -> GameState
    {
        if (auto state = LoadLocked())
            return std::move(*state);

        if (last_state_)
            return *last_state_;

        GameState blank;
        blank.player1.user_id = seats_[0].user;
        blank.player2.user_id = seats_[1].user;
        blank.current_player_id = seats_[0].user;
        return blank;
    }

    auto MatchSession::AllowedLocked(Seat const& seat) const -> std::chrono::seconds
    {
        std::size_t const idx = std::min<std::size_t>(seat.strikes, cfg_.turn_durations.size() - 1);
        return cfg_.turn_durations[idx];
    }

    auto MatchSession::StartTurnLocked(PlayerId const& player) -> void
    {
        StopTurnLocked();

        Seat const* seat = SeatOf(player);
        auto const allowed = seat ? AllowedLocked(*seat) : cfg_.turn_durations.front();
        turn_deadline_ = deps_.scheduler->Now() + allowed;

        // the server's own seat moves when its short timer runs out
        std::chrono::milliseconds const fire_in = seat && seat->ai
                                                      ? std::min<std::chrono::milliseconds>(cfg_.ai_delay, allowed)
                                                      : std::chrono::milliseconds{allowed};
        std::uint64_t const gen = turn_gen_;
        std::weak_ptr<MatchSession> weak = weak_from_this();
        turn_timer_ = deps_.scheduler->Schedule(fire_in, [weak, gen, player]
        {
            if (auto self = weak.lock()) self->OnTurnTimeout(gen, player);
        });

        Broadcast(protocol::MakeStartTurn(player, static_cast<int>(allowed.count())));
    }

    auto MatchSession::StopTurnLocked() -> void
    {
        turn_timer_.reset();
        ++turn_gen_;
    }

    auto MatchSession::StartGraceLocked(Seat& seat) -> void
    {
        ++seat.grace_gen;
        std::uint64_t const gen = seat.grace_gen;
        std::weak_ptr<MatchSession> weak = weak_from_this();
        seat.grace = deps_.scheduler->Schedule(cfg_.grace, [weak, gen, user = seat.user]
        {
            if (auto self = weak.lock()) self->OnGraceExpired(gen, user);
        });
    }

    auto MatchSession::CommitLocked(PlayerId const& actor, PlayerAction const& action,
                                    Transition transition, bool forced) -> bool
    {
        if (auto saved = deps_.store->Save(id_, transition.state); !saved)
        {
            std::print("[Match {}] could not persist {} by {}: {}\n", id_, ActionName(action), actor,
                       saved.error().message);
            Seat* seat = SeatOf(actor);
            if (seat && !forced)
                SendTo(*seat, protocol::MakeError(std::format("{}; please retry", saved.error().message)));
            return false;
        }
        last_state_ = transition.state;

        if (audit_)
        {
            audit_->events(transition.events);
            audit_->board(transition.state);
        }

        for (Seat& s : seats_)
            SendTo(s, protocol::MakeEvents(transition.events, transition.state, s.user, forced));

        if (!forced)
        {
            if (Seat* seat = SeatOf(actor)) seat->strikes = 0;
        }

        if (!transition.state.IsActive())
        {
            TerminationReason const reason = std::holds_alternative<SurrenderAction>(action)
                                                 ? TerminationReason::Surrender
                                                 : TerminationReason::Completed;
            FinalizeLocked(transition.state, reason);
            return true;
        }

        StartTurnLocked(transition.state.current_player_id);
        return true;
    }

    auto MatchSession::FinalizeLocked(GameState const& final_state, TerminationReason reason) -> void
    {
        if (Terminal(phase_))
            return;

        phase_ = reason == TerminationReason::Aborted ? SessionPhase::Aborted : SessionPhase::Completed;
        StopTurnLocked();
        for (Seat& s : seats_)
        {
            s.grace.reset();
            ++s.grace_gen;
        }
        last_state_ = final_state;

        Broadcast(protocol::MakeGameEnd(final_state.winner, reason));
        if (audit_) audit_->end(final_state, to_string(reason));

        std::print("[Match {}] over ({}), winner {}\n", id_, to_string(reason),
                   final_state.winner ? *final_state.winner : std::string("none"));

        deps_.rewards->Submit(id_, final_state, reason);
        if (!deps_.store->Erase(id_))
            std::print("[Match {}] no snapshot left to drop\n", id_);
        if (on_finished_) on_finished_(id_);
    }

    auto MatchSession::SendTo(Seat& seat, std::string const& text) -> void
    {
        if (!seat.conn)
            return;
        if (!seat.conn->Send(text))
            std::print("[Match {}] send to {} failed on connection {}\n", id_, seat.user, seat.conn->Id());
    }

    auto MatchSession::Broadcast(std::string const& text) -> void
    {
        for (Seat& s : seats_) SendTo(s, text);
    }

    auto MatchSession::OnTurnTimeout(std::uint64_t gen, PlayerId const& player) -> void
    {
        std::scoped_lock lock(mx_);
        if (gen != turn_gen_ || phase_ != SessionPhase::Active)
            return; // superseded by an action or a newer timer

        turn_timer_.reset();
        Seat* seat = SeatOf(player);
        if (!seat)
            return;

        auto const state = LoadLocked();
        if (!state)
        {
            std::print("[Match {}] timeout for {} with no readable snapshot: {}\n", id_, player,
                       state.error().message);
            StartTurnLocked(player);
            return;
        }
        if (state->current_player_id != player)
        {
            StartTurnLocked(state->current_player_id);
            return;
        }

        bool const forced = !seat->ai;
        if (forced) ++seat->strikes;

        std::optional<ScoredMove> const move =
            deps_.heuristic->Choose(*state, *deps_.engine, player, seat->ai.value_or(cfg_.forced_difficulty));
        PlayerAction action = move
                                  ? PlayerAction{PlaceCardAction{move->card, move->position}}
                                  : PlayerAction{EndTurnAction{}};

        auto result = deps_.engine->Apply(*state, player, action);
        if (!result)
        {
            std::print("[Match {}] forced {} rejected ({}), ending the turn instead\n", id_, ActionName(action),
                       result.error().message);
            action = EndTurnAction{};
            result = deps_.engine->Apply(*state, player, action);
        }
        if (!result)
        {
            std::print("[Match {}] cannot force a move for {}: {}\n", id_, player, result.error().message);
            StartTurnLocked(player);
            return;
        }

        if (forced)
            std::print("[Match {}] {} timed out (strike {}), playing {}\n", id_, player, seat->strikes,
                       ActionName(action));
        else
            std::print("[Match {}] ai ({}) plays {}\n", id_, to_string(*seat->ai), ActionName(action));
        if (audit_) audit_->turn(*state, player, action, forced);
        if (!CommitLocked(player, action, std::move(*result), forced))
            StartTurnLocked(player);
    }

    auto MatchSession::OnGraceExpired(std::uint64_t gen, PlayerId const& user) -> void
    {
        std::scoped_lock lock(mx_);

        Seat* seat = SeatOf(user);
        if (!seat || gen != seat->grace_gen || seat->conn || Terminal(phase_))
            return; // reconnected or already over

        seat->grace.reset();
        Seat const& other = OtherSeat(*seat);
        GameState base = SnapshotLocked();

        if (!other.ever_joined)
        {
            std::print("[Match {}] nobody stayed, aborting\n", id_);
            base.status = GameStatus::Aborted;
            base.winner.reset();
            if (auto saved = deps_.store->Save(id_, base); !saved)
                std::print("[Match {}] could not persist abort: {}\n", id_, saved.error().message);
            FinalizeLocked(base, TerminationReason::Aborted);
            return;
        }

        std::print("[Match {}] {} did not return, {} wins\n", id_, user, other.user);

        // forfeit through the engine so clients get the usual event stream
        auto result = deps_.engine->Surrender(base, user);
        if (result)
        {
            if (auto saved = deps_.store->Save(id_, result->state); !saved)
                std::print("[Match {}] could not persist forfeit: {}\n", id_, saved.error().message);
            for (Seat& s : seats_)
                SendTo(s, protocol::MakeEvents(result->events, result->state, s.user, true));
            FinalizeLocked(result->state, TerminationReason::Disconnect);
            return;
        }

        base.status = &other == &seats_[0] ? GameStatus::Player1Win : GameStatus::Player2Win;
        base.winner = other.user;
        if (auto saved = deps_.store->Save(id_, base); !saved)
            std::print("[Match {}] could not persist forfeit: {}\n", id_, saved.error().message);
        FinalizeLocked(base, TerminationReason::Disconnect);
    }
}
