//
// MatchSession.hpp
//

#ifndef GRIDDUEL_MATCHSESSION_HPP
#define GRIDDUEL_MATCHSESSION_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/Actions.hpp"
#include "../core/Game.hpp"
#include "../core/GameState.hpp"
#include "../core/Heuristic.hpp"
#include "../debug/AuditLogger.hpp"
#include "Connection.hpp"
#include "GameStore.hpp"
#include "Rewards.hpp"
#include "Scheduler.hpp"

namespace gridduel::net
{
    // Seat id of the server-side opponent in solo matches. Never a real account.
    inline constexpr char const* AiPlayerId = "00000000-0000-0000-0000-000000000000";

    struct SessionConfig
    {
        // Allowed turn time indexed by the mover's consecutive timeouts; the last entry repeats.
        std::vector<std::chrono::seconds> turn_durations{
            std::chrono::seconds{30}, std::chrono::seconds{15}, std::chrono::seconds{10}, std::chrono::seconds{5}
        };
        std::chrono::milliseconds grace{15000};
        core::Difficulty forced_difficulty{core::Difficulty::Medium};
        std::chrono::milliseconds ai_delay{1200}; // pause before the server plays its own seat
        std::string audit_dir{}; // empty disables transcripts
    };

    struct SessionDeps
    {
        std::shared_ptr<core::GameEngine const> engine;
        std::shared_ptr<core::Heuristic> heuristic;
        std::shared_ptr<GameStore> store;
        std::shared_ptr<RewardsSink> rewards;
        std::shared_ptr<Scheduler> scheduler;
    };

    enum class SessionPhase : std::uint8_t
    {
        AwaitingPlayers,
        Active,
        Completed,
        Aborted
    };

    auto to_string(SessionPhase p) -> std::string_view;

    // One live match: its two seats, the turn timer and the disconnect grace timers.
    // Every entry point takes the session mutex, so actions, timer expiries and socket
    // events for a match are applied one at a time against the stored snapshot.
    // With `ai` set the player2 seat belongs to the server and is played by the heuristic.
    class MatchSession : public std::enable_shared_from_this<MatchSession>
    {
    public:
        using FinishedFn = std::function<void(core::MatchId const&)>;

        MatchSession(core::MatchId id,
                     core::PlayerId player1,
                     core::PlayerId player2,
                     SessionDeps deps,
                     SessionConfig cfg,
                     FinishedFn on_finished,
                     std::optional<core::Difficulty> ai = std::nullopt);
        ~MatchSession();

        MatchSession(MatchSession const&) = delete;
        auto operator=(MatchSession const&) -> MatchSession& = delete;

        // Arms the join window for both seats. Call once, after construction.
        auto Start() -> void;

        // join_game. A second connection for the same seat evicts the first.
        auto Join(core::PlayerId const& user, ConnectionSP conn) -> void;
        // Socket closed. Ignored unless `conn` is the seat's current connection.
        auto Disconnect(core::PlayerId const& user, ConnectionId conn) -> void;
        // Dropped unless `conn` is the seat's current connection.
        auto HandleAction(core::PlayerId const& user, ConnectionId conn, core::PlayerAction const& action) -> void;
        // Advisory only; nothing waits on it.
        auto HandleAnimationsComplete(core::PlayerId const& user) -> void;
        // Server shutdown: terminal without a winner.
        auto Abort() -> void;

        auto Id() const noexcept -> core::MatchId const& { return id_; }
        auto Phase() const -> SessionPhase;
        auto Players() const -> std::array<core::PlayerId, 2>;
        auto HasParticipant(core::PlayerId const& user) const -> bool;
        auto IsConnected(core::PlayerId const& user) const -> bool;
        auto Strikes(core::PlayerId const& user) const -> std::uint32_t;
        // Turn length the player would get if their turn started now.
        auto AllowedFor(core::PlayerId const& user) const -> std::chrono::seconds;

    private:
        struct Seat
        {
            core::PlayerId user;
            ConnectionSP conn{};
            std::uint32_t strikes{};
            bool ever_joined{false};
            std::unique_ptr<TimerHandle> grace{};
            std::uint64_t grace_gen{};
            std::optional<core::Difficulty> ai{};
        };

        static auto Present(Seat const& seat) -> bool { return seat.conn || seat.ai; }

        auto SeatOf(core::PlayerId const& user) -> Seat*;
        auto SeatOf(core::PlayerId const& user) const -> Seat const*;
        auto OtherSeat(Seat const& seat) -> Seat&;

        auto LoadLocked() -> std::expected<core::GameState, core::error::ActionError>;
        // Stored snapshot, else the last one seen, else a blank with the seats filled in.
        auto SnapshotLocked() -> core::GameState;
        auto AllowedLocked(Seat const& seat) const -> std::chrono::seconds;

        auto StartTurnLocked(core::PlayerId const& player) -> void;
        auto StopTurnLocked() -> void;
        auto StartGraceLocked(Seat& seat) -> void;

        // Saves, broadcasts and moves the match on. False when the save failed.
        auto CommitLocked(core::PlayerId const& actor, core::PlayerAction const& action,
                          core::Transition transition, bool forced) -> bool;
        auto FinalizeLocked(core::GameState const& final_state, TerminationReason reason) -> void;

        auto SendTo(Seat& seat, std::string const& text) -> void;
        auto Broadcast(std::string const& text) -> void;

        auto OnTurnTimeout(std::uint64_t gen, core::PlayerId const& player) -> void;
        auto OnGraceExpired(std::uint64_t gen, core::PlayerId const& user) -> void;

    private:
        core::MatchId id_;
        SessionDeps deps_;
        SessionConfig cfg_;
        FinishedFn on_finished_;

        mutable std::mutex mx_;
        std::array<Seat, 2> seats_;
        SessionPhase phase_{SessionPhase::AwaitingPlayers};
        std::optional<core::GameState> last_state_{}; // last snapshot read or written

        std::unique_ptr<TimerHandle> turn_timer_{};
        std::uint64_t turn_gen_{};
        Scheduler::Clock::time_point turn_deadline_{};

        std::unique_ptr<core::debug::AuditLogger> audit_{};
    };

    using MatchSessionSP = std::shared_ptr<MatchSession>;
}

#endif //GRIDDUEL_MATCHSESSION_HPP
