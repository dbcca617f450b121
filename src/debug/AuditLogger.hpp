//
// AuditLogger.hpp
//

#ifndef GRIDDUEL_AUDITLOGGER_HPP
#define GRIDDUEL_AUDITLOGGER_HPP

#include <fstream>
#include <span>
#include <string>
#include <string_view>

#include "../core/Actions.hpp"
#include "../core/Events.hpp"
#include "../core/GameState.hpp"
#include "../core/Types.hpp"

namespace gridduel::core::debug
{
    // Plain-text match transcript: one line per action, event and board dump.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        auto IsOpen() const -> bool { return out_.is_open(); }

        // Header: match id, seats, opening hands
        auto start(MatchId const& match, GameState const& state) -> void;

        // Before Apply: the acting player and what they asked for
        auto turn(GameState const& before, PlayerId const& actor, PlayerAction const& a, bool forced) -> void;

        auto events(std::span<GameEvent const> evs) -> void;

        auto rejected(PlayerId const& actor, std::string_view reason) -> void;

        // 4x4 owner/power grid
        auto board(GameState const& state) -> void;

        // Footer: status, winner, scores
        auto end(GameState const& state, std::string_view reason) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //GRIDDUEL_AUDITLOGGER_HPP
