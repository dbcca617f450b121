#include "AuditLogger.hpp"

#include <format>
#include <type_traits>
#include <variant>

using namespace gridduel::core;

namespace
{

auto s_power(Power const& p) -> std::string
{
    return std::format("{}/{}/{}/{}", p.v[0], p.v[1], p.v[2], p.v[3]);
}

auto s_action(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlaceCardAction>)
            {
                return std::format("Place({} @ {},{})", act.card, act.position.x, act.position.y);
            }
            else if constexpr (std::is_same_v<T, EndTurnAction>)
            {
                return "EndTurn";
            }
            else
            {
                return "Surrender";
            }
        },
        a
    );
}

auto s_hand(PlayerState const& p) -> std::string
{
    std::string body;
    for (size_t i{}; i < p.hand.size(); ++i)
    {
        body += (i ? "," : "");
        body += p.hand[i];
    }
    return body;
}

auto s_seat(GameState const& s, PlayerId const& id) -> std::string_view
{
    if (id == s.player1.user_id) return "P1";
    if (id == s.player2.user_id) return "P2";
    return "??";
}

} // anonymous namespace

namespace gridduel::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(MatchId const& match, GameState const& state) -> void
{
    out_ << std::format("Match={}\n", match);
    out_ << std::format("P1={} hand=[{}] deck={}\n", state.player1.user_id, s_hand(state.player1),
                        state.player1.deck.size());
    out_ << std::format("P2={} hand=[{}] deck={}\n", state.player2.user_id, s_hand(state.player2),
                        state.player2.deck.size());
    out_.flush();
}

auto AuditLogger::turn(GameState const& before,
                       PlayerId const& actor,
                       PlayerAction const& a,
                       bool forced) -> void
{
    out_ << std::format(
        "Turn {} actor={} score={}-{}{}\n",
        before.turn_number,
        s_seat(before, actor),
        before.player1.score,
        before.player2.score,
        forced ? " (forced)" : ""
    );

    out_ << std::format("Action: {}\n", s_action(a));
}

auto AuditLogger::events(std::span<GameEvent const> evs) -> void
{
    for (GameEvent const& e : evs)
    {
        out_ << std::format("  #{} {}", e.seq, to_string(e.type));
        if (e.position) out_ << std::format(" @{},{}", e.position->x, e.position->y);
        if (e.card) out_ << std::format(" card={}", *e.card);
        if (e.player) out_ << std::format(" player={}", *e.player);
        if (!e.detail.empty()) out_ << std::format(" [{}]", e.detail);
        out_ << '\n';
    }
}

auto AuditLogger::rejected(PlayerId const& actor, std::string_view reason) -> void
{
    out_ << std::format("Rejected: {} {}\n", actor, reason);
}

auto AuditLogger::board(GameState const& state) -> void
{
    for (int y{}; y < static_cast<int>(constants::BoardSize); ++y)
    {
        std::string row;
        for (int x{}; x < static_cast<int>(constants::BoardSize); ++x)
        {
            auto const& cell = state.Cell(Position{x, y});
            std::string const txt = cell
                ? std::format("{}:{}", s_seat(state, cell->owner), s_power(cell->power))
                : std::string("--");
            row += std::format("{:<14}", txt);
        }
        out_ << "  " << row << '\n';
    }
}

auto AuditLogger::end(GameState const& state, std::string_view reason) -> void
{
    out_ << std::format("End status={} reason={} winner={} score={}-{}\n",
                        to_string(state.status),
                        reason,
                        state.winner ? *state.winner : std::string("none"),
                        state.player1.score,
                        state.player2.score);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace gridduel::core::debug
