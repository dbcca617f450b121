//
// Events.hpp
//

#ifndef GRIDDUEL_EVENTS_HPP
#define GRIDDUEL_EVENTS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "GameState.hpp"
#include "Types.hpp"

namespace gridduel::core
{
    enum class EventType : std::uint8_t
    {
        CardPlaced = 0,
        AbilityTriggered,
        PowerChanged,
        TileChanged,
        CardFlipped,
        ScoreUpdated,
        CardDrawn,
        CardDiscarded,
        TurnEnded,
        TurnStarted,
        GameOver
    };

    inline auto to_string(EventType t) -> std::string_view
    {
        switch (t)
        {
        case EventType::CardPlaced: return "cardPlaced";
        case EventType::AbilityTriggered: return "abilityTriggered";
        case EventType::PowerChanged: return "powerChanged";
        case EventType::TileChanged: return "tileChanged";
        case EventType::CardFlipped: return "cardFlipped";
        case EventType::ScoreUpdated: return "scoreUpdated";
        case EventType::CardDrawn: return "cardDrawn";
        case EventType::CardDiscarded: return "cardDiscarded";
        case EventType::TurnEnded: return "turnEnded";
        case EventType::TurnStarted: return "turnStarted";
        case EventType::GameOver: return "gameOver";
        }
        return "unknown";
    }

    // Clients animate these in seq order.
    struct GameEvent
    {
        std::uint32_t seq{};
        EventType type{};
        std::optional<Position> position{};
        std::optional<CardInstanceId> card{};
        std::optional<PlayerId> player{};
        std::string detail{};
    };

    class EventLog
    {
    public:
        auto Push(EventType type,
                  std::optional<Position> pos = std::nullopt,
                  std::optional<CardInstanceId> card = std::nullopt,
                  std::optional<PlayerId> player = std::nullopt,
                  std::string detail = {}) -> void
        {
            events_.push_back(GameEvent{next_seq_++, type, pos, std::move(card), std::move(player), std::move(detail)});
        }

        [[nodiscard]]
        auto Events() const noexcept -> std::vector<GameEvent> const& { return events_; }
        auto Take() -> std::vector<GameEvent> { return std::move(events_); }

    private:
        std::vector<GameEvent> events_;
        std::uint32_t next_seq_{0};
    };

    struct Transition
    {
        GameState state;
        std::vector<GameEvent> events;
    };
}

#endif //GRIDDUEL_EVENTS_HPP
