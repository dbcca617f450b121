//
// Exception.hpp
//

#ifndef GRIDDUEL_EXCEPTION_HPP
#define GRIDDUEL_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "Types.hpp"

namespace gridduel::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not a user illegal move)
        State, // game state corrupted / engine misuse
        InvalidAction, // IllegalMove: wrong turn, bad cell, card not in hand
        NotFound, // unknown match, card instance or deck
        Timeout, // deadline exceeded
        Network, // transport failure
        Serialization, // codec verification/build errors
        Persistence, // store read/write failed
        Assertion // internal assertion failed
    };

    auto to_string(Code c) -> std::string_view;

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NotFoundError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct TimeoutError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct PersistenceError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::Rules: throw RulesError(std::move(msg), c);
        case Code::State: throw StateError(std::move(msg), c);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c);
        case Code::NotFound: throw NotFoundError(std::move(msg), c);
        case Code::Timeout: throw TimeoutError(std::move(msg), c);
        case Code::Network: throw NetworkError(std::move(msg), c);
        case Code::Serialization: throw SerializationError(std::move(msg), c);
        case Code::Persistence: throw PersistenceError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define GDL_THROW(code_enum, msg) ::gridduel::core::error::fail((code_enum), (msg))
#define GDL_ASSERT(cond, msg) do { if(!(cond)) ::gridduel::core::error::fail(::gridduel::core::error::Code::Assertion, (msg)); } while(0)

    enum class RuleViolationCode : std::uint16_t
    {
        // Flow
        GameNotActive,
        NotYourTurn,
        UnknownPlayer,

        // Placement
        Place_OutOfBounds,
        Place_CellOccupied,
        Place_CardNotInHand,
        Place_CardNotOwned,

        // Safety net
        Internal_Unreachable
    };

    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<PlayerId> player{};
        std::optional<PlayerId> current{};
        std::optional<Position> position{};
        std::optional<CardInstanceId> card{};
        std::optional<std::uint32_t> turn{};

        auto with_player(PlayerId p) -> RuleViolation&
        {
            player = std::move(p);
            return *this;
        }

        auto with_current(PlayerId p) -> RuleViolation&
        {
            current = std::move(p);
            return *this;
        }

        auto with_position(Position p) -> RuleViolation&
        {
            position = p;
            return *this;
        }

        auto with_card(CardInstanceId c) -> RuleViolation&
        {
            card = std::move(c);
            return *this;
        }

        auto with_turn(std::uint32_t t) -> RuleViolation&
        {
            turn = t;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::GameNotActive: return "Game is not active";
        case E::NotYourTurn: return "Not your turn";
        case E::UnknownPlayer: return "Player is not part of this game";
        case E::Place_OutOfBounds: return "Place: position out of bounds";
        case E::Place_CellOccupied: return "Place: cell already occupied";
        case E::Place_CardNotInHand: return "Place: card not in hand";
        case E::Place_CardNotOwned: return "Place: card does not belong to player";
        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.player) s += std::format(" | player={}", *v.player);
        if (v.current) s += std::format(" | current={}", *v.current);
        if (v.position) s += std::format(" | pos=({},{})", v.position->x, v.position->y);
        if (v.card) s += std::format(" | card={}", *v.card);
        if (v.turn) s += std::format(" | turn={}", *v.turn);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;

    // What a rejected operation reports back to the caller.
    struct ActionError
    {
        Code code{Code::Unknown};
        std::string message;
        std::optional<RuleViolation> violation{};

        static auto Illegal(RuleViolation v) -> ActionError
        {
            std::string msg = describe(v);
            return ActionError{Code::InvalidAction, std::move(msg), std::move(v)};
        }

        static auto Missing(std::string msg) -> ActionError
        {
            return ActionError{Code::NotFound, std::move(msg), std::nullopt};
        }

        static auto Storage(std::string msg) -> ActionError
        {
            return ActionError{Code::Persistence, std::move(msg), std::nullopt};
        }
    };
}

#endif //GRIDDUEL_EXCEPTION_HPP
