//
// AbilityRegistry.hpp
//

#ifndef GRIDDUEL_ABILITYREGISTRY_HPP
#define GRIDDUEL_ABILITYREGISTRY_HPP

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "Ability.hpp"
#include "Events.hpp"
#include "GameState.hpp"

namespace gridduel::core
{
    struct AbilityContext
    {
        Position position; // cell whose ability fires
        PlayerId owner; // owner of that cell at dispatch time
        PlayerId acting_player; // player whose action caused the trigger
        std::string_view moment;
        std::optional<Position> counterpart{}; // other cell of a flip pair
    };

    template <typename T, typename V>
    struct VariantIndex;

    template <typename T, typename... Ts>
    struct VariantIndex<T, std::variant<Ts...>>
    {
        static constexpr std::size_t value = []
        {
            std::size_t i = 0;
            static_cast<void>(((std::is_same_v<T, Ts> ? false : (++i, true)) && ...));
            return i;
        }();
        static_assert(value < sizeof...(Ts), "type is not an Effect alternative");
    };

    // Maps every effect kind to a pure handler and fires the abilities of board cells
    // for a trigger moment. Handlers never touch anything but the state they are given.
    class AbilityRegistry
    {
    public:
        using Handler = std::function<GameState(GameState, AbilityContext const&, Effect const&)>;

        template <typename E>
        auto Register(std::function<GameState(GameState, AbilityContext const&, E const&)> fn) -> void
        {
            handlers_[VariantIndex<E, Effect>::value] =
                [fn = std::move(fn)](GameState s, AbilityContext const& ctx, Effect const& e) -> GameState
                {
                    return fn(std::move(s), ctx, std::get<E>(e));
                };
        }

        [[nodiscard]]
        auto Handles(Effect const& e) const -> bool { return static_cast<bool>(handlers_[e.index()]); }

        // Names of effect kinds with no handler; empty for a complete registry.
        [[nodiscard]]
        auto MissingHandlers() const -> std::vector<std::string_view>;

        // Fires `moment` for each listed cell in board-scan order. A cell fires when it
        // still holds a cached card whose ability lists the moment and whose condition
        // holds at that point. Stops as soon as an effect makes the state terminal.
        [[nodiscard]]
        auto Dispatch(GameState state,
                      std::string_view moment,
                      std::vector<Position> cells,
                      PlayerId const& acting_player,
                      EventLog& log,
                      std::optional<Position> counterpart = std::nullopt) const -> GameState;

        // Convenience: every occupied cell.
        [[nodiscard]]
        auto DispatchAll(GameState state,
                         std::string_view moment,
                         PlayerId const& acting_player,
                         EventLog& log) const -> GameState;

    private:
        std::array<Handler, std::variant_size_v<Effect>> handlers_{};
    };

    auto ConditionHolds(GameState const& s, Position pos, PlayerId const& owner, Condition const& c) -> bool;

    // Occupied cells an effect scope resolves to, in board-scan order.
    auto ResolveScope(GameState const& s, AbilityContext const& ctx, Scope scope) -> std::vector<Position>;

    // Registry with a handler for every effect kind. Throws if one is missing.
    auto MakeStandardRegistry() -> AbilityRegistry;
}

#endif //GRIDDUEL_ABILITYREGISTRY_HPP
