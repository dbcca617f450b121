//
// Game.hpp
//

#ifndef GRIDDUEL_GAME_HPP
#define GRIDDUEL_GAME_HPP

#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <vector>

#include "AbilityRegistry.hpp"
#include "Actions.hpp"
#include "Events.hpp"
#include "Exception.hpp"
#include "GameState.hpp"
#include "Hydrator.hpp"
#include "Rules.hpp"
#include "Types.hpp"

namespace gridduel::core
{
    using ActionResult = std::expected<Transition, error::ActionError>;

    // Pure state-transition engine. Every operation takes a snapshot and returns a new
    // one together with the events that produced it; the input is never modified.
    // Safe to share between matches: the only mutable member is the shuffle RNG.
    class GameEngine
    {
    public:
        GameEngine() = delete;
        GameEngine(Config const& config,
                   std::unique_ptr<Rules> rules,
                   std::shared_ptr<AbilityRegistry const> registry,
                   std::shared_ptr<CardHydrator const> hydrator);

        // Shuffles both card lists, deals the opening hands, player1 to move.
        auto InitializeGame(std::vector<CardInstanceId> player1_cards,
                            std::vector<CardInstanceId> player2_cards,
                            PlayerId const& player1_id,
                            PlayerId const& player2_id) const -> std::expected<GameState, error::ActionError>;

        auto PlaceCard(GameState const& state, PlayerId const& player,
                       CardInstanceId const& card, Position position) const -> ActionResult;
        auto EndTurn(GameState const& state, PlayerId const& player) const -> ActionResult;
        auto Surrender(GameState const& state, PlayerId const& player) const -> ActionResult;

        // Dispatches to one of the three operations above.
        auto Apply(GameState const& state, PlayerId const& player, PlayerAction const& action) const -> ActionResult;

        // Cached card of the snapshot, else the hydrator's answer.
        auto ResolveCard(GameState const& state, CardInstanceId const& card,
                         std::optional<PlayerId> const& owner) const -> std::expected<InGameCardCSP, error::ActionError>;

        auto GetRules() const noexcept -> Rules const& { return *rules_; }
        auto Registry() const noexcept -> AbilityRegistry const& { return *registry_; }
        auto Cfg() const noexcept -> Config const& { return cfg_; }

    private:
        auto ResolveCombat(GameState& state, Position placed, PlayerId const& player, EventLog& log) const -> void;
        // tick countdowns, OnTurnEnd, switch player, OnRound*, OnTurnStart
        auto AdvanceTurn(GameState& state, PlayerId const& ending, EventLog& log) const -> void;
        auto RecountScores(GameState& state, EventLog& log) const -> void;
        auto DrawOne(GameState& state, PlayerId const& player, EventLog& log) const -> void;
        // best effort: caches any uncached hand cards, logging failures
        auto HydrateHands(GameState& state) const -> void;
        auto Finish(GameState& state, GameStatus status, EventLog& log) const -> void;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::shared_ptr<AbilityRegistry const> registry_;
        std::shared_ptr<CardHydrator const> hydrator_;
        mutable std::mt19937_64 rng_;
        mutable std::mutex rng_mx_;
    };
}
#endif //GRIDDUEL_GAME_HPP
