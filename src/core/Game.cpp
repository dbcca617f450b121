//
// Game.cpp
//
#include "Game.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <ranges>
#include <type_traits>
#include <utility>
#include <variant>

namespace gridduel::core
{
    namespace
    {
        auto FormatPower(Power const& p) -> std::string
        {
            return std::format("{},{},{},{}", p.v[0], p.v[1], p.v[2], p.v[3]);
        }
    }

    GameEngine::GameEngine(Config const& config,
                           std::unique_ptr<Rules> rules,
                           std::shared_ptr<AbilityRegistry const> registry,
                           std::shared_ptr<CardHydrator const> hydrator) :
        cfg_(config),
        rules_(std::move(rules)),
        registry_(std::move(registry)),
        hydrator_(std::move(hydrator)),
        rng_{cfg_.seed}
    {
        GDL_ASSERT(rules_ != nullptr, "Engine constructed without rules");
        GDL_ASSERT(registry_ != nullptr, "Engine constructed without ability registry");
        GDL_ASSERT(hydrator_ != nullptr, "Engine constructed without card hydrator");
        if (auto const missing = registry_->MissingHandlers(); !missing.empty())
        {
            GDL_THROW(error::Code::Rules, std::format("Ability registry misses handler for '{}'", missing.front()));
        }
    }

    auto GameEngine::InitializeGame(std::vector<CardInstanceId> player1_cards,
                                    std::vector<CardInstanceId> player2_cards,
                                    PlayerId const& player1_id,
                                    PlayerId const& player2_id) const -> std::expected<GameState, error::ActionError>
    {
        if (player1_id == player2_id)
        {
            return std::unexpected(error::ActionError{error::Code::InvalidAction,
                                                      "A player cannot be matched against themselves"});
        }

        {
            std::scoped_lock lock(rng_mx_);
            std::ranges::shuffle(player1_cards, rng_);
            std::ranges::shuffle(player2_cards, rng_);
        }

        GameState s;
        s.max_hand_size = cfg_.max_hand_size;
        s.player1.user_id = player1_id;
        s.player1.deck = std::move(player1_cards);
        s.player2.user_id = player2_id;
        s.player2.deck = std::move(player2_cards);

        for (PlayerState* p : {&s.player1, &s.player2})
        {
            auto const deal = std::min<std::size_t>(cfg_.initial_hand, p->deck.size());
            p->hand.assign(p->deck.begin(), p->deck.begin() + static_cast<std::ptrdiff_t>(deal));
            p->deck.erase(p->deck.begin(), p->deck.begin() + static_cast<std::ptrdiff_t>(deal));

            for (CardInstanceId const& id : p->hand)
            {
                auto card = hydrator_->Resolve(id, p->user_id);
                if (!card) return std::unexpected(card.error());
                s.cache.insert_or_assign(id, std::move(*card));
            }
        }

        s.current_player_id = player1_id;
        s.turn_number = 1;
        s.status = GameStatus::Active;
        return s;
    }

    auto GameEngine::ResolveCard(GameState const& state, CardInstanceId const& card,
                                 std::optional<PlayerId> const& owner) const
        -> std::expected<InGameCardCSP, error::ActionError>
    {
        if (InGameCardCSP cached = state.Card(card))
        {
            if (owner && cached->owner != *owner)
                return std::unexpected(error::ActionError::Missing(std::format("Card instance {} not found", card)));
            return cached;
        }
        return hydrator_->Resolve(card, owner);
    }

    auto GameEngine::PlaceCard(GameState const& state, PlayerId const& player,
                               CardInstanceId const& card, Position const position) const -> ActionResult
    {
        if (auto const ok = rules_->Validate(state, player, PlaceCardAction{card, position}); !ok.has_value())
        {
            return std::unexpected(error::ActionError::Illegal(ok.error()));
        }

        auto hydrated = ResolveCard(state, card, player);
        if (!hydrated) return std::unexpected(hydrated.error());
        InGameCardCSP const& attrs = *hydrated;

        GameState next = state;
        EventLog log;
        next.cache.insert_or_assign(card, attrs);

        PlayerState& me = *next.Player(player);
        me.hand.erase(std::ranges::find(me.hand, card));

        BoardCell cell{};
        cell.owner = player;
        cell.card = card;
        cell.hydrated = attrs->current_power;
        cell.level = attrs->level;

        // A marked tile hands its effect to the card placed on it.
        TileEffect& tile = next.tiles[position.Index()];
        if (tile.Active())
        {
            auto const turns = static_cast<std::uint8_t>(tile.turns_left[0] + tile.turns_left[1]);
            cell.timed.push_back(TimedModifier{Power::Uniform(tile.Delta()), turns});
            cell.tile = tile;
            tile = TileEffect{};
            log.Push(EventType::TileChanged, position, card, player, "absorbed");
        }
        cell.Resolve();
        next.board[position.Index()] = cell;
        log.Push(EventType::CardPlaced, position, card, player, FormatPower(cell.power));

        next = registry_->Dispatch(std::move(next), moments::OnPlace, {position}, player, log);
        if (next.IsActive()) ResolveCombat(next, position, player, log);
        RecountScores(next, log);

        if (next.IsActive())
        {
            PlayerState const& after = *next.Player(player);
            if (after.hand.size() < next.max_hand_size && !after.deck.empty()) DrawOne(next, player, log);

            if (next.IsBoardFull())
            {
                Finish(next, rules_->Outcome(next), log);
            }
            else
            {
                AdvanceTurn(next, player, log);
                RecountScores(next, log);
            }
        }
        HydrateHands(next);
        return Transition{std::move(next), log.Take()};
    }

    auto GameEngine::ResolveCombat(GameState& state, Position const placed, PlayerId const& player,
                                   EventLog& log) const -> void
    {
        auto const& placed_cell = state.Cell(placed);
        if (!placed_cell) return;
        BoardCell const attacker = *placed_cell;

        struct PendingFlip
        {
            Position target;
            Direction towards;
        };

        // All four sides are judged against the board as it was right after placement.
        std::vector<PendingFlip> flips;
        for (Direction const d : AllDirections)
        {
            Position const n = Step(placed, d);
            if (!n.InBounds()) continue;
            auto const& defender = state.Cell(n);
            if (!defender || defender->owner == player) continue;
            if (rules_->Beats(attacker, *defender, d)) flips.push_back(PendingFlip{n, d});
        }

        for (PendingFlip const& flip : flips)
        {
            auto& target = state.Cell(flip.target);
            if (!target || target->owner == player) continue;

            std::string detail = std::format("{} {}>{} from {}", to_string(flip.towards),
                                             attacker.power[flip.towards],
                                             target->power[Opposite(flip.towards)], target->owner);
            target->owner = player;
            log.Push(EventType::CardFlipped, flip.target, target->card, player, std::move(detail));

            state = registry_->Dispatch(std::move(state), moments::OnFlip, {placed}, player, log, flip.target);
            if (!state.IsActive()) return;
            state = registry_->Dispatch(std::move(state), moments::OnFlipped, {flip.target}, player, log, placed);
            if (!state.IsActive()) return;
        }
    }

    auto GameEngine::AdvanceTurn(GameState& state, PlayerId const& ending, EventLog& log) const -> void
    {
        auto const slot = state.SlotOf(ending);
        GDL_ASSERT(slot.has_value(), "AdvanceTurn for a player outside the match");

        // Modifiers and immunity belong to the cell owner and tick on that owner's turn end.
        for (std::size_t i{}; i < constants::CellCount; ++i)
        {
            auto& cell = state.board[i];
            if (!cell || cell->owner != ending) continue;

            Power const before = cell->power;
            CardState const before_state = cell->state;
            for (TimedModifier& m : cell->timed)
            {
                if (m.turns_left > 0) --m.turns_left;
            }
            std::erase_if(cell->timed, [](TimedModifier const& m) { return m.turns_left == 0; });
            if (cell->immune_turns > 0) --cell->immune_turns;
            cell->Resolve();

            if (cell->power != before || cell->state != before_state)
            {
                log.Push(EventType::PowerChanged, Position::FromIndex(i), cell->card, cell->owner,
                         FormatPower(cell->power));
            }
        }

        for (std::size_t i{}; i < constants::CellCount; ++i)
        {
            TileEffect& tile = state.tiles[i];
            if (tile.status == TileStatus::Normal) continue;
            if (tile.turns_left[*slot] > 0) --tile.turns_left[*slot];
            if (!tile.Active())
            {
                tile = TileEffect{};
                log.Push(EventType::TileChanged, Position::FromIndex(i), std::nullopt, ending, "expired");
            }
        }

        state = registry_->DispatchAll(std::move(state), moments::OnTurnEnd, ending, log);
        if (!state.IsActive()) return;
        log.Push(EventType::TurnEnded, std::nullopt, std::nullopt, ending, std::to_string(state.turn_number));

        bool const round_over = state.turn_number % 2 == 0;
        if (round_over)
        {
            state = registry_->DispatchAll(std::move(state), moments::OnRoundEnd, ending, log);
            if (!state.IsActive()) return;
        }

        PlayerId const next_player = state.OpponentOf(ending);
        state.current_player_id = next_player;
        ++state.turn_number;

        if (round_over)
        {
            state = registry_->DispatchAll(std::move(state), moments::OnRoundStart, next_player, log);
            if (!state.IsActive()) return;
        }

        log.Push(EventType::TurnStarted, std::nullopt, std::nullopt, next_player, std::to_string(state.turn_number));
        state = registry_->DispatchAll(std::move(state), moments::OnTurnStart, next_player, log);
    }

    auto GameEngine::RecountScores(GameState& state, EventLog& log) const -> void
    {
        for (PlayerState* p : {&state.player1, &state.player2})
        {
            std::uint32_t const owned = state.CountOwned(p->user_id);
            if (owned == p->score) continue;
            p->score = owned;
            log.Push(EventType::ScoreUpdated, std::nullopt, std::nullopt, p->user_id, std::to_string(owned));
        }
    }

    auto GameEngine::DrawOne(GameState& state, PlayerId const& player, EventLog& log) const -> void
    {
        PlayerState& p = *state.Player(player);
        CardInstanceId id = std::move(p.deck.front());
        p.deck.erase(p.deck.begin());
        p.hand.push_back(id);

        if (auto card = ResolveCard(state, id, player))
        {
            state.cache.insert_or_assign(id, std::move(*card));
        }
        else
        {
            // stays in hand uncached; placement retries the lookup
            std::print("[Engine] failed to hydrate drawn card {} for {}: {}\n", id, player, card.error().message);
        }
        log.Push(EventType::CardDrawn, std::nullopt, id, player);
    }

    auto GameEngine::HydrateHands(GameState& state) const -> void
    {
        for (PlayerState const* p : {&state.player1, &state.player2})
        {
            for (CardInstanceId const& id : p->hand)
            {
                if (state.cache.contains(id)) continue;
                auto card = hydrator_->Resolve(id, p->user_id);
                if (!card)
                {
                    std::print("[Engine] failed to hydrate {} for {}: {}\n", id, p->user_id, card.error().message);
                    continue;
                }
                state.cache.insert_or_assign(id, std::move(*card));
            }
        }
    }

    auto GameEngine::Finish(GameState& state, GameStatus const status, EventLog& log) const -> void
    {
        state.status = status;
        state.winner = WinnerFor(state);
        log.Push(EventType::GameOver, std::nullopt, std::nullopt, state.winner, std::string{to_string(status)});
    }

    auto GameEngine::EndTurn(GameState const& state, PlayerId const& player) const -> ActionResult
    {
        if (auto const ok = rules_->Validate(state, player, EndTurnAction{}); !ok.has_value())
        {
            return std::unexpected(error::ActionError::Illegal(ok.error()));
        }

        GameState next = state;
        EventLog log;
        AdvanceTurn(next, player, log);
        RecountScores(next, log);
        HydrateHands(next);
        return Transition{std::move(next), log.Take()};
    }

    auto GameEngine::Surrender(GameState const& state, PlayerId const& player) const -> ActionResult
    {
        if (auto const ok = rules_->Validate(state, player, SurrenderAction{}); !ok.has_value())
        {
            return std::unexpected(error::ActionError::Illegal(ok.error()));
        }

        GameState next = state;
        EventLog log;
        Finish(next, state.SlotOf(player) == 0u ? GameStatus::Player2Win : GameStatus::Player1Win, log);
        return Transition{std::move(next), log.Take()};
    }

    auto GameEngine::Apply(GameState const& state, PlayerId const& player, PlayerAction const& action) const
        -> ActionResult
    {
        return std::visit([&]<typename T0>(T0 const& act) -> ActionResult
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, PlaceCardAction>) return PlaceCard(state, player, act.card, act.position);
            else if constexpr (std::is_same_v<T, EndTurnAction>) return EndTurn(state, player);
            else return Surrender(state, player);
        }, action);
    }
}
