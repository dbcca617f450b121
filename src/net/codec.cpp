//
// codec.cpp
//
#include "codec.hpp"

#include <format>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace fb = gridduel::gen::store;

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert(static_cast<int>(gridduel::core::GameStatus::Aborted) == static_cast<int>(fb::GameStatus::Aborted));
    static_assert(static_cast<int>(gridduel::core::CardState::Immune) == static_cast<int>(fb::CardState::Immune));
    static_assert(static_cast<int>(gridduel::core::TileStatus::Blessed) == static_cast<int>(fb::TileStatus::Blessed));
    static_assert(static_cast<int>(gridduel::core::Rarity::Legendary) == static_cast<int>(fb::Rarity::Legendary));
    static_assert(static_cast<int>(gridduel::core::Scope::FlipTarget) == static_cast<int>(fb::Scope::FlipTarget));
    static_assert(static_cast<int>(gridduel::core::ConditionKind::AdjacentEnemiesAtLeast) ==
        static_cast<int>(fb::ConditionKind::AdjacentEnemiesAtLeast));

    using gridduel::core::Direction;
    using gridduel::core::Power;

    inline auto ToFbPower(Power const& p) -> fb::Power
    {
        return fb::Power(p[Direction::Top], p[Direction::Right], p[Direction::Bottom], p[Direction::Left]);
    }

    inline auto FromFbPower(fb::Power const* p) -> Power
    {
        if (!p) return Power{};
        return Power::Of(p->top(), p->right(), p->bottom(), p->left());
    }

    inline auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    inline auto Strings(flatbuffers::Vector<flatbuffers::Offset<flatbuffers::String>> const* v)
        -> std::vector<std::string>
    {
        std::vector<std::string> out;
        if (!v) return out;
        out.reserve(v->size());
        for (auto const* s : *v) out.push_back(Str(s));
        return out;
    }

    inline auto ToFbSide(std::optional<Direction> side) -> std::int8_t
    {
        return side ? static_cast<std::int8_t>(*side) : std::int8_t{-1};
    }

    inline auto FromFbSide(std::int8_t side) -> std::optional<Direction>
    {
        if (side < 0 || side > 3) return std::nullopt;
        return static_cast<Direction>(side);
    }
}

namespace gridduel::net
{
    using namespace gridduel::core;

    auto ToFbStatus(GameStatus s) noexcept -> fb::GameStatus
    {
        return static_cast<fb::GameStatus>(s);
    }

    auto FromFbStatus(fb::GameStatus s) noexcept -> GameStatus
    {
        switch (s)
        {
        case fb::GameStatus::Active: return GameStatus::Active;
        case fb::GameStatus::Player1Win: return GameStatus::Player1Win;
        case fb::GameStatus::Player2Win: return GameStatus::Player2Win;
        case fb::GameStatus::Draw: return GameStatus::Draw;
        case fb::GameStatus::Aborted: return GameStatus::Aborted;
        }
        return GameStatus::Aborted;
    }

    static auto ToFbTile(flatbuffers::FlatBufferBuilder& fbb, TileEffect const& t)
        -> flatbuffers::Offset<fb::TileEffect>
    {
        return fb::CreateTileEffect(fbb, static_cast<fb::TileStatus>(t.status), t.magnitude,
                                    t.turns_left[0], t.turns_left[1]);
    }

    static auto FromFbTile(fb::TileEffect const* t) -> TileEffect
    {
        if (!t) return TileEffect{};
        return TileEffect{static_cast<TileStatus>(t->status()), t->magnitude(), {t->turns_p1(), t->turns_p2()}};
    }

    static auto ToFbEffect(flatbuffers::FlatBufferBuilder& fbb, Effect const& e)
        -> flatbuffers::Offset<fb::EffectEntry>
    {
        auto const [type, off] = std::visit([&]<typename T0>(T0 const& fx)
            -> std::pair<fb::Effect, flatbuffers::Offset<void>>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, effects::Buff>)
                return {fb::Effect::BuffFx, fb::CreateBuffFx(fbb, static_cast<fb::Scope>(fx.scope), fx.magnitude,
                                                             ToFbSide(fx.side), fx.duration).Union()};
            else if constexpr (std::is_same_v<T, effects::Debuff>)
                return {fb::Effect::DebuffFx, fb::CreateDebuffFx(fbb, static_cast<fb::Scope>(fx.scope), fx.magnitude,
                                                                 ToFbSide(fx.side), fx.duration).Union()};
            else if constexpr (std::is_same_v<T, effects::GrantImmunity>)
                return {fb::Effect::ImmunityFx,
                        fb::CreateImmunityFx(fbb, static_cast<fb::Scope>(fx.scope), fx.turns).Union()};
            else if constexpr (std::is_same_v<T, effects::HexTiles>)
                return {fb::Effect::HexTilesFx, fb::CreateHexTilesFx(fbb, fx.magnitude, fx.turns).Union()};
            else if constexpr (std::is_same_v<T, effects::BlessTiles>)
                return {fb::Effect::BlessTilesFx, fb::CreateBlessTilesFx(fbb, fx.magnitude, fx.turns).Union()};
            else if constexpr (std::is_same_v<T, effects::DrawCards>)
                return {fb::Effect::DrawCardsFx, fb::CreateDrawCardsFx(fbb, fx.count).Union()};
            else if constexpr (std::is_same_v<T, effects::EndMatch>)
                return {fb::Effect::EndMatchFx, fb::CreateEndMatchFx(fbb, fx.by_score).Union()};
            else
                return {fb::Effect::DiscardFx, fb::CreateDiscardFx(fbb, fx.count, fx.opponent).Union()};
        }, e);
        return fb::CreateEffectEntry(fbb, type, off);
    }

    static auto FromFbEffect(fb::EffectEntry const* e) -> std::expected<Effect, ParseError>
    {
        if (!e) return std::unexpected(ParseError{"null effect entry"});
        switch (e->effect_type())
        {
        case fb::Effect::BuffFx:
            {
                auto const* fx = e->effect_as_BuffFx();
                return effects::Buff{static_cast<Scope>(fx->scope()), fx->magnitude(), FromFbSide(fx->side()),
                                     fx->duration()};
            }
        case fb::Effect::DebuffFx:
            {
                auto const* fx = e->effect_as_DebuffFx();
                return effects::Debuff{static_cast<Scope>(fx->scope()), fx->magnitude(), FromFbSide(fx->side()),
                                       fx->duration()};
            }
        case fb::Effect::ImmunityFx:
            {
                auto const* fx = e->effect_as_ImmunityFx();
                return effects::GrantImmunity{static_cast<Scope>(fx->scope()), fx->turns()};
            }
        case fb::Effect::HexTilesFx:
            return effects::HexTiles{e->effect_as_HexTilesFx()->magnitude(), e->effect_as_HexTilesFx()->turns()};
        case fb::Effect::BlessTilesFx:
            return effects::BlessTiles{e->effect_as_BlessTilesFx()->magnitude(), e->effect_as_BlessTilesFx()->turns()};
        case fb::Effect::DrawCardsFx:
            return effects::DrawCards{e->effect_as_DrawCardsFx()->count()};
        case fb::Effect::EndMatchFx:
            return effects::EndMatch{e->effect_as_EndMatchFx()->by_score()};
        case fb::Effect::DiscardFx:
            return effects::Discard{e->effect_as_DiscardFx()->count(), e->effect_as_DiscardFx()->opponent()};
        default:
            break;
        }
        return std::unexpected(ParseError{std::format("unknown effect type {}", static_cast<int>(e->effect_type()))});
    }

    static auto ToFbCard(flatbuffers::FlatBufferBuilder& fbb, InGameCard const& c) -> flatbuffers::Offset<fb::Card>
    {
        flatbuffers::Offset<fb::Ability> ability{};
        if (c.ability)
        {
            AbilitySpec const& a = *c.ability;
            std::vector<flatbuffers::Offset<fb::EffectEntry>> fx;
            fx.reserve(a.effects.size());
            for (Effect const& e : a.effects) fx.push_back(ToFbEffect(fbb, e));

            auto const cond = fb::CreateCondition(fbb, static_cast<fb::ConditionKind>(a.condition.kind),
                                                  fbb.CreateString(a.condition.tag), a.condition.count);
            ability = fb::CreateAbility(fbb, fbb.CreateString(a.name), fbb.CreateString(a.description),
                                        fbb.CreateVectorOfStrings(a.triggers), cond, fbb.CreateVector(fx));
        }

        fb::Power const base = ToFbPower(c.base_power);
        fb::Power const enh = ToFbPower(c.enhancements);
        fb::Power const cur = ToFbPower(c.current_power);
        return fb::CreateCard(fbb,
                              fbb.CreateString(c.instance_id),
                              fbb.CreateString(c.base_card_id),
                              fbb.CreateString(c.name),
                              static_cast<fb::Rarity>(c.rarity),
                              &base, &enh, c.level, &cur,
                              fbb.CreateVectorOfStrings(c.tags),
                              ability,
                              fbb.CreateString(c.owner));
    }

    static auto FromFbCard(fb::Card const* c) -> std::expected<InGameCard, ParseError>
    {
        InGameCard out;
        out.instance_id = Str(c->instance_id());
        out.base_card_id = Str(c->base_card_id());
        out.name = Str(c->name());
        out.rarity = static_cast<Rarity>(c->rarity());
        out.base_power = FromFbPower(c->base_power());
        out.enhancements = FromFbPower(c->enhancements());
        out.level = c->level();
        out.current_power = FromFbPower(c->current_power());
        out.tags = Strings(c->tags());
        out.owner = Str(c->owner());

        if (auto const* a = c->ability())
        {
            AbilitySpec spec;
            spec.name = Str(a->name());
            spec.description = Str(a->description());
            spec.triggers = Strings(a->triggers());
            if (auto const* cond = a->condition())
            {
                spec.condition = Condition{static_cast<ConditionKind>(cond->kind()), Str(cond->tag()), cond->count()};
            }
            if (auto const* fx = a->effects())
            {
                for (auto const* entry : *fx)
                {
                    auto effect = FromFbEffect(entry);
                    if (!effect) return std::unexpected(effect.error());
                    spec.effects.push_back(std::move(*effect));
                }
            }
            out.ability = std::move(spec);
        }
        return out;
    }

    static auto ToFbPlayer(flatbuffers::FlatBufferBuilder& fbb, PlayerState const& p)
        -> flatbuffers::Offset<fb::Player>
    {
        return fb::CreatePlayer(fbb,
                                fbb.CreateString(p.user_id),
                                fbb.CreateVectorOfStrings(p.hand),
                                fbb.CreateVectorOfStrings(p.deck),
                                fbb.CreateVectorOfStrings(p.discard),
                                p.score);
    }

    static auto FromFbPlayer(fb::Player const* p) -> PlayerState
    {
        PlayerState out;
        if (!p) return out;
        out.user_id = Str(p->user_id());
        out.hand = Strings(p->hand());
        out.deck = Strings(p->deck());
        out.discard = Strings(p->discard());
        out.score = p->score();
        return out;
    }

    // ---------- Encode ----------

    auto EncodeGameState(GameState const& state) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::Cell>> cells;
        for (std::size_t i{}; i < constants::CellCount; ++i)
        {
            auto const& cell = state.board[i];
            if (!cell) continue;

            std::vector<flatbuffers::Offset<fb::TimedModifier>> timed;
            timed.reserve(cell->timed.size());
            for (TimedModifier const& m : cell->timed)
            {
                fb::Power const delta = ToFbPower(m.delta);
                timed.push_back(fb::CreateTimedModifier(fbb, &delta, m.turns_left));
            }
            auto const timed_vec = fbb.CreateVector(timed);
            auto const tile = cell->tile ? ToFbTile(fbb, *cell->tile) : flatbuffers::Offset<fb::TileEffect>{};
            auto const owner = fbb.CreateString(cell->owner);
            auto const card = fbb.CreateString(cell->card);

            fb::Power const hydrated = ToFbPower(cell->hydrated);
            fb::Power const permanent = ToFbPower(cell->permanent);
            fb::Power const power = ToFbPower(cell->power);
            cells.push_back(fb::CreateCell(fbb,
                                           /*index*/ static_cast<std::uint8_t>(i),
                                           owner, card,
                                           &hydrated, &permanent,
                                           timed_vec,
                                           &power,
                                           cell->level,
                                           cell->immune_turns,
                                           static_cast<fb::CardState>(cell->state),
                                           tile));
        }
        auto const cells_vec = fbb.CreateVector(cells);

        std::vector<flatbuffers::Offset<fb::TileEffect>> tiles;
        tiles.reserve(state.tiles.size());
        for (TileEffect const& t : state.tiles) tiles.push_back(ToFbTile(fbb, t));
        auto const tiles_vec = fbb.CreateVector(tiles);

        std::vector<flatbuffers::Offset<fb::Card>> cache;
        cache.reserve(state.cache.size());
        for (auto const& [id, card] : state.cache)
        {
            if (card) cache.push_back(ToFbCard(fbb, *card));
        }
        auto const cache_vec = fbb.CreateVector(cache);

        auto const p1 = ToFbPlayer(fbb, state.player1);
        auto const p2 = ToFbPlayer(fbb, state.player2);
        auto const current = fbb.CreateString(state.current_player_id);
        auto const winner = state.winner ? fbb.CreateString(*state.winner) : flatbuffers::Offset<flatbuffers::String>{};

        auto const root = fb::CreateGameStateRecord(fbb,
                                                    /*schema_version*/ 1,
                                                    cells_vec,
                                                    tiles_vec,
                                                    p1, p2,
                                                    current,
                                                    state.turn_number,
                                                    ToFbStatus(state.status),
                                                    state.max_hand_size,
                                                    winner,
                                                    cache_vec);
        fb::FinishGameStateRecordBuffer(fbb, root);
        return fbb.Release();
    }

    // ---------- Decode ----------

    auto DecodeGameState(std::span<std::uint8_t const> bytes) -> std::expected<GameState, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        flatbuffers::Verifier verifier(bytes.data(), bytes.size());
        if (!fb::VerifyGameStateRecordBuffer(verifier))
            return std::unexpected(ParseError{"verification failed"});

        auto const* rec = fb::GetGameStateRecord(bytes.data());
        if (rec->schema_version() != 1)
            return std::unexpected(ParseError{std::format("unsupported schema version {}", rec->schema_version())});

        GameState out;
        if (auto const* cells = rec->cells())
        {
            for (auto const* c : *cells)
            {
                if (c->index() >= constants::CellCount)
                    return std::unexpected(ParseError{std::format("cell index {} out of range", c->index())});

                BoardCell cell;
                cell.owner = Str(c->owner());
                cell.card = Str(c->card());
                cell.hydrated = FromFbPower(c->hydrated());
                cell.permanent = FromFbPower(c->permanent());
                if (auto const* timed = c->timed())
                {
                    for (auto const* m : *timed) cell.timed.push_back(TimedModifier{FromFbPower(m->delta()), m->turns_left()});
                }
                cell.power = FromFbPower(c->power());
                cell.level = c->level();
                cell.immune_turns = c->immune_turns();
                cell.state = static_cast<CardState>(c->state());
                if (c->tile()) cell.tile = FromFbTile(c->tile());
                out.board[c->index()] = std::move(cell);
            }
        }

        auto const* tiles = rec->tiles();
        if (!tiles || tiles->size() != constants::CellCount)
            return std::unexpected(ParseError{"tile layer must hold one entry per cell"});
        for (flatbuffers::uoffset_t i{}; i < tiles->size(); ++i) out.tiles[i] = FromFbTile(tiles->Get(i));

        out.player1 = FromFbPlayer(rec->player1());
        out.player2 = FromFbPlayer(rec->player2());
        out.current_player_id = Str(rec->current_player_id());
        out.turn_number = rec->turn_number();
        out.status = FromFbStatus(rec->status());
        out.max_hand_size = rec->max_hand_size();
        if (rec->winner()) out.winner = rec->winner()->str();

        if (auto const* cache = rec->cache())
        {
            for (auto const* c : *cache)
            {
                auto card = FromFbCard(c);
                if (!card) return std::unexpected(card.error());
                CardInstanceId id = card->instance_id;
                out.cache.insert_or_assign(std::move(id), std::make_shared<InGameCard const>(std::move(*card)));
            }
        }
        return out;
    }
}
