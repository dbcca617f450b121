//
// Catalog.cpp
//

#include "Catalog.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <print>
#include <type_traits>
#include <variant>

using json = nlohmann::json;

namespace gridduel::core
{
    namespace
    {
        template <typename T, typename Parser>
        auto Required(json const& j, char const* key, Parser parse) -> T
        {
            std::string const raw = j.at(key).get<std::string>();
            std::optional<T> v = parse(raw);
            if (!v) GDL_THROW(error::Code::Serialization, std::format("Unknown value '{}' for '{}'", raw, key));
            return *v;
        }

        auto U8(json const& j, char const* key, int fallback) -> std::uint8_t
        {
            return static_cast<std::uint8_t>(std::clamp(j.value(key, fallback), 0, 255));
        }

        auto EffectFromJson(json const& j) -> Effect
        {
            std::string const type = j.at("type").get<std::string>();
            auto scope = [&](Scope fallback) -> Scope
            {
                return j.contains("scope") ? Required<Scope>(j, "scope", ParseScope) : fallback;
            };
            auto side = [&]() -> std::optional<Direction>
            {
                if (!j.contains("side") || j["side"].is_null()) return std::nullopt;
                return Required<Direction>(j, "side", ParseDirection);
            };

            if (type == "buff")
                return effects::Buff{scope(Scope::Self), j.value("magnitude", 1), side(),
                                     U8(j, "duration", 0)};
            if (type == "debuff")
                return effects::Debuff{scope(Scope::AdjacentEnemies), j.value("magnitude", 1), side(),
                                       U8(j, "duration", 0)};
            if (type == "grantImmunity")
                return effects::GrantImmunity{scope(Scope::Self), U8(j, "turns", 1)};
            if (type == "hexTiles")
                return effects::HexTiles{j.value("magnitude", 1), U8(j, "turns", 2)};
            if (type == "blessTiles")
                return effects::BlessTiles{j.value("magnitude", 1), U8(j, "turns", 2)};
            if (type == "drawCards")
                return effects::DrawCards{U8(j, "count", 1)};
            if (type == "endMatch")
                return effects::EndMatch{j.value("byScore", false)};
            if (type == "discard")
                return effects::Discard{U8(j, "count", 1), j.value("opponent", true)};

            GDL_THROW(error::Code::Serialization, std::format("Unknown effect type '{}'", type));
        }

        auto EffectToJson(Effect const& e) -> json
        {
            json out{{"type", std::string{EffectName(e)}}};
            std::visit([&]<typename T0>(T0 const& fx)
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, effects::Buff> || std::is_same_v<T, effects::Debuff>)
                {
                    out["scope"] = std::string{to_string(fx.scope)};
                    out["magnitude"] = fx.magnitude;
                    if (fx.side) out["side"] = std::string{to_string(*fx.side)};
                    out["duration"] = fx.duration;
                }
                else if constexpr (std::is_same_v<T, effects::GrantImmunity>)
                {
                    out["scope"] = std::string{to_string(fx.scope)};
                    out["turns"] = fx.turns;
                }
                else if constexpr (std::is_same_v<T, effects::HexTiles> || std::is_same_v<T, effects::BlessTiles>)
                {
                    out["magnitude"] = fx.magnitude;
                    out["turns"] = fx.turns;
                }
                else if constexpr (std::is_same_v<T, effects::DrawCards>)
                {
                    out["count"] = fx.count;
                }
                else if constexpr (std::is_same_v<T, effects::EndMatch>)
                {
                    out["byScore"] = fx.by_score;
                }
                else
                {
                    out["count"] = fx.count;
                    out["opponent"] = fx.opponent;
                }
            }, e);
            return out;
        }
    }

    auto PowerFromJson(json const& j) -> Power
    {
        if (j.is_array())
            return Power::Of(j.at(0).get<int>(), j.at(1).get<int>(), j.at(2).get<int>(), j.at(3).get<int>());
        return Power::Of(j.value("top", 0), j.value("right", 0), j.value("bottom", 0), j.value("left", 0));
    }

    auto PowerToJson(Power const& p) -> json
    {
        return json{{"top", p[Direction::Top]}, {"right", p[Direction::Right]},
                    {"bottom", p[Direction::Bottom]}, {"left", p[Direction::Left]}};
    }

    auto AbilityFromJson(json const& j) -> AbilitySpec
    {
        AbilitySpec a;
        a.name = j.at("name").get<std::string>();
        a.description = j.value("description", "");
        a.triggers = j.at("triggers").get<std::vector<std::string>>();
        if (j.contains("condition"))
        {
            json const& c = j["condition"];
            a.condition.kind = Required<ConditionKind>(c, "kind", ParseConditionKind);
            a.condition.tag = c.value("tag", "");
            a.condition.count = U8(c, "count", 0);
        }
        for (json const& e : j.at("effects")) a.effects.push_back(EffectFromJson(e));
        return a;
    }

    auto AbilityToJson(AbilitySpec const& a) -> json
    {
        json effects = json::array();
        for (Effect const& e : a.effects) effects.push_back(EffectToJson(e));
        return json{
            {"name", a.name},
            {"description", a.description},
            {"triggers", a.triggers},
            {"condition", {{"kind", std::string{to_string(a.condition.kind)}}, {"tag", a.condition.tag}, {"count", a.condition.count}}},
            {"effects", std::move(effects)}
        };
    }

    Catalog::Catalog(std::uint8_t level_step) :
        level_step_(level_step) {}

    auto Catalog::AddCard(CardDefinition def) -> void
    {
        std::string key = def.id;
        cards_.insert_or_assign(std::move(key), std::move(def));
    }

    auto Catalog::AddInstance(CardInstanceRecord rec) -> void
    {
        if (!cards_.contains(rec.card_id))
            GDL_THROW(error::Code::Serialization, std::format("Instance {} references unknown card {}", rec.id, rec.card_id));
        CardInstanceId key = rec.id;
        instances_.insert_or_assign(std::move(key), std::move(rec));
    }

    auto Catalog::AddDeck(DeckRecord deck) -> void
    {
        for (CardInstanceId const& id : deck.cards)
        {
            auto const it = instances_.find(id);
            if (it == instances_.end())
                GDL_THROW(error::Code::Serialization, std::format("Deck {} references unknown instance {}", deck.ref, id));
            if (it->second.owner != deck.owner)
                GDL_THROW(error::Code::Serialization, std::format("Deck {} holds instance {} of another owner", deck.ref, id));
        }
        std::string key = deck.ref;
        decks_.insert_or_assign(std::move(key), std::move(deck));
    }

    auto Catalog::Resolve(CardInstanceId const& id, std::optional<PlayerId> const& owner) const
        -> std::expected<InGameCardCSP, error::ActionError>
    {
        auto const inst = instances_.find(id);
        if (inst == instances_.end() || (owner && inst->second.owner != *owner))
            return std::unexpected(error::ActionError::Missing(std::format("Card instance {} not found", id)));

        CardInstanceRecord const& rec = inst->second;
        CardDefinition const& def = cards_.at(rec.card_id);

        auto card = std::make_shared<InGameCard>();
        card->instance_id = rec.id;
        card->base_card_id = def.id;
        card->name = def.name;
        card->rarity = def.rarity;
        card->base_power = def.base_power;
        card->enhancements = rec.enhancements;
        card->level = rec.level;
        card->current_power = LevelAdjusted(def.base_power, rec.enhancements, rec.level, level_step_);
        card->tags = def.tags;
        card->ability = def.ability;
        card->owner = rec.owner;
        return card;
    }

    auto Catalog::DeckCards(std::string const& deck_ref, PlayerId const& owner) const
        -> std::expected<std::vector<CardInstanceId>, error::ActionError>
    {
        auto const it = decks_.find(deck_ref);
        if (it == decks_.end() || it->second.owner != owner)
            return std::unexpected(error::ActionError::Missing(std::format("Deck {} not found", deck_ref)));
        return it->second.cards;
    }

    auto Catalog::FromJson(json const& doc, std::uint8_t level_step) -> std::shared_ptr<Catalog>
    {
        auto catalog = std::make_shared<Catalog>(level_step);
        try
        {
            for (json const& c : doc.at("cards"))
            {
                CardDefinition def;
                def.id = c.at("id").get<std::string>();
                def.name = c.value("name", def.id);
                def.rarity = c.contains("rarity") ? Required<Rarity>(c, "rarity", ParseRarity) : Rarity::Common;
                def.base_power = PowerFromJson(c.at("power"));
                def.tags = c.value("tags", std::vector<std::string>{});
                if (c.contains("ability") && !c["ability"].is_null()) def.ability = AbilityFromJson(c["ability"]);
                catalog->AddCard(std::move(def));
            }
            for (json const& i : doc.at("instances"))
            {
                CardInstanceRecord rec;
                rec.id = i.at("id").get<std::string>();
                rec.card_id = i.at("card").get<std::string>();
                rec.owner = i.at("owner").get<std::string>();
                rec.level = U8(i, "level", 1);
                if (i.contains("enhancements")) rec.enhancements = PowerFromJson(i["enhancements"]);
                catalog->AddInstance(std::move(rec));
            }
            for (json const& d : doc.value("decks", json::array()))
            {
                DeckRecord deck;
                deck.ref = d.at("ref").get<std::string>();
                deck.owner = d.at("owner").get<std::string>();
                deck.cards = d.at("cards").get<std::vector<std::string>>();
                catalog->AddDeck(std::move(deck));
            }
        }
        catch (json::exception const& e)
        {
            GDL_THROW(error::Code::Serialization, std::format("Malformed catalog: {}", e.what()));
        }
        return catalog;
    }

    auto Catalog::LoadFile(std::string const& path, std::uint8_t level_step) -> std::shared_ptr<Catalog>
    {
        std::ifstream file(path);
        if (!file.is_open()) GDL_THROW(error::Code::NotFound, std::format("Cannot open catalog {}", path));

        json doc;
        try
        {
            doc = json::parse(file);
        }
        catch (json::parse_error const& e)
        {
            GDL_THROW(error::Code::Serialization, std::format("Catalog {} is not valid JSON: {}", path, e.what()));
        }
        auto catalog = FromJson(doc, level_step);
        std::print("[Catalog] loaded {} cards, {} instances, {} decks from {}\n",
                   catalog->CardCount(), catalog->InstanceCount(), catalog->DeckCount(), path);
        return catalog;
    }
}
