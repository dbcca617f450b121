#include <gtest/gtest.h>
#include <filesystem>
#include <format>
#include <print>

#include "../core/Catalog.hpp"
#include "../core/ClassicRules.hpp"
#include "../core/Game.hpp"
#include "../core/Heuristic.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"

#ifndef GDL_DATA_DIR
#define GDL_DATA_DIR "data"
#endif

using namespace gridduel::core;

namespace
{
    auto make_engine(std::shared_ptr<Catalog> catalog, std::uint64_t seed) -> GameEngine
    {
        Config cfg{};
        cfg.seed = seed;
        return GameEngine(cfg, std::make_unique<ClassicRules>(),
                          std::make_shared<AbilityRegistry const>(MakeStandardRegistry()), std::move(catalog));
    }

    auto deck_of(Catalog const& catalog, std::string const& ref, PlayerId const& owner) -> std::vector<CardInstanceId>
    {
        auto cards = catalog.DeckCards(ref, owner);
        GDL_ASSERT(cards.has_value(), std::format("deck {} missing", ref));
        return *cards;
    }
} // anonymous namespace

TEST(SelfPlay, Catalog_Decks_Play_To_The_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        auto catalog = Catalog::LoadFile(GDL_DATA_DIR "/catalog.json", 2);
        auto const alice = deck_of(*catalog, "alice-main", "alice");
        auto const bob = deck_of(*catalog, "bob-main", "bob");
        std::size_t const total = alice.size() + bob.size();

        for (std::uint64_t seed : {111ull, 222ull, 333ull})
        {
            GameEngine const engine = make_engine(catalog, seed);
            Heuristic ai(seed + 1);
            auto const path = fs::path(std::format("_artifacts/selfplay_{}.log", seed));
            debug::AuditLogger log(path.string());

            auto init = engine.InitializeGame(alice, bob, "alice", "bob");
            ASSERT_TRUE(init.has_value()) << init.error().message;
            GameState state = std::move(*init);
            debug::CheckInvariants(state, total);
            log.start(std::format("selfplay-{}", seed), state);

            // Every action fills a cell or passes; a stuck game would loop forever.
            int guard = 0;
            while (state.IsActive())
            {
                ASSERT_LT(++guard, 200) << "self-play did not terminate";

                PlayerId const actor = state.current_player_id;
                Difficulty const level = actor == "alice" ? Difficulty::Hard : Difficulty::Medium;
                PlayerAction action = EndTurnAction{};
                if (auto const move = ai.Choose(state, engine, actor, level))
                {
                    action = PlaceCardAction{move->card, move->position};
                }

                log.turn(state, actor, action, false);
                auto result = engine.Apply(state, actor, action);
                ASSERT_TRUE(result.has_value()) << result.error().message;

                log.events(result->events);
                state = std::move(result->state);
                debug::CheckInvariants(state, total);
                log.board(state);
            }
            log.end(state, "completed");
            log.flush();

            EXPECT_NE(state.status, GameStatus::Active);
            EXPECT_EQ(state.player1.score + state.player2.score, state.OccupiedCount());
            ASSERT_TRUE(fs::exists(path));
            ASSERT_GT(fs::file_size(path), 0u);
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e);
        FAIL() << e.what();
    }
}

TEST(SelfPlay, Same_Seed_Same_Game)
{
    auto catalog = Catalog::LoadFile(GDL_DATA_DIR "/catalog.json", 2);
    auto const alice = deck_of(*catalog, "alice-main", "alice");
    auto const bob = deck_of(*catalog, "bob-main", "bob");

    auto play = [&](std::uint64_t seed) -> GameState
    {
        GameEngine const engine = make_engine(catalog, seed);
        Heuristic ai(seed);
        GameState s = *engine.InitializeGame(alice, bob, "alice", "bob");
        for (int i{}; i < 200 && s.IsActive(); ++i)
        {
            PlayerAction action = EndTurnAction{};
            if (auto const move = ai.Choose(s, engine, s.current_player_id, Difficulty::Easy))
                action = PlaceCardAction{move->card, move->position};
            s = engine.Apply(s, s.current_player_id, action).value().state;
        }
        return s;
    };

    GameState const a = play(77);
    GameState const b = play(77);
    EXPECT_EQ(a.board, b.board);
    EXPECT_EQ(a.status, b.status);
    EXPECT_EQ(a.turn_number, b.turn_number);
}
