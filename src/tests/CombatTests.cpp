#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../core/ClassicRules.hpp"
#include "../core/Game.hpp"
#include "../debug/Invariants.hpp"
#include "TestSupport.hpp"

using namespace gridduel::core;
using namespace gridduel::test;

namespace
{
    using RVC = error::RuleViolationCode;

    auto ViolationOf(ActionResult const& r) -> std::optional<RVC>
    {
        if (r.has_value() || !r.error().violation) return std::nullopt;
        return r.error().violation->code;
    }

    // 15 cells filled with unbeatable cards, alice owning `alice_cells` of them.
    // (3,3) stays empty for the final placement.
    auto FillAllButCorner(GameState& s, Catalog& catalog, std::size_t alice_cells) -> void
    {
        for (std::size_t i{}; i + 1 < constants::CellCount; ++i)
        {
            PlayerId const owner = i < alice_cells ? Alice : Bob;
            CardInstanceId const id = "wall-" + std::to_string(i);
            AddCard(catalog, id, owner, Power::Uniform(9));
            PutCell(s, catalog, Position::FromIndex(i), id);
        }
    }
}

TEST(Combat, Scenario_Flip_From_Below)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "b-weak", Bob, Power::Uniform(1));
    AddCard(*catalog, "a-strong", Alice, Power::Of(6, 4, 2, 3));
    auto engine = MakeEngine(catalog);

    GameState s = BlankState({"a-strong"}, {"b-weak"});
    s.current_player_id = Bob;

    auto first = engine->PlaceCard(s, Bob, "b-weak", Position{1, 0});
    ASSERT_TRUE(first.has_value()) << first.error().message;
    EXPECT_EQ(first->state.current_player_id, Alice);
    EXPECT_EQ(first->state.player2.score, 1u);

    auto second = engine->PlaceCard(first->state, Alice, "a-strong", Position{1, 1});
    ASSERT_TRUE(second.has_value()) << second.error().message;

    GameState const& after = second->state;
    EXPECT_EQ(OwnerAt(after, Position{1, 0}), std::optional<PlayerId>{Alice});
    EXPECT_EQ(OwnerAt(after, Position{1, 1}), std::optional<PlayerId>{Alice});
    EXPECT_EQ(after.player1.score, 2u);
    EXPECT_EQ(after.player2.score, 0u);
    EXPECT_EQ(CountEvents(second->events, EventType::CardFlipped), 1u);
    EXPECT_EQ(CountEvents(second->events, EventType::CardPlaced), 1u);

    // seq numbers are dense from zero
    for (std::size_t i{}; i < second->events.size(); ++i)
    {
        EXPECT_EQ(second->events[i].seq, i);
    }
    EXPECT_EQ(second->events.front().type, EventType::CardPlaced);

    gridduel::core::debug::CheckInvariants(after, 2);
}

TEST(Combat, Strictly_Greater_Flips_Tie_Does_Not)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "attacker", Alice, Power::Of(5, 0, 0, 0));
    AddCard(*catalog, "tough", Bob, Power::Of(0, 0, 5, 0));
    AddCard(*catalog, "soft", Bob, Power::Of(0, 0, 3, 0));
    auto engine = MakeEngine(catalog);

    GameState tied = BlankState({"attacker"}, {});
    PutCell(tied, *catalog, Position{1, 0}, "tough");
    auto r1 = engine->PlaceCard(tied, Alice, "attacker", Position{1, 1});
    ASSERT_TRUE(r1.has_value());
    EXPECT_EQ(OwnerAt(r1->state, Position{1, 0}), std::optional<PlayerId>{Bob});
    EXPECT_EQ(CountEvents(r1->events, EventType::CardFlipped), 0u);

    GameState weaker = BlankState({"attacker"}, {});
    PutCell(weaker, *catalog, Position{1, 0}, "soft");
    auto r2 = engine->PlaceCard(weaker, Alice, "attacker", Position{1, 1});
    ASSERT_TRUE(r2.has_value());
    EXPECT_EQ(OwnerAt(r2->state, Position{1, 0}), std::optional<PlayerId>{Alice});
}

TEST(Combat, All_Four_Sides_Judged)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "star", Alice, Power::Uniform(2));
    std::vector<Position> const around{{1, 0}, {2, 1}, {1, 2}, {0, 1}};
    GameState s = BlankState({"star"}, {});
    for (std::size_t i{}; i < around.size(); ++i)
    {
        CardInstanceId const id = "ring-" + std::to_string(i);
        AddCard(*catalog, id, Bob, Power::Uniform(1));
        PutCell(s, *catalog, around[i], id);
    }
    auto engine = MakeEngine(catalog);

    auto r = engine->PlaceCard(s, Alice, "star", Position{1, 1});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(CountEvents(r->events, EventType::CardFlipped), 4u);
    EXPECT_EQ(r->state.player1.score, 5u);
    EXPECT_EQ(r->state.player2.score, 0u);
}

TEST(Combat, Flips_Do_Not_Chain)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "spear", Alice, Power::Of(0, 5, 0, 0));
    AddCard(*catalog, "middle", Bob, Power::Of(0, 9, 0, 1));
    AddCard(*catalog, "far", Bob, Power::Of(0, 0, 0, 1));
    auto engine = MakeEngine(catalog);

    GameState s = BlankState({"spear"}, {});
    PutCell(s, *catalog, Position{1, 0}, "middle");
    PutCell(s, *catalog, Position{2, 0}, "far");

    auto r = engine->PlaceCard(s, Alice, "spear", Position{0, 0});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(OwnerAt(r->state, Position{1, 0}), std::optional<PlayerId>{Alice});
    EXPECT_EQ(OwnerAt(r->state, Position{2, 0}), std::optional<PlayerId>{Bob});
}

TEST(Combat, Own_Cards_Are_Never_Flipped)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "big", Alice, Power::Uniform(9));
    AddCard(*catalog, "mine", Alice, Power::Uniform(0));
    auto engine = MakeEngine(catalog);

    GameState s = BlankState({"big"}, {});
    PutCell(s, *catalog, Position{0, 1}, "mine");
    auto r = engine->PlaceCard(s, Alice, "big", Position{0, 0});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(CountEvents(r->events, EventType::CardFlipped), 0u);
    EXPECT_EQ(r->state.player1.score, 2u);
}

TEST(Combat, Immune_Defender_Holds)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "big", Alice, Power::Uniform(9));
    AddCard(*catalog, "shielded", Bob, Power::Uniform(1));
    auto engine = MakeEngine(catalog);

    GameState s = BlankState({"big"}, {});
    BoardCell& cell = PutCell(s, *catalog, Position{0, 1}, "shielded");
    cell.immune_turns = 1;
    cell.Resolve();
    EXPECT_EQ(cell.state, CardState::Immune);

    auto r = engine->PlaceCard(s, Alice, "big", Position{0, 0});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(OwnerAt(r->state, Position{0, 1}), std::optional<PlayerId>{Bob});
}

TEST(Combat, Cursed_Tile_Absorbed_Before_Combat)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "three", Alice, Power::Uniform(3));
    AddCard(*catalog, "two", Bob, Power::Uniform(2));
    auto engine = MakeEngine(catalog);

    GameState s = BlankState({"three"}, {});
    PutCell(s, *catalog, Position{1, 0}, "two");
    s.tiles[Position{0, 0}.Index()] = TileEffect{TileStatus::Cursed, 2, {1, 1}};

    auto r = engine->PlaceCard(s, Alice, "three", Position{0, 0});
    ASSERT_TRUE(r.has_value());

    auto const& placed = r->state.Cell(Position{0, 0});
    ASSERT_TRUE(placed.has_value());
    EXPECT_EQ(placed->power, Power::Uniform(1));
    EXPECT_EQ(placed->state, CardState::Debuffed);
    ASSERT_EQ(placed->timed.size(), 1u);
    EXPECT_EQ(r->state.tiles[Position{0, 0}.Index()].status, TileStatus::Normal);
    EXPECT_EQ(OwnerAt(r->state, Position{1, 0}), std::optional<PlayerId>{Bob});
    EXPECT_EQ(r->events.front().type, EventType::TileChanged);
    EXPECT_EQ(r->events.front().detail, "absorbed");
}

TEST(Combat, Power_Floors_At_Zero)
{
    BoardCell cell;
    cell.hydrated = Power::Of(1, 2, 3, 4);
    cell.timed.push_back(TimedModifier{Power::Uniform(-3), 1});
    cell.Resolve();
    EXPECT_EQ(cell.power, Power::Of(0, 0, 0, 1));
    EXPECT_EQ(cell.state, CardState::Debuffed);
}

TEST(Combat, Level_Adds_One_Per_Step)
{
    EXPECT_EQ(LevelAdjusted(Power::Uniform(1), Power{}, 1, 2), Power::Uniform(1));
    EXPECT_EQ(LevelAdjusted(Power::Uniform(1), Power{}, 3, 2), Power::Uniform(2));
    EXPECT_EQ(LevelAdjusted(Power::Uniform(1), Power::Of(1, 0, 0, 0), 5, 2), Power::Of(4, 3, 3, 3));
}

TEST(Rules, Illegal_Moves_Carry_Violation_Code)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "a0", Alice, Power::Uniform(1));
    AddCard(*catalog, "a1", Alice, Power::Uniform(1));
    AddCard(*catalog, "b0", Bob, Power::Uniform(1));
    auto engine = MakeEngine(catalog);

    GameState s = BlankState({"a0"}, {"b0"});
    PutCell(s, *catalog, Position{2, 2}, "a1");

    EXPECT_EQ(ViolationOf(engine->PlaceCard(s, Bob, "b0", Position{0, 0})), RVC::NotYourTurn);
    EXPECT_EQ(ViolationOf(engine->PlaceCard(s, Alice, "a0", Position{4, 0})), RVC::Place_OutOfBounds);
    EXPECT_EQ(ViolationOf(engine->PlaceCard(s, Alice, "a0", Position{0, -1})), RVC::Place_OutOfBounds);
    EXPECT_EQ(ViolationOf(engine->PlaceCard(s, Alice, "a0", Position{2, 2})), RVC::Place_CellOccupied);
    EXPECT_EQ(ViolationOf(engine->PlaceCard(s, Alice, "b0", Position{0, 0})), RVC::Place_CardNotInHand);
    EXPECT_EQ(ViolationOf(engine->PlaceCard(s, "eve", "a0", Position{0, 0})), RVC::UnknownPlayer);
    EXPECT_EQ(ViolationOf(engine->EndTurn(s, Bob)), RVC::NotYourTurn);

    GameState over = s;
    over.status = GameStatus::Draw;
    EXPECT_EQ(ViolationOf(engine->PlaceCard(over, Alice, "a0", Position{0, 0})), RVC::GameNotActive);
    EXPECT_EQ(ViolationOf(engine->Surrender(over, Alice)), RVC::GameNotActive);

    auto const r = engine->PlaceCard(s, Bob, "b0", Position{0, 0});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::Code::InvalidAction);
    EXPECT_FALSE(r.error().message.empty());
}

TEST(Rules, Foreign_Card_In_Hand)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "b0", Bob, Power::Uniform(1));
    auto engine = MakeEngine(catalog);

    // Cached: the rules see the owner and refuse.
    GameState cached = BlankState({"b0"}, {});
    cached.cache.insert_or_assign("b0", *catalog->Resolve("b0", std::nullopt));
    EXPECT_EQ(ViolationOf(engine->PlaceCard(cached, Alice, "b0", Position{0, 0})), RVC::Place_CardNotOwned);

    // Uncached: the hydrator owner check reports it as missing.
    GameState uncached = BlankState({"b0"}, {});
    auto const r = engine->PlaceCard(uncached, Alice, "b0", Position{0, 0});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::Code::NotFound);
}

TEST(Rules, Input_Snapshot_Untouched)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "a0", Alice, Power::Uniform(1));
    auto engine = MakeEngine(catalog);

    GameState const s = BlankState({"a0"}, {});
    GameState const copy = s;
    auto r = engine->PlaceCard(s, Alice, "a0", Position{3, 3});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(s.OccupiedCount(), 0u);
    EXPECT_EQ(s.player1.hand, copy.player1.hand);
    EXPECT_EQ(s.current_player_id, copy.current_player_id);
    EXPECT_EQ(r->state.OccupiedCount(), 1u);
}

TEST(Turns, Place_Draws_And_Passes_Turn)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "a0", Alice, Power::Uniform(1));
    AddCard(*catalog, "a1", Alice, Power::Uniform(1));
    AddCard(*catalog, "b0", Bob, Power::Uniform(1));
    auto engine = MakeEngine(catalog);

    GameState s = BlankState({"a0"}, {"b0"}, {"a1"});
    auto r = engine->PlaceCard(s, Alice, "a0", Position{0, 0});
    ASSERT_TRUE(r.has_value());

    EXPECT_EQ(r->state.current_player_id, Bob);
    EXPECT_EQ(r->state.turn_number, 2u);
    EXPECT_EQ(r->state.player1.hand, std::vector<CardInstanceId>{"a1"});
    EXPECT_TRUE(r->state.player1.deck.empty());
    EXPECT_NE(r->state.Card("a1"), nullptr);
    EXPECT_EQ(CountEvents(r->events, EventType::CardDrawn), 1u);
    EXPECT_EQ(CountEvents(r->events, EventType::TurnEnded), 1u);
    EXPECT_EQ(CountEvents(r->events, EventType::TurnStarted), 1u);
    gridduel::core::debug::CheckInvariants(r->state, 3);
}

TEST(Turns, No_Draw_At_Hand_Limit)
{
    auto catalog = std::make_shared<Catalog>();
    std::vector<CardInstanceId> hand;
    for (int i{}; i < 6; ++i)
    {
        CardInstanceId const id = "a" + std::to_string(i);
        AddCard(*catalog, id, Alice, Power::Uniform(1));
        hand.push_back(id);
    }
    AddCard(*catalog, "spare", Alice, Power::Uniform(1));
    auto engine = MakeEngine(catalog);

    // Six in hand is only reachable by hand-building the snapshot; five remain after placing.
    GameState s = BlankState(hand, {}, {"spare"});
    auto r = engine->PlaceCard(s, Alice, "a0", Position{0, 0});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->state.player1.hand.size(), 5u);
    EXPECT_EQ(r->state.player1.deck.size(), 1u);
    EXPECT_EQ(CountEvents(r->events, EventType::CardDrawn), 0u);
}

TEST(Turns, End_Turn_Passes_Without_Placing)
{
    auto catalog = std::make_shared<Catalog>();
    auto engine = MakeEngine(catalog);

    GameState s = BlankState({}, {});
    auto r = engine->EndTurn(s, Alice);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->state.current_player_id, Bob);
    EXPECT_EQ(r->state.turn_number, 2u);
    ASSERT_EQ(r->events.size(), 2u);
    EXPECT_EQ(r->events[0].type, EventType::TurnEnded);
    EXPECT_EQ(r->events[1].type, EventType::TurnStarted);
    EXPECT_EQ(r->events[1].player, std::optional<PlayerId>{Bob});

    auto back = engine->EndTurn(r->state, Bob);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->state.current_player_id, Alice);
    EXPECT_EQ(back->state.turn_number, 3u);
}

TEST(Turns, Timed_Modifier_Expires_On_Owner_Turn_End)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "a0", Alice, Power::Uniform(2));
    AddCard(*catalog, "b0", Bob, Power::Uniform(2));
    auto engine = MakeEngine(catalog);

    GameState s = BlankState({}, {});
    BoardCell& mine = PutCell(s, *catalog, Position{0, 0}, "a0");
    mine.timed.push_back(TimedModifier{Power::Uniform(3), 1});
    mine.Resolve();
    BoardCell& theirs = PutCell(s, *catalog, Position{3, 3}, "b0");
    theirs.timed.push_back(TimedModifier{Power::Uniform(3), 1});
    theirs.Resolve();

    auto r = engine->EndTurn(s, Alice);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->state.Cell(Position{0, 0})->power, Power::Uniform(2));
    EXPECT_EQ(r->state.Cell(Position{3, 3})->power, Power::Uniform(5));
    EXPECT_EQ(CountEvents(r->events, EventType::PowerChanged), 1u);
}

TEST(Turns, Full_Board_Ends_With_Winner)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "last", Alice, Power::Uniform(0));
    auto engine = MakeEngine(catalog);

    GameState s = BlankState({"last"}, {});
    FillAllButCorner(s, *catalog, 8);

    auto r = engine->PlaceCard(s, Alice, "last", Position{3, 3});
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->state.IsBoardFull());
    EXPECT_EQ(r->state.status, GameStatus::Player1Win);
    EXPECT_EQ(r->state.winner, std::optional<PlayerId>{Alice});
    EXPECT_EQ(r->events.back().type, EventType::GameOver);
    EXPECT_EQ(CountEvents(r->events, EventType::TurnStarted), 0u);
    gridduel::core::debug::CheckInvariants(r->state);

    auto const late = engine->EndTurn(r->state, Alice);
    EXPECT_EQ(ViolationOf(late), RVC::GameNotActive);
}

TEST(Turns, Full_Board_Even_Split_Is_Draw)
{
    auto catalog = std::make_shared<Catalog>();
    AddCard(*catalog, "last", Alice, Power::Uniform(0));
    auto engine = MakeEngine(catalog);

    GameState s = BlankState({"last"}, {});
    FillAllButCorner(s, *catalog, 7);

    auto r = engine->PlaceCard(s, Alice, "last", Position{3, 3});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->state.status, GameStatus::Draw);
    EXPECT_FALSE(r->state.winner.has_value());
}

TEST(Turns, Surrender_Out_Of_Turn)
{
    auto catalog = std::make_shared<Catalog>();
    auto engine = MakeEngine(catalog);

    GameState s = BlankState({}, {});
    auto r = engine->Surrender(s, Bob);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->state.status, GameStatus::Player1Win);
    EXPECT_EQ(r->state.winner, std::optional<PlayerId>{Alice});
    ASSERT_EQ(r->events.size(), 1u);
    EXPECT_EQ(r->events[0].type, EventType::GameOver);

    auto via_apply = engine->Apply(s, Alice, SurrenderAction{});
    ASSERT_TRUE(via_apply.has_value());
    EXPECT_EQ(via_apply->state.winner, std::optional<PlayerId>{Bob});
}

TEST(Setup, Initialize_Deals_And_Caches)
{
    auto catalog = std::make_shared<Catalog>();
    auto const alice_cards = AddFiller(*catalog, Alice, 8);
    auto const bob_cards = AddFiller(*catalog, Bob, 3);
    auto engine = MakeEngine(catalog, 42);

    auto s = engine->InitializeGame(alice_cards, bob_cards, Alice, Bob);
    ASSERT_TRUE(s.has_value()) << s.error().message;
    EXPECT_EQ(s->player1.hand.size(), 5u);
    EXPECT_EQ(s->player1.deck.size(), 3u);
    EXPECT_EQ(s->player2.hand.size(), 3u);
    EXPECT_TRUE(s->player2.deck.empty());
    EXPECT_EQ(s->current_player_id, Alice);
    EXPECT_EQ(s->turn_number, 1u);
    EXPECT_TRUE(s->IsActive());
    for (auto const& id : s->player1.hand) EXPECT_NE(s->Card(id), nullptr);
    gridduel::core::debug::CheckInvariants(*s, 11);

    auto const self = engine->InitializeGame(alice_cards, alice_cards, Alice, Alice);
    EXPECT_FALSE(self.has_value());

    auto const stolen = engine->InitializeGame(bob_cards, alice_cards, Alice, Bob);
    ASSERT_FALSE(stolen.has_value());
    EXPECT_EQ(stolen.error().code, error::Code::NotFound);
}

TEST(Setup, Same_Seed_Same_Shuffle)
{
    auto catalog = std::make_shared<Catalog>();
    auto const alice_cards = AddFiller(*catalog, Alice, 10);
    auto const bob_cards = AddFiller(*catalog, Bob, 10);

    auto a = MakeEngine(catalog, 99)->InitializeGame(alice_cards, bob_cards, Alice, Bob);
    auto b = MakeEngine(catalog, 99)->InitializeGame(alice_cards, bob_cards, Alice, Bob);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->player1.hand, b->player1.hand);
    EXPECT_EQ(a->player2.deck, b->player2.deck);
}
