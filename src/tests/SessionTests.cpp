#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../net/MatchSession.hpp"
#include "../net/protocol.hpp"
#include "SessionSupport.hpp"

using namespace std::chrono_literals;
using namespace gridduel::core;
using namespace gridduel::net;
using namespace gridduel::test;
using gridduel::net::debug::RecordingConnection;

namespace
{
    constexpr char const* MatchName = "m-1";

    struct Harness : NetFixture
    {
        std::vector<MatchId> finished;
        std::shared_ptr<MatchSession> session;
        std::shared_ptr<RecordingConnection> alice_conn = Conn(1);
        std::shared_ptr<RecordingConnection> bob_conn = Conn(2);

        explicit Harness(std::optional<GameState> initial = std::nullopt, SessionConfig cfg = {})
        {
            GameState s = initial ? *initial : *engine->InitializeGame(alice_cards, bob_cards, Alice, Bob);
            EXPECT_TRUE(store->Save(MatchName, s).has_value());
            session = std::make_shared<MatchSession>(MatchName, Alice, Bob, Deps(), std::move(cfg),
                                                     [this](MatchId const& id) { finished.push_back(id); });
            session->Start();
        }

        auto JoinBoth() -> void
        {
            session->Join(Alice, alice_conn);
            session->Join(Bob, bob_conn);
        }

        auto Stored() const -> GameState
        {
            return *store->Load(MatchName);
        }

        // Connection a player acts through unless a test says otherwise.
        static auto HomeConn(PlayerId const& user) -> ConnectionId
        {
            return user == Alice ? 1 : 2;
        }

        // First hand card onto the first empty cell.
        auto PlayAny(PlayerId const& user, std::optional<ConnectionId> conn = std::nullopt) -> void
        {
            GameState const s = Stored();
            PlayerState const* p = s.Player(user);
            ASSERT_NE(p, nullptr);
            ASSERT_FALSE(p->hand.empty());
            session->HandleAction(user, conn.value_or(HomeConn(user)),
                                  PlaceCardAction{p->hand.front(), s.EmptyCells().front()});
        }

        static auto LastTurnSeconds(RecordingConnection const& c) -> int
        {
            auto const frame = c.Last("start_turn");
            return frame ? frame->at("timeAllowedSeconds").get<int>() : -1;
        }
    };

    auto ForcedFrames(RecordingConnection const& c) -> std::size_t
    {
        std::size_t n{};
        for (auto const& f : c.OfType("events")) n += f.value("serverForced", false) ? 1 : 0;
        return n;
    }
}

TEST(Session, Starts_When_Both_Seats_Are_Filled)
{
    Harness h;
    EXPECT_EQ(h.session->Phase(), SessionPhase::AwaitingPlayers);

    h.session->Join(Alice, h.alice_conn);
    EXPECT_EQ(h.session->Phase(), SessionPhase::AwaitingPlayers);
    auto const joined = h.alice_conn->Last("joined");
    ASSERT_TRUE(joined.has_value());
    EXPECT_EQ(joined->at("playerSlot").get<int>(), 1);
    EXPECT_EQ(joined->at("gameState").at("player1").at("hand").size(), 5u);
    EXPECT_FALSE(joined->at("gameState").at("player2").contains("hand"));
    EXPECT_TRUE(h.alice_conn->OfType("start_turn").empty());

    h.session->Join(Bob, h.bob_conn);
    EXPECT_EQ(h.session->Phase(), SessionPhase::Active);
    EXPECT_EQ(h.bob_conn->Last("joined")->at("playerSlot").get<int>(), 2);
    EXPECT_EQ(h.alice_conn->Last("player_joined")->at("userId").get<std::string>(), Bob);

    for (auto const* c : {h.alice_conn.get(), h.bob_conn.get()})
    {
        auto const turn = c->Last("start_turn");
        ASSERT_TRUE(turn.has_value());
        EXPECT_EQ(turn->at("currentPlayerId").get<std::string>(), Alice);
        EXPECT_EQ(turn->at("timeAllowedSeconds").get<int>(), 30);
    }
}

TEST(Session, Action_Broadcasts_And_Passes_The_Clock)
{
    Harness h;
    h.JoinBoth();

    h.PlayAny(Alice);
    for (auto const* c : {h.alice_conn.get(), h.bob_conn.get()})
    {
        auto const ev = c->Last("events");
        ASSERT_TRUE(ev.has_value());
        EXPECT_FALSE(ev->at("appliedEvents").empty());
        EXPECT_FALSE(ev->contains("serverForced"));
        EXPECT_EQ(c->Last("start_turn")->at("currentPlayerId").get<std::string>(), Bob);
    }
    EXPECT_EQ(h.Stored().turn_number, 2u);
    EXPECT_EQ(h.Stored().current_player_id, Bob);

    // out of turn: only the sender hears about it
    h.alice_conn->Clear();
    h.bob_conn->Clear();
    h.PlayAny(Alice);
    ASSERT_TRUE(h.alice_conn->Last("error").has_value());
    EXPECT_TRUE(h.bob_conn->Frames().empty());
    EXPECT_EQ(h.Stored().turn_number, 2u);
}

TEST(Session, No_Actions_Before_Start)
{
    Harness h;
    h.session->Join(Alice, h.alice_conn);
    h.PlayAny(Alice);
    auto const err = h.alice_conn->Last("error");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->at("message").get<std::string>(), "Match has not started");
    EXPECT_EQ(h.Stored().turn_number, 1u);

    auto stranger = h.Conn(9);
    h.session->Join("eve", stranger);
    ASSERT_TRUE(stranger->Last("error").has_value());
    EXPECT_FALSE(h.session->HasParticipant("eve"));
}

TEST(Session, Timeouts_Escalate_Then_Reset)
{
    Harness h;
    h.JoinBoth();

    std::vector<int> allowed;
    for (int round{}; round < 4; ++round)
    {
        auto const turn = h.session->AllowedFor(Alice);
        allowed.push_back(static_cast<int>(turn.count()));
        EXPECT_EQ(Harness::LastTurnSeconds(*h.alice_conn), turn.count());

        h.clock->AdvanceBy(turn);
        EXPECT_EQ(h.session->Strikes(Alice), static_cast<std::uint32_t>(round + 1));
        EXPECT_EQ(h.Stored().current_player_id, Bob);

        h.PlayAny(Bob);
        EXPECT_EQ(h.Stored().current_player_id, Alice);
    }
    EXPECT_EQ(allowed, (std::vector<int>{30, 15, 10, 5}));
    // floor of the list
    EXPECT_EQ(h.session->AllowedFor(Alice), 5s);
    EXPECT_EQ(Harness::LastTurnSeconds(*h.alice_conn), 5);
    EXPECT_EQ(ForcedFrames(*h.bob_conn), 4u);
    EXPECT_EQ(h.session->Strikes(Bob), 0u);

    h.PlayAny(Alice);
    EXPECT_EQ(h.session->Strikes(Alice), 0u);
    EXPECT_EQ(h.session->AllowedFor(Alice), 30s);
}

TEST(Session, Early_Timer_Does_Not_Fire)
{
    Harness h;
    h.JoinBoth();

    h.clock->AdvanceBy(29s);
    EXPECT_EQ(h.session->Strikes(Alice), 0u);
    EXPECT_EQ(h.Stored().current_player_id, Alice);

    h.clock->AdvanceBy(1s);
    EXPECT_EQ(h.session->Strikes(Alice), 1u);
    EXPECT_EQ(h.Stored().current_player_id, Bob);
}

TEST(Session, Timeout_With_Empty_Hand_Passes)
{
    GameState blank = BlankState({}, {});
    Harness h(blank);
    h.JoinBoth();

    h.clock->AdvanceBy(30s);
    GameState const s = h.Stored();
    EXPECT_EQ(s.current_player_id, Bob);
    EXPECT_EQ(s.OccupiedCount(), 0u);

    auto const ev = h.bob_conn->Last("events");
    ASSERT_TRUE(ev.has_value());
    EXPECT_TRUE(ev->value("serverForced", false));
    EXPECT_EQ(ev->at("appliedEvents").front().at("type").get<std::string>(), "turnEnded");
}

TEST(Session, Stale_Timers_Are_Ignored)
{
    Harness h;
    h.JoinBoth();

    // alice acts, cancelling her timer; a late completion must not force a move for her
    h.PlayAny(Alice);
    h.session->Disconnect(Bob, 2);
    h.session->Join(Bob, h.Conn(3));
    EXPECT_GT(h.clock->FireCancelled(), 0u);

    EXPECT_EQ(h.session->Strikes(Alice), 0u);
    EXPECT_EQ(h.session->Strikes(Bob), 0u);
    EXPECT_EQ(h.session->Phase(), SessionPhase::Active);
    EXPECT_EQ(h.Stored().current_player_id, Bob);
    EXPECT_EQ(ForcedFrames(*h.alice_conn), 0u);
}

TEST(Session, Reconnect_Inside_Grace_Keeps_The_Clock)
{
    Harness h;
    h.JoinBoth();
    GameState const before = h.Stored();

    h.session->Disconnect(Alice, 1);
    EXPECT_FALSE(h.session->IsConnected(Alice));
    EXPECT_EQ(h.bob_conn->Last("player_disconnected")->at("userId").get<std::string>(), Alice);

    h.clock->AdvanceBy(10s);
    auto back = h.Conn(3);
    h.session->Join(Alice, back);
    EXPECT_TRUE(h.session->IsConnected(Alice));

    // the match waited: same board, same hands, same mover
    GameState const after = h.Stored();
    EXPECT_EQ(after.board, before.board);
    EXPECT_EQ(after.tiles, before.tiles);
    EXPECT_EQ(after.current_player_id, before.current_player_id);
    EXPECT_EQ(after.turn_number, before.turn_number);
    EXPECT_EQ(after.player1.hand, before.player1.hand);
    EXPECT_EQ(after.player1.deck, before.player1.deck);
    EXPECT_EQ(after.player2.hand, before.player2.hand);
    EXPECT_EQ(after.player2.deck, before.player2.deck);

    auto const joined = back->Last("joined");
    ASSERT_TRUE(joined.has_value());
    EXPECT_EQ(joined->at("gameState"), protocol::StateToJson(before, Alice));
    // no refund: 20 of the 30 seconds remain
    EXPECT_EQ(Harness::LastTurnSeconds(*back), 20);

    h.clock->AdvanceBy(10s);
    EXPECT_EQ(h.session->Phase(), SessionPhase::Active);
    EXPECT_EQ(h.session->Strikes(Alice), 0u);

    h.clock->AdvanceBy(10s);
    EXPECT_EQ(h.session->Strikes(Alice), 1u);
    EXPECT_EQ(ForcedFrames(*back), 1u);
}

TEST(Session, Grace_Expiry_Forfeits_To_The_Other_Seat)
{
    Harness h;
    h.JoinBoth();

    h.session->Disconnect(Bob, 2);
    h.clock->AdvanceBy(14999ms);
    EXPECT_EQ(h.session->Phase(), SessionPhase::Active);

    h.clock->AdvanceBy(1ms);
    EXPECT_EQ(h.session->Phase(), SessionPhase::Completed);

    auto const end = h.alice_conn->Last("game_end");
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(end->at("winnerId").get<std::string>(), Alice);
    EXPECT_EQ(end->at("reason").get<std::string>(), "disconnect");

    auto const subs = h.rewards->All();
    ASSERT_EQ(subs.size(), 1u);
    EXPECT_EQ(subs[0].reason, TerminationReason::Disconnect);
    EXPECT_EQ(subs[0].state.winner, std::optional<PlayerId>{Alice});
    EXPECT_EQ(subs[0].state.status, GameStatus::Player1Win);
    EXPECT_EQ(h.store->Size(), 0u);
    EXPECT_EQ(h.finished, std::vector<MatchId>{MatchName});

    // nothing is left ticking
    h.clock->AdvanceBy(60s);
    EXPECT_EQ(h.rewards->All().size(), 1u);
    EXPECT_EQ(h.session->Strikes(Alice), 0u);
}

TEST(Session, No_Show_Loses_By_Disconnect)
{
    Harness h;
    h.session->Join(Alice, h.alice_conn);

    h.clock->AdvanceBy(15s);
    EXPECT_EQ(h.session->Phase(), SessionPhase::Completed);
    EXPECT_EQ(h.alice_conn->Last("game_end")->at("winnerId").get<std::string>(), Alice);
    EXPECT_EQ(h.rewards->All().at(0).reason, TerminationReason::Disconnect);
}

TEST(Session, Nobody_Shows_Up_Aborts)
{
    Harness h;
    h.clock->AdvanceBy(15s);

    EXPECT_EQ(h.session->Phase(), SessionPhase::Aborted);
    auto const subs = h.rewards->All();
    ASSERT_EQ(subs.size(), 1u);
    EXPECT_EQ(subs[0].reason, TerminationReason::Aborted);
    EXPECT_FALSE(subs[0].state.winner.has_value());
    EXPECT_EQ(subs[0].state.status, GameStatus::Aborted);
    EXPECT_EQ(h.store->Size(), 0u);
}

TEST(Session, Second_Connection_Evicts_The_First)
{
    Harness h;
    h.JoinBoth();

    auto second = h.Conn(7);
    h.session->Join(Alice, second);

    ASSERT_TRUE(h.alice_conn->Last("session_replaced").has_value());
    EXPECT_EQ(h.alice_conn->CloseReason(), std::optional<std::string>{"session replaced"});
    EXPECT_FALSE(h.alice_conn->IsOpen());
    ASSERT_TRUE(second->Last("joined").has_value());

    // the evicted socket closing afterwards changes nothing
    h.bob_conn->Clear();
    h.session->Disconnect(Alice, 1);
    EXPECT_TRUE(h.session->IsConnected(Alice));
    EXPECT_FALSE(h.bob_conn->Last("player_disconnected").has_value());

    // only the live connection may act for the seat
    h.bob_conn->Clear();
    h.PlayAny(Alice, 1);
    EXPECT_TRUE(h.bob_conn->Frames().empty());
    EXPECT_EQ(h.Stored().current_player_id, Alice);

    h.PlayAny(Alice, 7);
    EXPECT_TRUE(second->Last("events").has_value());
    EXPECT_EQ(h.Stored().current_player_id, Bob);
}

TEST(Session, Actions_Need_The_Seat_Connection)
{
    Harness h;
    h.JoinBoth();

    // bob's socket cannot act for alice, and a dropped seat cannot act at all
    h.session->HandleAction(Alice, 2, SurrenderAction{});
    EXPECT_EQ(h.session->Phase(), SessionPhase::Active);

    h.session->Disconnect(Bob, 2);
    h.session->HandleAction(Bob, 2, SurrenderAction{});
    EXPECT_EQ(h.session->Phase(), SessionPhase::Active);
    EXPECT_TRUE(h.rewards->All().empty());

    h.session->HandleAction(Alice, 1, SurrenderAction{});
    EXPECT_EQ(h.session->Phase(), SessionPhase::Completed);
    EXPECT_EQ(h.rewards->All().at(0).state.winner, std::optional<PlayerId>{Bob});
}

TEST(Session, Surrender_Ends_Immediately)
{
    Harness h;
    h.JoinBoth();

    EXPECT_EQ(h.store->Size(), 1u);
    h.session->HandleAction(Bob, 2, SurrenderAction{});
    EXPECT_EQ(h.session->Phase(), SessionPhase::Completed);

    for (auto const* c : {h.alice_conn.get(), h.bob_conn.get()})
    {
        auto const end = c->Last("game_end");
        ASSERT_TRUE(end.has_value());
        EXPECT_EQ(end->at("winnerId").get<std::string>(), Alice);
        EXPECT_EQ(end->at("reason").get<std::string>(), "surrender");
    }
    EXPECT_EQ(h.rewards->All().at(0).reason, TerminationReason::Surrender);
    EXPECT_EQ(h.rewards->All().at(0).state.winner, std::optional<PlayerId>{Alice});
    // handed off to rewards, so the store lets go of it
    EXPECT_EQ(h.store->Size(), 0u);
    EXPECT_FALSE(h.store->Load(MatchName).has_value());

    h.session->HandleAction(Alice, 1, EndTurnAction{});
    EXPECT_EQ(h.alice_conn->Last("error")->at("message").get<std::string>(), "Match has ended");

    auto late = h.Conn(5);
    h.session->Join(Bob, late);
    EXPECT_TRUE(late->Last("error").has_value());
}

TEST(Session, Full_Board_Completes)
{
    NetFixture fx;
    GameState s = BlankState({"alice-0"}, {});
    for (std::size_t i{}; i + 1 < constants::CellCount; ++i)
    {
        CardInstanceId const id = "wall-" + std::to_string(i);
        AddCard(*fx.catalog, id, i % 2 == 0 ? PlayerId{Alice} : PlayerId{Bob}, Power::Uniform(9));
        PutCell(s, *fx.catalog, Position::FromIndex(i), id);
    }

    // the walls travel in the snapshot's cache, so the harness catalog never needs them
    Harness h(s);
    h.JoinBoth();

    h.session->HandleAction(Alice, 1, PlaceCardAction{"alice-0", Position{3, 3}});
    EXPECT_EQ(h.session->Phase(), SessionPhase::Completed);
    auto const end = h.bob_conn->Last("game_end");
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(end->at("reason").get<std::string>(), "completed");
    EXPECT_EQ(end->at("winnerId").get<std::string>(), Alice);
    EXPECT_EQ(h.rewards->All().at(0).state.status, GameStatus::Player1Win);
}

TEST(Session, Failed_Save_Keeps_The_Turn)
{
    Harness h;
    h.JoinBoth();
    h.bob_conn->Clear();

    h.store->fail_saves = true;
    h.PlayAny(Alice);

    auto const err = h.alice_conn->Last("error");
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->at("message").get<std::string>().find("please retry"), std::string::npos);
    EXPECT_TRUE(h.bob_conn->OfType("events").empty());
    EXPECT_EQ(h.Stored().turn_number, 1u);
    EXPECT_EQ(h.session->Phase(), SessionPhase::Active);

    h.store->fail_saves = false;
    h.PlayAny(Alice);
    EXPECT_TRUE(h.bob_conn->Last("events").has_value());
    EXPECT_EQ(h.Stored().current_player_id, Bob);
}

TEST(Session, Failed_Forced_Save_Rearms_The_Timer)
{
    Harness h;
    h.JoinBoth();

    h.store->fail_saves = true;
    h.clock->AdvanceBy(30s);
    EXPECT_EQ(h.Stored().current_player_id, Alice);
    EXPECT_EQ(ForcedFrames(*h.bob_conn), 0u);
    EXPECT_EQ(h.clock->Pending(), 1u);

    h.store->fail_saves = false;
    h.clock->AdvanceBy(h.session->AllowedFor(Alice));
    EXPECT_EQ(h.Stored().current_player_id, Bob);
    EXPECT_EQ(ForcedFrames(*h.bob_conn), 1u);
}

TEST(Session, Abort_Has_No_Winner)
{
    Harness h;
    h.JoinBoth();

    h.session->Abort();
    EXPECT_EQ(h.session->Phase(), SessionPhase::Aborted);
    auto const end = h.alice_conn->Last("game_end");
    ASSERT_TRUE(end.has_value());
    EXPECT_TRUE(end->at("winnerId").is_null());
    EXPECT_EQ(end->at("reason").get<std::string>(), "aborted");
    EXPECT_EQ(h.rewards->All().at(0).state.status, GameStatus::Aborted);
    EXPECT_EQ(h.store->Size(), 0u);
    EXPECT_EQ(h.clock->Pending(), 0u);

    h.session->Abort();
    EXPECT_EQ(h.rewards->All().size(), 1u);
}

TEST(Session, Server_Seat_Answers_Every_Move)
{
    NetFixture fx;
    std::vector<CardInstanceId> const ai_cards = AddFiller(*fx.catalog, AiPlayerId, 10);
    ASSERT_TRUE(fx.store->Save(MatchName, *fx.engine->InitializeGame(fx.alice_cards, ai_cards, Alice, AiPlayerId))
                    .has_value());

    std::vector<MatchId> finished;
    auto session = std::make_shared<MatchSession>(MatchName, Alice, AiPlayerId, fx.Deps(), SessionConfig{},
                                                  [&finished](MatchId const& id) { finished.push_back(id); },
                                                  Difficulty::Hard);
    session->Start();

    // the server's seat is taken from the start and cannot be claimed
    auto impostor = fx.Conn(9);
    session->Join(AiPlayerId, impostor);
    ASSERT_TRUE(impostor->Last("error").has_value());
    EXPECT_TRUE(session->IsConnected(AiPlayerId));

    auto alice = fx.Conn(1);
    session->Join(Alice, alice);
    EXPECT_EQ(session->Phase(), SessionPhase::Active);

    GameState const first = *fx.store->Load(MatchName);
    session->HandleAction(Alice, 1, PlaceCardAction{first.player1.hand.front(), Position{0, 0}});
    EXPECT_EQ(alice->Last("start_turn")->at("currentPlayerId").get<std::string>(), AiPlayerId);

    fx.clock->AdvanceBy(1199ms);
    EXPECT_EQ(fx.store->Load(MatchName)->current_player_id, AiPlayerId);
    fx.clock->AdvanceBy(1ms);

    GameState const answered = *fx.store->Load(MatchName);
    EXPECT_EQ(answered.current_player_id, Alice);
    EXPECT_EQ(answered.OccupiedCount(), 2u);
    auto const ev = alice->Last("events");
    ASSERT_TRUE(ev.has_value());
    EXPECT_FALSE(ev->contains("serverForced"));
    EXPECT_EQ(session->Strikes(AiPlayerId), 0u);

    // play it out: alice moves, the server replies after its pause
    for (int i{}; i < 40 && session->Phase() == SessionPhase::Active; ++i)
    {
        GameState const s = *fx.store->Load(MatchName);
        if (s.current_player_id == Alice && !s.player1.hand.empty())
            session->HandleAction(Alice, 1, PlaceCardAction{s.player1.hand.front(), s.EmptyCells().front()});
        else
            fx.clock->AdvanceBy(SessionConfig{}.ai_delay);
    }
    EXPECT_EQ(session->Phase(), SessionPhase::Completed);
    ASSERT_EQ(fx.rewards->All().size(), 1u);
    EXPECT_EQ(fx.rewards->All()[0].reason, TerminationReason::Completed);
    EXPECT_TRUE(fx.rewards->All()[0].state.IsBoardFull());
    EXPECT_EQ(fx.store->Size(), 0u);
    EXPECT_EQ(finished, std::vector<MatchId>{MatchName});
}
