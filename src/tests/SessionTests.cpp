#include <gtest/gtest.h>
#include <algorithm>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "../core/CardData.hpp"
#include "../core/Exception.hpp"
#include "../session/GameSession.hpp"
#include "../session/SessionManager.hpp"

using namespace cashflow;
using namespace cashflow::core;
using session::ActionResult;
using session::GameSession;
using session::SessionManager;

namespace
{
    std::vector<PlayerSeat> const kSeats{{"p1", "Ann"}, {"p2", "Ben"}};

    auto make_session(std::uint64_t seed = 2024) -> GameSession
    {
        return GameSession("room-1", kSeats, data::Professions(), Config{.seed = seed});
    }

    auto all_null = [](auto const& pile)
    {
        return std::ranges::all_of(pile, [](auto const& c) { return c == nullptr; });
    };
}

TEST(GameSession, ClientDiceAreReplaced)
{
    GameSession s = make_session();
    // out-of-range dice would be refused if they reached the engine
    ActionResult const r = s.ProcessAction(RollDiceAction{"p1", {7, 9}});
    ASSERT_TRUE(r.success) << r.error.value_or("");
    ASSERT_TRUE(r.state.dice_result.has_value());
    for (int const d : *r.state.dice_result)
    {
        EXPECT_GE(d, 1);
        EXPECT_LE(d, 6);
    }
}

TEST(GameSession, DiceFollowTheSeed)
{
    GameSession a = make_session(5);
    GameSession b = make_session(5);
    for (int i = 0; i < 20; ++i)
    {
        EXPECT_EQ(a.RollDice(), b.RollDice());
    }
}

TEST(GameSession, RejectedAction_ReportsReason)
{
    GameSession s = make_session();
    std::size_t const before = s.AuthoritativeState().log.size();

    ActionResult const r = s.ProcessAction(EndTurnAction{"p2"});
    EXPECT_FALSE(r.success);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_TRUE(r.error->starts_with("Not your turn"));
    EXPECT_FALSE(r.error->starts_with(InvalidActionPrefix));
    EXPECT_EQ(r.state.log.size(), before + 1);
    EXPECT_EQ(r.valid_actions, std::vector{ActionType::RollDice});
}

TEST(GameSession, SanitizedState_HidesDecks)
{
    GameSession s = make_session();
    GameState const& real = s.AuthoritativeState();
    GameState const view = s.GetSanitizedState();

    EXPECT_EQ(view.decks.small_deals.size(), real.decks.small_deals.size());
    EXPECT_EQ(view.decks.market.size(), real.decks.market.size());
    EXPECT_TRUE(all_null(view.decks.small_deals));
    EXPECT_TRUE(all_null(view.decks.big_deals));
    EXPECT_TRUE(all_null(view.decks.market));
    EXPECT_TRUE(all_null(view.decks.doodads));
    EXPECT_FALSE(all_null(real.decks.small_deals));
    EXPECT_EQ(view.shuffle_seed, 0u);

    // everything else is shown as is
    EXPECT_EQ(view.players.size(), real.players.size());
    EXPECT_EQ(view.players[0].cash, real.players[0].cash);
    EXPECT_EQ(view.log.size(), real.log.size());
}

TEST(GameSession, SanitizedState_HidesDiscards)
{
    GameSession s = make_session();
    // play until something has been discarded
    for (int i = 0; i < 400 && s.AuthoritativeState().turn_phase != TurnPhase::GameOver; ++i)
    {
        GameState const& st = s.AuthoritativeState();
        Decks const& d = st.decks;
        if (!d.small_deal_discard.empty() || !d.market_discard.empty() || !d.doodad_discard.empty()) break;

        PlayerId const me = st.Current().id;
        std::vector<ActionType> const valid = s.GetValidActions();
        if (std::ranges::contains(valid, ActionType::RollDice)) (void)s.ProcessAction(RollDiceAction{me});
        else if (std::ranges::contains(valid, ActionType::CollectPayDay)) (void)s.ProcessAction(CollectPayDayAction{me});
        else if (std::ranges::contains(valid, ActionType::ChooseDealType)) (void)s.ProcessAction(ChooseDealTypeAction{me});
        else if (std::ranges::contains(valid, ActionType::DeclineCharity)) (void)s.ProcessAction(DeclineCharityAction{me});
        else if (std::ranges::contains(valid, ActionType::PayExpense)) (void)s.ProcessAction(PayExpenseAction{me});
        else if (std::ranges::contains(valid, ActionType::SkipDeal)) (void)s.ProcessAction(SkipDealAction{me});
        else if (std::ranges::contains(valid, ActionType::DeclineMarket)) (void)s.ProcessAction(DeclineMarketAction{me});
        else if (std::ranges::contains(valid, ActionType::DeclareBankruptcy)) (void)s.ProcessAction(DeclareBankruptcyAction{me});
        else if (std::ranges::contains(valid, ActionType::EndTurn)) (void)s.ProcessAction(EndTurnAction{me});
        else FAIL() << "no scripted move for " << to_string(st.turn_phase);
    }

    GameState const view = s.GetSanitizedState();
    Decks const& real = s.AuthoritativeState().decks;
    std::size_t const discarded = real.small_deal_discard.size() + real.market_discard.size() +
                                  real.doodad_discard.size();
    ASSERT_GT(discarded, 0u);
    EXPECT_EQ(view.decks.small_deal_discard.size(), real.small_deal_discard.size());
    EXPECT_TRUE(all_null(view.decks.small_deal_discard));
    EXPECT_TRUE(all_null(view.decks.market_discard));
    EXPECT_TRUE(all_null(view.decks.doodad_discard));
}

TEST(SessionManager, Rooms)
{
    SessionManager mgr;
    ActionResult const first = mgr.CreateRoom("room-1", kSeats, data::Professions());
    EXPECT_TRUE(first.success);
    EXPECT_EQ(first.valid_actions, std::vector{ActionType::RollDice});
    EXPECT_TRUE(mgr.HasRoom("room-1"));

    EXPECT_THROW((void)mgr.CreateRoom("room-1", kSeats, data::Professions()), error::StateError);
    EXPECT_THROW(mgr.BindConnection(1, "room-9", "p1"), error::StateError);

    EXPECT_TRUE(mgr.CloseRoom("room-1"));
    EXPECT_FALSE(mgr.HasRoom("room-1"));
    EXPECT_FALSE(mgr.CloseRoom("room-1"));
}

TEST(SessionManager, Unauthorized)
{
    SessionManager mgr;
    (void)mgr.CreateRoom("room-1", kSeats, data::Professions());
    mgr.BindConnection(10, "room-1", "p1");

    // unbound connection
    ActionResult const a = mgr.Submit(99, RollDiceAction{"p1"}).get();
    EXPECT_FALSE(a.success);
    EXPECT_EQ(a.error, std::optional<std::string>{session::UnauthorizedError});

    // bound connection speaking for another seat
    ActionResult const b = mgr.Submit(10, EndTurnAction{"p2"}).get();
    EXPECT_FALSE(b.success);
    EXPECT_EQ(b.error, std::optional<std::string>{session::UnauthorizedError});

    // the refused actions never reached the game
    ActionResult const now = mgr.Query("room-1").get();
    ActionResult const ok = mgr.Submit(10, RollDiceAction{"p1"}).get();
    EXPECT_TRUE(ok.success);
    EXPECT_GT(ok.state.log.size(), now.state.log.size());

    mgr.UnbindConnection(10);
    EXPECT_EQ(mgr.Submit(10, EndTurnAction{"p1"}).get().error, std::optional<std::string>{session::UnauthorizedError});
}

TEST(SessionManager, ConcurrentSubmissions_AreSerialized)
{
    SessionManager mgr;
    (void)mgr.CreateRoom("room-1", kSeats, data::Professions());
    mgr.BindConnection(1, "room-1", "p1");
    mgr.BindConnection(2, "room-1", "p2");
    std::size_t const start = mgr.Query("room-1").get().state.log.size();

    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;

    std::mutex mtx;
    std::set<std::size_t> seen;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t)
    {
        workers.emplace_back([&, t]
        {
            // each of these is refused and adds exactly one log line
            GameAction const a = t % 2 == 0 ? GameAction{CollectPayDayAction{"p1"}}
                                            : GameAction{EndTurnAction{"p2"}};
            session::ConnId const conn = t % 2 == 0 ? 1 : 2;
            for (int i = 0; i < kPerThread; ++i)
            {
                ActionResult const r = mgr.Submit(conn, a).get();
                EXPECT_FALSE(r.success);
                std::scoped_lock lk(mtx);
                seen.insert(r.state.log.size());
            }
        });
    }
    for (std::thread& w : workers) w.join();

    // no two jobs ever saw the same state
    EXPECT_EQ(seen.size(), static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_EQ(*seen.begin(), start + 1);
    EXPECT_EQ(*seen.rbegin(), start + kThreads * kPerThread);
    EXPECT_EQ(mgr.Query("room-1").get().state.log.size(), start + kThreads * kPerThread);
}

TEST(SessionManager, QueuedJobs_RunInOrder)
{
    SessionManager mgr;
    (void)mgr.CreateRoom("room-1", kSeats, data::Professions());
    mgr.BindConnection(1, "room-1", "p1");

    std::vector<std::future<ActionResult>> futs;
    futs.push_back(mgr.Submit(1, RollDiceAction{"p1"}));
    futs.push_back(mgr.Query("room-1"));
    futs.push_back(mgr.Submit(1, RollDiceAction{"p1"}));

    ActionResult const rolled = futs[0].get();
    ActionResult const seen = futs[1].get();
    ActionResult const again = futs[2].get();
    EXPECT_TRUE(rolled.success);
    EXPECT_EQ(seen.state.log.size(), rolled.state.log.size());
    // a second roll in the same turn is out of phase
    EXPECT_FALSE(again.success);
    EXPECT_EQ(again.state.log.size(), rolled.state.log.size() + 1);
}

TEST(SessionManager, ConcurrentRooms_ProgressSeparately)
{
    SessionManager mgr;
    (void)mgr.CreateRoom("room-1", kSeats, data::Professions(), Config{.seed = 1});
    (void)mgr.CreateRoom("room-2", kSeats, data::Professions(), Config{.seed = 2});
    mgr.BindConnection(1, "room-1", "p2");
    mgr.BindConnection(2, "room-2", "p2");
    std::size_t const start1 = mgr.Query("room-1").get().state.log.size();
    std::size_t const start2 = mgr.Query("room-2").get().state.log.size();

    constexpr int kPerRoom = 100;
    auto hammer = [&](session::ConnId conn)
    {
        // out of turn, so each adds one refusal line to its own room only
        for (int i = 0; i < kPerRoom; ++i) EXPECT_FALSE(mgr.Submit(conn, EndTurnAction{"p2"}).get().success);
    };
    std::thread a(hammer, 1);
    std::thread b(hammer, 2);
    a.join();
    b.join();

    EXPECT_EQ(mgr.Query("room-1").get().state.log.size(), start1 + kPerRoom);
    EXPECT_EQ(mgr.Query("room-2").get().state.log.size(), start2 + kPerRoom);
}

TEST(SessionManager, RoomsAreIndependent)
{
    SessionManager mgr;
    (void)mgr.CreateRoom("room-1", kSeats, data::Professions(), Config{.seed = 1});
    (void)mgr.CreateRoom("room-2", kSeats, data::Professions(), Config{.seed = 2});
    mgr.BindConnection(1, "room-1", "p1");
    mgr.BindConnection(2, "room-2", "p1");

    EXPECT_TRUE(mgr.Submit(1, RollDiceAction{"p1"}).get().success);
    ActionResult const other = mgr.Query("room-2").get();
    EXPECT_EQ(other.state.turn_phase, TurnPhase::RollDice);
    EXPECT_FALSE(other.state.dice_result.has_value());
}
