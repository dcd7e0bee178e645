#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <span>
#include <vector>

#include "../core/CardData.hpp"
#include "../core/Game.hpp"
#include "../debug/Invariants.hpp"
#include "../net/codec.hpp"
#include "../session/GameSession.hpp"

using namespace cashflow::core;
using namespace cashflow::net;
namespace fb = cashflow::gen::net;

namespace
{
    auto make_session() -> cashflow::session::GameSession
    {
        std::vector<PlayerSeat> const seats{{"p1", "Ann"}, {"p2", "Ben"}, {"p3", "Cat"}};
        return cashflow::session::GameSession("room-7", seats, data::Professions(), Config{.seed = 77});
    }

    auto round_trip(GameAction const& a) -> GameAction
    {
        auto const buf = BuildAction(a, 1);
        auto decoded = DecodeAction(AsBytes(buf));
        EXPECT_TRUE(decoded.has_value()) << (decoded ? "" : decoded.error().message);
        return decoded ? *decoded : GameAction{};
    }
}

TEST(Codec, Action_OptionalFieldsSurvive)
{
    GameAction const partial = round_trip(SellAssetAction{"p2", "asset-4", std::nullopt, 25});
    auto const& sell = std::get<SellAssetAction>(partial);
    EXPECT_EQ(sell.player_id, "p2");
    EXPECT_EQ(sell.asset_id, "asset-4");
    EXPECT_FALSE(sell.shares.has_value());
    EXPECT_EQ(sell.price, std::optional<Money>{25});

    GameAction const whole = round_trip(BuyAssetAction{"p1", 300});
    EXPECT_EQ(std::get<BuyAssetAction>(whole).shares, std::optional<std::int64_t>{300});

    GameAction const none = round_trip(BuyAssetAction{"p1", std::nullopt});
    EXPECT_FALSE(std::get<BuyAssetAction>(none).shares.has_value());
}

TEST(Codec, Action_Payloads)
{
    GameAction const r = round_trip(RollDiceAction{"p1", {4, 6}, true});
    auto const& roll = std::get<RollDiceAction>(r);
    EXPECT_EQ(roll.dice_values, (Dice{4, 6}));
    EXPECT_TRUE(roll.use_both_dice);

    GameAction const o = round_trip(OfferDealToPlayerAction{"p1", "p3", 4500});
    auto const& offer = std::get<OfferDealToPlayerAction>(o);
    EXPECT_EQ(offer.target_player_id, "p3");
    EXPECT_EQ(offer.asking_price, 4500);

    GameAction const l = round_trip(PayOffLoanAction{"p2", "Car Loan", 2000});
    EXPECT_EQ(std::get<PayOffLoanAction>(l).loan_type, "Car Loan");

    GameAction const d = round_trip(ChooseDealTypeAction{"p1", DealSize::Big});
    EXPECT_EQ(std::get<ChooseDealTypeAction>(d).deal_type, DealSize::Big);

    EXPECT_EQ(TypeOf(round_trip(DeclinePlayerDealAction{"p3"})), ActionType::DeclinePlayerDeal);
}

TEST(Codec, ActionTypes_MapBothWays)
{
    for (std::size_t i = 0; i < ActionTypeCount; ++i)
    {
        auto const t = static_cast<ActionType>(i);
        EXPECT_EQ(FromFbActionType(ToFbActionType(t)), t);
    }
    EXPECT_EQ(FromFbPhase(ToFbPhase(TurnPhase::WaitingForDealResponse)), TurnPhase::WaitingForDealResponse);
}

TEST(Codec, State_Decodes)
{
    auto session = make_session();
    auto const res = session.Snapshot();
    auto const buf = BuildState("room-7", res.state, res.valid_actions, 5);

    ASSERT_EQ(PeekMessage(AsBytes(buf)), fb::Message::StateMsg);
    auto const decoded = DecodeState(AsBytes(buf));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;

    EXPECT_EQ(decoded->room, "room-7");
    EXPECT_EQ(decoded->valid_actions, res.valid_actions);
    EXPECT_EQ(decoded->log_size, res.state.log.size());

    GameState const& s = decoded->state;
    ASSERT_EQ(s.players.size(), 3u);
    for (std::size_t i = 0; i < s.players.size(); ++i)
    {
        EXPECT_EQ(s.players[i].id, res.state.players[i].id);
        EXPECT_EQ(s.players[i].profession, res.state.players[i].profession);
        EXPECT_EQ(s.players[i].cash, res.state.players[i].cash);
        EXPECT_EQ(s.players[i].statement.liabilities.size(), res.state.players[i].statement.liabilities.size());
    }
    EXPECT_EQ(s.turn_phase, TurnPhase::RollDice);
    EXPECT_EQ(s.decks.small_deals.size(), data::SmallDeals().size());
    EXPECT_EQ(s.decks.small_deals.front(), nullptr);
    EXPECT_EQ(s.turn_number, res.state.turn_number);
    EXPECT_FALSE(s.winner.has_value());
    EXPECT_NO_THROW(debug::CheckInvariants(s));
}

TEST(Codec, State_CarriesCardsAndTail)
{
    GameState s = make_session().GetSanitizedState();
    s.turn_phase = TurnPhase::WaitingForDealResponse;
    s.active_card = ActiveBigDeal{data::FindDeal("bd-4")};
    s.decks.big_deals.pop_back();
    s.pending_player_deal = PendingPlayerDeal{.seller_id = "p1", .buyer_id = "p3",
                                              .card = data::FindDeal("bd-4"), .asking_price = 12000};
    s.players[2].statement.assets.emplace_back(StockAsset{.id = "asset-1", .name = "OK4U", .symbol = "OK4U",
                                                          .shares = 40, .cost_per_share = 5, .dividend_per_share = 0});
    s.next_asset_id = 2;
    for (int i = 0; i < 30; ++i) AddLog(s, "p1", "filler");

    std::array const valid{ActionType::AcceptPlayerDeal, ActionType::DeclinePlayerDeal};
    auto const buf = BuildState("room-7", s, valid, 9, 10);
    auto const decoded = DecodeState(AsBytes(buf));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;

    GameState const& d = decoded->state;
    ASSERT_EQ(KindOf(d.active_card), ActiveCardKind::BigDeal);
    EXPECT_EQ(ActiveDealCard(d.active_card), data::FindDeal("bd-4"));
    ASSERT_TRUE(d.pending_player_deal.has_value());
    EXPECT_EQ(d.pending_player_deal->buyer_id, "p3");
    EXPECT_EQ(d.pending_player_deal->asking_price, 12000);

    ASSERT_EQ(d.players[2].statement.assets.size(), 1u);
    EXPECT_EQ(std::get<StockAsset>(d.players[2].statement.assets.front()).shares, 40);

    EXPECT_EQ(d.log.size(), 10u);
    EXPECT_EQ(decoded->log_size, s.log.size());
    EXPECT_EQ(d.log.back().message, "filler");
    EXPECT_EQ(d.next_asset_id, 2u);
}

TEST(Codec, Error_And_Welcome)
{
    auto const err = BuildError("Not your turn", 41, 42);
    ASSERT_EQ(PeekMessage(AsBytes(err)), fb::Message::ErrorMsg);
    EXPECT_EQ(DecodeError(AsBytes(err)), std::string{"Not your turn"});

    auto const hello = BuildWelcome("room-3", "p2", 1);
    auto const w = DecodeWelcome(AsBytes(hello));
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(w->room, "room-3");
    EXPECT_EQ(w->player_id, "p2");
}

TEST(Codec, RejectsBadBuffers)
{
    std::array<std::byte, 3> const tiny{};
    EXPECT_FALSE(PeekMessage(tiny).has_value());

    std::vector<std::byte> junk(64, std::byte{0xAB});
    EXPECT_FALSE(DecodeAction(junk).has_value());
    EXPECT_FALSE(DecodeState(junk).has_value());

    // well formed, wrong message
    auto const err = BuildError("nope", 0, 1);
    EXPECT_FALSE(DecodeAction(AsBytes(err)).has_value());
    EXPECT_FALSE(DecodeState(AsBytes(err)).has_value());

    auto const act = BuildAction(EndTurnAction{"p1"}, 3);
    EXPECT_FALSE(DecodeWelcome(AsBytes(act)).has_value());
}
