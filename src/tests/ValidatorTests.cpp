#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <vector>

#include "../core/CardData.hpp"
#include "../core/Game.hpp"
#include "../core/Validator.hpp"

using namespace cashflow::core;
using RVC = error::RuleViolationCode;

namespace
{
    auto make_game() -> GameState
    {
        std::vector<PlayerSeat> const seats{{"p1", "Ann"}, {"p2", "Ben"}};
        std::vector<ProfessionSP> const profs{data::FindProfession("Janitor")};
        return CreateGame(seats, profs, Config{.seed = 7});
    }

    // Code of the violation, or nullopt when the action is legal.
    auto refusal(GameState const& s, GameAction const& a) -> std::optional<RVC>
    {
        auto const r = ValidateAction(s, a);
        if (r) return std::nullopt;
        return r.error().code;
    }

    auto with_deal(GameState s, std::string_view id) -> GameState
    {
        s.turn_phase = TurnPhase::MakeDecision;
        s.active_card = ActiveSmallDeal{data::FindDeal(id)};
        return s;
    }
}

TEST(Validator, Roll_DiceRange)
{
    GameState const s = make_game();
    EXPECT_EQ(refusal(s, RollDiceAction{"p1", {3, 4}}), std::nullopt);
    EXPECT_EQ(refusal(s, RollDiceAction{"p1", {7, 3}}), RVC::Roll_InvalidDice);
    EXPECT_EQ(refusal(s, RollDiceAction{"p1", {1, 0}}), RVC::Roll_InvalidDice);
}

TEST(Validator, Turn_Order)
{
    GameState const s = make_game();
    EXPECT_EQ(refusal(s, RollDiceAction{"p2", {3, 4}}), RVC::NotYourTurn);
    EXPECT_EQ(refusal(s, RollDiceAction{"p9", {3, 4}}), RVC::PlayerNotFound);
    EXPECT_EQ(refusal(s, CollectPayDayAction{"p1"}), RVC::WrongPhase);
}

TEST(Validator, Violation_Describes)
{
    auto const r = ValidateAction(make_game(), RollDiceAction{"p2", {3, 4}});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(error::describe(r.error()), "Not your turn | action=ROLL_DICE | actor=p2");
}

TEST(Validator, GameOver_RefusesEverything)
{
    GameState s = make_game();
    s.turn_phase = TurnPhase::GameOver;
    EXPECT_EQ(refusal(s, RollDiceAction{"p1", {3, 4}}), RVC::GameOver);
    EXPECT_EQ(refusal(s, EndTurnAction{"p1"}), RVC::GameOver);
}

TEST(Validator, TakeLoan_Amounts)
{
    GameState s = make_game();
    EXPECT_EQ(refusal(s, TakeLoanAction{"p1", 1000}), RVC::WrongPhase);

    s.turn_phase = TurnPhase::EndOfTurn;
    EXPECT_EQ(refusal(s, TakeLoanAction{"p1", 1000}), std::nullopt);
    EXPECT_EQ(refusal(s, TakeLoanAction{"p1", 83000}), std::nullopt);
    EXPECT_EQ(refusal(s, TakeLoanAction{"p1", 1500}), RVC::Loan_InvalidAmount);
    EXPECT_EQ(refusal(s, TakeLoanAction{"p1", 0}), RVC::Loan_InvalidAmount);
    EXPECT_EQ(refusal(s, TakeLoanAction{"p1", -1000}), RVC::Loan_InvalidAmount);
    EXPECT_EQ(refusal(s, TakeLoanAction{"p1", 84000}), RVC::Loan_ExceedsMaximum);

    s.players[0].in_fast_track = true;
    EXPECT_EQ(refusal(s, TakeLoanAction{"p1", 1000}), RVC::Loan_FastTrack);
}

TEST(Validator, PayOffLoan)
{
    GameState s = make_game();
    s.turn_phase = TurnPhase::EndOfTurn;
    s.players[0].cash = 5000;

    EXPECT_EQ(refusal(s, PayOffLoanAction{"p1", "Bank Loan", 1000}), RVC::Loan_NotFound);
    EXPECT_EQ(refusal(s, PayOffLoanAction{"p1", "School Loan", 1000}), RVC::Loan_NotFound);
    EXPECT_EQ(refusal(s, PayOffLoanAction{"p1", "Credit Card", 2000}), std::nullopt);
    EXPECT_EQ(refusal(s, PayOffLoanAction{"p1", "Credit Card", 3000}), RVC::Loan_ExceedsBalance);
    EXPECT_EQ(refusal(s, PayOffLoanAction{"p1", "Credit Card", 500}), RVC::Loan_InvalidAmount);
    EXPECT_EQ(refusal(s, PayOffLoanAction{"p1", "Home Mortgage", 6000}), RVC::Loan_InsufficientCash);

    s.players[0].bank_loan_amount = 3000;
    EXPECT_EQ(refusal(s, PayOffLoanAction{"p1", "Bank Loan", 3000}), std::nullopt);
}

TEST(Validator, EndTurn_BlockedByDoodad)
{
    GameState s = make_game();
    s.turn_phase = TurnPhase::MakeDecision;
    s.active_card = ActiveDoodad{data::FindDoodad("dd-2")};
    EXPECT_EQ(refusal(s, EndTurnAction{"p1"}), RVC::EndTurn_DoodadOutstanding);
    EXPECT_EQ(refusal(s, PayExpenseAction{"p1"}), std::nullopt);

    s.turn_phase = TurnPhase::EndOfTurn;
    s.active_card = std::monostate{};
    EXPECT_EQ(refusal(s, EndTurnAction{"p1"}), std::nullopt);
    EXPECT_EQ(refusal(s, PayExpenseAction{"p1"}), RVC::WrongPhase);
}

TEST(Validator, Downsized_MustEndTurn)
{
    GameState s = make_game();
    EXPECT_EQ(refusal(s, EndTurnAction{"p1"}), RVC::WrongPhase);

    s.players[0].downsized_turns_left = 2;
    EXPECT_EQ(refusal(s, RollDiceAction{"p1", {2, 2}}), RVC::Roll_MustSkipTurn);
    EXPECT_EQ(refusal(s, EndTurnAction{"p1"}), std::nullopt);
}

TEST(Validator, Bankrupt_OnlyEndsTurn)
{
    GameState s = make_game();
    s.players[0].is_bankrupt = true;
    EXPECT_EQ(refusal(s, RollDiceAction{"p1", {2, 2}}), RVC::PlayerBankrupt);
    EXPECT_EQ(refusal(s, EndTurnAction{"p1"}), std::nullopt);
}

TEST(Validator, Deal_BuyAndShares)
{
    GameState s = with_deal(make_game(), "sd-2"); // ON2U at $5, cash $560
    EXPECT_EQ(refusal(s, BuyAssetAction{"p1", 100}), std::nullopt);
    EXPECT_EQ(refusal(s, BuyAssetAction{"p1", 0}), RVC::Deal_InvalidShareCount);
    EXPECT_EQ(refusal(s, BuyAssetAction{"p1", 200}), RVC::Deal_CannotAfford);
    EXPECT_EQ(refusal(s, SkipDealAction{"p1"}), std::nullopt);

    GameState house = with_deal(make_game(), "sd-21");
    EXPECT_EQ(refusal(house, BuyAssetAction{"p1", std::nullopt}), RVC::Deal_CannotAfford);

    GameState split = with_deal(make_game(), "sd-17");
    EXPECT_EQ(refusal(split, BuyAssetAction{"p1", 1}), RVC::Deal_StockSplitNotBuyable);
}

TEST(Validator, Deal_ShareCountBounds)
{
    GameState s = with_deal(make_game(), "sd-2"); // ON2U at $5
    EXPECT_EQ(refusal(s, BuyAssetAction{"p1", (std::int64_t{1} << 32) + 1}), RVC::Deal_TooManyShares);
    EXPECT_EQ(refusal(s, BuyAssetAction{"p1", std::numeric_limits<std::int64_t>::max()}), RVC::Deal_TooManyShares);
    EXPECT_EQ(refusal(s, BuyAssetAction{"p1", 200}), RVC::Deal_CannotAfford);

    s.players[0].cash = 1'000'000'000;
    EXPECT_EQ(refusal(s, BuyAssetAction{"p1", constants::MaxShareLot}), RVC::Deal_CannotAfford);
    EXPECT_EQ(refusal(s, BuyAssetAction{"p1", 1'500'000'000}), RVC::Deal_TooManyShares);
    EXPECT_EQ(refusal(s, BuyAssetAction{"p1", 1'000'000'000 / 5}), std::nullopt);
}

TEST(Validator, Offer_Targets)
{
    GameState s = with_deal(make_game(), "sd-21");
    EXPECT_EQ(refusal(s, OfferDealToPlayerAction{"p1", "p2", 1000}), std::nullopt);
    EXPECT_EQ(refusal(s, OfferDealToPlayerAction{"p1", "p1", 1000}), RVC::Offer_SelfTarget);
    EXPECT_EQ(refusal(s, OfferDealToPlayerAction{"p1", "p7", 1000}), RVC::Offer_TargetNotFound);
    EXPECT_EQ(refusal(s, OfferDealToPlayerAction{"p1", "p2", 0}), RVC::Offer_InvalidPrice);
    EXPECT_EQ(refusal(s, OfferDealToPlayerAction{"p1", "p2", constants::MaxPrice}), std::nullopt);
    EXPECT_EQ(refusal(s, OfferDealToPlayerAction{"p1", "p2", constants::MaxPrice + 1}), RVC::Offer_PriceTooHigh);
    EXPECT_EQ(refusal(s, OfferDealToPlayerAction{"p1", "p2", std::numeric_limits<Money>::max()}),
              RVC::Offer_PriceTooHigh);

    s.players[1].is_bankrupt = true;
    EXPECT_EQ(refusal(s, OfferDealToPlayerAction{"p1", "p2", 1000}), RVC::Offer_TargetBankrupt);
}

TEST(Validator, PlayerDeal_OnlyRecipientResponds)
{
    GameState s = with_deal(make_game(), "sd-21");
    s.turn_phase = TurnPhase::WaitingForDealResponse;
    s.pending_player_deal = PendingPlayerDeal{.seller_id = "p1", .buyer_id = "p2",
                                              .card = data::FindDeal("sd-21"), .asking_price = 1000};

    EXPECT_EQ(refusal(s, AcceptPlayerDealAction{"p2"}), std::nullopt);
    EXPECT_EQ(refusal(s, DeclinePlayerDealAction{"p2"}), std::nullopt);
    EXPECT_EQ(refusal(s, AcceptPlayerDealAction{"p1"}), RVC::Offer_NotRecipient);
    EXPECT_EQ(refusal(s, EndTurnAction{"p1"}), RVC::WrongPhase);
}

TEST(Validator, Market_OutOfTurn)
{
    GameState s = make_game();
    s.turn_phase = TurnPhase::MakeDecision;
    s.active_card = ActiveMarket{data::FindMarket("mk-1")};
    s.players[1].statement.assets.emplace_back(StockAsset{.id = "asset-1", .name = "ON2U", .symbol = "ON2U",
                                                          .shares = 10, .cost_per_share = 5});
    s.players[1].statement.assets.emplace_back(StockAsset{.id = "asset-2", .name = "MYT4U", .symbol = "MYT4U",
                                                          .shares = 10, .cost_per_share = 5});
    s.next_asset_id = 3;

    EXPECT_EQ(refusal(s, SellToMarketAction{"p2", "asset-1"}), std::nullopt);
    EXPECT_EQ(refusal(s, SellToMarketAction{"p2", "asset-2"}), RVC::Market_AssetMismatch);
    EXPECT_EQ(refusal(s, SellToMarketAction{"p1", "asset-1"}), RVC::Sell_AssetNotFound);
    EXPECT_EQ(refusal(s, DeclineMarketAction{"p2"}), std::nullopt);
    // still the current player's turn for everything else
    EXPECT_EQ(refusal(s, EndTurnAction{"p2"}), RVC::NotYourTurn);

    s.active_card = ActiveMarket{data::FindMarket("mk-19")};
    EXPECT_EQ(refusal(s, SellToMarketAction{"p2", "asset-1"}), RVC::Market_NotAnOffer);
}

TEST(Validator, SellAsset)
{
    GameState s = make_game();
    s.turn_phase = TurnPhase::EndOfTurn;
    s.players[0].statement.assets.emplace_back(StockAsset{.id = "asset-1", .name = "OK4U", .symbol = "OK4U",
                                                          .shares = 10, .cost_per_share = 5});
    s.players[0].statement.assets.emplace_back(BusinessAsset{.id = "asset-2", .name = "Vending", .cost = 3000,
                                                             .down_payment = 3000, .cash_flow = 90});
    s.next_asset_id = 3;

    EXPECT_EQ(refusal(s, SellAssetAction{"p1", "asset-1", 5, 20}), std::nullopt);
    EXPECT_EQ(refusal(s, SellAssetAction{"p1", "asset-1", std::nullopt, 20}), std::nullopt);
    EXPECT_EQ(refusal(s, SellAssetAction{"p1", "asset-1", 11, 20}), RVC::Sell_TooManyShares);
    EXPECT_EQ(refusal(s, SellAssetAction{"p1", "asset-1", 5, std::nullopt}), RVC::Sell_PriceRequired);
    EXPECT_EQ(refusal(s, SellAssetAction{"p1", "asset-1", 5, -1}), RVC::Sell_NegativePrice);
    EXPECT_EQ(refusal(s, SellAssetAction{"p1", "asset-2", 1, 20}), RVC::Sell_NotAStock);
    EXPECT_EQ(refusal(s, SellAssetAction{"p1", "asset-9", 1, 20}), RVC::Sell_AssetNotFound);
}

TEST(Validator, SellAsset_PriceCeiling)
{
    GameState s = make_game();
    s.turn_phase = TurnPhase::EndOfTurn;
    s.players[0].statement.assets.emplace_back(StockAsset{.id = "asset-1", .name = "ON2U", .symbol = "ON2U",
                                                          .shares = 10, .cost_per_share = 5});
    s.next_asset_id = 2;

    Money const huge = std::numeric_limits<Money>::max() / 4;
    EXPECT_EQ(refusal(s, SellAssetAction{"p1", "asset-1", 10, huge}), RVC::Sell_PriceTooHigh);
    EXPECT_EQ(refusal(s, SellAssetAction{"p1", "asset-1", std::nullopt, huge}), RVC::Sell_PriceTooHigh);
    EXPECT_EQ(refusal(s, SellAssetAction{"p1", "asset-1", 10, constants::MaxPrice / 10}), std::nullopt);
    EXPECT_EQ(refusal(s, SellAssetAction{"p1", "asset-1", 10, constants::MaxPrice / 10 + 1}), RVC::Sell_PriceTooHigh);
    EXPECT_EQ(refusal(s, SellAssetAction{"p1", "asset-1", 1, constants::MaxPrice}), std::nullopt);
}

TEST(Validator, ChooseDream)
{
    GameState s = make_game();
    EXPECT_EQ(refusal(s, ChooseDreamAction{"p1", "Private Jet"}), RVC::Dream_NotEscaped);

    s.players[0].has_escaped = true;
    EXPECT_EQ(refusal(s, ChooseDreamAction{"p1", "Moon Base"}), RVC::Dream_Unknown);
    EXPECT_EQ(refusal(s, ChooseDreamAction{"p1", "Private Jet"}), std::nullopt);

    s.players[0].dream = "Private Jet";
    EXPECT_EQ(refusal(s, ChooseDreamAction{"p1", "African Safari"}), RVC::Dream_AlreadyChosen);
}

TEST(Validator, Charity_OnlyOnCharitySpace)
{
    GameState s = make_game();
    s.turn_phase = TurnPhase::ResolveSpace;
    s.players[0].position = 3;
    EXPECT_EQ(refusal(s, AcceptCharityAction{"p1"}), RVC::Space_NotCharity);
    EXPECT_EQ(refusal(s, ChooseDealTypeAction{"p1", DealSize::Big}), std::nullopt);

    s.players[0].position = 13;
    EXPECT_EQ(refusal(s, AcceptCharityAction{"p1"}), std::nullopt);
    EXPECT_EQ(refusal(s, DeclineCharityAction{"p1"}), std::nullopt);
    EXPECT_EQ(refusal(s, ChooseDealTypeAction{"p1", DealSize::Small}), RVC::Space_NotDeal);
}
