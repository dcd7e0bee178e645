//
// Actions.hpp
//

#ifndef CASHFLOW_ACTIONS_HPP
#define CASHFLOW_ACTIONS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "Types.hpp"

namespace cashflow::core
{
    // dice are advisory when they come from a client; the session overwrites them
    struct RollDiceAction        { PlayerId player_id; Dice dice_values{}; bool use_both_dice{false}; };
    struct ChooseDealTypeAction  { PlayerId player_id; DealSize deal_type{DealSize::Small}; };
    struct BuyAssetAction        { PlayerId player_id; std::optional<std::int64_t> shares{}; };
    struct SellAssetAction
    {
        PlayerId player_id;
        AssetId asset_id;
        std::optional<std::int64_t> shares{};
        std::optional<Money> price{};
    };
    struct SkipDealAction        { PlayerId player_id; };
    struct PayExpenseAction      { PlayerId player_id; };
    struct AcceptCharityAction   { PlayerId player_id; };
    struct DeclineCharityAction  { PlayerId player_id; };
    struct TakeLoanAction        { PlayerId player_id; Money amount{}; };
    struct PayOffLoanAction      { PlayerId player_id; std::string loan_type; Money amount{}; };
    struct EndTurnAction         { PlayerId player_id; };
    struct CollectPayDayAction   { PlayerId player_id; };
    struct ChooseDreamAction     { PlayerId player_id; std::string dream; };
    struct SellToMarketAction    { PlayerId player_id; AssetId asset_id; };
    struct DeclineMarketAction   { PlayerId player_id; };
    struct DeclareBankruptcyAction { PlayerId player_id; };
    struct OfferDealToPlayerAction { PlayerId player_id; PlayerId target_player_id; Money asking_price{}; };
    struct AcceptPlayerDealAction  { PlayerId player_id; };
    struct DeclinePlayerDealAction { PlayerId player_id; };

    using GameAction = std::variant<
        RollDiceAction, ChooseDealTypeAction, BuyAssetAction, SellAssetAction, SkipDealAction,
        PayExpenseAction, AcceptCharityAction, DeclineCharityAction, TakeLoanAction, PayOffLoanAction,
        EndTurnAction, CollectPayDayAction, ChooseDreamAction, SellToMarketAction, DeclineMarketAction,
        DeclareBankruptcyAction, OfferDealToPlayerAction, AcceptPlayerDealAction, DeclinePlayerDealAction>;

    // Same order as GameAction's alternatives.
    enum class ActionType : std::uint8_t
    {
        RollDice,
        ChooseDealType,
        BuyAsset,
        SellAsset,
        SkipDeal,
        PayExpense,
        AcceptCharity,
        DeclineCharity,
        TakeLoan,
        PayOffLoan,
        EndTurn,
        CollectPayDay,
        ChooseDream,
        SellToMarket,
        DeclineMarket,
        DeclareBankruptcy,
        OfferDealToPlayer,
        AcceptPlayerDeal,
        DeclinePlayerDeal
    };

    inline constexpr std::size_t ActionTypeCount = std::variant_size_v<GameAction>;
    static_assert(static_cast<std::size_t>(ActionType::DeclinePlayerDeal) + 1 == ActionTypeCount);

    inline auto TypeOf(GameAction const& a) -> ActionType
    {
        return static_cast<ActionType>(a.index());
    }

    inline auto ActorOf(GameAction const& a) -> PlayerId const&
    {
        return std::visit([](auto const& x) -> PlayerId const& { return x.player_id; }, a);
    }

    inline auto to_string(ActionType t) -> std::string_view
    {
        switch (t)
        {
        case ActionType::RollDice: return "ROLL_DICE";
        case ActionType::ChooseDealType: return "CHOOSE_DEAL_TYPE";
        case ActionType::BuyAsset: return "BUY_ASSET";
        case ActionType::SellAsset: return "SELL_ASSET";
        case ActionType::SkipDeal: return "SKIP_DEAL";
        case ActionType::PayExpense: return "PAY_EXPENSE";
        case ActionType::AcceptCharity: return "ACCEPT_CHARITY";
        case ActionType::DeclineCharity: return "DECLINE_CHARITY";
        case ActionType::TakeLoan: return "TAKE_LOAN";
        case ActionType::PayOffLoan: return "PAY_OFF_LOAN";
        case ActionType::EndTurn: return "END_TURN";
        case ActionType::CollectPayDay: return "COLLECT_PAY_DAY";
        case ActionType::ChooseDream: return "CHOOSE_DREAM";
        case ActionType::SellToMarket: return "SELL_TO_MARKET";
        case ActionType::DeclineMarket: return "DECLINE_MARKET";
        case ActionType::DeclareBankruptcy: return "DECLARE_BANKRUPTCY";
        case ActionType::OfferDealToPlayer: return "OFFER_DEAL_TO_PLAYER";
        case ActionType::AcceptPlayerDeal: return "ACCEPT_PLAYER_DEAL";
        case ActionType::DeclinePlayerDeal: return "DECLINE_PLAYER_DEAL";
        }
        return "?";
    }

    // Actions a non-current player may legally submit.
    inline auto AllowedOutOfTurn(ActionType t) -> bool
    {
        return t == ActionType::SellToMarket || t == ActionType::DeclineMarket ||
               t == ActionType::AcceptPlayerDeal || t == ActionType::DeclinePlayerDeal;
    }
} // namespace cashflow::core

#endif //CASHFLOW_ACTIONS_HPP
