//
// Validator.cpp
//

#include "Validator.hpp"

#include <initializer_list>
#include <type_traits>

#include "Board.hpp"
#include "CardResolver.hpp"
#include "Finance.hpp"

namespace cashflow::core
{
    using RVC = error::RuleViolationCode;
    using error::Viol;

    namespace
    {
        auto InPhase(GameState const& s, std::initializer_list<TurnPhase> phases) -> bool
        {
            for (TurnPhase const p : phases)
            {
                if (s.turn_phase == p) return true;
            }
            return false;
        }

        auto WrongPhase(GameState const& s, ActionType t) -> std::unexpected<error::RuleViolation>
        {
            return std::unexpected(Viol(RVC::WrongPhase).with_action(t).with_phase(s.turn_phase));
        }

        auto IsLoanStep(Money amount) -> bool
        {
            return amount > 0 && amount % constants::LoanIncrement == 0;
        }

        auto RoundUpToStep(Money amount) -> Money
        {
            return (amount + constants::LoanIncrement - 1) / constants::LoanIncrement * constants::LoanIncrement;
        }

        auto LandedOn(Player const& p) -> SpaceType
        {
            return p.in_fast_track ? board::FastTrackSpace(p.fast_track_position).type
                                   : board::RatRaceSpace(p.position);
        }

        // Deal card that may be bought, skipped or offered; reports why not otherwise.
        auto ActionableDeal(GameState const& s) -> std::expected<DealSP, error::RuleViolation>
        {
            DealSP card = ActiveDealCard(s.active_card);
            if (!card) return std::unexpected(Viol(RVC::Deal_NoActiveDeal));
            if (IsStockSplit(*card)) return std::unexpected(Viol(RVC::Deal_StockSplitNotBuyable));
            return card;
        }
    }

    auto ValidateAction(GameState const& s, GameAction const& action) -> error::ValidateResult
    {
        if (s.turn_phase == TurnPhase::GameOver)
        {
            return std::unexpected(Viol(RVC::GameOver));
        }

        ActionType const type = TypeOf(action);
        PlayerId const& actor = ActorOf(action);
        std::optional<PlyrIdxT> const idx = s.FindPlayer(actor);
        if (!idx)
        {
            return std::unexpected(Viol(RVC::PlayerNotFound).with_actor(actor));
        }
        if (*idx != s.current_player_index && !AllowedOutOfTurn(type))
        {
            return std::unexpected(Viol(RVC::NotYourTurn).with_action(type).with_actor(actor));
        }

        Player const& p = s.players[*idx];
        if (p.is_bankrupt && type != ActionType::EndTurn)
        {
            return std::unexpected(Viol(RVC::PlayerBankrupt).with_action(type).with_actor(actor));
        }

        return std::visit([&]<typename T0>(T0 const& a) -> error::ValidateResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, RollDiceAction>)
            {
                if (!InPhase(s, {TurnPhase::RollDice})) return WrongPhase(s, type);
                if (p.downsized_turns_left > 0)
                {
                    return std::unexpected(Viol(RVC::Roll_MustSkipTurn).with_actor(actor));
                }
                for (int const d : a.dice_values)
                {
                    if (d < 1 || d > 6) return std::unexpected(Viol(RVC::Roll_InvalidDice).with_amount(d));
                }
                return {};
            }
            else if constexpr (std::is_same_v<T, CollectPayDayAction>)
            {
                if (!InPhase(s, {TurnPhase::PayDayCollection})) return WrongPhase(s, type);
                if (s.pay_days_remaining <= 0) return std::unexpected(Viol(RVC::PayDay_NothingToCollect));
                return {};
            }
            else if constexpr (std::is_same_v<T, ChooseDealTypeAction>)
            {
                if (!InPhase(s, {TurnPhase::ResolveSpace})) return WrongPhase(s, type);
                if (p.in_fast_track || LandedOn(p) != SpaceType::Deal)
                {
                    return std::unexpected(Viol(RVC::Space_NotDeal).with_phase(s.turn_phase));
                }
                return {};
            }
            else if constexpr (std::is_same_v<T, BuyAssetAction>)
            {
                if (!InPhase(s, {TurnPhase::MakeDecision})) return WrongPhase(s, type);
                auto const card = ActionableDeal(s);
                if (!card) return std::unexpected(card.error());

                std::int64_t const shares = a.shares.value_or(1);
                if (std::holds_alternative<StockDeal>((*card)->deal) && shares < 1)
                {
                    return std::unexpected(Viol(RVC::Deal_InvalidShareCount).with_amount(shares));
                }
                if (shares > constants::MaxShareLot)
                {
                    return std::unexpected(Viol(RVC::Deal_TooManyShares).with_amount(shares).with_limit(constants::MaxShareLot));
                }
                Money const price = UpFrontCost((*card)->deal, shares);
                if (p.cash < price)
                {
                    return std::unexpected(Viol(RVC::Deal_CannotAfford).with_amount(price).with_limit(p.cash));
                }
                return {};
            }
            else if constexpr (std::is_same_v<T, SkipDealAction>)
            {
                if (!InPhase(s, {TurnPhase::MakeDecision})) return WrongPhase(s, type);
                if (!ActiveDealCard(s.active_card)) return std::unexpected(Viol(RVC::Deal_NoActiveDeal));
                return {};
            }
            else if constexpr (std::is_same_v<T, SellAssetAction>)
            {
                if (!InPhase(s, {TurnPhase::MakeDecision, TurnPhase::EndOfTurn})) return WrongPhase(s, type);
                Asset const* asset = resolve::FindAsset(p, a.asset_id);
                if (asset == nullptr) return std::unexpected(Viol(RVC::Sell_AssetNotFound).with_actor(actor));

                auto const* st = std::get_if<StockAsset>(asset);
                if (st == nullptr) return std::unexpected(Viol(RVC::Sell_NotAStock));
                if (!a.price) return std::unexpected(Viol(RVC::Sell_PriceRequired));
                if (*a.price < 0) return std::unexpected(Viol(RVC::Sell_NegativePrice).with_amount(*a.price));

                std::int64_t const shares = a.shares.value_or(st->shares);
                if (shares < 1) return std::unexpected(Viol(RVC::Deal_InvalidShareCount).with_amount(shares));
                if (shares > st->shares)
                {
                    return std::unexpected(Viol(RVC::Sell_TooManyShares).with_amount(shares).with_limit(st->shares));
                }
                if (*a.price > constants::MaxPrice / shares)
                {
                    return std::unexpected(Viol(RVC::Sell_PriceTooHigh).with_amount(*a.price).with_limit(constants::MaxPrice / shares));
                }
                return {};
            }
            else if constexpr (std::is_same_v<T, PayExpenseAction>)
            {
                if (!InPhase(s, {TurnPhase::MakeDecision})) return WrongPhase(s, type);
                if (KindOf(s.active_card) != ActiveCardKind::Doodad)
                {
                    return std::unexpected(Viol(RVC::Expense_NothingToPay));
                }
                return {};
            }
            else if constexpr (std::is_same_v<T, AcceptCharityAction> || std::is_same_v<T, DeclineCharityAction>)
            {
                if (!InPhase(s, {TurnPhase::ResolveSpace})) return WrongPhase(s, type);
                if (LandedOn(p) != SpaceType::Charity) return std::unexpected(Viol(RVC::Space_NotCharity));
                return {};
            }
            else if constexpr (std::is_same_v<T, TakeLoanAction>)
            {
                if (!InPhase(s, {TurnPhase::EndOfTurn})) return WrongPhase(s, type);
                if (p.in_fast_track) return std::unexpected(Viol(RVC::Loan_FastTrack));
                if (!IsLoanStep(a.amount)) return std::unexpected(Viol(RVC::Loan_InvalidAmount).with_amount(a.amount));

                Money const max = finance::MaxAffordableLoan(p);
                if (a.amount > max)
                {
                    return std::unexpected(Viol(RVC::Loan_ExceedsMaximum).with_amount(a.amount).with_limit(max));
                }
                return {};
            }
            else if constexpr (std::is_same_v<T, PayOffLoanAction>)
            {
                if (!InPhase(s, {TurnPhase::EndOfTurn})) return WrongPhase(s, type);
                if (!IsLoanStep(a.amount)) return std::unexpected(Viol(RVC::Loan_InvalidAmount).with_amount(a.amount));
                if (a.amount > p.cash)
                {
                    return std::unexpected(Viol(RVC::Loan_InsufficientCash).with_amount(a.amount).with_limit(p.cash));
                }

                Money balance{};
                if (a.loan_type == constants::BankLoan)
                {
                    balance = p.bank_loan_amount;
                }
                else if (Liability const* l = finance::FindLiability(p, a.loan_type))
                {
                    balance = l->balance;
                }
                if (balance <= 0) return std::unexpected(Viol(RVC::Loan_NotFound));
                if (a.amount > RoundUpToStep(balance))
                {
                    return std::unexpected(Viol(RVC::Loan_ExceedsBalance).with_amount(a.amount).with_limit(balance));
                }
                return {};
            }
            else if constexpr (std::is_same_v<T, EndTurnAction>)
            {
                if (p.is_bankrupt)
                {
                    if (InPhase(s, {TurnPhase::WaitingForDealResponse})) return WrongPhase(s, type);
                    return {};
                }
                if (InPhase(s, {TurnPhase::RollDice}) && p.downsized_turns_left > 0) return {};
                if (InPhase(s, {TurnPhase::MakeDecision}) && KindOf(s.active_card) == ActiveCardKind::Doodad)
                {
                    return std::unexpected(Viol(RVC::EndTurn_DoodadOutstanding));
                }
                if (!InPhase(s, {TurnPhase::EndOfTurn, TurnPhase::MakeDecision})) return WrongPhase(s, type);
                return {};
            }
            else if constexpr (std::is_same_v<T, ChooseDreamAction>)
            {
                if (!InPhase(s, {TurnPhase::RollDice, TurnPhase::EndOfTurn})) return WrongPhase(s, type);
                if (!p.has_escaped) return std::unexpected(Viol(RVC::Dream_NotEscaped));
                if (p.dream) return std::unexpected(Viol(RVC::Dream_AlreadyChosen));
                if (!board::DreamPosition(a.dream)) return std::unexpected(Viol(RVC::Dream_Unknown));
                return {};
            }
            else if constexpr (std::is_same_v<T, SellToMarketAction>)
            {
                if (!InPhase(s, {TurnPhase::MakeDecision})) return WrongPhase(s, type);
                auto const* mk = std::get_if<ActiveMarket>(&s.active_card);
                if (mk == nullptr) return std::unexpected(Viol(RVC::Market_NoActiveCard));

                Asset const* asset = resolve::FindAsset(p, a.asset_id);
                if (asset == nullptr) return std::unexpected(Viol(RVC::Sell_AssetNotFound).with_actor(actor));

                MarketEffect const& e = mk->card->effect;
                if (std::holds_alternative<DamageToProperty>(e) || std::holds_alternative<AllPlayersExpense>(e))
                {
                    return std::unexpected(Viol(RVC::Market_NotAnOffer));
                }
                if (!resolve::MarketSalePrice(*asset, e)) return std::unexpected(Viol(RVC::Market_AssetMismatch));
                return {};
            }
            else if constexpr (std::is_same_v<T, DeclineMarketAction>)
            {
                if (!InPhase(s, {TurnPhase::MakeDecision})) return WrongPhase(s, type);
                if (KindOf(s.active_card) != ActiveCardKind::Market)
                {
                    return std::unexpected(Viol(RVC::Market_NoActiveCard));
                }
                return {};
            }
            else if constexpr (std::is_same_v<T, DeclareBankruptcyAction>)
            {
                if (!InPhase(s, {TurnPhase::BankruptcyDecision})) return WrongPhase(s, type);
                return {};
            }
            else if constexpr (std::is_same_v<T, OfferDealToPlayerAction>)
            {
                if (!InPhase(s, {TurnPhase::MakeDecision})) return WrongPhase(s, type);
                auto const card = ActionableDeal(s);
                if (!card) return std::unexpected(card.error());

                if (a.asking_price <= 0)
                {
                    return std::unexpected(Viol(RVC::Offer_InvalidPrice).with_amount(a.asking_price));
                }
                if (a.asking_price > constants::MaxPrice)
                {
                    return std::unexpected(Viol(RVC::Offer_PriceTooHigh).with_amount(a.asking_price).with_limit(constants::MaxPrice));
                }
                if (a.target_player_id == actor) return std::unexpected(Viol(RVC::Offer_SelfTarget));

                std::optional<PlyrIdxT> const target = s.FindPlayer(a.target_player_id);
                if (!target)
                {
                    return std::unexpected(Viol(RVC::Offer_TargetNotFound).with_target(a.target_player_id));
                }
                if (s.players[*target].is_bankrupt)
                {
                    return std::unexpected(Viol(RVC::Offer_TargetBankrupt).with_target(a.target_player_id));
                }
                return {};
            }
            else if constexpr (std::is_same_v<T, AcceptPlayerDealAction> || std::is_same_v<T, DeclinePlayerDealAction>)
            {
                if (!InPhase(s, {TurnPhase::WaitingForDealResponse})) return WrongPhase(s, type);
                if (!s.pending_player_deal) return std::unexpected(Viol(RVC::Offer_NoPendingDeal));
                if (s.pending_player_deal->buyer_id != actor)
                {
                    return std::unexpected(Viol(RVC::Offer_NotRecipient).with_actor(actor));
                }
                return {};
            }
            else
            {
                static_assert(!sizeof(T), "unhandled action type");
            }
        }, action);
    }
}
