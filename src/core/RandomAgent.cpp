//
// RandomAgent.cpp
//

#include "RandomAgent.hpp"

#include <algorithm>

#include "Board.hpp"
#include "CardResolver.hpp"
#include "Finance.hpp"
#include "StandardRules.hpp"
#include "Validator.hpp"

namespace cashflow::core
{
    RandomAgent::RandomAgent(std::uint64_t rng_seed) :
        rng_(rng_seed)
    {
    }

    auto RandomAgent::Candidates(GameState const& s, Player const& p, ActionType t) -> std::vector<GameAction>
    {
        using AT = ActionType;
        PlayerId const& me = p.id;
        std::vector<GameAction> out;

        switch (t)
        {
        case AT::RollDice:
        {
            std::uniform_int_distribution<int> die{1, 6};
            Dice const dice{die(rng_), die(rng_)};
            out.emplace_back(RollDiceAction{me, dice, p.charity_turns_left > 0 && coin()});
            break;
        }
        case AT::ChooseDealType:
            out.emplace_back(ChooseDealTypeAction{me, coin() ? DealSize::Small : DealSize::Big});
            break;
        case AT::BuyAsset:
        {
            DealSP const card = ActiveDealCard(s.active_card);
            if (!card) break;
            if (auto const* st = std::get_if<StockDeal>(&card->deal))
            {
                auto const afford = static_cast<std::int64_t>(static_cast<double>(p.cash) / st->cost_per_share);
                if (afford < 1) break;
                std::int64_t const shares = std::uniform_int_distribution<std::int64_t>{1, std::min<std::int64_t>(afford, 2000)}(rng_);
                out.emplace_back(BuyAssetAction{me, shares});
            }
            else
            {
                out.emplace_back(BuyAssetAction{me, std::nullopt});
            }
            break;
        }
        case AT::SellAsset:
            for (Asset const& a : p.statement.assets)
            {
                if (auto const* st = std::get_if<StockAsset>(&a))
                {
                    auto const price = std::max<Money>(1, static_cast<Money>(st->cost_per_share));
                    out.emplace_back(SellAssetAction{me, st->id, st->shares, price});
                }
            }
            break;
        case AT::TakeLoan:
        {
            Money const max = finance::MaxAffordableLoan(p) / constants::LoanIncrement;
            if (max < 1) break;
            Money const steps = std::uniform_int_distribution<Money>{1, std::min<Money>(max, 5)}(rng_);
            out.emplace_back(TakeLoanAction{me, steps * constants::LoanIncrement});
            break;
        }
        case AT::PayOffLoan:
            if (p.bank_loan_amount > 0)
            {
                out.emplace_back(PayOffLoanAction{me, std::string{constants::BankLoan}, constants::LoanIncrement});
            }
            for (Liability const& l : p.statement.liabilities)
            {
                out.emplace_back(PayOffLoanAction{me, l.name, constants::LoanIncrement});
            }
            break;
        case AT::ChooseDream:
            for (board::Space const& sp : board::FastTrack())
            {
                if (sp.type == SpaceType::Dream) out.emplace_back(ChooseDreamAction{me, std::string{sp.label}});
            }
            break;
        case AT::SellToMarket:
            if (auto const* mk = std::get_if<ActiveMarket>(&s.active_card))
            {
                for (Asset const& a : p.statement.assets)
                {
                    if (resolve::MarketSalePrice(a, mk->card->effect)) out.emplace_back(SellToMarketAction{me, IdOf(a)});
                }
            }
            break;
        case AT::OfferDealToPlayer:
            for (Player const& o : s.players)
            {
                if (o.id == me || o.is_bankrupt) continue;
                Money const ask = std::uniform_int_distribution<Money>{1, 5}(rng_) * constants::LoanIncrement;
                out.emplace_back(OfferDealToPlayerAction{me, o.id, ask});
            }
            break;
        case AT::SkipDeal: out.emplace_back(SkipDealAction{me}); break;
        case AT::PayExpense: out.emplace_back(PayExpenseAction{me}); break;
        case AT::AcceptCharity: out.emplace_back(AcceptCharityAction{me}); break;
        case AT::DeclineCharity: out.emplace_back(DeclineCharityAction{me}); break;
        case AT::EndTurn: out.emplace_back(EndTurnAction{me}); break;
        case AT::CollectPayDay: out.emplace_back(CollectPayDayAction{me}); break;
        case AT::DeclineMarket: out.emplace_back(DeclineMarketAction{me}); break;
        case AT::DeclareBankruptcy: out.emplace_back(DeclareBankruptcyAction{me}); break;
        case AT::AcceptPlayerDeal: out.emplace_back(AcceptPlayerDealAction{me}); break;
        case AT::DeclinePlayerDeal: out.emplace_back(DeclinePlayerDealAction{me}); break;
        }

        std::erase_if(out, [&](GameAction const& a) { return !ValidateAction(s, a).has_value(); });
        return out;
    }

    auto RandomAgent::Play(GameState const& view, PlayerId const& me) -> std::optional<GameAction>
    {
        if (view.turn_phase == TurnPhase::GameOver) return std::nullopt;

        std::optional<PlyrIdxT> const idx = view.FindPlayer(me);
        if (!idx) return std::nullopt;
        Player const& p = view.players[*idx];

        std::vector<ActionType> types;
        if (view.turn_phase == TurnPhase::WaitingForDealResponse)
        {
            if (!view.pending_player_deal || view.pending_player_deal->buyer_id != me) return std::nullopt;
            types = {ActionType::AcceptPlayerDeal, ActionType::DeclinePlayerDeal};
        }
        else
        {
            if (*idx != view.current_player_index) return std::nullopt;
            types = StandardRules{}.ValidActions(view);
        }

        // ending the turn is taken half the time it is on offer
        if (std::ranges::contains(types, ActionType::EndTurn) && types.size() > 1 && coin())
        {
            EndTurnAction const end{me};
            if (ValidateAction(view, end)) return end;
        }

        std::vector<GameAction> all;
        for (ActionType const t : types)
        {
            std::vector<GameAction> c = Candidates(view, p, t);
            all.insert(all.end(), std::make_move_iterator(c.begin()), std::make_move_iterator(c.end()));
        }
        if (all.empty()) return std::nullopt;
        return all[pick(all)];
    }
}
