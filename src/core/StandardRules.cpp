//
// StandardRules.cpp
//

#include "StandardRules.hpp"

#include <algorithm>
#include <format>
#include <type_traits>

#include "Board.hpp"
#include "CardResolver.hpp"
#include "Finance.hpp"
#include "Util.hpp"
#include "Validator.hpp"

namespace cashflow::core
{
    namespace
    {
        using error::Code;

        auto IndexOf(GameState const& s, PlayerId const& id) -> PlyrIdxT
        {
            std::optional<PlyrIdxT> const idx = s.FindPlayer(id);
            if (!idx) CF_THROW(Code::Rules, std::format("unknown player {}", id));
            return *idx;
        }

        // Puts whatever card is face up onto its discard pile.
        auto DiscardActive(GameState& s) -> void
        {
            std::visit([&]<typename C0>(C0 const& c)
            {
                using C = std::decay_t<C0>;
                if constexpr (std::is_same_v<C, ActiveSmallDeal>) s.decks.small_deal_discard.push_back(c.card);
                else if constexpr (std::is_same_v<C, ActiveBigDeal>) s.decks.big_deal_discard.push_back(c.card);
                else if constexpr (std::is_same_v<C, ActiveMarket>) s.decks.market_discard.push_back(c.card);
                else if constexpr (std::is_same_v<C, ActiveDoodad>) s.decks.doodad_discard.push_back(c.card);
            }, s.active_card);
            s.active_card = std::monostate{};
        }

        auto EmptyDeck(GameState& s, PlyrIdxT idx, std::string_view deck) -> void
        {
            AddLog(s, s.players[idx].id, std::format("The {} deck and its discard pile are empty; nothing drawn.", deck));
            s.turn_phase = TurnPhase::EndOfTurn;
        }

        auto Win(GameState& s, PlyrIdxT idx, std::string const& why) -> void
        {
            Player& p = s.players[idx];
            p.has_won = true;
            s.winner = p.id;
            s.turn_phase = TurnPhase::GameOver;
            s.pay_days_remaining = 0;
            AddLog(s, p.id, std::format("WINNER! {} {}", p.name, why));
        }

        auto CheckCashFlowWin(GameState& s, PlyrIdxT idx) -> bool
        {
            Player const& p = s.players[idx];
            if (!p.in_fast_track || p.fast_track_cash_flow < s.fast_track_win_cash_flow) return false;
            Win(s, idx, std::format("reached ${}/mo cash flow.", p.fast_track_cash_flow));
            return true;
        }

        auto DrawDeal(GameState& s, PlyrIdxT idx, DealSize size) -> void
        {
            bool const small = size == DealSize::Small;
            DealSP card = small ? util::Draw(s.decks.small_deals, s.decks.small_deal_discard, s.shuffle_seed)
                                : util::Draw(s.decks.big_deals, s.decks.big_deal_discard, s.shuffle_seed);
            if (!card)
            {
                EmptyDeck(s, idx, small ? "small deal" : "big deal");
                return;
            }

            AddLog(s, s.players[idx].id, std::format("Drew {} deal: {}", small ? "small" : "big", card->title));
            if (auto const* split = std::get_if<StockSplitDeal>(&card->deal))
            {
                resolve::ApplyStockSplit(s, *split);
                (small ? s.decks.small_deal_discard : s.decks.big_deal_discard).push_back(card);
                s.turn_phase = TurnPhase::EndOfTurn;
                return;
            }

            if (small) s.active_card = ActiveSmallDeal{std::move(card)};
            else s.active_card = ActiveBigDeal{std::move(card)};
            s.turn_phase = TurnPhase::MakeDecision;
        }

        auto DrawMarket(GameState& s, PlyrIdxT idx) -> void
        {
            MarketSP card = util::Draw(s.decks.market, s.decks.market_discard, s.shuffle_seed);
            if (!card)
            {
                EmptyDeck(s, idx, "market");
                return;
            }

            if (resolve::ApplyMarket(s, *card))
            {
                s.active_card = ActiveMarket{std::move(card)};
                s.turn_phase = TurnPhase::MakeDecision;
            }
            else
            {
                s.decks.market_discard.push_back(std::move(card));
                s.turn_phase = TurnPhase::EndOfTurn;
            }
        }

        auto DrawDoodad(GameState& s, PlyrIdxT idx) -> void
        {
            DoodadSP card = util::Draw(s.decks.doodads, s.decks.doodad_discard, s.shuffle_seed);
            if (!card)
            {
                EmptyDeck(s, idx, "doodad");
                return;
            }
            AddLog(s, s.players[idx].id, std::format("Doodad: {} (${})", card->title,
                                                     resolve::DoodadCost(s.players[idx], *card)));
            s.active_card = ActiveDoodad{std::move(card)};
            s.turn_phase = TurnPhase::MakeDecision;
        }

        auto ResolveRatRace(GameState& s, PlyrIdxT idx) -> void
        {
            Player& p = s.players[idx];
            switch (board::RatRaceSpace(p.position))
            {
            case SpaceType::Deal:
            case SpaceType::Charity:
                s.turn_phase = TurnPhase::ResolveSpace;
                return;
            case SpaceType::Market:
                DrawMarket(s, idx);
                return;
            case SpaceType::Doodad:
                DrawDoodad(s, idx);
                return;
            case SpaceType::Baby:
                if (finance::AddChild(p))
                {
                    AddLog(s, p.id, std::format("Had a baby! Now has {} child(ren).", p.statement.expenses.child_count));
                }
                else
                {
                    AddLog(s, p.id, "Landed on Baby, but already has the maximum number of children.");
                }
                s.turn_phase = TurnPhase::EndOfTurn;
                return;
            case SpaceType::Downsized:
            {
                Money const owed = finance::TotalExpenses(p);
                p.downsized_turns_left = constants::DownsizedTurns;
                resolve::Charge(s, idx, owed, "Downsized");
                s.turn_phase = TurnPhase::EndOfTurn;
                return;
            }
            case SpaceType::PayDay:
                s.turn_phase = TurnPhase::EndOfTurn;
                return;
            default:
                CF_THROW(Code::State, "fast track space on the rat race");
            }
        }

        auto ResolveFastTrack(GameState& s, PlyrIdxT idx) -> void
        {
            Player& p = s.players[idx];
            board::Space const& space = board::FastTrackSpace(p.fast_track_position);
            switch (space.type)
            {
            case SpaceType::CashFlowDay:
                s.turn_phase = TurnPhase::EndOfTurn;
                return;
            case SpaceType::Dream:
                if (p.dream && *p.dream == space.label)
                {
                    Win(s, idx, std::format("achieved their dream: {}!", space.label));
                    return;
                }
                AddLog(s, p.id, std::format("Visited {}, not their dream.", space.label));
                s.turn_phase = TurnPhase::EndOfTurn;
                return;
            case SpaceType::BusinessDeal:
                DrawDeal(s, idx, DealSize::Big);
                return;
            case SpaceType::Charity:
                s.turn_phase = TurnPhase::ResolveSpace;
                return;
            case SpaceType::Tax:
            case SpaceType::Lawsuit:
            case SpaceType::Divorce:
                resolve::ApplyFastTrackPenalty(s, idx, space.type);
                s.turn_phase = TurnPhase::EndOfTurn;
                return;
            default:
                CF_THROW(Code::State, "rat race space on the fast track");
            }
        }

        auto ResolveSpace(GameState& s, PlyrIdxT idx) -> void
        {
            if (s.players[idx].in_fast_track) ResolveFastTrack(s, idx);
            else ResolveRatRace(s, idx);
        }

        auto DoRoll(GameState& s, PlyrIdxT idx, RollDiceAction const& a) -> void
        {
            Player& p = s.players[idx];
            bool const charity = p.charity_turns_left > 0;
            int const total = board::DiceTotal(a.dice_values, a.use_both_dice, charity, p.in_fast_track);
            if (charity) --p.charity_turns_left;
            s.dice_result = a.dice_values;

            std::size_t& pos = p.in_fast_track ? p.fast_track_position : p.position;
            std::size_t const size = p.in_fast_track ? constants::FastTrackSize : constants::RatRaceSize;
            auto const markers = p.in_fast_track ? board::CashFlowDayPositions() : board::PayDayPositions();

            std::size_t const from = pos;
            pos = board::Move(from, total, size);
            s.pay_days_remaining = board::CountCrossings(from, pos, markers);

            SpaceType const landed = p.in_fast_track ? board::FastTrackSpace(pos).type : board::RatRaceSpace(pos);
            AddLog(s, p.id, std::format("Rolled {} and moved to space {} ({}).", total, pos, to_string(landed)));

            if (s.pay_days_remaining > 0)
            {
                s.turn_phase = TurnPhase::PayDayCollection;
                return;
            }
            ResolveSpace(s, idx);
        }

        auto DoCollectPayDay(GameState& s, PlyrIdxT idx) -> void
        {
            Player& p = s.players[idx];
            Money const amount = p.in_fast_track ? p.fast_track_cash_flow : finance::CashFlow(p);
            p.cash += amount;
            --s.pay_days_remaining;
            AddLog(s, p.id, std::format("{}: collected ${}.", p.in_fast_track ? "Cash Flow Day" : "PayDay", amount));

            if (Money const borrowed = finance::ApplyForcedLoan(p); borrowed > 0)
            {
                AddLog(s, p.id, std::format("Forced bank loan of ${} (cash was negative).", borrowed));
            }
            if (CheckCashFlowWin(s, idx)) return;

            if (s.pay_days_remaining == 0)
            {
                ResolveSpace(s, idx);
            }
        }

        auto DoBuy(GameState& s, PlyrIdxT idx, BuyAssetAction const& a) -> void
        {
            DealSP const card = ActiveDealCard(s.active_card);
            CF_ASSERT(card != nullptr, "buy without an active deal");

            if (!resolve::BuyDeal(s, idx, *card, a.shares.value_or(1), false)) return;

            DiscardActive(s);
            s.turn_phase = TurnPhase::EndOfTurn;
            CheckCashFlowWin(s, idx);
        }

        auto DoEndTurn(GameState& s) -> void
        {
            DiscardActive(s);
            s.dice_result.reset();
            s.pay_days_remaining = 0;
            s.pending_player_deal.reset();

            if (std::ranges::all_of(s.players, &Player::is_bankrupt))
            {
                s.turn_phase = TurnPhase::GameOver;
                s.winner.reset();
                AddLog(s, s.Current().id, "Every player is bankrupt. Game over with no winner.");
                return;
            }

            // each lap through skipping players lowers a counter, so this ends
            PlyrIdxT next = s.current_player_index;
            for (;;)
            {
                next = (next + 1) % s.players.size();
                Player& c = s.players[next];
                if (c.is_bankrupt) continue;
                if (c.downsized_turns_left > 0)
                {
                    --c.downsized_turns_left;
                    AddLog(s, c.id, std::format("{} is downsized and loses a turn ({} left).", c.name, c.downsized_turns_left));
                    continue;
                }
                if (c.bankrupt_turns_left > 0)
                {
                    --c.bankrupt_turns_left;
                    AddLog(s, c.id, std::format("{} is recovering from bankruptcy and loses a turn ({} left).",
                                                c.name, c.bankrupt_turns_left));
                    continue;
                }
                break;
            }

            s.current_player_index = next;
            ++s.turn_number;
            s.turn_phase = TurnPhase::RollDice;
            AddLog(s, s.Current().id, std::format("Turn {}: {}'s turn.", s.turn_number, s.Current().name));
        }

        auto DoAcceptPlayerDeal(GameState& s, PlyrIdxT buyer) -> void
        {
            CF_ASSERT(s.pending_player_deal.has_value(), "accepting without a pending deal");
            PendingPlayerDeal const deal = *s.pending_player_deal;
            PlyrIdxT const seller = IndexOf(s, deal.seller_id);

            Money const down = UpFrontCost(deal.card->deal, 1);
            resolve::BuyDeal(s, buyer, *deal.card, 1, true);
            resolve::Charge(s, buyer, deal.asking_price + down,
                            std::format("{} from {} (price ${} + down ${})", deal.card->title,
                                        s.players[seller].name, deal.asking_price, down));

            s.players[seller].cash += deal.asking_price;
            AddLog(s, deal.seller_id, std::format("Sold {} to {} for ${}.", deal.card->title,
                                                  s.players[buyer].name, deal.asking_price));

            s.pending_player_deal.reset();
            DiscardActive(s);
            s.turn_phase = TurnPhase::EndOfTurn;
            CheckCashFlowWin(s, buyer);
        }
    }

    auto StandardRules::Validate(GameState const& state, GameAction const& a) const -> CheckResult
    {
        return ValidateAction(state, a);
    }

    auto StandardRules::Apply(GameState const& state, GameAction const& a) const -> GameState
    {
        GameState s = state;
        PlyrIdxT const idx = IndexOf(s, ActorOf(a));

        std::visit([&]<typename T0>(T0 const& act)
        {
            using T = std::decay_t<T0>;
            Player& p = s.players[idx];

            if constexpr (std::is_same_v<T, RollDiceAction>)
            {
                DoRoll(s, idx, act);
            }
            else if constexpr (std::is_same_v<T, CollectPayDayAction>)
            {
                DoCollectPayDay(s, idx);
            }
            else if constexpr (std::is_same_v<T, ChooseDealTypeAction>)
            {
                DrawDeal(s, idx, act.deal_type);
            }
            else if constexpr (std::is_same_v<T, BuyAssetAction>)
            {
                DoBuy(s, idx, act);
            }
            else if constexpr (std::is_same_v<T, SkipDealAction>)
            {
                AddLog(s, p.id, std::format("Passed on {}.", ActiveDealCard(s.active_card)->title));
                DiscardActive(s);
                s.turn_phase = TurnPhase::EndOfTurn;
            }
            else if constexpr (std::is_same_v<T, SellAssetAction>)
            {
                auto const& st = std::get<StockAsset>(*resolve::FindAsset(p, act.asset_id));
                resolve::SellStock(s, idx, act.asset_id, act.shares.value_or(st.shares), *act.price);
            }
            else if constexpr (std::is_same_v<T, PayExpenseAction>)
            {
                resolve::PayDoodad(s, idx, *std::get<ActiveDoodad>(s.active_card).card);
                DiscardActive(s);
                s.turn_phase = TurnPhase::EndOfTurn;
            }
            else if constexpr (std::is_same_v<T, AcceptCharityAction>)
            {
                Money const donation = finance::TotalIncome(p) * constants::CharityPercent / 100;
                p.charity_turns_left = constants::CharityTurns;
                resolve::Charge(s, idx, donation, "Charity donation");
                AddLog(s, p.id, std::format("May roll two dice for the next {} turns.", constants::CharityTurns));
                s.turn_phase = TurnPhase::EndOfTurn;
            }
            else if constexpr (std::is_same_v<T, DeclineCharityAction>)
            {
                AddLog(s, p.id, "Declined to donate to charity.");
                s.turn_phase = TurnPhase::EndOfTurn;
            }
            else if constexpr (std::is_same_v<T, TakeLoanAction>)
            {
                finance::TakeLoan(p, act.amount);
                AddLog(s, p.id, std::format("Took a bank loan of ${} (total ${}).", act.amount, p.bank_loan_amount));
            }
            else if constexpr (std::is_same_v<T, PayOffLoanAction>)
            {
                Money const paid = act.loan_type == constants::BankLoan
                                       ? finance::PayOffBankLoan(p, act.amount)
                                       : finance::PayOffLiability(p, act.loan_type, act.amount);
                AddLog(s, p.id, std::format("Paid ${} toward {}.", paid, act.loan_type));
            }
            else if constexpr (std::is_same_v<T, EndTurnAction>)
            {
                DoEndTurn(s);
            }
            else if constexpr (std::is_same_v<T, ChooseDreamAction>)
            {
                p.dream = act.dream;
                p.in_fast_track = true;
                p.fast_track_position = 0;
                p.fast_track_cash_flow = finance::FastTrackCashFlow(p);
                AddLog(s, p.id, std::format("Chose dream \"{}\" and moved to the Fast Track with ${}/mo cash flow.",
                                            act.dream, p.fast_track_cash_flow));
            }
            else if constexpr (std::is_same_v<T, SellToMarketAction>)
            {
                resolve::SellToMarket(s, idx, act.asset_id, *std::get<ActiveMarket>(s.active_card).card);
            }
            else if constexpr (std::is_same_v<T, DeclineMarketAction>)
            {
                if (idx == s.current_player_index)
                {
                    AddLog(s, p.id, "Closed the market offer.");
                    DiscardActive(s);
                    s.turn_phase = TurnPhase::EndOfTurn;
                }
                else
                {
                    AddLog(s, p.id, "Passed on the market offer.");
                }
            }
            else if constexpr (std::is_same_v<T, DeclareBankruptcyAction>)
            {
                finance::BankruptcyOutcome const out = finance::ExecuteBankruptcy(p);
                AddLog(s, p.id, std::format("Declared bankruptcy: liquidated for ${}, lost {} stock holding(s).",
                                            out.liquidated, out.stocks_lost));
                AddLog(s, p.id, out.eliminated ? std::string{"Still cannot cover expenses and is out of the game."}
                                               : std::format("Survives and sits out {} turns.", constants::BankruptTurns));
                s.turn_phase = TurnPhase::EndOfTurn;
            }
            else if constexpr (std::is_same_v<T, OfferDealToPlayerAction>)
            {
                DealSP card = ActiveDealCard(s.active_card);
                s.pending_player_deal = PendingPlayerDeal{
                    .seller_id = p.id,
                    .buyer_id = act.target_player_id,
                    .card = card,
                    .asking_price = act.asking_price};
                AddLog(s, p.id, std::format("Offered {} to {} for ${}.", card->title, act.target_player_id,
                                            act.asking_price));
                s.turn_phase = TurnPhase::WaitingForDealResponse;
            }
            else if constexpr (std::is_same_v<T, AcceptPlayerDealAction>)
            {
                DoAcceptPlayerDeal(s, idx);
            }
            else if constexpr (std::is_same_v<T, DeclinePlayerDealAction>)
            {
                AddLog(s, p.id, std::format("Declined the offer from {}.", s.pending_player_deal->seller_id));
                s.pending_player_deal.reset();
                s.turn_phase = TurnPhase::MakeDecision;
            }
            else
            {
                static_assert(!sizeof(T), "unhandled action type");
            }
        }, a);

        return s;
    }

    auto StandardRules::Advance(GameState& s) const -> void
    {
        if (s.turn_phase == TurnPhase::GameOver) return;

        for (Player& p : s.players)
        {
            if (!p.has_escaped && !p.is_bankrupt && finance::CanEscape(p))
            {
                p.has_escaped = true;
                AddLog(s, p.id, std::format("{} escaped the Rat Race! Passive income ${} beats expenses ${}.",
                                            p.name, finance::PassiveIncome(p), finance::TotalExpenses(p)));
            }
        }

        Player const& cur = s.Current();
        if (s.turn_phase == TurnPhase::EndOfTurn && !cur.in_fast_track && !cur.is_bankrupt &&
            finance::CashFlow(cur) < 0)
        {
            AddLog(s, cur.id, std::format("Monthly cash flow is ${}; must declare bankruptcy.", finance::CashFlow(cur)));
            s.turn_phase = TurnPhase::BankruptcyDecision;
        }
    }

    auto StandardRules::ValidActions(GameState const& s) const -> std::vector<ActionType>
    {
        using AT = ActionType;
        if (s.turn_phase == TurnPhase::GameOver) return {};

        Player const& p = s.Current();
        if (p.is_bankrupt) return {AT::EndTurn};

        bool const between_moves = s.turn_phase == TurnPhase::RollDice || s.turn_phase == TurnPhase::EndOfTurn;
        if (p.has_escaped && !p.dream && between_moves) return {AT::ChooseDream};

        bool const has_stock = std::ranges::any_of(p.statement.assets, [](Asset const& a)
        {
            return std::holds_alternative<StockAsset>(a);
        });

        switch (s.turn_phase)
        {
        case TurnPhase::RollDice:
            return p.downsized_turns_left > 0 ? std::vector{AT::EndTurn} : std::vector{AT::RollDice};

        case TurnPhase::PayDayCollection:
            return {AT::CollectPayDay};

        case TurnPhase::ResolveSpace:
        {
            SpaceType const at = p.in_fast_track ? board::FastTrackSpace(p.fast_track_position).type
                                                 : board::RatRaceSpace(p.position);
            if (at == SpaceType::Deal) return {AT::ChooseDealType};
            if (at == SpaceType::Charity) return {AT::AcceptCharity, AT::DeclineCharity};
            return {};
        }

        case TurnPhase::MakeDecision:
            switch (KindOf(s.active_card))
            {
            case ActiveCardKind::SmallDeal:
            case ActiveCardKind::BigDeal:
            {
                std::vector<AT> out{AT::BuyAsset, AT::SkipDeal};
                bool const someone_else = std::ranges::any_of(s.players, [&](Player const& o)
                {
                    return o.id != p.id && !o.is_bankrupt;
                });
                if (someone_else) out.push_back(AT::OfferDealToPlayer);
                if (has_stock) out.push_back(AT::SellAsset);
                out.push_back(AT::EndTurn);
                return out;
            }
            case ActiveCardKind::Market:
            {
                std::vector<AT> out;
                MarketEffect const& e = std::get<ActiveMarket>(s.active_card).card->effect;
                bool const can_sell = std::ranges::any_of(p.statement.assets, [&](Asset const& a)
                {
                    return resolve::MarketSalePrice(a, e).has_value();
                });
                if (can_sell) out.push_back(AT::SellToMarket);
                out.push_back(AT::DeclineMarket);
                out.push_back(AT::EndTurn);
                return out;
            }
            case ActiveCardKind::Doodad:
                return {AT::PayExpense};
            case ActiveCardKind::None:
                return {AT::EndTurn};
            }
            return {};

        case TurnPhase::EndOfTurn:
        {
            std::vector<AT> out{AT::EndTurn};
            if (!p.in_fast_track)
            {
                out.push_back(AT::TakeLoan);
                out.push_back(AT::PayOffLoan);
            }
            if (has_stock) out.push_back(AT::SellAsset);
            return out;
        }

        case TurnPhase::BankruptcyDecision:
            return {AT::DeclareBankruptcy};

        case TurnPhase::WaitingForDealResponse:
            return {AT::AcceptPlayerDeal, AT::DeclinePlayerDeal};

        case TurnPhase::GameOver:
            return {};
        }
        return {};
    }
}
