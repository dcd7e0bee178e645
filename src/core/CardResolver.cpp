//
// CardResolver.cpp
//

#include "CardResolver.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <type_traits>

#include "Exception.hpp"
#include "Finance.hpp"

namespace cashflow::core::resolve
{
    namespace
    {
        auto FindStockBySymbol(Player& p, std::string_view symbol) -> StockAsset*
        {
            for (Asset& a : p.statement.assets)
            {
                if (auto* st = std::get_if<StockAsset>(&a); st && st->symbol == symbol)
                {
                    return st;
                }
            }
            return nullptr;
        }

        auto EraseAsset(Player& p, AssetId const& id) -> void
        {
            std::erase_if(p.statement.assets, [&](Asset const& a) { return IdOf(a) == id; });
        }

        auto SplitLabel(double ratio) -> std::string
        {
            if (ratio >= 2.0) return std::format("Stock split! {}-for-1", static_cast<int>(ratio));
            if (ratio <= 0.5) return std::format("Reverse stock split! 1-for-{}", static_cast<int>(1.0 / ratio));
            return std::format("Stock split x{}", ratio);
        }
    }

    auto MintAssetId(GameState& s) -> AssetId
    {
        return std::format("asset-{}", s.next_asset_id++);
    }

    auto FindAsset(Player const& p, AssetId const& id) -> Asset const*
    {
        auto const& as = p.statement.assets;
        auto const it = std::ranges::find_if(as, [&](Asset const& a) { return IdOf(a) == id; });
        return it == as.end() ? nullptr : &*it;
    }

    auto Charge(GameState& s, PlyrIdxT idx, Money amount, std::string_view reason) -> Money
    {
        Player& p = s.players[idx];
        p.cash -= amount;
        AddLog(s, p.id, std::format("Paid ${}: {}", amount, reason));

        Money const borrowed = finance::ApplyForcedLoan(p);
        if (borrowed > 0)
        {
            AddLog(s, p.id, std::format("Forced bank loan of ${} (cash was negative).", borrowed));
        }
        return borrowed;
    }

    auto BuyDeal(GameState& s, PlyrIdxT idx, DealCard const& card, std::int64_t shares, bool skip_payment) -> bool
    {
        Player& p = s.players[idx];
        Money const price = UpFrontCost(card.deal, shares);

        if (!skip_payment && p.cash < price)
        {
            AddLog(s, p.id, std::format("Cannot afford {} (needs ${}, has ${}).", card.title, price, p.cash));
            return false;
        }

        Money const added_cash_flow = std::visit([&]<typename T0>(T0 const& d) -> Money
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, StockDeal>)
            {
                if (StockAsset* held = FindStockBySymbol(p, d.symbol))
                {
                    auto const total = held->shares + shares;
                    held->cost_per_share = (held->cost_per_share * static_cast<double>(held->shares) +
                                            d.cost_per_share * static_cast<double>(shares)) / static_cast<double>(total);
                    held->dividend_per_share = (held->dividend_per_share * static_cast<double>(held->shares) +
                                                d.dividend_per_share * static_cast<double>(shares)) / static_cast<double>(total);
                    held->shares = total;
                }
                else
                {
                    p.statement.assets.emplace_back(StockAsset{
                        .id = MintAssetId(s), .name = d.name, .symbol = d.symbol, .shares = shares,
                        .cost_per_share = d.cost_per_share, .dividend_per_share = d.dividend_per_share});
                }
                return static_cast<Money>(std::floor(static_cast<double>(shares) * d.dividend_per_share));
            }
            else if constexpr (std::is_same_v<T, RealEstateDeal>)
            {
                p.statement.assets.emplace_back(RealEstateAsset{
                    .id = MintAssetId(s), .name = d.name, .sub_type = d.sub_type, .cost = d.cost,
                    .mortgage = d.mortgage, .down_payment = d.down_payment, .cash_flow = d.cash_flow});
                return d.cash_flow;
            }
            else if constexpr (std::is_same_v<T, BusinessDeal>)
            {
                p.statement.assets.emplace_back(BusinessAsset{
                    .id = MintAssetId(s), .name = d.name, .cost = d.cost,
                    .mortgage = d.mortgage, .down_payment = d.down_payment, .cash_flow = d.cash_flow});
                return d.cash_flow;
            }
            else
            {
                CF_THROW(error::Code::Rules, "a stock split cannot be bought");
            }
        }, card.deal);

        if (!skip_payment)
        {
            p.cash -= price;
        }
        if (p.in_fast_track)
        {
            p.fast_track_cash_flow += added_cash_flow * constants::FastTrackMultiple;
        }

        if (skip_payment)
        {
            AddLog(s, p.id, std::format("Acquired {}.", card.title));
        }
        else if (std::holds_alternative<StockDeal>(card.deal))
        {
            AddLog(s, p.id, std::format("Bought {} shares of {} for ${}.", shares,
                                        std::get<StockDeal>(card.deal).symbol, price));
        }
        else
        {
            AddLog(s, p.id, std::format("Bought {} for ${}.", card.title, price));
        }
        return true;
    }

    auto MarketSalePrice(Asset const& a, MarketEffect const& effect) -> std::optional<Money>
    {
        return std::visit([&]<typename E0>(E0 const& e) -> std::optional<Money>
        {
            using E = std::decay_t<E0>;
            if constexpr (std::is_same_v<E, StockPriceChange>)
            {
                auto const* st = std::get_if<StockAsset>(&a);
                if (st == nullptr || st->symbol != e.symbol) return std::nullopt;
                return e.new_price * st->shares;
            }
            else if constexpr (std::is_same_v<E, RealEstateOffer> || std::is_same_v<E, RealEstateOfferFlat>)
            {
                auto const* re = std::get_if<RealEstateAsset>(&a);
                if (re == nullptr || !Matches(e.sub_types, re->sub_type)) return std::nullopt;
                if constexpr (std::is_same_v<E, RealEstateOffer>)
                {
                    return static_cast<Money>(std::floor(static_cast<double>(re->cost) * e.multiplier));
                }
                else
                {
                    return e.amount;
                }
            }
            else
            {
                return std::nullopt;
            }
        }, effect);
    }

    auto ApplyMarket(GameState& s, MarketCard const& card) -> bool
    {
        return std::visit([&]<typename E0>(E0 const& e) -> bool
        {
            using E = std::decay_t<E0>;
            if constexpr (std::is_same_v<E, DamageToProperty>)
            {
                for (PlyrIdxT i = 0; i < s.players.size(); ++i)
                {
                    bool const hit = std::ranges::any_of(s.players[i].statement.assets, [&](Asset const& a)
                    {
                        auto const* re = std::get_if<RealEstateAsset>(&a);
                        return re != nullptr && Matches(e.sub_types, re->sub_type);
                    });
                    if (hit)
                    {
                        Charge(s, i, e.cost, std::format("property damage ({})", card.title));
                    }
                }
                return false;
            }
            else if constexpr (std::is_same_v<E, AllPlayersExpense>)
            {
                for (PlyrIdxT i = 0; i < s.players.size(); ++i)
                {
                    if (!s.players[i].is_bankrupt)
                    {
                        Charge(s, i, e.amount, card.title);
                    }
                }
                return false;
            }
            else
            {
                AddLog(s, s.Current().id, std::format("Market: {}", card.title));
                return true;
            }
        }, card.effect);
    }

    auto SellToMarket(GameState& s, PlyrIdxT idx, AssetId const& id, MarketCard const& card) -> Money
    {
        Player& p = s.players[idx];
        Asset const* a = FindAsset(p, id);
        CF_ASSERT(a != nullptr, "selling an asset the player does not own");

        std::optional<Money> const price = MarketSalePrice(*a, card.effect);
        CF_ASSERT(price.has_value(), "market card does not apply to this asset");

        Money proceeds = *price;
        std::string what;
        if (auto const* re = std::get_if<RealEstateAsset>(a))
        {
            // the mortgage is forgiven on sale; only the equity is paid out
            proceeds -= re->mortgage;
            what = re->name;
        }
        else
        {
            auto const& st = std::get<StockAsset>(*a);
            what = std::format("{} shares of {}", st.shares, st.symbol);
        }

        EraseAsset(p, id);
        p.cash += proceeds;
        AddLog(s, p.id, std::format("Sold {} to the market for ${} (net ${}).", what, *price, proceeds));

        if (Money const borrowed = finance::ApplyForcedLoan(p); borrowed > 0)
        {
            AddLog(s, p.id, std::format("Forced bank loan of ${} (cash was negative).", borrowed));
        }
        return proceeds;
    }

    auto SellStock(GameState& s, PlyrIdxT idx, AssetId const& id, std::int64_t shares, Money price) -> Money
    {
        Player& p = s.players[idx];
        auto& as = p.statement.assets;
        auto const it = std::ranges::find_if(as, [&](Asset const& a) { return IdOf(a) == id; });
        CF_ASSERT(it != as.end(), "selling a stock the player does not own");

        auto& st = std::get<StockAsset>(*it);
        CF_ASSERT(shares > 0 && shares <= st.shares, "share count out of range");

        Money const proceeds = price * shares;
        std::string const symbol = st.symbol;
        st.shares -= shares;
        if (st.shares == 0)
        {
            as.erase(it);
        }
        p.cash += proceeds;
        AddLog(s, p.id, std::format("Sold {} shares of {} at ${} for ${}.", shares, symbol, price, proceeds));
        return proceeds;
    }

    auto ApplyStockSplit(GameState& s, StockSplitDeal const& split) -> void
    {
        CF_ASSERT(split.ratio > 0.0, "split ratio must be positive");

        for (Player& p : s.players)
        {
            for (Asset& a : p.statement.assets)
            {
                auto* st = std::get_if<StockAsset>(&a);
                if (st == nullptr || st->symbol != split.symbol) continue;

                st->shares = static_cast<std::int64_t>(std::floor(static_cast<double>(st->shares) * split.ratio));
                st->cost_per_share /= split.ratio;
                st->dividend_per_share /= split.ratio;
            }
            std::erase_if(p.statement.assets, [&](Asset const& a)
            {
                auto const* st = std::get_if<StockAsset>(&a);
                return st != nullptr && st->symbol == split.symbol && st->shares <= 0;
            });
        }
        AddLog(s, s.Current().id, std::format("{} ({})", SplitLabel(split.ratio), split.symbol));
    }

    auto DoodadCost(Player const& p, DoodadCard const& card) -> Money
    {
        if (card.percent_of_income)
        {
            return finance::TotalIncome(p) * card.cost / 100;
        }
        return card.cost;
    }

    auto PayDoodad(GameState& s, PlyrIdxT idx, DoodadCard const& card) -> Money
    {
        Money const cost = DoodadCost(s.players[idx], card);
        Charge(s, idx, cost, card.title);
        return cost;
    }

    auto ApplyFastTrackPenalty(GameState& s, PlyrIdxT idx, SpaceType space) -> void
    {
        Player& p = s.players[idx];
        switch (space)
        {
        case SpaceType::Tax:
            Charge(s, idx, p.fast_track_cash_flow / 2, "Fast Track tax");
            return;
        case SpaceType::Lawsuit:
            Charge(s, idx, p.cash / 2, "Lawsuit");
            return;
        case SpaceType::Divorce:
        {
            Money const lost_flow = p.fast_track_cash_flow / 2;
            p.fast_track_cash_flow -= lost_flow;
            Charge(s, idx, s.players[idx].cash / 2, "Divorce settlement");
            AddLog(s, s.players[idx].id, std::format("Divorce halves cash flow to ${}.", s.players[idx].fast_track_cash_flow));
            return;
        }
        default:
            CF_THROW(error::Code::Rules, std::format("{} is not a fast track penalty", to_string(space)));
        }
    }
}
