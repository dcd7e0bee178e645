//
// Cards.hpp
//

#ifndef CASHFLOW_CARDS_HPP
#define CASHFLOW_CARDS_HPP

#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "Types.hpp"

namespace cashflow::core
{
    struct ProfessionCard
    {
        std::string title;
        Money salary{};
        Money taxes{};
        Money home_mortgage_payment{};
        Money home_mortgage_balance{};
        Money school_loan_payment{};
        Money school_loan_balance{};
        Money car_loan_payment{};
        Money car_loan_balance{};
        Money credit_card_payment{};
        Money credit_card_balance{};
        Money other_expenses{};
        Money per_child_expense{};
        Money savings{};
    };

    // ---- deal payloads ----

    struct StockDeal
    {
        std::string name;
        std::string symbol;
        double cost_per_share{};
        double dividend_per_share{};
        Money price_low{};
        Money price_high{};
    };

    struct RealEstateDeal
    {
        std::string name;
        RealEstateType sub_type{RealEstateType::House};
        Money cost{};
        Money mortgage{};
        Money down_payment{};
        Money cash_flow{};
    };

    struct BusinessDeal
    {
        std::string name;
        Money cost{};
        Money mortgage{};
        Money down_payment{};
        Money cash_flow{};
    };

    // ratio > 1 is a forward split, ratio < 1 a reverse split
    struct StockSplitDeal
    {
        std::string symbol;
        double ratio{2.0};
    };

    using Deal = std::variant<StockDeal, RealEstateDeal, BusinessDeal, StockSplitDeal>;

    struct DealCard
    {
        std::string id;
        std::string title;
        Deal deal;
    };

    // ---- market effects ----

    struct StockPriceChange
    {
        std::string symbol;
        Money new_price{};
    };

    struct RealEstateOffer
    {
        std::vector<RealEstateType> sub_types;
        double multiplier{1.0};
    };

    struct RealEstateOfferFlat
    {
        std::vector<RealEstateType> sub_types;
        Money amount{};
    };

    struct DamageToProperty
    {
        std::vector<RealEstateType> sub_types;
        Money cost{};
    };

    struct AllPlayersExpense
    {
        Money amount{};
    };

    using MarketEffect = std::variant<StockPriceChange, RealEstateOffer, RealEstateOfferFlat,
                                      DamageToProperty, AllPlayersExpense>;

    struct MarketCard
    {
        std::string id;
        std::string title;
        std::string description;
        MarketEffect effect;
    };

    struct DoodadCard
    {
        std::string id;
        std::string title;
        std::string description;
        Money cost{};
        // cost is a percentage of total income when set
        bool percent_of_income{false};
    };

    using ProfessionSP = std::shared_ptr<ProfessionCard const>;
    using DealSP       = std::shared_ptr<DealCard const>;
    using MarketSP     = std::shared_ptr<MarketCard const>;
    using DoodadSP     = std::shared_ptr<DoodadCard const>;

    inline auto IsStockSplit(DealCard const& c) -> bool
    {
        return std::holds_alternative<StockSplitDeal>(c.deal);
    }

    // What the buyer pays up front: cost for one lot of stock, else the down payment.
    inline auto UpFrontCost(Deal const& d, std::int64_t shares = 1) -> Money
    {
        return std::visit([&]<typename T0>(T0 const& x) -> Money
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, StockDeal>)
            {
                return static_cast<Money>(x.cost_per_share * static_cast<double>(shares));
            }
            else if constexpr (std::is_same_v<T, StockSplitDeal>)
            {
                return 0;
            }
            else
            {
                return x.down_payment;
            }
        }, d);
    }

    inline auto Matches(std::vector<RealEstateType> const& types, RealEstateType t) -> bool
    {
        for (RealEstateType const x : types)
        {
            if (x == t) return true;
        }
        return false;
    }
}

#endif //CASHFLOW_CARDS_HPP
