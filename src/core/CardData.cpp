//
// CardData.cpp
//

#include "CardData.hpp"

#include <algorithm>
#include <format>
#include <string>

namespace cashflow::core::data
{
    namespace
    {
        using enum RealEstateType;

        auto prof(std::string title, Money salary, Money taxes,
                  Money mort_pay, Money mort_bal, Money school_pay, Money school_bal,
                  Money car_pay, Money car_bal, Money card_pay, Money card_bal,
                  Money other, Money per_child, Money savings) -> ProfessionSP
        {
            return std::make_shared<ProfessionCard const>(ProfessionCard{
                .title                 = std::move(title),
                .salary                = salary,
                .taxes                 = taxes,
                .home_mortgage_payment = mort_pay,
                .home_mortgage_balance = mort_bal,
                .school_loan_payment   = school_pay,
                .school_loan_balance   = school_bal,
                .car_loan_payment      = car_pay,
                .car_loan_balance      = car_bal,
                .credit_card_payment   = card_pay,
                .credit_card_balance   = card_bal,
                .other_expenses        = other,
                .per_child_expense     = per_child,
                .savings               = savings
            });
        }

        // card ids are "<prefix>-<n>" in table order
        class DealTable
        {
        public:
            explicit DealTable(char const* prefix) : prefix_{prefix} {}

            auto stock(std::string title, std::string symbol, double cost, double dividend,
                       Money low, Money high) -> DealTable&
            {
                return add(std::move(title), StockDeal{
                    .name = symbol, .symbol = symbol, .cost_per_share = cost,
                    .dividend_per_share = dividend, .price_low = low, .price_high = high});
            }

            auto split(std::string title, std::string symbol, double ratio) -> DealTable&
            {
                return add(std::move(title), StockSplitDeal{.symbol = std::move(symbol), .ratio = ratio});
            }

            auto estate(std::string title, RealEstateType sub, Money cost, Money mortgage, Money down,
                        Money cash_flow) -> DealTable&
            {
                std::string name = title;
                return add(std::move(title), RealEstateDeal{
                    .name = std::move(name), .sub_type = sub, .cost = cost, .mortgage = mortgage,
                    .down_payment = down, .cash_flow = cash_flow});
            }

            auto business(std::string title, Money cost, Money mortgage, Money down, Money cash_flow) -> DealTable&
            {
                std::string name = title;
                return add(std::move(title), BusinessDeal{
                    .name = std::move(name), .cost = cost, .mortgage = mortgage,
                    .down_payment = down, .cash_flow = cash_flow});
            }

            auto take() -> std::vector<DealSP> { return std::move(cards_); }

        private:
            auto add(std::string title, Deal deal) -> DealTable&
            {
                cards_.push_back(std::make_shared<DealCard const>(DealCard{
                    .id = std::format("{}-{}", prefix_, cards_.size() + 1),
                    .title = std::move(title),
                    .deal = std::move(deal)}));
                return *this;
            }

            char const* prefix_;
            std::vector<DealSP> cards_;
        };

        auto market(int n, std::string title, std::string description, MarketEffect effect) -> MarketSP
        {
            return std::make_shared<MarketCard const>(MarketCard{
                .id = std::format("mk-{}", n),
                .title = std::move(title),
                .description = std::move(description),
                .effect = std::move(effect)});
        }

        auto doodad(int n, std::string title, std::string description, Money cost, bool percent = false) -> DoodadSP
        {
            return std::make_shared<DoodadCard const>(DoodadCard{
                .id = std::format("dd-{}", n),
                .title = std::move(title),
                .description = std::move(description),
                .cost = cost,
                .percent_of_income = percent});
        }
    }

    auto Professions() -> std::vector<ProfessionSP> const&
    {
        //                                   salary  taxes  mortgage        school         car           card         other child savings
        static std::vector<ProfessionSP> const table{
            prof("Teacher",                   3300,   630,  500,  50000,   60, 12000,  100,  5000,  90,  3000,   760, 180,  400),
            prof("Janitor",                   1600,   280,  200,  20000,    0,     0,   60,  4000,  60,  2000,   300,  70,  560),
            prof("Engineer",                  4900,  1050,  700,  75000,   60, 12000,  140,  7000, 120,  4000,  1090, 250,  400),
            prof("Doctor",                   13200,  3420, 1900, 202000,  750,150000,  380, 19000, 270,  9000,  2880, 640,  400),
            prof("Lawyer",                    7500,  1830, 1100, 115000,  390, 78000,  220, 11000, 180,  6000,  1650, 380,  400),
            prof("Nurse",                     3100,   600,  400,  47000,   30,  6000,  100,  5000,  90,  3000,   710, 170,  480),
            prof("Police Officer",            3000,   580,  400,  46000,    0,     0,  100,  5000,  60,  2000,   690, 160,  520),
            prof("Secretary",                 2500,   460,  400,  38000,    0,     0,   80,  4000,  60,  2000,   570, 140,  710),
            prof("Truck Driver",              2500,   460,  400,  38000,    0,     0,   80,  4000,  60,  2000,   570, 140,  750),
            prof("Mechanic",                  2000,   360,  300,  31000,    0,     0,   60,  3000,  60,  2000,   450, 110,  670),
            prof("Airline Pilot",             9500,  2350, 1330, 143000,    0,     0,  300, 15000, 660, 22000,  2210, 480,  400),
            prof("Business Manager",          4600,   910,  700,  75000,   60, 12000,  120,  6000,  90,  3000,  1000, 240,  400),
        };
        return table;
    }

    auto SmallDeals() -> std::vector<DealSP> const&
    {
        static std::vector<DealSP> const table = DealTable{"sd"}
            .stock("ON2U Stock - Low Price", "ON2U", 1, 0, 1, 30)
            .stock("ON2U Stock", "ON2U", 5, 0, 5, 30)
            .stock("ON2U Stock", "ON2U", 10, 0, 5, 30)
            .stock("ON2U Stock - High Price", "ON2U", 20, 0, 5, 30)
            .stock("MYT4U Stock", "MYT4U", 5, 0, 5, 30)
            .stock("MYT4U Stock", "MYT4U", 10, 0, 5, 30)
            .stock("MYT4U Stock", "MYT4U", 20, 0, 5, 30)
            .stock("MYT4U Stock - High Price", "MYT4U", 30, 0, 5, 30)
            .stock("OK4U Drug Co. - Low Price", "OK4U", 1, 0, 1, 40)
            .stock("OK4U Drug Co.", "OK4U", 5, 0, 1, 40)
            .stock("OK4U Drug Co.", "OK4U", 10, 0, 1, 40)
            .stock("OK4U Drug Co. - High Price", "OK4U", 30, 0, 1, 40)
            .stock("GRO4US Fund", "GRO4US", 5, 0.1, 5, 50)
            .stock("GRO4US Fund", "GRO4US", 10, 0.2, 5, 50)
            .stock("GRO4US Fund", "GRO4US", 20, 0.4, 5, 50)
            .stock("GRO4US Fund - High Price", "GRO4US", 40, 0.8, 5, 50)
            .split("ON2U Stock Split", "ON2U", 2.0)
            .split("MYT4U Stock Split", "MYT4U", 2.0)
            .split("OK4U Reverse Split", "OK4U", 0.5)
            .split("GRO4US Reverse Split", "GRO4US", 0.5)
            .estate("3Br/2Ba House for Sale", House, 65000, 60000, 5000, 160)
            .estate("3Br/2Ba House - Motivated Seller", House, 50000, 47000, 3000, 100)
            .estate("House Foreclosure", House, 35000, 33000, 2000, 220)
            .estate("2Br/1Ba Condo for Sale", Condo, 40000, 35000, 5000, 140)
            .estate("2Br/1Ba Condo - Estate Sale", Condo, 50000, 46000, 4000, 100)
            .estate("Duplex for Sale", Duplex, 55000, 50000, 5000, 180)
            .estate("10 Acres Raw Land", Land, 5000, 0, 5000, 0)
            .estate("20 Acres Raw Land", Land, 10000, 0, 10000, 0)
            .business("Part-Time Software Business", 5000, 0, 5000, 100)
            .business("Vending Machine Route", 3000, 0, 3000, 90)
            .take();
        return table;
    }

    auto BigDeals() -> std::vector<DealSP> const&
    {
        static std::vector<DealSP> const table = DealTable{"bd"}
            .estate("4-plex for Sale", Fourplex, 80000, 64000, 16000, 400)
            .estate("4-plex - Owner Retiring", Fourplex, 100000, 80000, 20000, 500)
            .estate("4-plex in Good Neighborhood", Fourplex, 120000, 96000, 24000, 800)
            .estate("8-plex for Sale", Eightplex, 160000, 128000, 32000, 1000)
            .estate("8-plex - Bank Owned", Eightplex, 200000, 160000, 40000, 1700)
            .estate("12-Unit Apartment Complex", Apartment, 350000, 310000, 40000, 2400)
            .estate("24-Unit Apartment Complex", Apartment, 575000, 500000, 75000, 3400)
            .estate("Duplex - Great Location", Duplex, 60000, 50000, 10000, 320)
            .estate("Duplex - Needs Work", Duplex, 45000, 38000, 7000, 240)
            .estate("3Br/2Ba House with Pool", House, 125000, 110000, 15000, 500)
            .estate("3Br/2Ba House - Lake View", House, 100000, 90000, 10000, 300)
            .estate("Strip Mall", Commercial, 220000, 180000, 40000, 1500)
            .estate("Office Building", Commercial, 300000, 240000, 60000, 2200)
            .estate("40 Acres Zoned Land", Land, 30000, 0, 30000, 0)
            .business("Pizza Franchise", 500000, 400000, 100000, 5000)
            .business("Car Wash", 350000, 225000, 125000, 1800)
            .business("Laundromat", 150000, 110000, 40000, 1200)
            .business("Bed & Breakfast", 400000, 320000, 80000, 3000)
            .business("Sandwich Shop Partnership", 30000, 0, 30000, 1000)
            .business("Mini Storage Facility", 200000, 150000, 50000, 2000)
            .business("Dry Cleaning Business", 120000, 100000, 20000, 800)
            .business("Auto Parts Franchise", 150000, 100000, 50000, 2200)
            .business("Coin-Op Arcade", 80000, 60000, 20000, 900)
            .business("Medical Billing Company", 250000, 200000, 50000, 2500)
            .take();
        return table;
    }

    auto MarketCards() -> std::vector<MarketSP> const&
    {
        static std::vector<MarketSP> const table{
            market(1, "ON2U Skyrockets!", "ON2U receives FDA approval for new drug. Stock soars to $20 per share!",
                   StockPriceChange{"ON2U", 20}),
            market(2, "MYT4U Crashes!", "MYT4U caught in accounting scandal. Stock drops to $0!",
                   StockPriceChange{"MYT4U", 0}),
            market(3, "OK4U Surges", "OK4U announces blockbuster drug. Stock jumps to $40 per share!",
                   StockPriceChange{"OK4U", 40}),
            market(4, "GRO4US Rises", "GRO4US reports record quarterly earnings. Stock reaches $50 per share.",
                   StockPriceChange{"GRO4US", 50}),
            market(5, "ON2U Bankrupt!", "ON2U fails clinical trial and files for bankruptcy. Stock goes to $0.",
                   StockPriceChange{"ON2U", 0}),
            market(6, "CHEAP2GT Gold Strike!", "CHEAP2GT discovers major gold deposit. Stock jumps to $15 per share!",
                   StockPriceChange{"CHEAP2GT", 15}),
            market(7, "TOYRU Product Recall", "TOYRU issues massive product recall. Stock drops to $1 per share.",
                   StockPriceChange{"TOYRU", 1}),
            market(8, "FRYK Expansion News", "FRYK announces international expansion plans. Stock climbs to $35 per share.",
                   StockPriceChange{"FRYK", 35}),
            market(9, "SLRP Contract Win", "SLRP lands exclusive contract with major automaker. Stock reaches $55.",
                   StockPriceChange{"SLRP", 55}),
            market(10, "TOYRU Goes Viral!", "TOYRU product becomes viral sensation. Stock shoots to $30 per share.",
                   StockPriceChange{"TOYRU", 30}),
            market(11, "Housing Boom!", "Hot housing market! Buyer will pay 2x the original cost for any house you own.",
                   RealEstateOffer{{House}, 2.0}),
            market(12, "Condo Market Heats Up", "Investor wants to buy condos. Offering 1.5x original cost for any condo.",
                   RealEstateOffer{{Condo}, 1.5}),
            market(13, "Apartment Complex Buyer", "REIT is buying apartment complexes. Offering 1.8x original cost.",
                   RealEstateOffer{{Apartment, Eightplex, Fourplex}, 1.8}),
            market(14, "Commercial Real Estate Boom", "Foreign investor buying commercial properties. Paying 2x original cost.",
                   RealEstateOffer{{Commercial}, 2.0}),
            market(15, "Land Developer Offer", "Developer wants your vacant land for a new subdivision. Offering $250,000.",
                   RealEstateOfferFlat{{Land}, 250000}),
            market(16, "Duplex Buyer", "Investor looking for duplexes. Offering 1.5x original cost for any duplex.",
                   RealEstateOffer{{Duplex}, 1.5}),
            market(17, "Tornado Damage!", "Tornado hits the area! If you own a house or duplex, pay $5,000 for repairs.",
                   DamageToProperty{{House, Duplex}, 5000}),
            market(18, "Roof Damage - Apartments", "Major hailstorm! If you own an apartment building, pay $10,000 for roof repairs.",
                   DamageToProperty{{Apartment, Eightplex, Fourplex}, 10000}),
            market(19, "Tax Increase", "City passes new tax levy. All players pay $500.",
                   AllPlayersExpense{500}),
            market(20, "Insurance Premium Hike", "Insurance rates go up across the board. All players pay $1,000.",
                   AllPlayersExpense{1000}),
            market(21, "Utility Rate Increase", "Electric company raises rates. All players pay $300.",
                   AllPlayersExpense{300}),
            market(22, "GRO4US Dips", "GRO4US faces supply chain issues. Stock drops to $15 per share.",
                   StockPriceChange{"GRO4US", 15}),
            market(23, "Plumbing Emergency", "Burst pipes! If you own any condo, pay $3,000 for plumbing repairs.",
                   DamageToProperty{{Condo}, 3000}),
            market(24, "House Buyer Frenzy", "Relocating company buying houses for employees. Offering $100,000 for any house.",
                   RealEstateOfferFlat{{House}, 100000}),
            market(25, "FRYK Health Scare", "Health department investigation at FRYK locations. Stock drops to $5.",
                   StockPriceChange{"FRYK", 5}),
        };
        return table;
    }

    auto Doodads() -> std::vector<DoodadSP> const&
    {
        static std::vector<DoodadSP> const table{
            doodad(1, "New Golf Clubs", "You buy a new set of golf clubs.", 220),
            doodad(2, "Dinner Out", "Fancy dinner with friends.", 80),
            doodad(3, "Big Screen TV", "You could not resist the sale.", 1500),
            doodad(4, "Boat Repairs", "Your weekend boat needs a new motor.", 1000),
            doodad(5, "Car Repairs", "Your car needs new brakes.", 300),
            doodad(6, "Birthday Party", "Throw a party for your best friend.", 300),
            doodad(7, "Visit the Dentist", "Two cavities and a cleaning.", 200),
            doodad(8, "Concert Tickets", "Front row seats.", 110),
            doodad(9, "New Coffee Maker", "The old one finally died.", 150),
            doodad(10, "New Phone", "The latest model.", 400),
            doodad(11, "Kids' Summer Camp", "Two weeks by the lake.", 700),
            doodad(12, "Tennis Racquet", "Buy a new tennis racquet.", 200),
            doodad(13, "Family Vacation", "A week at the beach.", 2000),
            doodad(14, "Gym Membership", "Annual fee due.", 320),
            doodad(15, "Home Repairs", "The roof is leaking.", 1000),
            doodad(16, "Anniversary Jewelry", "Buy jewelry for your anniversary.", 1200),
            doodad(17, "Charity Gala", "Attend a black-tie fundraiser. Pay 5% of your total income.", 5, true),
            doodad(18, "Tax Audit", "The tax office finds a mistake. Pay 10% of your total income.", 10, true),
            doodad(19, "Holiday Gifts", "Gifts for the whole family. Pay 5% of your total income.", 5, true),
            doodad(20, "Shopping Spree", "Retail therapy. Pay 15% of your total income.", 15, true),
        };
        return table;
    }

    auto FindProfession(std::string_view title) -> ProfessionSP
    {
        auto const& ps = Professions();
        auto const it = std::ranges::find_if(ps, [&](ProfessionSP const& p) { return p->title == title; });
        return it == ps.end() ? nullptr : *it;
    }

    namespace
    {
        template <typename T>
        auto FindById(std::vector<std::shared_ptr<T const>> const& cards, std::string_view id) -> std::shared_ptr<T const>
        {
            auto const it = std::ranges::find_if(cards, [&](auto const& c) { return c->id == id; });
            return it == cards.end() ? nullptr : *it;
        }
    }

    auto FindDeal(std::string_view id) -> DealSP
    {
        if (DealSP small = FindById(SmallDeals(), id)) return small;
        return FindById(BigDeals(), id);
    }

    auto FindMarket(std::string_view id) -> MarketSP
    {
        return FindById(MarketCards(), id);
    }

    auto FindDoodad(std::string_view id) -> DoodadSP
    {
        return FindById(Doodads(), id);
    }
}
