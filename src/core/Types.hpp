//
// Types.hpp
//

#ifndef CASHFLOW_TYPES_HPP
#define CASHFLOW_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace cashflow::core
{
    using Money    = std::int64_t;
    using PlayerId = std::string;
    using AssetId  = std::string;
    using PlyrIdxT = std::size_t;

    namespace constants
    {
        inline constexpr std::size_t RatRaceSize   = 24;
        inline constexpr std::size_t FastTrackSize = 18;

        inline constexpr Money LoanIncrement     = 1000;
        inline constexpr int   MaxChildren       = 3;
        inline constexpr int   DownsizedTurns    = 2;
        inline constexpr int   BankruptTurns     = 2;
        inline constexpr int   CharityTurns      = 3;
        inline constexpr Money CharityPercent    = 10;
        inline constexpr Money FastTrackMultiple = 100;

        // Ceilings on client-supplied numbers; keeps every product and sum within Money.
        inline constexpr std::int64_t MaxShareLot = 1'000'000'000;
        inline constexpr Money        MaxPrice    = 1'000'000'000'000;

        inline constexpr std::string_view BankLoan     = "Bank Loan";
        inline constexpr std::string_view HomeMortgage = "Home Mortgage";
        inline constexpr std::string_view SchoolLoan   = "School Loan";
        inline constexpr std::string_view CarLoan      = "Car Loan";
        inline constexpr std::string_view CreditCard   = "Credit Card";
    }

    enum class TurnPhase : std::uint8_t
    {
        RollDice,
        PayDayCollection,
        ResolveSpace,
        MakeDecision,
        EndOfTurn,
        GameOver,
        BankruptcyDecision,
        WaitingForDealResponse
    };

    inline auto to_string(TurnPhase p) -> std::string_view
    {
        switch (p)
        {
        case TurnPhase::RollDice: return "ROLL_DICE";
        case TurnPhase::PayDayCollection: return "PAY_DAY_COLLECTION";
        case TurnPhase::ResolveSpace: return "RESOLVE_SPACE";
        case TurnPhase::MakeDecision: return "MAKE_DECISION";
        case TurnPhase::EndOfTurn: return "END_OF_TURN";
        case TurnPhase::GameOver: return "GAME_OVER";
        case TurnPhase::BankruptcyDecision: return "BANKRUPTCY_DECISION";
        case TurnPhase::WaitingForDealResponse: return "WAITING_FOR_DEAL_RESPONSE";
        }
        return "?";
    }

    enum class SpaceType : std::uint8_t
    {
        // rat race
        Deal,
        PayDay,
        Market,
        Doodad,
        Charity,
        Baby,
        Downsized,
        // fast track
        CashFlowDay,
        Dream,
        BusinessDeal,
        Tax,
        Lawsuit,
        Divorce
    };

    inline auto to_string(SpaceType s) -> std::string_view
    {
        switch (s)
        {
        case SpaceType::Deal: return "Deal";
        case SpaceType::PayDay: return "PayDay";
        case SpaceType::Market: return "Market";
        case SpaceType::Doodad: return "Doodad";
        case SpaceType::Charity: return "Charity";
        case SpaceType::Baby: return "Baby";
        case SpaceType::Downsized: return "Downsized";
        case SpaceType::CashFlowDay: return "CashFlowDay";
        case SpaceType::Dream: return "Dream";
        case SpaceType::BusinessDeal: return "BusinessDeal";
        case SpaceType::Tax: return "Tax";
        case SpaceType::Lawsuit: return "Lawsuit";
        case SpaceType::Divorce: return "Divorce";
        }
        return "?";
    }

    enum class RealEstateType : std::uint8_t
    {
        House,
        Condo,
        Apartment,
        Duplex,
        Fourplex,
        Eightplex,
        Land,
        Commercial
    };

    inline auto to_string(RealEstateType t) -> std::string_view
    {
        switch (t)
        {
        case RealEstateType::House: return "house";
        case RealEstateType::Condo: return "condo";
        case RealEstateType::Apartment: return "apartment";
        case RealEstateType::Duplex: return "duplex";
        case RealEstateType::Fourplex: return "fourplex";
        case RealEstateType::Eightplex: return "eightplex";
        case RealEstateType::Land: return "land";
        case RealEstateType::Commercial: return "commercial";
        }
        return "?";
    }

    enum class DealSize : std::uint8_t
    {
        Small,
        Big
    };

    using Dice = std::array<int, 2>;

    struct Config
    {
        std::uint64_t seed{0xC0FFEEULL};
        Money fast_track_win_cash_flow{50'000};
        std::size_t starting_position{0};
    };
}

#endif //CASHFLOW_TYPES_HPP
