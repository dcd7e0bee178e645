//
// Exception.hpp
//

#ifndef CASHFLOW_EXCEPTION_HPP
#define CASHFLOW_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace cashflow::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not a player's invalid move)
        State, // state corrupted or built inconsistently
        InvalidAction, // action could not be applied at all
        Network, // transport failure
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define CF_THROW(code_enum, msg) ::cashflow::core::error::fail((code_enum), (msg))
#define CF_ASSERT(cond, msg) do { if(!(cond)) ::cashflow::core::error::fail(::cashflow::core::error::Code::Assertion, (msg)); } while(0)

    // Why a proposed action was refused. Grouped roughly by action.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        GameOver,
        PlayerNotFound,
        NotYourTurn,
        PlayerBankrupt,
        WrongPhase,

        // Dice / pay day
        Roll_InvalidDice,
        Roll_MustSkipTurn,
        PayDay_NothingToCollect,

        // Space choices
        Space_NotDeal,
        Space_NotCharity,

        // Deals
        Deal_NoActiveDeal,
        Deal_StockSplitNotBuyable,
        Deal_InvalidShareCount,
        Deal_CannotAfford,
        Deal_TooManyShares,

        // Direct sales
        Sell_AssetNotFound,
        Sell_NotAStock,
        Sell_NegativePrice,
        Sell_PriceRequired,
        Sell_TooManyShares,
        Sell_PriceTooHigh,

        // Doodad
        Expense_NothingToPay,

        // Loans
        Loan_InvalidAmount,
        Loan_ExceedsMaximum,
        Loan_FastTrack,
        Loan_InsufficientCash,
        Loan_NotFound,
        Loan_ExceedsBalance,

        // End turn
        EndTurn_DoodadOutstanding,

        // Dream
        Dream_NotEscaped,
        Dream_AlreadyChosen,
        Dream_Unknown,

        // Market
        Market_NoActiveCard,
        Market_NotAnOffer,
        Market_AssetMismatch,

        // Player-to-player
        Offer_InvalidPrice,
        Offer_PriceTooHigh,
        Offer_SelfTarget,
        Offer_TargetNotFound,
        Offer_TargetBankrupt,
        Offer_NoPendingDeal,
        Offer_NotRecipient,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<TurnPhase> phase{};
        std::optional<ActionType> action{};
        std::optional<PlayerId> actor{};
        std::optional<PlayerId> target{};
        std::optional<Money> amount{};
        std::optional<Money> limit{};

        auto with_phase(TurnPhase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_action(ActionType a) -> RuleViolation&
        {
            action = a;
            return *this;
        }

        auto with_actor(PlayerId id) -> RuleViolation&
        {
            actor = std::move(id);
            return *this;
        }

        auto with_target(PlayerId id) -> RuleViolation&
        {
            target = std::move(id);
            return *this;
        }

        auto with_amount(Money v) -> RuleViolation&
        {
            amount = v;
            return *this;
        }

        auto with_limit(Money v) -> RuleViolation&
        {
            limit = v;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::GameOver: return "Game is over";
        case E::PlayerNotFound: return "Player not found";
        case E::NotYourTurn: return "Not your turn";
        case E::PlayerBankrupt: return "Bankrupt players can only end their turn";
        case E::WrongPhase: return "Action not allowed in the current phase";

        case E::Roll_InvalidDice: return "Each die value must be an integer between 1 and 6";
        case E::Roll_MustSkipTurn: return "Downsized players must end their turn without rolling";
        case E::PayDay_NothingToCollect: return "No PayDay left to collect";

        case E::Space_NotDeal: return "Not on a Deal space";
        case E::Space_NotCharity: return "Not on a Charity space";

        case E::Deal_NoActiveDeal: return "No deal card to act on";
        case E::Deal_StockSplitNotBuyable: return "A stock split cannot be bought or offered";
        case E::Deal_InvalidShareCount: return "Share count must be at least 1";
        case E::Deal_CannotAfford: return "Cannot afford this deal";
        case E::Deal_TooManyShares: return "Share count is too large";

        case E::Sell_AssetNotFound: return "Asset not found";
        case E::Sell_NotAStock: return "Only stocks can be sold directly";
        case E::Sell_NegativePrice: return "Sale price cannot be negative";
        case E::Sell_PriceRequired: return "A sale price is required";
        case E::Sell_TooManyShares: return "Not enough shares to sell";
        case E::Sell_PriceTooHigh: return "Sale price is too high";

        case E::Expense_NothingToPay: return "No expense to pay";

        case E::Loan_InvalidAmount: return "Loan amount must be a positive multiple of $1,000";
        case E::Loan_ExceedsMaximum: return "Loan amount exceeds maximum affordable loan";
        case E::Loan_FastTrack: return "Loans are not available on the Fast Track";
        case E::Loan_InsufficientCash: return "Insufficient cash";
        case E::Loan_NotFound: return "No such loan";
        case E::Loan_ExceedsBalance: return "Payment exceeds loan balance";

        case E::EndTurn_DoodadOutstanding: return "Must pay doodad expense before ending turn";

        case E::Dream_NotEscaped: return "Must escape the Rat Race before choosing a dream";
        case E::Dream_AlreadyChosen: return "Dream already chosen";
        case E::Dream_Unknown: return "Unknown dream";

        case E::Market_NoActiveCard: return "No market card to act on";
        case E::Market_NotAnOffer: return "This market card is not an offer";
        case E::Market_AssetMismatch: return "Asset does not match the market offer";

        case E::Offer_InvalidPrice: return "Asking price must be greater than 0";
        case E::Offer_PriceTooHigh: return "Asking price is too high";
        case E::Offer_SelfTarget: return "Cannot sell to yourself";
        case E::Offer_TargetNotFound: return "Target player not found";
        case E::Offer_TargetBankrupt: return "Cannot sell to a bankrupt player";
        case E::Offer_NoPendingDeal: return "No pending deal";
        case E::Offer_NotRecipient: return "You are not the deal recipient";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.action) s += std::format(" | action={}", to_string(*v.action));
        if (v.phase) s += std::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += std::format(" | actor={}", *v.actor);
        if (v.target) s += std::format(" | target={}", *v.target);
        if (v.amount) s += std::format(" | amount={}", *v.amount);
        if (v.limit) s += std::format(" | limit={}", *v.limit);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;

    inline auto Viol(RuleViolationCode c) -> RuleViolation
    {
        return RuleViolation{.code = c};
    }
}

#endif //CASHFLOW_EXCEPTION_HPP
