//
// Finance.hpp
//

#ifndef CASHFLOW_FINANCE_HPP
#define CASHFLOW_FINANCE_HPP

#include <string_view>

#include "Types.hpp"
#include "Cards.hpp"
#include "State.hpp"

namespace cashflow::core::finance
{
    // ---- derived figures; nothing here is ever stored on the player ----

    auto PassiveIncome(Player const& p) -> Money;
    auto TotalIncome(Player const& p) -> Money;
    auto BankLoanPayment(Money loan) -> Money;
    auto TotalExpenses(Player const& p) -> Money;
    auto CashFlow(Player const& p) -> Money;
    auto CanEscape(Player const& p) -> bool;
    auto FastTrackCashFlow(Player const& p) -> Money;

    // Largest multiple of $1,000 that still leaves monthly cash flow positive.
    auto MaxAffordableLoan(Player const& p) -> Money;

    // Smallest multiple of $1,000 that brings cash back to zero or above.
    auto ForcedLoanAmount(Money cash) -> Money;

    // ---- procedures; they edit the player they are handed ----

    auto NewPlayer(PlayerSeat const& seat, ProfessionCard const& prof) -> Player;

    // Borrows when cash is negative. Returns the amount borrowed (0 if none).
    auto ApplyForcedLoan(Player& p) -> Money;

    auto TakeLoan(Player& p, Money amount) -> void;
    auto PayOffBankLoan(Player& p, Money amount) -> Money;

    // Pays down a named starting liability. Returns what was actually charged.
    auto PayOffLiability(Player& p, std::string_view name, Money amount) -> Money;

    // Expense line tied to a starting liability, nullptr for unknown names.
    auto ExpenseLineFor(Expenses& e, std::string_view liability) -> Money*;

    auto FindLiability(Player const& p, std::string_view name) -> Liability const*;

    // Returns false when the family is already full.
    auto AddChild(Player& p) -> bool;

    struct BankruptcyOutcome
    {
        Money liquidated{};
        std::size_t stocks_lost{};
        bool eliminated{false};
    };

    auto ExecuteBankruptcy(Player& p) -> BankruptcyOutcome;
}

#endif //CASHFLOW_FINANCE_HPP
