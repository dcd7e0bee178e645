//
// Finance.cpp
//

#include "Finance.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

#include "Exception.hpp"

namespace cashflow::core::finance
{
    auto PassiveIncome(Player const& p) -> Money
    {
        Money total{};
        for (Asset const& a : p.statement.assets)
        {
            total += std::visit([]<typename T0>(T0 const& x) -> Money
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, StockAsset>)
                {
                    return static_cast<Money>(std::floor(static_cast<double>(x.shares) * x.dividend_per_share));
                }
                else
                {
                    return x.cash_flow;
                }
            }, a);
        }
        return total;
    }

    auto TotalIncome(Player const& p) -> Money
    {
        return p.statement.salary + PassiveIncome(p);
    }

    // 10% a year, paid monthly, rounded up
    auto BankLoanPayment(Money loan) -> Money
    {
        if (loan <= 0) return 0;
        return (loan + 119) / 120;
    }

    auto TotalExpenses(Player const& p) -> Money
    {
        Expenses const& e = p.statement.expenses;
        return e.taxes + e.home_mortgage_payment + e.school_loan_payment + e.car_loan_payment +
               e.credit_card_payment + e.other_expenses + e.per_child_expense * e.child_count +
               BankLoanPayment(p.bank_loan_amount);
    }

    auto CashFlow(Player const& p) -> Money
    {
        return TotalIncome(p) - TotalExpenses(p);
    }

    auto CanEscape(Player const& p) -> bool
    {
        return PassiveIncome(p) > TotalExpenses(p);
    }

    auto FastTrackCashFlow(Player const& p) -> Money
    {
        return PassiveIncome(p) * constants::FastTrackMultiple;
    }

    auto MaxAffordableLoan(Player const& p) -> Money
    {
        Money const cf = CashFlow(p);
        if (cf <= 0) return 0;

        Money const loan = p.bank_loan_amount;
        Money const base = BankLoanPayment(loan);
        auto fits = [&](Money k)
        {
            return cf - (BankLoanPayment(loan + k * constants::LoanIncrement) - base) > 0;
        };

        // ~$8.33 a month per $1,000; the estimate can be off by one step either way
        Money k = (cf - 1) * 12 / 100;
        while (k > 0 && !fits(k)) --k;
        while (fits(k + 1)) ++k;
        return k * constants::LoanIncrement;
    }

    auto ForcedLoanAmount(Money cash) -> Money
    {
        if (cash >= 0) return 0;
        Money const owed = -cash;
        return (owed + constants::LoanIncrement - 1) / constants::LoanIncrement * constants::LoanIncrement;
    }

    auto NewPlayer(PlayerSeat const& seat, ProfessionCard const& prof) -> Player
    {
        Player p{};
        p.id = seat.id;
        p.name = seat.name;
        p.profession = prof.title;
        p.cash = prof.savings;

        FinancialStatement& fs = p.statement;
        fs.salary = prof.salary;
        fs.expenses = Expenses{
            .taxes                 = prof.taxes,
            .home_mortgage_payment = prof.home_mortgage_payment,
            .school_loan_payment   = prof.school_loan_payment,
            .car_loan_payment      = prof.car_loan_payment,
            .credit_card_payment   = prof.credit_card_payment,
            .other_expenses        = prof.other_expenses,
            .per_child_expense     = prof.per_child_expense,
            .child_count           = 0
        };

        auto add = [&](std::string_view name, Money balance, Money payment)
        {
            if (balance > 0)
            {
                fs.liabilities.push_back(Liability{std::string{name}, balance, payment});
            }
        };
        add(constants::HomeMortgage, prof.home_mortgage_balance, prof.home_mortgage_payment);
        add(constants::SchoolLoan, prof.school_loan_balance, prof.school_loan_payment);
        add(constants::CarLoan, prof.car_loan_balance, prof.car_loan_payment);
        add(constants::CreditCard, prof.credit_card_balance, prof.credit_card_payment);
        return p;
    }

    auto ApplyForcedLoan(Player& p) -> Money
    {
        Money const amount = ForcedLoanAmount(p.cash);
        if (amount > 0)
        {
            p.cash += amount;
            p.bank_loan_amount += amount;
        }
        return amount;
    }

    auto TakeLoan(Player& p, Money amount) -> void
    {
        CF_ASSERT(amount > 0, "loan amount must be positive");
        p.cash += amount;
        p.bank_loan_amount += amount;
    }

    auto PayOffBankLoan(Player& p, Money amount) -> Money
    {
        Money const charged = std::min(amount, p.bank_loan_amount);
        p.cash -= charged;
        p.bank_loan_amount -= charged;
        return charged;
    }

    auto ExpenseLineFor(Expenses& e, std::string_view liability) -> Money*
    {
        if (liability == constants::HomeMortgage) return &e.home_mortgage_payment;
        if (liability == constants::SchoolLoan) return &e.school_loan_payment;
        if (liability == constants::CarLoan) return &e.car_loan_payment;
        if (liability == constants::CreditCard) return &e.credit_card_payment;
        return nullptr;
    }

    auto FindLiability(Player const& p, std::string_view name) -> Liability const*
    {
        auto const& ls = p.statement.liabilities;
        auto const it = std::ranges::find(ls, name, &Liability::name);
        return it == ls.end() ? nullptr : &*it;
    }

    auto PayOffLiability(Player& p, std::string_view name, Money amount) -> Money
    {
        auto& ls = p.statement.liabilities;
        auto const it = std::ranges::find(ls, name, &Liability::name);
        CF_ASSERT(it != ls.end(), "paying off a liability the player does not have");

        Money const charged = std::min(amount, it->balance);
        p.cash -= charged;
        it->balance -= charged;
        if (it->balance <= 0)
        {
            if (Money* line = ExpenseLineFor(p.statement.expenses, name))
            {
                *line = 0;
            }
            ls.erase(it);
        }
        return charged;
    }

    auto AddChild(Player& p) -> bool
    {
        if (p.statement.expenses.child_count >= constants::MaxChildren) return false;
        ++p.statement.expenses.child_count;
        return true;
    }

    auto ExecuteBankruptcy(Player& p) -> BankruptcyOutcome
    {
        BankruptcyOutcome out{};
        FinancialStatement& fs = p.statement;

        for (Asset const& a : fs.assets)
        {
            if (auto const* re = std::get_if<RealEstateAsset>(&a))
            {
                out.liquidated += re->down_payment / 2;
            }
            else if (auto const* biz = std::get_if<BusinessAsset>(&a))
            {
                out.liquidated += biz->down_payment / 2;
            }
            else
            {
                ++out.stocks_lost;
            }
        }
        fs.assets.clear();
        p.cash += out.liquidated;

        // only consumer debt is renegotiated
        for (Liability& l : fs.liabilities)
        {
            if (l.name == constants::CarLoan || l.name == constants::CreditCard)
            {
                l.balance /= 2;
                l.payment /= 2;
                if (Money* line = ExpenseLineFor(fs.expenses, l.name))
                {
                    *line = l.payment;
                }
            }
        }
        std::erase_if(fs.liabilities, [&](Liability const& l)
        {
            if (l.balance > 0) return false;
            if (Money* line = ExpenseLineFor(fs.expenses, l.name))
            {
                *line = 0;
            }
            return true;
        });

        if (CashFlow(p) < 0)
        {
            p.is_bankrupt = true;
            out.eliminated = true;
        }
        else
        {
            p.bankrupt_turns_left = constants::BankruptTurns;
        }
        return out;
    }
}
