#include <gtest/gtest.h>
#include <string>

#include "../core/CardData.hpp"
#include "../core/Exception.hpp"
#include "../core/Finance.hpp"

using namespace cashflow::core;

namespace
{
    // Janitor: salary 1600, expenses 900, savings 560
    auto janitor() -> Player
    {
        ProfessionSP const prof = data::FindProfession("Janitor");
        return finance::NewPlayer(PlayerSeat{"p1", "Ann"}, *prof);
    }
}

TEST(Finance, NewPlayer_FromProfession)
{
    Player const p = janitor();
    EXPECT_EQ(p.id, "p1");
    EXPECT_EQ(p.profession, "Janitor");
    EXPECT_EQ(p.cash, 560);
    EXPECT_EQ(p.statement.salary, 1600);

    // no school loan for a janitor
    ASSERT_EQ(p.statement.liabilities.size(), 3u);
    EXPECT_NE(finance::FindLiability(p, constants::HomeMortgage), nullptr);
    EXPECT_EQ(finance::FindLiability(p, constants::SchoolLoan), nullptr);
    EXPECT_EQ(finance::FindLiability(p, constants::CarLoan)->balance, 4000);
}

TEST(Finance, DerivedFigures)
{
    Player p = janitor();
    EXPECT_EQ(finance::PassiveIncome(p), 0);
    EXPECT_EQ(finance::TotalIncome(p), 1600);
    EXPECT_EQ(finance::TotalExpenses(p), 900);
    EXPECT_EQ(finance::CashFlow(p), 700);
    EXPECT_FALSE(finance::CanEscape(p));

    p.statement.assets.emplace_back(StockAsset{.id = "asset-1", .name = "GRO4US", .symbol = "GRO4US",
                                               .shares = 250, .cost_per_share = 10, .dividend_per_share = 0.2});
    p.statement.assets.emplace_back(BusinessAsset{.id = "asset-2", .name = "Car Wash", .cost = 350000,
                                                  .mortgage = 225000, .down_payment = 125000, .cash_flow = 1800});
    EXPECT_EQ(finance::PassiveIncome(p), 1850);
    EXPECT_EQ(finance::TotalIncome(p), 3450);
    EXPECT_TRUE(finance::CanEscape(p));
    EXPECT_EQ(finance::FastTrackCashFlow(p), 185000);

    p.statement.expenses.child_count = 2;
    EXPECT_EQ(finance::TotalExpenses(p), 1040);
}

TEST(Finance, BankLoanPayment)
{
    EXPECT_EQ(finance::BankLoanPayment(0), 0);
    EXPECT_EQ(finance::BankLoanPayment(1000), 9);
    EXPECT_EQ(finance::BankLoanPayment(12000), 100);
    EXPECT_EQ(finance::BankLoanPayment(100000), 834);

    Player p = janitor();
    p.bank_loan_amount = 12000;
    EXPECT_EQ(finance::TotalExpenses(p), 1000);
}

TEST(Finance, ForcedLoan_RoundsUpToThousands)
{
    EXPECT_EQ(finance::ForcedLoanAmount(0), 0);
    EXPECT_EQ(finance::ForcedLoanAmount(250), 0);
    EXPECT_EQ(finance::ForcedLoanAmount(-1), 1000);
    EXPECT_EQ(finance::ForcedLoanAmount(-1000), 1000);
    EXPECT_EQ(finance::ForcedLoanAmount(-1001), 2000);

    Player p = janitor();
    p.cash = -940;
    EXPECT_EQ(finance::ApplyForcedLoan(p), 1000);
    EXPECT_EQ(p.cash, 60);
    EXPECT_EQ(p.bank_loan_amount, 1000);

    EXPECT_EQ(finance::ApplyForcedLoan(p), 0);
    EXPECT_EQ(p.bank_loan_amount, 1000);
}

TEST(Finance, MaxAffordableLoan_KeepsCashFlowPositive)
{
    Player p = janitor();
    Money const max = finance::MaxAffordableLoan(p);
    EXPECT_EQ(max, 83000);
    EXPECT_EQ(max % constants::LoanIncrement, 0);

    Player borrowed = p;
    finance::TakeLoan(borrowed, max);
    EXPECT_GT(finance::CashFlow(borrowed), 0);

    Player over = p;
    finance::TakeLoan(over, max + constants::LoanIncrement);
    EXPECT_LE(finance::CashFlow(over), 0);
}

TEST(Finance, MaxAffordableLoan_ZeroWithoutCashFlow)
{
    Player p = janitor();
    p.statement.expenses.other_expenses += 700;
    EXPECT_EQ(finance::CashFlow(p), 0);
    EXPECT_EQ(finance::MaxAffordableLoan(p), 0);

    p.statement.expenses.other_expenses += 1;
    EXPECT_EQ(finance::MaxAffordableLoan(p), 0);
}

TEST(Finance, MaxAffordableLoan_AccountsForExistingLoan)
{
    Player p = janitor();
    finance::TakeLoan(p, 40000);
    Money const more = finance::MaxAffordableLoan(p);
    EXPECT_GT(more, 0);
    EXPECT_LT(more, 83000);

    finance::TakeLoan(p, more);
    EXPECT_GT(finance::CashFlow(p), 0);
    EXPECT_EQ(finance::MaxAffordableLoan(p), 0);
}

TEST(Finance, PayOffBankLoan)
{
    Player p = janitor();
    p.cash = 10000;
    finance::TakeLoan(p, 5000);
    EXPECT_EQ(finance::PayOffBankLoan(p, 2000), 2000);
    EXPECT_EQ(p.bank_loan_amount, 3000);
    EXPECT_EQ(p.cash, 13000);

    // never charges more than is owed
    EXPECT_EQ(finance::PayOffBankLoan(p, 9000), 3000);
    EXPECT_EQ(p.bank_loan_amount, 0);
}

TEST(Finance, PayOffLiability_RemovesExpenseLine)
{
    Player p = janitor();
    p.cash = 10000;

    EXPECT_EQ(finance::PayOffLiability(p, constants::CreditCard, 1000), 1000);
    EXPECT_EQ(finance::FindLiability(p, constants::CreditCard)->balance, 1000);
    EXPECT_EQ(p.statement.expenses.credit_card_payment, 60);

    EXPECT_EQ(finance::PayOffLiability(p, constants::CarLoan, 4000), 4000);
    EXPECT_EQ(finance::FindLiability(p, constants::CarLoan), nullptr);
    EXPECT_EQ(p.statement.expenses.car_loan_payment, 0);
    EXPECT_EQ(p.cash, 5000);
    EXPECT_EQ(finance::CashFlow(p), 760);
}

TEST(Finance, PayOffLiability_UnknownNameThrows)
{
    Player p = janitor();
    EXPECT_THROW(finance::PayOffLiability(p, constants::SchoolLoan, 1000), error::AssertionError);
}

TEST(Finance, AddChild_CappedAtThree)
{
    Player p = janitor();
    EXPECT_TRUE(finance::AddChild(p));
    EXPECT_TRUE(finance::AddChild(p));
    EXPECT_TRUE(finance::AddChild(p));
    EXPECT_FALSE(finance::AddChild(p));
    EXPECT_EQ(p.statement.expenses.child_count, constants::MaxChildren);
    EXPECT_EQ(finance::TotalExpenses(p), 900 + 3 * 70);
}

TEST(Finance, Bankruptcy_Survivable)
{
    Player p = janitor();
    p.cash = 0;
    p.statement.assets.emplace_back(RealEstateAsset{.id = "asset-1", .name = "House", .sub_type = RealEstateType::House,
                                                    .cost = 65000, .mortgage = 60000, .down_payment = 5000,
                                                    .cash_flow = -200});
    p.statement.assets.emplace_back(BusinessAsset{.id = "asset-2", .name = "Vending", .cost = 3000,
                                                  .mortgage = 0, .down_payment = 3000, .cash_flow = -1000});
    p.statement.assets.emplace_back(StockAsset{.id = "asset-3", .name = "ON2U", .symbol = "ON2U", .shares = 100,
                                               .cost_per_share = 5, .dividend_per_share = 0});
    ASSERT_LT(finance::CashFlow(p), 0);

    finance::BankruptcyOutcome const out = finance::ExecuteBankruptcy(p);
    EXPECT_EQ(out.liquidated, 2500 + 1500);
    EXPECT_EQ(out.stocks_lost, 1u);
    EXPECT_FALSE(out.eliminated);

    EXPECT_TRUE(p.statement.assets.empty());
    EXPECT_EQ(p.cash, 4000);
    EXPECT_FALSE(p.is_bankrupt);
    EXPECT_EQ(p.bankrupt_turns_left, constants::BankruptTurns);

    // consumer debt halved, mortgage untouched
    EXPECT_EQ(finance::FindLiability(p, constants::CarLoan)->balance, 2000);
    EXPECT_EQ(p.statement.expenses.car_loan_payment, 30);
    EXPECT_EQ(p.statement.expenses.credit_card_payment, 30);
    EXPECT_EQ(finance::FindLiability(p, constants::HomeMortgage)->balance, 20000);
    EXPECT_EQ(finance::CashFlow(p), 760);
}

TEST(Finance, Bankruptcy_Eliminates)
{
    Player p = janitor();
    p.bank_loan_amount = 100000;
    ASSERT_LT(finance::CashFlow(p), 0);

    finance::BankruptcyOutcome const out = finance::ExecuteBankruptcy(p);
    EXPECT_TRUE(out.eliminated);
    EXPECT_TRUE(p.is_bankrupt);
    EXPECT_EQ(p.bankrupt_turns_left, 0);
}
