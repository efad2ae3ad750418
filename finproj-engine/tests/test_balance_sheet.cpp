#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "balance_check.hpp"
#include "balance_sheet.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace finproj;
using finproj::testing::make_sample_history;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Opening balance sheet
// ============================================================================

TEST_CASE("Opening balance sheet carries reported totals", "[balance_sheet]") {
    auto bs = BalanceSheetPeriod::opening(make_sample_history(), 2023);

    REQUIRE(bs.year == 2023);
    REQUIRE(bs.cash == Approx(150.0));
    REQUIRE(bs.other_current_assets == Approx(20.0));
    REQUIRE(bs.current_assets == Approx(320.0));
    REQUIRE(bs.other_non_current_assets == Approx(80.0));
    REQUIRE(bs.total_assets == Approx(900.0));

    REQUIRE(bs.other_current_liabilities == Approx(30.0));
    REQUIRE(bs.current_liabilities == Approx(130.0));
    REQUIRE(bs.other_non_current_liabilities == Approx(70.0));
    REQUIRE(bs.total_liabilities == Approx(400.0));

    REQUIRE(bs.retained_earnings == Approx(350.0));
    REQUIRE(bs.other_equity == Approx(150.0));
    REQUIRE(bs.stockholders_equity == Approx(500.0));
    REQUIRE(bs.minority_interest == 0.0);
    REQUIRE(bs.total_equity == Approx(500.0));

    auto check = check_balance(bs, 0.01);
    REQUIRE(check.balanced);
    REQUIRE_THAT(check.residual, WithinAbs(0.0, 1e-9));
}

TEST_CASE("Opening short-term investments come out of other current assets", "[balance_sheet]") {
    auto history = make_sample_history();
    history.set_value(Statement::Balance, 2023, fields::SHORT_TERM_INVESTMENTS, 15.0);

    auto bs = BalanceSheetPeriod::opening(history, 2023);
    REQUIRE(bs.st_investments == Approx(15.0));
    REQUIRE(bs.other_current_assets == Approx(5.0));
    REQUIRE(bs.current_assets == Approx(320.0));
    REQUIRE(bs.total_assets == Approx(900.0));
}

TEST_CASE("Opening balance sheet requires the reported totals", "[balance_sheet]") {
    HistoricalFinancials h("Partial Co");
    h.set_value(Statement::Balance, 2023, fields::CASH, 10.0);
    h.set_value(Statement::Balance, 2023, fields::TOTAL_ASSETS, 100.0);

    REQUIRE_THROWS_AS(BalanceSheetPeriod::opening(h, 2023), MissingDataError);
}

// ============================================================================
// Roll-forward
// ============================================================================

TEST_CASE("Balance sheet rolls forward from the period flows", "[balance_sheet]") {
    auto prior = BalanceSheetPeriod::opening(make_sample_history(), 2023);

    IncomeStatementPeriod is;
    is.year = 2024;
    is.depreciation = 46.0;
    is.net_income = 180.0;

    CashBudgetPeriod cb;
    cb.year = 2024;
    cb.capital_expenditure = 70.0;
    cb.dividends_paid = 65.0;
    cb.share_repurchases = 12.0;
    cb.equity_issued = 5.0;
    cb.ending_cash = 160.0;

    DebtScheduleState debt;
    debt.st_ending = 0.0;
    debt.lt_ending = 180.0;

    WorkingCapital wc(120.0, 44.0, 88.0);

    auto bs = assemble_balance_sheet(prior, is, cb, debt, wc);

    REQUIRE(bs.year == 2024);
    REQUIRE(bs.cash == Approx(160.0));
    REQUIRE(bs.accounts_receivable == Approx(120.0));
    REQUIRE(bs.inventory == Approx(44.0));
    REQUIRE(bs.net_ppe == Approx(424.0));
    REQUIRE(bs.accounts_payable == Approx(88.0));
    REQUIRE(bs.short_term_debt == 0.0);
    REQUIRE(bs.long_term_debt == Approx(180.0));
    REQUIRE(bs.retained_earnings == Approx(465.0));
    REQUIRE(bs.other_equity == Approx(143.0));

    SECTION("Held lines are unchanged") {
        REQUIRE(bs.goodwill_and_intangibles == Approx(prior.goodwill_and_intangibles));
        REQUIRE(bs.other_current_assets == Approx(prior.other_current_assets));
        REQUIRE(bs.other_non_current_liabilities == Approx(prior.other_non_current_liabilities));
        REQUIRE(bs.minority_interest == Approx(prior.minority_interest));
    }

    SECTION("Totals are recomputed") {
        REQUIRE(bs.current_assets == Approx(160.0 + 120.0 + 44.0 + 20.0));
        REQUIRE(bs.total_liabilities == Approx(88.0 + 30.0 + 180.0 + 70.0));
        REQUIRE(bs.total_equity == Approx(465.0 + 143.0));
    }
}

// ============================================================================
// Balance check
// ============================================================================

TEST_CASE("Balance check tolerance", "[balance_sheet][balance_check]") {
    BalanceSheetPeriod bs;
    bs.year = 2024;
    bs.cash = 1000.0;
    bs.retained_earnings = 999.995;
    bs.compute_totals();

    SECTION("Within absolute tolerance") {
        auto check = check_balance(bs, 0.01);
        REQUIRE(check.balanced);
        REQUIRE(check.residual == Approx(0.005));
        REQUIRE(check.total_assets == Approx(1000.0));
        REQUIRE(check.total_liabilities_and_equity == Approx(999.995));
    }

    SECTION("Outside absolute tolerance") {
        auto check = check_balance(bs, 0.001);
        REQUIRE_FALSE(check.balanced);
        REQUIRE(check.tolerance == Approx(0.001));
    }

    SECTION("Relative tolerance scales with total assets") {
        auto check = check_balance(bs, 0.001, 1e-5);
        REQUIRE(check.tolerance == Approx(0.01));
        REQUIRE(check.balanced);
    }

    SECTION("Residual sign is assets minus claims") {
        bs.retained_earnings = 1010.0;
        bs.compute_totals();
        auto check = check_balance(bs, 0.01);
        REQUIRE(check.residual == Approx(-10.0));
        REQUIRE_FALSE(check.balanced);
    }
}
