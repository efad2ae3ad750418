#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "income_statement.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace finproj;
using Catch::Approx;

namespace {

ResolvedAssumptions make_test_assumptions() {
    ResolvedAssumptions a;
    a.revenue_growth = Assumption(0.10, Provenance::Overridden);
    a.cogs_pct_revenue = Assumption(0.60, Provenance::Overridden);
    a.sga_pct_revenue = Assumption(0.20, Provenance::Overridden);
    a.depreciation_rate = Assumption(0.10, Provenance::Overridden);
    a.tax_rate = Assumption(0.25, Provenance::Overridden);
    a.payout_ratio = Assumption(0.40, Provenance::Overridden);
    a.return_on_cash = Assumption(0.03, Provenance::Overridden);
    return a;
}

IncomeStatementPeriod make_prior(int year, double revenue) {
    IncomeStatementPeriod prior;
    prior.year = year;
    prior.revenue = revenue;
    return prior;
}

} // anonymous namespace

TEST_CASE("Income statement projects line by line", "[income_statement]") {
    auto a = make_test_assumptions();
    auto is = project_income_statement(1, make_prior(2023, 1000.0), 400.0, 100.0, 10.0, a);

    REQUIRE(is.year == 2024);
    REQUIRE(is.revenue == Approx(1100.0));
    REQUIRE(is.cost_of_revenue == Approx(660.0));
    REQUIRE(is.gross_profit == Approx(440.0));
    REQUIRE(is.sga == Approx(220.0));
    REQUIRE(is.depreciation == Approx(40.0));
    REQUIRE(is.operating_income == Approx(180.0));
    REQUIRE(is.interest_expense == Approx(10.0));
    REQUIRE(is.interest_income == Approx(3.0));
    REQUIRE(is.pretax_income == Approx(173.0));
    REQUIRE(is.tax == Approx(43.25));
    REQUIRE(is.net_income == Approx(129.75));
    REQUIRE(is.dividends == Approx(51.9));
}

TEST_CASE("Short-term investments held over the year end earn their return", "[income_statement]") {
    auto a = make_test_assumptions();
    a.return_st_investment = Assumption(0.04, Provenance::Overridden);

    auto is = project_income_statement(1, make_prior(2023, 1000.0), 400.0, 100.0, 10.0, a, 200.0);

    REQUIRE(is.interest_income == Approx(3.0));
    REQUIRE(is.investment_income == Approx(8.0));
    REQUIRE(is.pretax_income == Approx(181.0));
    REQUIRE(is.net_income == Approx(135.75));

    auto without = project_income_statement(1, make_prior(2023, 1000.0), 400.0, 100.0, 10.0, a);
    REQUIRE(without.investment_income == 0.0);
}

TEST_CASE("Losses pay no tax and no dividends", "[income_statement]") {
    auto a = make_test_assumptions();
    a.cogs_pct_revenue = Assumption(0.95, Provenance::Overridden);

    auto is = project_income_statement(1, make_prior(2023, 1000.0), 400.0, 0.0, 50.0, a);

    REQUIRE(is.pretax_income < 0.0);
    REQUIRE(is.tax == 0.0);
    REQUIRE(is.net_income == Approx(is.pretax_income));
    REQUIRE(is.dividends == 0.0);
}

TEST_CASE("Interest expense passes through unchanged", "[income_statement]") {
    auto a = make_test_assumptions();
    auto low = project_income_statement(1, make_prior(2023, 1000.0), 400.0, 100.0, 0.0, a);
    auto high = project_income_statement(1, make_prior(2023, 1000.0), 400.0, 100.0, 25.0, a);

    REQUIRE(high.interest_expense == Approx(25.0));
    REQUIRE(low.operating_income == Approx(high.operating_income));
    REQUIRE(low.pretax_income - high.pretax_income == Approx(25.0));
}

TEST_CASE("Growth decay applies by period", "[income_statement]") {
    auto a = make_test_assumptions();
    a.revenue_growth_decay = 0.5;

    auto second = project_income_statement(2, make_prior(2024, 1000.0), 0.0, 0.0, 0.0, a);
    REQUIRE(second.revenue == Approx(1050.0));
    REQUIRE(second.depreciation == 0.0);
}

TEST_CASE("Base-year income statement from history", "[income_statement]") {
    auto history = finproj::testing::make_sample_history();
    auto is = IncomeStatementPeriod::from_history(history, 2023);

    REQUIRE(is.year == 2023);
    REQUIRE(is.revenue == Approx(1331.0));
    REQUIRE(is.gross_profit == Approx(532.4));
    REQUIRE(is.operating_income == Approx(220.2));
    REQUIRE(is.interest_expense == Approx(13.0));
    REQUIRE(is.net_income == Approx(166.058));
    REQUIRE(is.dividends == Approx(60.0));

    REQUIRE_THROWS_AS(IncomeStatementPeriod::from_history(history, 2019), MissingDataError);
}
