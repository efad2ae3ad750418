#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "backtest.hpp"
#include "test_helpers.hpp"

using namespace finproj;
using Catch::Approx;

namespace {

ForecastPeriod make_forecast_period(int year, double revenue, double cash) {
    ForecastPeriod p;
    p.period = 1;
    p.income_statement.year = year;
    p.income_statement.revenue = revenue;
    p.income_statement.cost_of_revenue = revenue * 0.6;
    p.income_statement.operating_income = revenue * 0.15;
    p.income_statement.net_income = revenue * 0.1;
    p.balance_sheet.year = year;
    p.balance_sheet.cash = cash;
    return p;
}

} // anonymous namespace

TEST_CASE("Line item variance", "[backtest]") {
    SECTION("Over-forecast") {
        auto r = compare_line_item(2023, fields::TOTAL_REVENUE, 102.0, 100.0);
        REQUIRE(r.year == 2023);
        REQUIRE(r.line_item == "Total Revenue");
        REQUIRE(r.absolute_variance == Approx(2.0));
        REQUIRE(r.percent_variance.value() == Approx(2.0));
    }

    SECTION("Zero actual has no percentage") {
        auto r = compare_line_item(2023, fields::CASH, 5.0, 0.0);
        REQUIRE(r.absolute_variance == Approx(5.0));
        REQUIRE_FALSE(r.percent_variance.has_value());
    }

    SECTION("Negative actual divides by magnitude") {
        auto r = compare_line_item(2023, fields::NET_INCOME, -90.0, -100.0);
        REQUIRE(r.absolute_variance == Approx(10.0));
        REQUIRE(r.percent_variance.value() == Approx(10.0));
    }
}

TEST_CASE("Backtest compares years with reported actuals", "[backtest]") {
    auto actuals = finproj::testing::make_sample_history();

    std::vector<ForecastPeriod> periods = {
        make_forecast_period(2022, 1200.0, 150.0),
        make_forecast_period(2023, 1320.0, 160.0),
        make_forecast_period(2024, 1450.0, 170.0)
    };

    auto results = run_backtest(periods, actuals);

    // Eight line items in each of the two reported years; 2024 has no actuals
    REQUIRE(results.size() == 16);
    for (const auto& r : results) {
        REQUIRE(r.year != 2024);
    }

    REQUIRE(results[0].year == 2022);
    REQUIRE(results[0].line_item == fields::TOTAL_REVENUE);
    REQUIRE(results[0].actual == Approx(1210.0));
    REQUIRE(results[0].absolute_variance == Approx(-10.0));

    SECTION("Summary") {
        auto summary = summarize_backtest(results);
        REQUIRE(summary.comparisons == 16);
        REQUIRE(summary.periods == 2);
        REQUIRE(summary.mean_absolute_percent_error > 0.0);
    }

    SECTION("Inputs are not modified") {
        REQUIRE(periods[0].income_statement.revenue == Approx(1200.0));
        REQUIRE(actuals.require_value(Statement::Income, 2022, fields::TOTAL_REVENUE) == Approx(1210.0));
    }
}

TEST_CASE("Backtest skips line items the actuals do not report", "[backtest]") {
    HistoricalFinancials actuals("Thin Co");
    actuals.set_value(Statement::Income, 2024, fields::TOTAL_REVENUE, 1000.0);
    actuals.set_value(Statement::Balance, 2024, fields::CASH, 0.0);

    auto results = run_backtest({make_forecast_period(2024, 1100.0, 20.0)}, actuals);

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].percent_variance.value() == Approx(10.0));
    REQUIRE_FALSE(results[1].percent_variance.has_value());

    auto summary = summarize_backtest(results);
    REQUIRE(summary.mean_absolute_percent_error == Approx(10.0));
}

TEST_CASE("Empty backtest summary", "[backtest]") {
    auto summary = summarize_backtest({});
    REQUIRE(summary.comparisons == 0);
    REQUIRE(summary.periods == 0);
    REQUIRE(summary.mean_absolute_percent_error == 0.0);
}
