#ifndef FINPROJ_FORECASTER_HPP
#define FINPROJ_FORECASTER_HPP

#include "assumption_resolver.hpp"
#include "backtest.hpp"
#include "company_config.hpp"
#include "errors.hpp"
#include "forecast_period.hpp"
#include "historical.hpp"
#include <optional>
#include <string>
#include <vector>

namespace finproj {

// Inputs of one forecast run. Owns its copies, so runs never share state.
struct ForecastContext {
    CompanyConfig config;
    HistoricalFinancials history;

    ForecastContext();
    ForecastContext(const CompanyConfig& company_config, const HistoricalFinancials& historical);
};

struct ForecastResult {
    std::string company;
    int base_year;
    ResolvedAssumptions assumptions;

    // Base-year position the forecast rolls forward from
    IncomeStatementPeriod opening_income_statement;
    BalanceSheetPeriod opening_balance_sheet;
    DebtScheduleState opening_debt;
    BalanceCheckResult opening_balance_check;

    std::vector<ForecastPeriod> periods;        // Ordered by year
    std::vector<ForecastWarning> warnings;
    std::optional<std::vector<BacktestResult>> backtest;   // Set when the base year is historical

    double execution_time_ms;

    ForecastResult();

    // True when every forecast period passed the balance check
    bool balanced() const;
};

// Run the pipeline for one company:
//   resolve assumptions -> per period: interest, income statement, working
//   capital, cash budget, debt schedule, balance sheet, balance check ->
//   backtest when actuals exist after the base year.
//
// Throws MissingDataError, InsufficientHistoryError or ConfigError before
// any period is computed. Numerical anomalies are recorded in
// ForecastResult::warnings. Deterministic: the same context always yields
// the same periods.
ForecastResult run_forecast(const ForecastContext& context);

struct BatchOutcome {
    std::string company;
    bool success;
    std::string error_message;
    ForecastResult result;

    BatchOutcome();
};

// Run independent contexts, in parallel when built with OpenMP. A failing
// run is reported in its outcome and does not affect the others.
std::vector<BatchOutcome> run_forecasts(const std::vector<ForecastContext>& contexts);

} // namespace finproj

#endif // FINPROJ_FORECASTER_HPP
