#ifndef FINPROJ_BACKTEST_HPP
#define FINPROJ_BACKTEST_HPP

#include "forecast_period.hpp"
#include "historical.hpp"
#include <optional>
#include <string>
#include <vector>

namespace finproj {

// Forecast versus reported value for one line item in one year
struct BacktestResult {
    int year;
    std::string line_item;              // Reported label, e.g. "Total Revenue"
    double forecast;
    double actual;
    double absolute_variance;           // forecast - actual
    std::optional<double> percent_variance;  // absolute / |actual| × 100; unset when actual is 0

    BacktestResult();
};

struct BacktestSummary {
    size_t comparisons;
    size_t periods;
    double mean_absolute_percent_error;     // Over comparisons with a defined percentage

    BacktestSummary();
};

BacktestResult compare_line_item(int year, const std::string& line_item,
                                 double forecast, double actual);

// Compare each forecast period that has reported actuals. Line items the
// actuals do not report are skipped. Never modifies its inputs.
std::vector<BacktestResult> run_backtest(const std::vector<ForecastPeriod>& periods,
                                         const HistoricalFinancials& actuals);

BacktestSummary summarize_backtest(const std::vector<BacktestResult>& results);

} // namespace finproj

#endif // FINPROJ_BACKTEST_HPP
