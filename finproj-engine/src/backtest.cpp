#include "backtest.hpp"
#include <cmath>
#include <set>

namespace finproj {

BacktestResult::BacktestResult()
    : year(0), forecast(0.0), actual(0.0), absolute_variance(0.0) {}

BacktestSummary::BacktestSummary()
    : comparisons(0), periods(0), mean_absolute_percent_error(0.0) {}

BacktestResult compare_line_item(int year, const std::string& line_item,
                                 double forecast, double actual) {
    BacktestResult r;
    r.year = year;
    r.line_item = line_item;
    r.forecast = forecast;
    r.actual = actual;
    r.absolute_variance = forecast - actual;
    if (actual != 0.0) {
        r.percent_variance = r.absolute_variance / std::fabs(actual) * 100.0;
    }
    return r;
}

namespace {

struct ComparedLine {
    Statement statement;
    const std::string& field;
    double (*forecast)(const ForecastPeriod&);
};

const std::vector<ComparedLine>& compared_lines() {
    static const std::vector<ComparedLine> lines = {
        {Statement::Income, fields::TOTAL_REVENUE,
         [](const ForecastPeriod& p) { return p.income_statement.revenue; }},
        {Statement::Income, fields::COST_OF_REVENUE,
         [](const ForecastPeriod& p) { return p.income_statement.cost_of_revenue; }},
        {Statement::Income, fields::OPERATING_INCOME,
         [](const ForecastPeriod& p) { return p.income_statement.operating_income; }},
        {Statement::Income, fields::NET_INCOME,
         [](const ForecastPeriod& p) { return p.income_statement.net_income; }},
        {Statement::Balance, fields::CASH,
         [](const ForecastPeriod& p) { return p.balance_sheet.cash; }},
        {Statement::Balance, fields::TOTAL_ASSETS,
         [](const ForecastPeriod& p) { return p.balance_sheet.total_assets; }},
        {Statement::Balance, fields::TOTAL_LIABILITIES,
         [](const ForecastPeriod& p) { return p.balance_sheet.total_liabilities; }},
        {Statement::Balance, fields::STOCKHOLDERS_EQUITY,
         [](const ForecastPeriod& p) { return p.balance_sheet.stockholders_equity; }}
    };
    return lines;
}

} // anonymous namespace

std::vector<BacktestResult> run_backtest(const std::vector<ForecastPeriod>& periods,
                                         const HistoricalFinancials& actuals) {
    std::vector<BacktestResult> results;
    for (const ForecastPeriod& period : periods) {
        int year = period.year();
        for (const ComparedLine& line : compared_lines()) {
            auto actual = actuals.get_value(line.statement, year, line.field);
            if (!actual) continue;
            results.push_back(compare_line_item(year, line.field, line.forecast(period), *actual));
        }
    }
    return results;
}

BacktestSummary summarize_backtest(const std::vector<BacktestResult>& results) {
    BacktestSummary summary;
    std::set<int> years;
    double total = 0.0;
    size_t with_percent = 0;

    for (const BacktestResult& r : results) {
        years.insert(r.year);
        if (r.percent_variance) {
            total += std::fabs(*r.percent_variance);
            ++with_percent;
        }
    }

    summary.comparisons = results.size();
    summary.periods = years.size();
    summary.mean_absolute_percent_error = with_percent > 0 ? total / static_cast<double>(with_percent) : 0.0;
    return summary;
}

} // namespace finproj
