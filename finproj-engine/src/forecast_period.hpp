#ifndef FINPROJ_FORECAST_PERIOD_HPP
#define FINPROJ_FORECAST_PERIOD_HPP

#include "balance_check.hpp"
#include "balance_sheet.hpp"
#include "cash_budget.hpp"
#include "debt_schedule.hpp"
#include "income_statement.hpp"

namespace finproj {

// The five statements of one forecast year. A period is only published
// once all five are computed and mutually consistent.
struct ForecastPeriod {
    int period;                     // 1-based offset from the base year
    IncomeStatementPeriod income_statement;
    CashBudgetPeriod cash_budget;
    DebtScheduleState debt;
    BalanceSheetPeriod balance_sheet;
    BalanceCheckResult balance_check;

    int year() const { return income_statement.year; }
};

} // namespace finproj

#endif // FINPROJ_FORECAST_PERIOD_HPP
