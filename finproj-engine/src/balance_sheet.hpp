#ifndef FINPROJ_BALANCE_SHEET_HPP
#define FINPROJ_BALANCE_SHEET_HPP

#include "cash_budget.hpp"
#include "debt_schedule.hpp"
#include "historical.hpp"
#include "income_statement.hpp"

namespace finproj {

// Period-end balance sheet. Every line is rolled forward from the prior
// period; none is solved for as a residual.
struct BalanceSheetPeriod {
    int year;

    // Assets
    double cash;
    double accounts_receivable;
    double inventory;
    double st_investments;
    double other_current_assets;
    double current_assets;
    double net_ppe;
    double goodwill_and_intangibles;
    double other_non_current_assets;
    double total_assets;

    // Liabilities
    double accounts_payable;
    double short_term_debt;
    double other_current_liabilities;
    double current_liabilities;
    double long_term_debt;
    double other_non_current_liabilities;
    double total_liabilities;

    // Equity
    double retained_earnings;
    double other_equity;                // Paid-in capital, treasury stock, OCI
    double stockholders_equity;
    double minority_interest;
    double total_equity;                // Stockholders' equity plus minority interest

    BalanceSheetPeriod();

    // Recompute subtotals and totals from the component lines
    void compute_totals();

    WorkingCapital working_capital() const;

    // Base-year sheet from reported figures. The "other" lines are the
    // remainder of each reported subtotal, so the opening sheet carries
    // exactly the reported totals.
    static BalanceSheetPeriod opening(const HistoricalFinancials& history, int year);
};

// Roll the prior balance sheet forward one period.
//   cash            = cash budget ending cash
//   st investments  = this period's placement (last year's are redeemed)
//   AR, inventory, AP from the projected working capital
//   net PPE        += capex - depreciation
//   debt            = debt schedule ending balances
//   retained earnings += net income - dividends
//   other equity   += equity issued - repurchases
// Goodwill, minority interest and the "other" lines are held.
BalanceSheetPeriod assemble_balance_sheet(
    const BalanceSheetPeriod& prior,
    const IncomeStatementPeriod& is,
    const CashBudgetPeriod& cash_budget,
    const DebtScheduleState& debt,
    const WorkingCapital& working_capital
);

} // namespace finproj

#endif // FINPROJ_BALANCE_SHEET_HPP
