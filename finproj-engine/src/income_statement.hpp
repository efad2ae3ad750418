#ifndef FINPROJ_INCOME_STATEMENT_HPP
#define FINPROJ_INCOME_STATEMENT_HPP

#include "assumption_resolver.hpp"
#include "historical.hpp"

namespace finproj {

// One fiscal year of the income statement, historical or projected
struct IncomeStatementPeriod {
    int year;
    double revenue;
    double cost_of_revenue;
    double gross_profit;
    double sga;
    double depreciation;
    double operating_income;        // EBIT
    double interest_expense;        // On opening debt balances
    double interest_income;         // On opening cash
    double investment_income;       // Return on the short-term investments placed last year
    double pretax_income;
    double tax;
    double net_income;
    double dividends;               // Declared and paid in the same year

    IncomeStatementPeriod();

    // Base-year actuals. Lines the statements do not report are rebuilt from
    // the reported ones (gross profit, EBIT) or taken as zero.
    static IncomeStatementPeriod from_history(const HistoricalFinancials& history, int year);
};

// Project forecast period `period` (1-based) from the prior year.
//
// Fixed evaluation order, each line using only lines above it:
//   1. revenue = prior revenue × (1 + growth_t)
//   2. COGS, SG&A as ratios of revenue
//   3. depreciation = depreciation_rate × opening net PPE
//   4. operating income
//   5. interest expense (computed by the debt schedule on opening balances)
//   6. interest income = return_on_cash × opening cash,
//      investment income = return_st_investment × opening investments
//   7. pre-tax income, tax = max(0, pretax × rate), net income
//   8. dividends = max(0, net income × payout)
IncomeStatementPeriod project_income_statement(
    int period,
    const IncomeStatementPeriod& prior,
    double opening_net_ppe,
    double opening_cash,
    double interest_expense,
    const ResolvedAssumptions& assumptions,
    double opening_st_investments = 0.0
);

} // namespace finproj

#endif // FINPROJ_INCOME_STATEMENT_HPP
