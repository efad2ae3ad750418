#ifndef FINPROJ_CASH_BUDGET_HPP
#define FINPROJ_CASH_BUDGET_HPP

#include "assumption_resolver.hpp"
#include "debt_schedule.hpp"
#include "income_statement.hpp"

namespace finproj {

// Working-capital balances at a period end
struct WorkingCapital {
    double receivables;
    double inventory;
    double payables;

    WorkingCapital();
    WorkingCapital(double ar, double inv, double ap);

    double net() const { return receivables + inventory - payables; }
};

// AR, inventory and AP from the period's revenue and COGS and the days assumptions
WorkingCapital project_working_capital(const IncomeStatementPeriod& is,
                                       const ResolvedAssumptions& assumptions);

// Cash budget for one forecast year. Sign convention: inflows positive.
//
// ending_cash = beginning_cash + operating + investing + financing
//             + external + discretionary
struct CashBudgetPeriod {
    int year;
    double beginning_cash;

    // Operating. Investment income is part of net income but is reported
    // with the discretionary flows.
    double net_income;
    double depreciation;
    double change_in_working_capital;   // Increase is a use of cash
    double operating;

    // Investing
    double capital_expenditure;
    double investing;

    // External (owners)
    double dividends_paid;
    double share_repurchases;
    double equity_issued;
    double external;

    // Long-term funding of capex that operations do not cover
    double investment_gap;
    double term_financing_need;
    double lt_debt_request;

    // Last year's short-term investments come back with their return
    double st_investment_redemption;
    double st_investment_return;

    double position_before_debt;        // beginning + operating + investing + external
                                        // + redemption + return

    // Supplied by the debt schedule
    double financing;                   // Long-term borrowing less amortization
    double pre_financing_cash;
    double minimum_cash;
    double st_investment_placed;
    double discretionary;               // Redemption + return + short-term draw
                                        // - repayment - placement

    double net_change;
    double ending_cash;

    CashBudgetPeriod();

    // ending_cash minus the sum of its parts; zero up to rounding
    double identity_residual() const;
};

// Operating, investing and external flows for the period, and the long-term
// debt request handed to the debt schedule.
//
// The share of capex not covered by operating cash flow is funded with
// long-term capital only while the period would otherwise end below
// minimum_cash: need = min(gap, max(0, minimum_cash - position)). The need
// is split pct_financing_with_debt to new long-term debt and the rest to
// new equity. The position counts the redemption of opening_st_investments
// and their return.
CashBudgetPeriod begin_cash_budget(
    const IncomeStatementPeriod& is,
    const WorkingCapital& opening_wc,
    const WorkingCapital& closing_wc,
    double opening_cash,
    double minimum_cash,
    const ResolvedAssumptions& assumptions,
    double opening_st_investments = 0.0
);

// Record the debt schedule's flows and compute ending cash
void close_cash_budget(CashBudgetPeriod& budget, const FinancingDecision& decision);

} // namespace finproj

#endif // FINPROJ_CASH_BUDGET_HPP
