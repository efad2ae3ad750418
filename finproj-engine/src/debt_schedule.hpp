#ifndef FINPROJ_DEBT_SCHEDULE_HPP
#define FINPROJ_DEBT_SCHEDULE_HPP

#include "assumption_resolver.hpp"
#include "errors.hpp"
#include "historical.hpp"
#include <vector>

namespace finproj {

// A long-term loan amortized straight-line over its term
struct LoanTranche {
    int origination_year;
    double principal;
    double annual_payment;
    double balance;

    LoanTranche();
    LoanTranche(int year, double amount, double term_years);
};

// Debt balances for one period. Interest is charged on the beginning
// balances, so it is known before any borrowing decision in the period.
struct DebtScheduleState {
    int year;

    double st_beginning;
    double st_borrowing;
    double st_repayment;
    double st_ending;

    double lt_beginning;
    double lt_borrowing;
    double lt_amortization;
    double lt_ending;

    double interest_rate;
    double interest_expense;

    std::vector<LoanTranche> lt_tranches;   // Outstanding at period end

    DebtScheduleState();

    double total_ending() const { return st_ending + lt_ending; }

    // Base-year balances: Current Debt is short-term, Long Term Debt becomes
    // a single tranche amortizing over existing_debt_years.
    static DebtScheduleState opening(const HistoricalFinancials& history, int year,
                                     const ResolvedAssumptions& assumptions);
};

// Outcome of the financing step for one period
struct FinancingDecision {
    DebtScheduleState state;
    double pre_financing_cash;      // Cash after term debt flows, before short-term moves
    double minimum_cash;
    double financing;               // lt_borrowing - lt_amortization
    double st_investment_placed;    // Surplus moved into short-term investments
    double discretionary;           // st_borrowing - st_repayment - st_investment_placed
    std::vector<ForecastWarning> warnings;

    FinancingDecision();
};

// Interest for the period following `prior`, on its ending balances
double interest_for_period(const DebtScheduleState& prior, double cost_of_debt);

// Run the debt schedule for `year` given the cash position before any debt
// flow (beginning cash plus operating, investing and external flows, and
// last year's short-term investments with their return).
//
// Order within the period:
//   1. interest on beginning balances
//   2. scheduled amortization of each long-term tranche; the last payment of
//      a schedule is whatever balance remains. Payments exceeding the
//      beginning long-term balance are clamped and recorded as NegativeDebt
//   3. new long-term tranche of lt_request, amortizing from next year
//   4. pre-financing cash = position + long-term flows
//   5. below minimum_cash: short-term draw of exactly the shortfall;
//      above it: surplus repays short-term debt up to its balance, then
//      st_investment_share of the remainder is placed in short-term
//      investments and the rest stays in cash
FinancingDecision finance_period(
    const DebtScheduleState& prior,
    int year,
    double position_before_debt,
    double lt_request,
    double minimum_cash,
    const ResolvedAssumptions& assumptions
);

} // namespace finproj

#endif // FINPROJ_DEBT_SCHEDULE_HPP
