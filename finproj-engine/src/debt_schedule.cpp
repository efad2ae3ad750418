#include "debt_schedule.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace finproj {

namespace {

// Balances within this fraction of principal count as fully repaid
constexpr double RETIRED_FRACTION = 1e-9;

} // anonymous namespace

LoanTranche::LoanTranche()
    : origination_year(0), principal(0.0), annual_payment(0.0), balance(0.0) {}

LoanTranche::LoanTranche(int year, double amount, double term_years)
    : origination_year(year),
      principal(amount),
      annual_payment(term_years > 0.0 ? amount / term_years : amount),
      balance(amount) {}

DebtScheduleState::DebtScheduleState()
    : year(0), st_beginning(0.0), st_borrowing(0.0), st_repayment(0.0), st_ending(0.0),
      lt_beginning(0.0), lt_borrowing(0.0), lt_amortization(0.0), lt_ending(0.0),
      interest_rate(0.0), interest_expense(0.0) {}

DebtScheduleState DebtScheduleState::opening(const HistoricalFinancials& history, int year,
                                             const ResolvedAssumptions& assumptions) {
    DebtScheduleState state;
    state.year = year;
    state.interest_rate = assumptions.cost_of_debt.value;
    state.interest_expense = std::fabs(history.value_or(Statement::Income, year, fields::INTEREST_EXPENSE, 0.0));

    state.st_ending = std::max(0.0, history.value_or(Statement::Balance, year, fields::CURRENT_DEBT, 0.0));
    state.st_beginning = state.st_ending;

    double lt = std::max(0.0, history.value_or(Statement::Balance, year, fields::LONG_TERM_DEBT, 0.0));
    state.lt_beginning = lt;
    state.lt_ending = lt;
    if (lt > 0.0) {
        state.lt_tranches.emplace_back(year, lt, assumptions.existing_debt_years.value);
    }
    return state;
}

FinancingDecision::FinancingDecision()
    : pre_financing_cash(0.0), minimum_cash(0.0), financing(0.0), st_investment_placed(0.0),
      discretionary(0.0) {}

double interest_for_period(const DebtScheduleState& prior, double cost_of_debt) {
    return cost_of_debt * (prior.st_ending + prior.lt_ending);
}

FinancingDecision finance_period(
    const DebtScheduleState& prior,
    int year,
    double position_before_debt,
    double lt_request,
    double minimum_cash,
    const ResolvedAssumptions& assumptions
) {
    FinancingDecision decision;
    DebtScheduleState& state = decision.state;

    state.year = year;
    state.st_beginning = prior.st_ending;
    state.lt_beginning = prior.lt_ending;
    state.interest_rate = assumptions.cost_of_debt.value;
    state.interest_expense = interest_for_period(prior, state.interest_rate);

    // Scheduled amortization. A term that is not a whole number of years
    // ends with a smaller payment.
    for (const LoanTranche& tranche : prior.lt_tranches) {
        LoanTranche next = tranche;
        double due = std::min(next.annual_payment, next.balance);
        if (next.balance - due <= next.principal * RETIRED_FRACTION) {
            due = next.balance;
        }
        next.balance -= due;
        state.lt_amortization += due;
        if (next.balance > 0.0) {
            state.lt_tranches.push_back(next);
        }
    }

    // Tranches owing more than the recorded balance
    double excess = state.lt_amortization - state.lt_beginning;
    if (excess > RETIRED_FRACTION * std::max(1.0, state.lt_beginning)) {
        std::ostringstream msg;
        msg << "Scheduled long-term repayment " << state.lt_amortization
            << " exceeds beginning balance " << state.lt_beginning << "; clamped to balance";
        decision.warnings.emplace_back(WarningKind::NegativeDebt, year, excess, msg.str());
        state.lt_amortization = state.lt_beginning;
        state.lt_tranches.clear();
    }

    // New term debt starts amortizing next year
    if (lt_request > 0.0) {
        state.lt_borrowing = lt_request;
        state.lt_tranches.emplace_back(year, lt_request, assumptions.lt_loan_years.value);
    }
    state.lt_ending = std::max(0.0, state.lt_beginning + state.lt_borrowing - state.lt_amortization);

    decision.financing = state.lt_borrowing - state.lt_amortization;
    decision.pre_financing_cash = position_before_debt + decision.financing;
    decision.minimum_cash = minimum_cash;

    // Discretionary short-term financing
    if (decision.pre_financing_cash < minimum_cash) {
        state.st_borrowing = minimum_cash - decision.pre_financing_cash;
    } else {
        double surplus = decision.pre_financing_cash - minimum_cash;
        state.st_repayment = std::min(surplus, state.st_beginning);
        decision.st_investment_placed = (surplus - state.st_repayment) * assumptions.st_investment_share;
    }
    state.st_ending = state.st_beginning + state.st_borrowing - state.st_repayment;
    decision.discretionary = state.st_borrowing - state.st_repayment - decision.st_investment_placed;

    return decision;
}

} // namespace finproj
