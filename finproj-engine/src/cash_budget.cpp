#include "cash_budget.hpp"
#include <algorithm>

namespace finproj {

// ============================================================================
// Working capital
// ============================================================================

WorkingCapital::WorkingCapital()
    : receivables(0.0), inventory(0.0), payables(0.0) {}

WorkingCapital::WorkingCapital(double ar, double inv, double ap)
    : receivables(ar), inventory(inv), payables(ap) {}

WorkingCapital project_working_capital(const IncomeStatementPeriod& is,
                                       const ResolvedAssumptions& assumptions) {
    return WorkingCapital(
        assumptions.days_sales_outstanding.value * is.revenue / DAYS_PER_YEAR,
        assumptions.days_inventory.value * is.cost_of_revenue / DAYS_PER_YEAR,
        assumptions.days_payable.value * is.cost_of_revenue / DAYS_PER_YEAR);
}

// ============================================================================
// Cash budget
// ============================================================================

CashBudgetPeriod::CashBudgetPeriod()
    : year(0), beginning_cash(0.0),
      net_income(0.0), depreciation(0.0), change_in_working_capital(0.0), operating(0.0),
      capital_expenditure(0.0), investing(0.0),
      dividends_paid(0.0), share_repurchases(0.0), equity_issued(0.0), external(0.0),
      investment_gap(0.0), term_financing_need(0.0), lt_debt_request(0.0),
      st_investment_redemption(0.0), st_investment_return(0.0), position_before_debt(0.0),
      financing(0.0), pre_financing_cash(0.0), minimum_cash(0.0), st_investment_placed(0.0),
      discretionary(0.0),
      net_change(0.0), ending_cash(0.0) {}

double CashBudgetPeriod::identity_residual() const {
    return ending_cash -
           (beginning_cash + operating + investing + financing + external + discretionary);
}

CashBudgetPeriod begin_cash_budget(
    const IncomeStatementPeriod& is,
    const WorkingCapital& opening_wc,
    const WorkingCapital& closing_wc,
    double opening_cash,
    double minimum_cash,
    const ResolvedAssumptions& assumptions,
    double opening_st_investments
) {
    CashBudgetPeriod cb;
    cb.year = is.year;
    cb.beginning_cash = opening_cash;
    cb.minimum_cash = minimum_cash;

    cb.net_income = is.net_income;
    cb.depreciation = is.depreciation;
    cb.change_in_working_capital = closing_wc.net() - opening_wc.net();
    cb.st_investment_redemption = std::max(0.0, opening_st_investments);
    cb.st_investment_return = is.investment_income;
    cb.operating = cb.net_income + cb.depreciation - cb.change_in_working_capital -
                   cb.st_investment_return;

    cb.capital_expenditure = is.revenue * assumptions.capex_pct_revenue.value;
    cb.investing = -cb.capital_expenditure;

    cb.dividends_paid = is.dividends;
    cb.share_repurchases = is.revenue * assumptions.repurchase_pct_revenue.value;

    double position = opening_cash + cb.operating + cb.investing
                    - cb.dividends_paid - cb.share_repurchases
                    + cb.st_investment_redemption + cb.st_investment_return;

    cb.investment_gap = std::max(0.0, cb.capital_expenditure - std::max(0.0, cb.operating));
    cb.term_financing_need = std::min(cb.investment_gap, std::max(0.0, minimum_cash - position));

    double debt_share = assumptions.pct_financing_with_debt.value;
    cb.lt_debt_request = cb.term_financing_need * debt_share;
    cb.equity_issued = cb.term_financing_need - cb.lt_debt_request;

    cb.external = cb.equity_issued - cb.dividends_paid - cb.share_repurchases;
    cb.position_before_debt = opening_cash + cb.operating + cb.investing + cb.external +
                              cb.st_investment_redemption + cb.st_investment_return;

    return cb;
}

void close_cash_budget(CashBudgetPeriod& budget, const FinancingDecision& decision) {
    budget.financing = decision.financing;
    budget.pre_financing_cash = decision.pre_financing_cash;
    budget.minimum_cash = decision.minimum_cash;
    budget.st_investment_placed = decision.st_investment_placed;
    budget.discretionary = budget.st_investment_redemption + budget.st_investment_return +
                           decision.discretionary;

    budget.net_change = budget.operating + budget.investing + budget.financing +
                        budget.external + budget.discretionary;
    budget.ending_cash = budget.beginning_cash + budget.net_change;
}

} // namespace finproj
