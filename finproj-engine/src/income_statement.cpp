#include "income_statement.hpp"
#include <algorithm>
#include <cmath>

namespace finproj {

IncomeStatementPeriod::IncomeStatementPeriod()
    : year(0), revenue(0.0), cost_of_revenue(0.0), gross_profit(0.0), sga(0.0),
      depreciation(0.0), operating_income(0.0), interest_expense(0.0),
      interest_income(0.0), investment_income(0.0), pretax_income(0.0), tax(0.0), net_income(0.0),
      dividends(0.0) {}

IncomeStatementPeriod IncomeStatementPeriod::from_history(const HistoricalFinancials& history, int year) {
    IncomeStatementPeriod is;
    is.year = year;
    is.revenue = history.require_value(Statement::Income, year, fields::TOTAL_REVENUE);
    is.cost_of_revenue = history.require_value(Statement::Income, year, fields::COST_OF_REVENUE);
    is.gross_profit = is.revenue - is.cost_of_revenue;
    is.sga = history.value_or(Statement::Income, year, fields::SGA, 0.0);
    is.depreciation = std::fabs(history.value_or(Statement::Income, year, fields::DEPRECIATION, 0.0));
    is.operating_income = history.value_or(Statement::Income, year, fields::OPERATING_INCOME,
                                           is.gross_profit - is.sga - is.depreciation);
    is.interest_expense = std::fabs(history.value_or(Statement::Income, year, fields::INTEREST_EXPENSE, 0.0));
    is.interest_income = history.value_or(Statement::Income, year, fields::INTEREST_INCOME, 0.0);
    is.net_income = history.require_value(Statement::Income, year, fields::NET_INCOME);
    is.tax = history.value_or(Statement::Income, year, fields::TAX_PROVISION, 0.0);
    is.pretax_income = history.value_or(Statement::Income, year, fields::PRETAX_INCOME,
                                        is.net_income + is.tax);
    is.dividends = std::fabs(history.value_or(Statement::CashFlow, year, fields::DIVIDENDS_PAID, 0.0));
    return is;
}

IncomeStatementPeriod project_income_statement(
    int period,
    const IncomeStatementPeriod& prior,
    double opening_net_ppe,
    double opening_cash,
    double interest_expense,
    const ResolvedAssumptions& assumptions,
    double opening_st_investments
) {
    IncomeStatementPeriod is;
    is.year = prior.year + 1;

    is.revenue = prior.revenue * (1.0 + assumptions.growth_for_period(period));
    is.cost_of_revenue = is.revenue * assumptions.cogs_pct_revenue.value;
    is.gross_profit = is.revenue - is.cost_of_revenue;
    is.sga = is.revenue * assumptions.sga_pct_revenue.value;
    is.depreciation = std::max(0.0, opening_net_ppe) * assumptions.depreciation_rate.value;
    is.operating_income = is.gross_profit - is.sga - is.depreciation;

    is.interest_expense = interest_expense;
    is.interest_income = std::max(0.0, opening_cash) * assumptions.return_on_cash.value;
    is.investment_income = std::max(0.0, opening_st_investments) * assumptions.return_st_investment.value;

    is.pretax_income = is.operating_income - is.interest_expense + is.interest_income +
                       is.investment_income;
    is.tax = std::max(0.0, is.pretax_income * assumptions.tax_rate.value);
    is.net_income = is.pretax_income - is.tax;
    is.dividends = std::max(0.0, is.net_income * assumptions.payout_ratio.value);

    return is;
}

} // namespace finproj
