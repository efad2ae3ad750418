#include "balance_sheet.hpp"
#include <algorithm>

namespace finproj {

BalanceSheetPeriod::BalanceSheetPeriod()
    : year(0),
      cash(0.0), accounts_receivable(0.0), inventory(0.0), st_investments(0.0),
      other_current_assets(0.0),
      current_assets(0.0), net_ppe(0.0), goodwill_and_intangibles(0.0),
      other_non_current_assets(0.0), total_assets(0.0),
      accounts_payable(0.0), short_term_debt(0.0), other_current_liabilities(0.0),
      current_liabilities(0.0), long_term_debt(0.0), other_non_current_liabilities(0.0),
      total_liabilities(0.0),
      retained_earnings(0.0), other_equity(0.0), stockholders_equity(0.0),
      minority_interest(0.0), total_equity(0.0) {}

void BalanceSheetPeriod::compute_totals() {
    current_assets = cash + accounts_receivable + inventory + st_investments + other_current_assets;
    total_assets = current_assets + net_ppe + goodwill_and_intangibles + other_non_current_assets;

    current_liabilities = accounts_payable + short_term_debt + other_current_liabilities;
    total_liabilities = current_liabilities + long_term_debt + other_non_current_liabilities;

    stockholders_equity = retained_earnings + other_equity;
    total_equity = stockholders_equity + minority_interest;
}

WorkingCapital BalanceSheetPeriod::working_capital() const {
    return WorkingCapital(accounts_receivable, inventory, accounts_payable);
}

BalanceSheetPeriod BalanceSheetPeriod::opening(const HistoricalFinancials& history, int year) {
    auto reported = [&](const std::string& field) {
        return history.require_value(Statement::Balance, year, field);
    };
    auto optional = [&](const std::string& field, double fallback) {
        return history.value_or(Statement::Balance, year, field, fallback);
    };

    BalanceSheetPeriod bs;
    bs.year = year;

    // Assets
    bs.cash = reported(fields::CASH);
    bs.accounts_receivable = optional(fields::ACCOUNTS_RECEIVABLE, 0.0);
    bs.inventory = optional(fields::INVENTORY, 0.0);
    bs.st_investments = std::max(0.0, optional(fields::SHORT_TERM_INVESTMENTS, 0.0));
    double current_assets = optional(fields::CURRENT_ASSETS,
                                     bs.cash + bs.accounts_receivable + bs.inventory + bs.st_investments);
    bs.other_current_assets = current_assets - bs.cash - bs.accounts_receivable - bs.inventory -
                              bs.st_investments;
    bs.net_ppe = optional(fields::NET_PPE, 0.0);
    bs.goodwill_and_intangibles = optional(fields::GOODWILL_AND_INTANGIBLES, 0.0);
    double total_assets = reported(fields::TOTAL_ASSETS);
    bs.other_non_current_assets = total_assets - current_assets - bs.net_ppe - bs.goodwill_and_intangibles;

    // Liabilities
    bs.accounts_payable = optional(fields::ACCOUNTS_PAYABLE, 0.0);
    bs.short_term_debt = std::max(0.0, optional(fields::CURRENT_DEBT, 0.0));
    double current_liabilities = optional(fields::CURRENT_LIABILITIES,
                                          bs.accounts_payable + bs.short_term_debt);
    bs.other_current_liabilities = current_liabilities - bs.accounts_payable - bs.short_term_debt;
    bs.long_term_debt = std::max(0.0, optional(fields::LONG_TERM_DEBT, 0.0));
    double total_liabilities = reported(fields::TOTAL_LIABILITIES);
    bs.other_non_current_liabilities = total_liabilities - current_liabilities - bs.long_term_debt;

    // Equity
    double stockholders_equity = reported(fields::STOCKHOLDERS_EQUITY);
    bs.retained_earnings = optional(fields::RETAINED_EARNINGS, 0.0);
    bs.other_equity = stockholders_equity - bs.retained_earnings;
    bs.minority_interest = optional(fields::MINORITY_INTEREST, 0.0);

    bs.compute_totals();
    return bs;
}

BalanceSheetPeriod assemble_balance_sheet(
    const BalanceSheetPeriod& prior,
    const IncomeStatementPeriod& is,
    const CashBudgetPeriod& cash_budget,
    const DebtScheduleState& debt,
    const WorkingCapital& working_capital
) {
    BalanceSheetPeriod bs = prior;
    bs.year = is.year;

    bs.cash = cash_budget.ending_cash;
    bs.accounts_receivable = working_capital.receivables;
    bs.inventory = working_capital.inventory;
    bs.st_investments = cash_budget.st_investment_placed;
    bs.net_ppe = prior.net_ppe + cash_budget.capital_expenditure - is.depreciation;

    bs.accounts_payable = working_capital.payables;
    bs.short_term_debt = debt.st_ending;
    bs.long_term_debt = debt.lt_ending;

    bs.retained_earnings = prior.retained_earnings + is.net_income - cash_budget.dividends_paid;
    bs.other_equity = prior.other_equity + cash_budget.equity_issued - cash_budget.share_repurchases;

    bs.compute_totals();
    return bs;
}

} // namespace finproj
