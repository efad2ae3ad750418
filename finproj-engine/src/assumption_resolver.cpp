#include "assumption_resolver.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace finproj {

std::string provenance_to_string(Provenance provenance) {
    switch (provenance) {
        case Provenance::Overridden: return "overridden";
        case Provenance::Derived: return "derived";
        case Provenance::Defaulted: return "defaulted";
        default: return "unknown";
    }
}

Assumption::Assumption() : value(0.0), source(Provenance::Defaulted) {}

Assumption::Assumption(double v, Provenance p) : value(v), source(p) {}

ResolvedAssumptions::ResolvedAssumptions()
    : revenue_growth_decay(0.0), st_investment_share(0.0) {}

double ResolvedAssumptions::growth_for_period(int period) const {
    double fade = 1.0 - revenue_growth_decay * static_cast<double>(period - 1);
    return revenue_growth.value * std::max(0.0, fade);
}

double ResolvedAssumptions::minimum_cash(double revenue) const {
    if (minimum_cash_threshold) {
        return *minimum_cash_threshold;
    }
    return std::max(0.0, min_cash_pct_revenue.value * revenue);
}

std::vector<std::pair<std::string, Assumption>> ResolvedAssumptions::entries() const {
    return {
        {"revenue_growth", revenue_growth},
        {"cogs_pct_revenue", cogs_pct_revenue},
        {"sga_pct_revenue", sga_pct_revenue},
        {"depreciation_rate", depreciation_rate},
        {"tax_rate", tax_rate},
        {"payout_ratio", payout_ratio},
        {"days_sales_outstanding", days_sales_outstanding},
        {"days_inventory", days_inventory},
        {"days_payable", days_payable},
        {"capex_pct_revenue", capex_pct_revenue},
        {"repurchase_pct_revenue", repurchase_pct_revenue},
        {"cost_of_debt", cost_of_debt},
        {"return_on_cash", return_on_cash},
        {"return_st_investment", return_st_investment},
        {"min_cash_pct_revenue", min_cash_pct_revenue},
        {"pct_financing_with_debt", pct_financing_with_debt},
        {"lt_loan_years", lt_loan_years},
        {"existing_debt_years", existing_debt_years}
    };
}

// ============================================================================
// Resolution helpers
// ============================================================================

namespace {

double mean(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

class Resolver {
public:
    Resolver(const HistoricalFinancials& history, int base_year, const CompanyConfig& config)
        : history_(history),
          config_(config),
          window_(history.window(base_year, static_cast<size_t>(config.n_input_years))) {}

    const std::vector<int>& window() const { return window_; }

    // Override, else clamped mean of the series, else fallback.
    // min_years is the window length the derivation needs.
    Assumption resolve(const std::string& name, const std::vector<double>& series,
                       double fallback, size_t min_years,
                       double lo = -INFINITY, double hi = INFINITY) const {
        auto it = config_.overrides.find(name);
        if (it != config_.overrides.end()) {
            return Assumption(it->second, Provenance::Overridden);
        }
        if (window_.size() < min_years) {
            throw InsufficientHistoryError(
                name + " requires " + std::to_string(min_years) + " historical years but the input window has " +
                std::to_string(window_.size()) + " (n_input_years=" + std::to_string(config_.n_input_years) + ")");
        }
        if (series.empty()) {
            return Assumption(fallback, Provenance::Defaulted);
        }
        return Assumption(std::clamp(mean(series), lo, hi), Provenance::Derived);
    }

    bool overridden(const std::string& name) const {
        return config_.overrides.count(name) > 0;
    }

    std::vector<double> ratio(Statement num_statement, const std::string& numerator,
                              Statement den_statement, const std::string& denominator,
                              bool absolute_numerator = false) const {
        auto values = history_.ratio_series(num_statement, numerator, den_statement, denominator, window_);
        if (absolute_numerator) {
            for (double& v : values) v = std::fabs(v);
        }
        return values;
    }

    // numerator / denominator restricted to years where the denominator is positive
    std::vector<double> ratio_positive(Statement num_statement, const std::string& numerator,
                                       Statement den_statement, const std::string& denominator,
                                       bool absolute_numerator) const {
        std::vector<double> values;
        for (int year : window_) {
            auto num = history_.get_value(num_statement, year, numerator);
            auto den = history_.get_value(den_statement, year, denominator);
            if (num && den && *den > 0.0) {
                values.push_back((absolute_numerator ? std::fabs(*num) : *num) / *den);
            }
        }
        return values;
    }

    std::vector<double> cost_of_debt() const {
        std::vector<double> values;
        for (int year : window_) {
            auto interest = history_.get_value(Statement::Income, year, fields::INTEREST_EXPENSE);
            double debt = history_.value_or(Statement::Balance, year, fields::CURRENT_DEBT, 0.0) +
                          history_.value_or(Statement::Balance, year, fields::LONG_TERM_DEBT, 0.0);
            if (interest && debt > 0.0) {
                values.push_back(std::fabs(*interest) / debt);
            }
        }
        return values;
    }

    // Interest income over cash plus short-term investments, in years that
    // report investments
    std::vector<double> investment_return() const {
        std::vector<double> values;
        for (int year : window_) {
            auto interest = history_.get_value(Statement::Income, year, fields::INTEREST_INCOME);
            auto investments = history_.get_value(Statement::Balance, year, fields::SHORT_TERM_INVESTMENTS);
            double base = history_.value_or(Statement::Balance, year, fields::CASH, 0.0) +
                          investments.value_or(0.0);
            if (interest && investments && *investments > 0.0 && base > 0.0) {
                values.push_back(std::fabs(*interest) / base);
            }
        }
        return values;
    }

    std::vector<double> debt_share() const {
        std::vector<double> values;
        for (int year : window_) {
            auto equity = history_.get_value(Statement::Balance, year, fields::STOCKHOLDERS_EQUITY);
            double debt = history_.value_or(Statement::Balance, year, fields::CURRENT_DEBT, 0.0) +
                          history_.value_or(Statement::Balance, year, fields::LONG_TERM_DEBT, 0.0);
            if (equity && *equity > 0.0 && debt + *equity > 0.0) {
                values.push_back(debt / (debt + *equity));
            }
        }
        return values;
    }

private:
    const HistoricalFinancials& history_;
    const CompanyConfig& config_;
    std::vector<int> window_;
};

constexpr size_t GROWTH_MIN_YEARS = 2;
constexpr size_t LEVEL_MIN_YEARS = 1;

// Share of the lt_loan_years term assumed still outstanding on opening debt
constexpr double EXISTING_DEBT_REMAINING_SHARE = 0.7;

} // anonymous namespace

// ============================================================================
// resolve_assumptions
// ============================================================================

ResolvedAssumptions resolve_assumptions(
    const HistoricalFinancials& history,
    int base_year,
    const CompanyConfig& config
) {
    Resolver r(history, base_year, config);
    const AssumptionDefaults& d = config.defaults;
    const AssumptionBounds& b = config.bounds;
    ResolvedAssumptions a;

    a.revenue_growth = r.resolve("revenue_growth",
        history.growth_series(Statement::Income, fields::TOTAL_REVENUE, r.window()),
        d.revenue_growth, GROWTH_MIN_YEARS, b.min_revenue_growth, b.max_revenue_growth);

    a.cogs_pct_revenue = r.resolve("cogs_pct_revenue",
        r.ratio(Statement::Income, fields::COST_OF_REVENUE, Statement::Income, fields::TOTAL_REVENUE),
        d.cogs_pct_revenue, LEVEL_MIN_YEARS);

    a.sga_pct_revenue = r.resolve("sga_pct_revenue",
        r.ratio(Statement::Income, fields::SGA, Statement::Income, fields::TOTAL_REVENUE),
        d.sga_pct_revenue, LEVEL_MIN_YEARS);

    a.depreciation_rate = r.resolve("depreciation_rate",
        r.ratio_positive(Statement::Income, fields::DEPRECIATION, Statement::Balance, fields::NET_PPE, true),
        1.0 / d.depreciation_years, LEVEL_MIN_YEARS, 0.0, 1.0);

    a.tax_rate = r.resolve("tax_rate",
        r.ratio_positive(Statement::Income, fields::TAX_PROVISION, Statement::Income, fields::PRETAX_INCOME, false),
        d.tax_rate, LEVEL_MIN_YEARS, b.min_tax_rate, b.max_tax_rate);

    a.payout_ratio = r.resolve("payout_ratio",
        r.ratio_positive(Statement::CashFlow, fields::DIVIDENDS_PAID, Statement::Income, fields::NET_INCOME, true),
        d.payout_ratio, LEVEL_MIN_YEARS, 0.0, 1.0);

    a.days_sales_outstanding = r.resolve("days_sales_outstanding",
        [&] {
            auto v = r.ratio(Statement::Balance, fields::ACCOUNTS_RECEIVABLE, Statement::Income, fields::TOTAL_REVENUE);
            for (double& x : v) x *= DAYS_PER_YEAR;
            return v;
        }(),
        d.receivables_pct_revenue * DAYS_PER_YEAR, LEVEL_MIN_YEARS, 0.0);

    a.days_inventory = r.resolve("days_inventory",
        [&] {
            auto v = r.ratio(Statement::Balance, fields::INVENTORY, Statement::Income, fields::COST_OF_REVENUE);
            for (double& x : v) x *= DAYS_PER_YEAR;
            return v;
        }(),
        d.inventory_pct_cogs * DAYS_PER_YEAR, LEVEL_MIN_YEARS, 0.0);

    a.days_payable = r.resolve("days_payable",
        [&] {
            auto v = r.ratio(Statement::Balance, fields::ACCOUNTS_PAYABLE, Statement::Income, fields::COST_OF_REVENUE);
            for (double& x : v) x *= DAYS_PER_YEAR;
            return v;
        }(),
        d.payables_pct_cogs * DAYS_PER_YEAR, LEVEL_MIN_YEARS, 0.0);

    a.capex_pct_revenue = r.resolve("capex_pct_revenue",
        r.ratio(Statement::CashFlow, fields::CAPITAL_EXPENDITURE, Statement::Income, fields::TOTAL_REVENUE, true),
        d.capex_pct_revenue, LEVEL_MIN_YEARS, 0.0);

    a.repurchase_pct_revenue = r.resolve("repurchase_pct_revenue",
        r.ratio(Statement::CashFlow, fields::STOCK_REPURCHASES, Statement::Income, fields::TOTAL_REVENUE, true),
        d.repurchase_pct_revenue, LEVEL_MIN_YEARS, 0.0);

    a.cost_of_debt = r.resolve("cost_of_debt", r.cost_of_debt(),
        d.cost_of_debt, LEVEL_MIN_YEARS, b.min_cost_of_debt, b.max_cost_of_debt);

    double cash_fallback = std::clamp(a.cost_of_debt.value - 0.01, b.min_return_on_cash, b.max_return_on_cash);
    a.return_on_cash = r.resolve("return_on_cash",
        r.ratio_positive(Statement::Income, fields::INTEREST_INCOME, Statement::Balance, fields::CASH, true),
        cash_fallback, LEVEL_MIN_YEARS, b.min_return_on_cash, b.max_return_on_cash);

    a.return_st_investment = r.resolve("return_st_investment", r.investment_return(),
        a.return_on_cash.value, LEVEL_MIN_YEARS, b.min_return_on_cash, b.max_return_on_cash);

    a.min_cash_pct_revenue = r.resolve("min_cash_pct_revenue",
        r.ratio(Statement::Balance, fields::CASH, Statement::Income, fields::TOTAL_REVENUE),
        d.min_cash_pct_revenue, LEVEL_MIN_YEARS, 0.0);

    // The financing section of the config wins over a derived mix
    if (config.pct_financing_with_debt && !r.overridden("pct_financing_with_debt")) {
        a.pct_financing_with_debt = Assumption(*config.pct_financing_with_debt, Provenance::Overridden);
    } else {
        a.pct_financing_with_debt = r.resolve("pct_financing_with_debt", r.debt_share(),
            d.pct_financing_with_debt, LEVEL_MIN_YEARS, 0.0, 1.0);
    }

    // Loan terms are policy: an override, else the financing section, else
    // a share of the new-loan term for the opening debt
    auto term_override = config.overrides.find("lt_loan_years");
    a.lt_loan_years = Assumption(
        term_override != config.overrides.end() ? term_override->second : config.lt_loan_years,
        Provenance::Overridden);

    auto existing_override = config.overrides.find("existing_debt_years");
    if (existing_override != config.overrides.end()) {
        a.existing_debt_years = Assumption(existing_override->second, Provenance::Overridden);
    } else if (config.existing_debt_years) {
        a.existing_debt_years = Assumption(*config.existing_debt_years, Provenance::Overridden);
    } else {
        a.existing_debt_years = Assumption(a.lt_loan_years.value * EXISTING_DEBT_REMAINING_SHARE,
                                           Provenance::Defaulted);
    }

    a.revenue_growth_decay = config.revenue_growth_decay;
    a.st_investment_share = config.st_investment_share;
    a.minimum_cash_threshold = config.minimum_cash_threshold;

    return a;
}

} // namespace finproj
