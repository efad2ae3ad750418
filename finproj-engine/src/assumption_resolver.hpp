#ifndef FINPROJ_ASSUMPTION_RESOLVER_HPP
#define FINPROJ_ASSUMPTION_RESOLVER_HPP

#include "company_config.hpp"
#include "historical.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace finproj {

// Where a resolved assumption came from
enum class Provenance : uint8_t {
    Overridden = 0,     // Supplied by configuration
    Derived = 1,        // Computed from the historical input window
    Defaulted = 2       // Window had no data for the line item; configured fallback
};

std::string provenance_to_string(Provenance provenance);

struct Assumption {
    double value;
    Provenance source;

    Assumption();
    Assumption(double v, Provenance p);
};

// Fully resolved forecast drivers. Every field is populated before the first
// period is projected; downstream modules never see a missing assumption.
struct ResolvedAssumptions {
    // Income statement drivers
    Assumption revenue_growth;
    Assumption cogs_pct_revenue;
    Assumption sga_pct_revenue;
    Assumption depreciation_rate;       // Of opening net PPE
    Assumption tax_rate;
    Assumption payout_ratio;

    // Working capital, in days
    Assumption days_sales_outstanding;  // AR = DSO × revenue / 365
    Assumption days_inventory;          // Inventory = DIO × COGS / 365
    Assumption days_payable;            // AP = DPO × COGS / 365

    // Investment and owners
    Assumption capex_pct_revenue;
    Assumption repurchase_pct_revenue;

    // Financing
    Assumption cost_of_debt;
    Assumption return_on_cash;
    Assumption return_st_investment;    // On short-term investments held over a year end
    Assumption min_cash_pct_revenue;
    Assumption pct_financing_with_debt;
    Assumption lt_loan_years;
    Assumption existing_debt_years;

    double revenue_growth_decay;
    double st_investment_share;                     // Of the surplus left after short-term repayment
    std::optional<double> minimum_cash_threshold;   // Absolute floor; overrides min_cash_pct_revenue

    ResolvedAssumptions();

    // Growth applied in forecast period t (1-based), after linear decay
    double growth_for_period(int period) const;

    // Cash floor for a period with the given revenue
    double minimum_cash(double revenue) const;

    // Named view in a fixed order, for logging and output
    std::vector<std::pair<std::string, Assumption>> entries() const;
};

constexpr double DAYS_PER_YEAR = 365.0;

// Derive every assumption not overridden in config from the trailing
// config.n_input_years of history ending at base_year.
//
// Growth rates need two years in the window, level ratios need one.
// Throws InsufficientHistoryError when the window is shorter than a
// non-overridden assumption needs. Pure: reads history and config only.
ResolvedAssumptions resolve_assumptions(
    const HistoricalFinancials& history,
    int base_year,
    const CompanyConfig& config
);

} // namespace finproj

#endif // FINPROJ_ASSUMPTION_RESOLVER_HPP
