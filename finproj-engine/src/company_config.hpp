/**
 * @file company_config.hpp
 * @brief Per-company forecast configuration loaded from JSON
 */

#ifndef FINPROJ_COMPANY_CONFIG_HPP
#define FINPROJ_COMPANY_CONFIG_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace finproj {

/**
 * @brief Clamping bounds applied to ratios derived from history
 */
struct AssumptionBounds {
    double min_revenue_growth;
    double max_revenue_growth;
    double min_tax_rate;
    double max_tax_rate;
    double min_cost_of_debt;
    double max_cost_of_debt;
    double min_return_on_cash;
    double max_return_on_cash;

    AssumptionBounds();
};

/**
 * @brief Fallback values used when the input window reports nothing for a line item
 */
struct AssumptionDefaults {
    double revenue_growth;
    double cogs_pct_revenue;
    double sga_pct_revenue;
    double tax_rate;
    double payout_ratio;
    double receivables_pct_revenue;     ///< DSO = pct × 365
    double inventory_pct_cogs;          ///< DIO = pct × 365
    double payables_pct_cogs;           ///< DPO = pct × 365
    double capex_pct_revenue;
    double depreciation_years;          ///< depreciation_rate = 1 / years
    double cost_of_debt;
    double min_cash_pct_revenue;
    double pct_financing_with_debt;
    double repurchase_pct_revenue;

    AssumptionDefaults();
};

/**
 * @brief Everything a forecast run needs besides the historical statements
 *
 * Optional fields are resolved downstream: an unset base_year means the
 * latest reported year, an unset minimum_cash_threshold means a derived
 * percentage of revenue, and unset financing fields fall back to derived
 * ratios or defaults.
 */
struct CompanyConfig {
    std::string name;
    std::string ticker;
    std::string data_path;                      ///< Directory holding the statement CSVs

    std::optional<int> base_year;
    int n_forecast_years;
    int n_input_years;

    double lt_loan_years;                       ///< Amortization term for new long-term debt
    std::optional<double> existing_debt_years;  ///< Remaining term of the opening long-term debt
    std::optional<double> pct_financing_with_debt;
    std::optional<double> minimum_cash_threshold;
    double st_investment_share;                 ///< Share of the surplus above the cash floor placed in short-term investments
    double revenue_growth_decay;                ///< Linear fade of growth per forecast year

    double balance_tolerance;
    double balance_relative_tolerance;

    std::map<std::string, double> overrides;    ///< Assumption name -> fixed value
    AssumptionBounds bounds;
    AssumptionDefaults defaults;

    CompanyConfig();
};

/**
 * @brief Names accepted in the "overrides" section
 */
const std::vector<std::string>& overridable_assumptions();

/**
 * @brief Checks ranges and override names
 *
 * @throws ConfigError describing the first invalid field
 */
void validate_company_config(const CompanyConfig& config);

/**
 * @brief Parses a company configuration from a JSON string
 *
 * @throws ConfigError if JSON is invalid or the configuration fails validation
 */
CompanyConfig parse_company_config_from_string(const std::string& json_string);

/**
 * @brief Parses a company configuration from a JSON file
 *
 * A relative data_path is resolved against the directory of the file.
 *
 * @throws ConfigError if the file cannot be read, JSON is invalid or the
 *         configuration fails validation
 */
CompanyConfig parse_company_config_from_file(const std::string& file_path);

/**
 * @brief Expands ${VAR} and $VAR references from the environment
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a relative path against the directory of config_file_path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace finproj

#endif // FINPROJ_COMPANY_CONFIG_HPP
