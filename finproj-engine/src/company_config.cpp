#include "company_config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace finproj {

// ============================================================================
// Defaults
// ============================================================================

AssumptionBounds::AssumptionBounds()
    : min_revenue_growth(-0.10),
      max_revenue_growth(0.15),
      min_tax_rate(0.10),
      max_tax_rate(0.40),
      min_cost_of_debt(0.03),
      max_cost_of_debt(0.15),
      min_return_on_cash(0.0),
      max_return_on_cash(0.08) {}

AssumptionDefaults::AssumptionDefaults()
    : revenue_growth(0.03),
      cogs_pct_revenue(0.60),
      sga_pct_revenue(0.20),
      tax_rate(0.21),
      payout_ratio(0.50),
      receivables_pct_revenue(0.08),
      inventory_pct_cogs(0.05),
      payables_pct_cogs(0.10),
      capex_pct_revenue(0.04),
      depreciation_years(10.0),
      cost_of_debt(0.05),
      min_cash_pct_revenue(0.05),
      pct_financing_with_debt(0.70),
      repurchase_pct_revenue(0.0) {}

CompanyConfig::CompanyConfig()
    : n_forecast_years(2),
      n_input_years(3),
      lt_loan_years(10.0),
      st_investment_share(0.0),
      revenue_growth_decay(0.0),
      balance_tolerance(0.01),
      balance_relative_tolerance(1e-9) {}

const std::vector<std::string>& overridable_assumptions() {
    static const std::vector<std::string> names = {
        "revenue_growth",
        "cogs_pct_revenue",
        "sga_pct_revenue",
        "tax_rate",
        "payout_ratio",
        "days_sales_outstanding",
        "days_inventory",
        "days_payable",
        "capex_pct_revenue",
        "depreciation_rate",
        "cost_of_debt",
        "return_on_cash",
        "return_st_investment",
        "repurchase_pct_revenue",
        "min_cash_pct_revenue",
        "pct_financing_with_debt",
        "lt_loan_years",
        "existing_debt_years"
    };
    return names;
}

// ============================================================================
// Validation
// ============================================================================

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

bool is_fraction(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // anonymous namespace

void validate_company_config(const CompanyConfig& config) {
    require(config.n_forecast_years > 0, "n_forecast_years must be greater than 0");
    require(config.n_input_years > 0, "n_input_years must be greater than 0");
    require(config.lt_loan_years > 0.0, "lt_loan_years must be positive");
    if (config.existing_debt_years) {
        require(*config.existing_debt_years > 0.0, "existing_debt_years must be positive");
    }
    if (config.pct_financing_with_debt) {
        require(is_fraction(*config.pct_financing_with_debt),
                "pct_financing_with_debt must be between 0 and 1");
    }
    if (config.minimum_cash_threshold) {
        require(*config.minimum_cash_threshold >= 0.0, "minimum_cash_threshold must be non-negative");
    }
    require(is_fraction(config.st_investment_share), "st_investment_share must be between 0 and 1");
    require(config.revenue_growth_decay >= 0.0 && config.revenue_growth_decay <= 1.0,
            "revenue_growth_decay must be between 0 and 1");
    require(config.balance_tolerance >= 0.0, "balance_tolerance must be non-negative");
    require(config.balance_relative_tolerance >= 0.0, "balance_relative_tolerance must be non-negative");

    const AssumptionBounds& b = config.bounds;
    require(b.min_revenue_growth <= b.max_revenue_growth, "revenue growth bounds are inverted");
    require(b.min_tax_rate <= b.max_tax_rate, "tax rate bounds are inverted");
    require(b.min_cost_of_debt <= b.max_cost_of_debt, "cost of debt bounds are inverted");
    require(b.min_return_on_cash <= b.max_return_on_cash, "return on cash bounds are inverted");

    require(config.defaults.depreciation_years > 0.0, "defaults.depreciation_years must be positive");

    const auto& known = overridable_assumptions();
    for (const auto& [name, value] : config.overrides) {
        require(std::find(known.begin(), known.end(), name) != known.end(),
                "Unknown assumption override: " + name);
        require(std::isfinite(value), "Override " + name + " must be a finite number");
    }
    auto fraction_override = [&](const std::string& name) {
        auto it = config.overrides.find(name);
        if (it != config.overrides.end()) {
            require(is_fraction(it->second), "Override " + name + " must be between 0 and 1");
        }
    };
    fraction_override("payout_ratio");
    fraction_override("tax_rate");
    fraction_override("pct_financing_with_debt");

    for (const char* term : {"lt_loan_years", "existing_debt_years"}) {
        auto it = config.overrides.find(term);
        if (it != config.overrides.end()) {
            require(it->second > 0.0, std::string("Override ") + term + " must be positive");
        }
    }
}

// ============================================================================
// Parsing
// ============================================================================

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

namespace {

void read_number(const json& section, const char* key, double& target) {
    if (section.contains(key)) {
        target = section[key].get<double>();
    }
}

void read_optional(const json& section, const char* key, std::optional<double>& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<double>();
    }
}

} // anonymous namespace

CompanyConfig parse_company_config_from_string(const std::string& json_string) {
    CompanyConfig config;

    try {
        json j = json::parse(json_string);

        if (j.contains("company")) {
            const auto& company = j["company"];
            if (company.contains("name")) config.name = company["name"].get<std::string>();
            if (company.contains("ticker")) config.ticker = company["ticker"].get<std::string>();
        }

        if (j.contains("data_path")) {
            config.data_path = expand_environment_variables(j["data_path"].get<std::string>());
        }

        if (j.contains("forecast")) {
            const auto& forecast = j["forecast"];
            if (forecast.contains("base_year") && !forecast["base_year"].is_null()) {
                config.base_year = forecast["base_year"].get<int>();
            }
            if (forecast.contains("n_forecast_years")) {
                config.n_forecast_years = forecast["n_forecast_years"].get<int>();
            }
            if (forecast.contains("n_input_years")) {
                config.n_input_years = forecast["n_input_years"].get<int>();
            }
            read_number(forecast, "revenue_growth_decay", config.revenue_growth_decay);
        }

        if (j.contains("financing")) {
            const auto& financing = j["financing"];
            read_number(financing, "lt_loan_years", config.lt_loan_years);
            read_optional(financing, "existing_debt_years", config.existing_debt_years);
            read_optional(financing, "pct_financing_with_debt", config.pct_financing_with_debt);
            read_optional(financing, "minimum_cash_threshold", config.minimum_cash_threshold);
            read_number(financing, "st_investment_share", config.st_investment_share);
        }

        if (j.contains("overrides")) {
            const auto& overrides = j["overrides"];
            if (!overrides.is_object()) {
                throw ConfigError("overrides must be an object of assumption names to numbers");
            }
            for (auto it = overrides.begin(); it != overrides.end(); ++it) {
                config.overrides[it.key()] = it.value().get<double>();
            }
        }

        if (j.contains("bounds")) {
            const auto& bounds = j["bounds"];
            read_number(bounds, "min_revenue_growth", config.bounds.min_revenue_growth);
            read_number(bounds, "max_revenue_growth", config.bounds.max_revenue_growth);
            read_number(bounds, "min_tax_rate", config.bounds.min_tax_rate);
            read_number(bounds, "max_tax_rate", config.bounds.max_tax_rate);
            read_number(bounds, "min_cost_of_debt", config.bounds.min_cost_of_debt);
            read_number(bounds, "max_cost_of_debt", config.bounds.max_cost_of_debt);
            read_number(bounds, "min_return_on_cash", config.bounds.min_return_on_cash);
            read_number(bounds, "max_return_on_cash", config.bounds.max_return_on_cash);
        }

        if (j.contains("defaults")) {
            const auto& defaults = j["defaults"];
            AssumptionDefaults& d = config.defaults;
            read_number(defaults, "revenue_growth", d.revenue_growth);
            read_number(defaults, "cogs_pct_revenue", d.cogs_pct_revenue);
            read_number(defaults, "sga_pct_revenue", d.sga_pct_revenue);
            read_number(defaults, "tax_rate", d.tax_rate);
            read_number(defaults, "payout_ratio", d.payout_ratio);
            read_number(defaults, "receivables_pct_revenue", d.receivables_pct_revenue);
            read_number(defaults, "inventory_pct_cogs", d.inventory_pct_cogs);
            read_number(defaults, "payables_pct_cogs", d.payables_pct_cogs);
            read_number(defaults, "capex_pct_revenue", d.capex_pct_revenue);
            read_number(defaults, "depreciation_years", d.depreciation_years);
            read_number(defaults, "cost_of_debt", d.cost_of_debt);
            read_number(defaults, "min_cash_pct_revenue", d.min_cash_pct_revenue);
            read_number(defaults, "pct_financing_with_debt", d.pct_financing_with_debt);
            read_number(defaults, "repurchase_pct_revenue", d.repurchase_pct_revenue);
        }

        if (j.contains("checks")) {
            const auto& checks = j["checks"];
            read_number(checks, "balance_tolerance", config.balance_tolerance);
            read_number(checks, "balance_relative_tolerance", config.balance_relative_tolerance);
        }

    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("JSON type error: ") + e.what());
    } catch (const json::exception& e) {
        throw ConfigError(std::string("JSON error: ") + e.what());
    }

    validate_company_config(config);

    return config;
}

CompanyConfig parse_company_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    CompanyConfig config = parse_company_config_from_string(buffer.str());

    if (!config.data_path.empty()) {
        config.data_path = resolve_relative_path(config.data_path, file_path);
    }

    return config;
}

} // namespace finproj
