#ifndef FINPROJ_HISTORICAL_HPP
#define FINPROJ_HISTORICAL_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace finproj {

enum class Statement : uint8_t {
    Income = 0,
    Balance = 1,
    CashFlow = 2
};

std::string statement_to_string(Statement statement);

// Row labels as they appear in the statement exports
namespace fields {
// Income statement
inline const std::string TOTAL_REVENUE = "Total Revenue";
inline const std::string COST_OF_REVENUE = "Cost Of Revenue";
inline const std::string SGA = "Selling General And Administration";
inline const std::string DEPRECIATION = "Reconciled Depreciation";
inline const std::string OPERATING_INCOME = "Operating Income";
inline const std::string INTEREST_EXPENSE = "Interest Expense";
inline const std::string INTEREST_INCOME = "Interest Income";
inline const std::string PRETAX_INCOME = "Pretax Income";
inline const std::string TAX_PROVISION = "Tax Provision";
inline const std::string NET_INCOME = "Net Income";

// Balance sheet
inline const std::string CASH = "Cash And Cash Equivalents";
inline const std::string ACCOUNTS_RECEIVABLE = "Accounts Receivable";
inline const std::string INVENTORY = "Inventory";
inline const std::string SHORT_TERM_INVESTMENTS = "Other Short Term Investments";
inline const std::string CURRENT_ASSETS = "Current Assets";
inline const std::string NET_PPE = "Net PPE";
inline const std::string GOODWILL_AND_INTANGIBLES = "Goodwill And Other Intangible Assets";
inline const std::string TOTAL_ASSETS = "Total Assets";
inline const std::string ACCOUNTS_PAYABLE = "Accounts Payable";
inline const std::string CURRENT_DEBT = "Current Debt";
inline const std::string CURRENT_LIABILITIES = "Current Liabilities";
inline const std::string LONG_TERM_DEBT = "Long Term Debt";
inline const std::string TOTAL_LIABILITIES = "Total Liabilities Net Minority Interest";
inline const std::string RETAINED_EARNINGS = "Retained Earnings";
inline const std::string STOCKHOLDERS_EQUITY = "Stockholders Equity";
inline const std::string MINORITY_INTEREST = "Minority Interest";

// Cash flow statement
inline const std::string OPERATING_CASH_FLOW = "Operating Cash Flow";
inline const std::string CAPITAL_EXPENDITURE = "Capital Expenditure";
inline const std::string DIVIDENDS_PAID = "Cash Dividends Paid";
inline const std::string STOCK_REPURCHASES = "Common Stock Payments";
} // namespace fields

// HistoricalFinancials: reported line items per statement and fiscal year.
// Read-only once loaded; a forecast never writes into it.
class HistoricalFinancials {
public:
    static constexpr size_t NUM_STATEMENTS = 3;

    HistoricalFinancials();
    explicit HistoricalFinancials(const std::string& company);

    const std::string& company() const { return company_; }
    void set_company(const std::string& company) { company_ = company; }

    void set_value(Statement statement, int year, const std::string& field, double value);
    std::optional<double> get_value(Statement statement, int year, const std::string& field) const;
    bool has_value(Statement statement, int year, const std::string& field) const;
    double value_or(Statement statement, int year, const std::string& field, double fallback) const;

    // Throws MissingDataError naming the statement, field and year
    double require_value(Statement statement, int year, const std::string& field) const;

    // Fiscal years present in any statement, ascending
    std::vector<int> years() const;
    bool has_year(int year) const;
    bool empty() const;
    int latest_year() const;

    // Up to n_years fiscal years ending at end_year (inclusive), ascending
    std::vector<int> window(int end_year, size_t n_years) const;

    // Copy restricted to years <= year, used to forecast from a historical base
    HistoricalFinancials up_to(int year) const;

    // numerator / denominator for each year in `years` where both are reported
    // and the denominator is non-zero
    std::vector<double> ratio_series(Statement num_statement, const std::string& numerator,
                                     Statement den_statement, const std::string& denominator,
                                     const std::vector<int>& years) const;

    // Year-over-year growth of one field across consecutive entries of `years`
    std::vector<double> growth_series(Statement statement, const std::string& field,
                                      const std::vector<int>& years) const;

    // Load "income statement.csv", "balance sheet.csv" and "cash flow.csv"
    // from a company directory. The balance sheet and income statement are
    // required; a missing cash flow file leaves those fields unreported.
    static HistoricalFinancials load_from_directory(const std::string& dirpath);

    // Statement CSV layout: header row of fiscal year-end dates after a label
    // column, then one row per line item. Empty and "nan" cells are skipped.
    void load_statement_csv(Statement statement, const std::string& filepath);
    void load_statement_csv(Statement statement, std::istream& is);

    static std::string statement_filename(Statement statement);

    // "2024-06-30" or "2024" -> 2024
    static int parse_year(const std::string& header);

private:
    std::string company_;
    // values_[statement][year][field]
    std::array<std::map<int, std::map<std::string, double>>, NUM_STATEMENTS> values_;
};

} // namespace finproj

#endif // FINPROJ_HISTORICAL_HPP
