#include "historical.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <set>
#include <stdexcept>

namespace finproj {

std::string statement_to_string(Statement statement) {
    switch (statement) {
        case Statement::Income: return "income statement";
        case Statement::Balance: return "balance sheet";
        case Statement::CashFlow: return "cash flow";
        default: return "unknown";
    }
}

// ============================================================================
// Accessors
// ============================================================================

HistoricalFinancials::HistoricalFinancials() = default;

HistoricalFinancials::HistoricalFinancials(const std::string& company)
    : company_(company) {}

void HistoricalFinancials::set_value(Statement statement, int year,
                                     const std::string& field, double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Non-finite value for " + field + " in " + std::to_string(year));
    }
    values_[static_cast<size_t>(statement)][year][field] = value;
}

std::optional<double> HistoricalFinancials::get_value(Statement statement, int year,
                                                      const std::string& field) const {
    const auto& by_year = values_[static_cast<size_t>(statement)];
    auto year_it = by_year.find(year);
    if (year_it == by_year.end()) {
        return std::nullopt;
    }
    auto field_it = year_it->second.find(field);
    if (field_it == year_it->second.end()) {
        return std::nullopt;
    }
    return field_it->second;
}

bool HistoricalFinancials::has_value(Statement statement, int year,
                                     const std::string& field) const {
    return get_value(statement, year, field).has_value();
}

double HistoricalFinancials::value_or(Statement statement, int year,
                                      const std::string& field, double fallback) const {
    return get_value(statement, year, field).value_or(fallback);
}

double HistoricalFinancials::require_value(Statement statement, int year,
                                           const std::string& field) const {
    auto value = get_value(statement, year, field);
    if (!value) {
        throw MissingDataError("Missing '" + field + "' in " + statement_to_string(statement) +
                               " for " + std::to_string(year));
    }
    return *value;
}

std::vector<int> HistoricalFinancials::years() const {
    std::set<int> all;
    for (const auto& by_year : values_) {
        for (const auto& entry : by_year) {
            all.insert(entry.first);
        }
    }
    return std::vector<int>(all.begin(), all.end());
}

bool HistoricalFinancials::has_year(int year) const {
    for (const auto& by_year : values_) {
        if (by_year.count(year) > 0) {
            return true;
        }
    }
    return false;
}

bool HistoricalFinancials::empty() const {
    return std::all_of(values_.begin(), values_.end(),
                       [](const auto& by_year) { return by_year.empty(); });
}

int HistoricalFinancials::latest_year() const {
    auto all = years();
    if (all.empty()) {
        throw MissingDataError("No historical data loaded");
    }
    return all.back();
}

std::vector<int> HistoricalFinancials::window(int end_year, size_t n_years) const {
    std::vector<int> result;
    for (int year : years()) {
        if (year <= end_year) {
            result.push_back(year);
        }
    }
    if (result.size() > n_years) {
        result.erase(result.begin(), result.end() - static_cast<std::ptrdiff_t>(n_years));
    }
    return result;
}

HistoricalFinancials HistoricalFinancials::up_to(int year) const {
    HistoricalFinancials truncated(company_);
    for (size_t s = 0; s < NUM_STATEMENTS; ++s) {
        for (const auto& entry : values_[s]) {
            if (entry.first <= year) {
                truncated.values_[s].insert(entry);
            }
        }
    }
    return truncated;
}

std::vector<double> HistoricalFinancials::ratio_series(
    Statement num_statement, const std::string& numerator,
    Statement den_statement, const std::string& denominator,
    const std::vector<int>& years) const {
    std::vector<double> ratios;
    for (int year : years) {
        auto num = get_value(num_statement, year, numerator);
        auto den = get_value(den_statement, year, denominator);
        if (num && den && *den != 0.0) {
            ratios.push_back(*num / *den);
        }
    }
    return ratios;
}

std::vector<double> HistoricalFinancials::growth_series(
    Statement statement, const std::string& field, const std::vector<int>& years) const {
    std::vector<double> growth;
    for (size_t i = 1; i < years.size(); ++i) {
        auto prior = get_value(statement, years[i - 1], field);
        auto current = get_value(statement, years[i], field);
        if (prior && current && *prior != 0.0) {
            growth.push_back(*current / *prior - 1.0);
        }
    }
    return growth;
}

// ============================================================================
// CSV loading
// ============================================================================

std::string HistoricalFinancials::statement_filename(Statement statement) {
    return statement_to_string(statement) + ".csv";
}

int HistoricalFinancials::parse_year(const std::string& header) {
    std::string text = CsvReader::trim(header);
    if (text.size() < 4 ||
        !std::all_of(text.begin(), text.begin() + 4, [](unsigned char c) { return std::isdigit(c); })) {
        throw std::runtime_error("Cannot parse fiscal year from column header: '" + header + "'");
    }
    return std::stoi(text.substr(0, 4));
}

namespace {

bool is_missing_cell(const std::string& cell) {
    if (cell.empty()) {
        return true;
    }
    std::string lower;
    for (char c : cell) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower == "nan" || lower == "none" || lower == "null" || lower == "-";
}

} // anonymous namespace

void HistoricalFinancials::load_statement_csv(Statement statement, const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + statement_to_string(statement) + " file: " + filepath);
    }
    try {
        load_statement_csv(statement, file);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(filepath + ": " + e.what());
    }
}

void HistoricalFinancials::load_statement_csv(Statement statement, std::istream& is) {
    CsvReader reader(is);

    std::vector<std::string> header;
    while (reader.has_more() && header.empty()) {
        header = reader.read_row();
    }
    if (header.size() < 2) {
        throw std::runtime_error("Statement CSV requires a label column and at least one year column");
    }

    // Columns are usually newest first; the first column seen for a year wins
    std::vector<int> column_years;
    std::set<int> seen;
    std::vector<bool> column_used;
    for (size_t c = 1; c < header.size(); ++c) {
        int year = parse_year(header[c]);
        column_years.push_back(year);
        column_used.push_back(seen.insert(year).second);
    }

    size_t line = 1;
    while (reader.has_more()) {
        auto row = reader.read_row();
        ++line;
        if (row.empty() || row[0].empty()) continue;

        const std::string& label = row[0];
        for (size_t c = 1; c < row.size() && c <= column_years.size(); ++c) {
            if (!column_used[c - 1] || is_missing_cell(row[c])) continue;

            // Cells arrive trimmed; the whole cell must parse
            double value = 0.0;
            size_t parsed = 0;
            try {
                value = std::stod(row[c], &parsed);
            } catch (const std::exception&) {
                parsed = 0;
            }
            if (parsed == 0 || parsed != row[c].size()) {
                throw std::runtime_error("Invalid number '" + row[c] + "' for " + label +
                                         " at line " + std::to_string(line));
            }
            if (std::isnan(value)) continue;
            set_value(statement, column_years[c - 1], label, value);
        }
    }
}

HistoricalFinancials HistoricalFinancials::load_from_directory(const std::string& dirpath) {
    HistoricalFinancials history;

    std::string base = dirpath;
    if (!base.empty() && base.back() != '/') {
        base += '/';
    }

    history.load_statement_csv(Statement::Income, base + statement_filename(Statement::Income));
    history.load_statement_csv(Statement::Balance, base + statement_filename(Statement::Balance));

    std::string cash_flow_path = base + statement_filename(Statement::CashFlow);
    std::ifstream probe(cash_flow_path);
    if (probe.good()) {
        probe.close();
        history.load_statement_csv(Statement::CashFlow, cash_flow_path);
    }

    if (history.empty()) {
        throw MissingDataError("No historical values found in " + dirpath);
    }
    return history;
}

} // namespace finproj
