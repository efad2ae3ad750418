#include "json_writer.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <utility>
#include <vector>

namespace finproj {
namespace io {

namespace {

// Quoted JSON string with control characters escaped; invalid UTF-8 is replaced
std::string quote(const std::string& str) {
    return nlohmann::json(str).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Streams nested objects with consistent indentation and comma placement
class JsonStream {
public:
    JsonStream(std::ostream& os, bool pretty) : os_(os), pretty_(pretty) {
        os_ << std::fixed << std::setprecision(6);
    }

    void begin_object(const std::string& key = "") { open(key, '{'); }
    void end_object() { close('}'); }
    void begin_array(const std::string& key = "") { open(key, '['); }
    void end_array() { close(']'); }

    void number(const std::string& key, double value) {
        item(key);
        if (std::isfinite(value)) {
            os_ << value;
        } else {
            os_ << "null";
        }
    }

    void integer(const std::string& key, long long value) {
        item(key);
        os_ << value;
    }

    void string(const std::string& key, const std::string& value) {
        item(key);
        os_ << quote(value);
    }

    void boolean(const std::string& key, bool value) {
        item(key);
        os_ << (value ? "true" : "false");
    }

    void null(const std::string& key) {
        item(key);
        os_ << "null";
    }

    void finish() {
        if (pretty_) os_ << "\n";
    }

private:
    std::ostream& os_;
    bool pretty_;
    std::vector<bool> has_items_;

    void newline_indent() {
        if (!pretty_) return;
        os_ << "\n" << std::string(has_items_.size() * 2, ' ');
    }

    void item(const std::string& key) {
        if (!has_items_.empty()) {
            if (has_items_.back()) os_ << ",";
            has_items_.back() = true;
            newline_indent();
        }
        if (!key.empty()) {
            os_ << quote(key) << ":" << (pretty_ ? " " : "");
        }
    }

    void open(const std::string& key, char bracket) {
        item(key);
        os_ << bracket;
        has_items_.push_back(false);
    }

    void close(char bracket) {
        bool had_items = has_items_.back();
        has_items_.pop_back();
        if (had_items) newline_indent();
        os_ << bracket;
    }
};

void write_income_statement(JsonStream& js, const IncomeStatementPeriod& is) {
    js.begin_object("income_statement");
    js.number("revenue", is.revenue);
    js.number("cost_of_revenue", is.cost_of_revenue);
    js.number("gross_profit", is.gross_profit);
    js.number("sga", is.sga);
    js.number("depreciation", is.depreciation);
    js.number("operating_income", is.operating_income);
    js.number("interest_expense", is.interest_expense);
    js.number("interest_income", is.interest_income);
    js.number("investment_income", is.investment_income);
    js.number("pretax_income", is.pretax_income);
    js.number("tax", is.tax);
    js.number("net_income", is.net_income);
    js.number("dividends", is.dividends);
    js.end_object();
}

void write_balance_sheet(JsonStream& js, const BalanceSheetPeriod& bs) {
    js.begin_object("balance_sheet");
    js.number("cash", bs.cash);
    js.number("accounts_receivable", bs.accounts_receivable);
    js.number("inventory", bs.inventory);
    js.number("st_investments", bs.st_investments);
    js.number("other_current_assets", bs.other_current_assets);
    js.number("current_assets", bs.current_assets);
    js.number("net_ppe", bs.net_ppe);
    js.number("goodwill_and_intangibles", bs.goodwill_and_intangibles);
    js.number("other_non_current_assets", bs.other_non_current_assets);
    js.number("total_assets", bs.total_assets);
    js.number("accounts_payable", bs.accounts_payable);
    js.number("short_term_debt", bs.short_term_debt);
    js.number("other_current_liabilities", bs.other_current_liabilities);
    js.number("current_liabilities", bs.current_liabilities);
    js.number("long_term_debt", bs.long_term_debt);
    js.number("other_non_current_liabilities", bs.other_non_current_liabilities);
    js.number("total_liabilities", bs.total_liabilities);
    js.number("retained_earnings", bs.retained_earnings);
    js.number("other_equity", bs.other_equity);
    js.number("stockholders_equity", bs.stockholders_equity);
    js.number("minority_interest", bs.minority_interest);
    js.number("total_equity", bs.total_equity);
    js.end_object();
}

void write_cash_budget(JsonStream& js, const CashBudgetPeriod& cb) {
    js.begin_object("cash_budget");
    js.number("beginning_cash", cb.beginning_cash);
    js.number("operating", cb.operating);
    js.number("change_in_working_capital", cb.change_in_working_capital);
    js.number("investing", cb.investing);
    js.number("capital_expenditure", cb.capital_expenditure);
    js.number("external", cb.external);
    js.number("dividends_paid", cb.dividends_paid);
    js.number("share_repurchases", cb.share_repurchases);
    js.number("equity_issued", cb.equity_issued);
    js.number("financing", cb.financing);
    js.number("st_investment_redemption", cb.st_investment_redemption);
    js.number("st_investment_return", cb.st_investment_return);
    js.number("pre_financing_cash", cb.pre_financing_cash);
    js.number("minimum_cash", cb.minimum_cash);
    js.number("st_investment_placed", cb.st_investment_placed);
    js.number("discretionary", cb.discretionary);
    js.number("net_change", cb.net_change);
    js.number("ending_cash", cb.ending_cash);
    js.end_object();
}

void write_debt(JsonStream& js, const DebtScheduleState& debt) {
    js.begin_object("debt_schedule");
    js.number("st_beginning", debt.st_beginning);
    js.number("st_borrowing", debt.st_borrowing);
    js.number("st_repayment", debt.st_repayment);
    js.number("st_ending", debt.st_ending);
    js.number("lt_beginning", debt.lt_beginning);
    js.number("lt_borrowing", debt.lt_borrowing);
    js.number("lt_amortization", debt.lt_amortization);
    js.number("lt_ending", debt.lt_ending);
    js.number("interest_rate", debt.interest_rate);
    js.number("interest_expense", debt.interest_expense);
    js.integer("lt_tranches", static_cast<long long>(debt.lt_tranches.size()));
    js.end_object();
}

void write_balance_check(JsonStream& js, const BalanceCheckResult& check) {
    js.begin_object("balance_check");
    js.number("residual", check.residual);
    js.number("tolerance", check.tolerance);
    js.boolean("balanced", check.balanced);
    js.end_object();
}

} // anonymous namespace

void write_forecast_result_json(std::ostream& os, const ForecastResult& result,
                                bool pretty_print) {
    JsonStream js(os, pretty_print);
    js.begin_object();

    js.string("company", result.company);
    js.integer("base_year", result.base_year);
    js.boolean("balanced", result.balanced());

    js.begin_object("assumptions");
    for (const auto& [name, assumption] : result.assumptions.entries()) {
        js.begin_object(name);
        js.number("value", assumption.value);
        js.string("provenance", provenance_to_string(assumption.source));
        js.end_object();
    }
    if (result.assumptions.minimum_cash_threshold) {
        js.number("minimum_cash_threshold", *result.assumptions.minimum_cash_threshold);
    }
    js.end_object();

    js.begin_object("opening");
    js.integer("year", result.base_year);
    write_income_statement(js, result.opening_income_statement);
    write_balance_sheet(js, result.opening_balance_sheet);
    write_balance_check(js, result.opening_balance_check);
    js.end_object();

    js.begin_array("periods");
    for (const ForecastPeriod& p : result.periods) {
        js.begin_object();
        js.integer("year", p.year());
        js.integer("period", p.period);
        write_income_statement(js, p.income_statement);
        write_cash_budget(js, p.cash_budget);
        write_debt(js, p.debt);
        write_balance_sheet(js, p.balance_sheet);
        write_balance_check(js, p.balance_check);
        js.end_object();
    }
    js.end_array();

    js.begin_array("warnings");
    for (const ForecastWarning& w : result.warnings) {
        js.begin_object();
        js.string("kind", warning_kind_to_string(w.kind));
        js.integer("year", w.year);
        js.number("amount", w.amount);
        js.string("message", w.message);
        js.end_object();
    }
    js.end_array();

    if (result.backtest) {
        BacktestSummary summary = summarize_backtest(*result.backtest);
        js.begin_object("backtest");
        js.integer("comparisons", static_cast<long long>(summary.comparisons));
        js.number("mean_absolute_percent_error", summary.mean_absolute_percent_error);
        js.begin_array("results");
        for (const BacktestResult& r : *result.backtest) {
            js.begin_object();
            js.integer("year", r.year);
            js.string("line_item", r.line_item);
            js.number("forecast", r.forecast);
            js.number("actual", r.actual);
            js.number("absolute_variance", r.absolute_variance);
            if (r.percent_variance) {
                js.number("percent_variance", *r.percent_variance);
            } else {
                js.null("percent_variance");
            }
            js.end_object();
        }
        js.end_array();
        js.end_object();
    } else {
        js.null("backtest");
    }

    js.number("execution_time_ms", result.execution_time_ms);

    js.end_object();
    js.finish();
}

void write_forecast_result_json(const std::string& filepath, const ForecastResult& result,
                                bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_forecast_result_json(file, result, pretty_print);
}

} // namespace io
} // namespace finproj
