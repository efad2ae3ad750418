#include "forecaster.hpp"
#include "logger.hpp"
#include <chrono>
#include <sstream>

#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace finproj {

ForecastContext::ForecastContext() = default;

ForecastContext::ForecastContext(const CompanyConfig& company_config,
                                 const HistoricalFinancials& historical)
    : config(company_config), history(historical) {}

ForecastResult::ForecastResult()
    : base_year(0), execution_time_ms(0.0) {}

bool ForecastResult::balanced() const {
    for (const ForecastPeriod& p : periods) {
        if (!p.balance_check.balanced) {
            return false;
        }
    }
    return true;
}

BatchOutcome::BatchOutcome() : success(false) {}

// ============================================================================
// Input validation
// ============================================================================

namespace {

struct RequiredField {
    Statement statement;
    const std::string& field;
};

void require_base_year_fields(const HistoricalFinancials& history, int base_year) {
    if (!history.has_year(base_year)) {
        throw MissingDataError("Base year " + std::to_string(base_year) + " is not in the historical data");
    }

    const RequiredField required[] = {
        {Statement::Income, fields::TOTAL_REVENUE},
        {Statement::Income, fields::COST_OF_REVENUE},
        {Statement::Income, fields::NET_INCOME},
        {Statement::Balance, fields::CASH},
        {Statement::Balance, fields::TOTAL_ASSETS},
        {Statement::Balance, fields::TOTAL_LIABILITIES},
        {Statement::Balance, fields::STOCKHOLDERS_EQUITY}
    };

    std::vector<std::string> missing;
    for (const RequiredField& r : required) {
        if (!history.has_value(r.statement, base_year, r.field)) {
            missing.push_back(r.field);
        }
    }
    if (!missing.empty()) {
        std::ostringstream msg;
        msg << "Missing required fields for base year " << base_year << ":";
        for (size_t i = 0; i < missing.size(); ++i) {
            msg << (i == 0 ? " " : ", ") << missing[i];
        }
        throw MissingDataError(msg.str());
    }
}

std::string company_label(const ForecastContext& context) {
    if (!context.config.name.empty()) return context.config.name;
    if (!context.config.ticker.empty()) return context.config.ticker;
    return context.history.company();
}

} // anonymous namespace

// ============================================================================
// run_forecast
// ============================================================================

ForecastResult run_forecast(const ForecastContext& context) {
    auto start_time = std::chrono::high_resolution_clock::now();
    Logger& logger = Logger::get_instance();

    const CompanyConfig& config = context.config;
    validate_company_config(config);

    ForecastResult result;
    result.company = company_label(context);
    result.base_year = config.base_year ? *config.base_year : context.history.latest_year();

    RunContext ctx(result.company, result.base_year);
    logger.log_run_start(ctx, config.n_forecast_years, config.n_input_years);

    // Everything after the base year is hidden from resolution and projection
    const HistoricalFinancials history = context.history.up_to(result.base_year);
    require_base_year_fields(history, result.base_year);

    ctx.phase = "resolve";
    result.assumptions = resolve_assumptions(history, result.base_year, config);
    const ResolvedAssumptions& assumptions = result.assumptions;
    for (const auto& [name, assumption] : assumptions.entries()) {
        logger.log_assumption_resolved(ctx, name, assumption.value, provenance_to_string(assumption.source));
    }

    result.opening_income_statement = IncomeStatementPeriod::from_history(history, result.base_year);
    result.opening_balance_sheet = BalanceSheetPeriod::opening(history, result.base_year);
    result.opening_debt = DebtScheduleState::opening(history, result.base_year, assumptions);
    result.opening_balance_check = check_balance(result.opening_balance_sheet,
                                                 config.balance_tolerance,
                                                 config.balance_relative_tolerance);
    if (!result.opening_balance_check.balanced) {
        std::ostringstream msg;
        msg << "Reported base-year balance sheet does not balance (residual "
            << result.opening_balance_check.residual << "); the residual carries into every period";
        logger.log_warning(ctx, msg.str());
    }

    // Period loop. Each period reads only the prior period's closing values.
    ctx.phase = "project";
    const IncomeStatementPeriod* prior_is = &result.opening_income_statement;
    const BalanceSheetPeriod* prior_bs = &result.opening_balance_sheet;
    const DebtScheduleState* prior_debt = &result.opening_debt;
    result.periods.reserve(static_cast<size_t>(config.n_forecast_years));

    for (int t = 1; t <= config.n_forecast_years; ++t) {
        ForecastPeriod period;
        period.period = t;
        ctx.year = result.base_year + t;

        double interest = interest_for_period(*prior_debt, assumptions.cost_of_debt.value);
        period.income_statement = project_income_statement(
            t, *prior_is, prior_bs->net_ppe, prior_bs->cash, interest, assumptions,
            prior_bs->st_investments);

        WorkingCapital wc = project_working_capital(period.income_statement, assumptions);
        double minimum_cash = assumptions.minimum_cash(period.income_statement.revenue);

        period.cash_budget = begin_cash_budget(
            period.income_statement, prior_bs->working_capital(), wc,
            prior_bs->cash, minimum_cash, assumptions, prior_bs->st_investments);

        FinancingDecision decision = finance_period(
            *prior_debt, ctx.year, period.cash_budget.position_before_debt,
            period.cash_budget.lt_debt_request, minimum_cash, assumptions);
        close_cash_budget(period.cash_budget, decision);
        period.debt = decision.state;

        for (const ForecastWarning& w : decision.warnings) {
            logger.log_warning(ctx, w.message);
            result.warnings.push_back(w);
        }

        period.balance_sheet = assemble_balance_sheet(
            *prior_bs, period.income_statement, period.cash_budget, period.debt, wc);

        period.balance_check = check_balance(period.balance_sheet,
                                             config.balance_tolerance,
                                             config.balance_relative_tolerance);
        if (!period.balance_check.balanced) {
            std::ostringstream msg;
            msg << "Balance check failed: assets - (liabilities + equity) = "
                << period.balance_check.residual << " exceeds tolerance " << period.balance_check.tolerance;
            logger.log_warning(ctx, msg.str());
            result.warnings.emplace_back(WarningKind::BalanceCheckFailure, ctx.year,
                                         period.balance_check.residual, msg.str());
        }

        logger.log_period_complete(ctx, period.cash_budget.ending_cash, period.debt.st_ending,
                                   period.debt.lt_ending, period.balance_check.residual);

        result.periods.push_back(std::move(period));
        prior_is = &result.periods.back().income_statement;
        prior_bs = &result.periods.back().balance_sheet;
        prior_debt = &result.periods.back().debt;
    }
    ctx.year = 0;

    if (result.base_year < context.history.latest_year()) {
        ctx.phase = "backtest";
        result.backtest = run_backtest(result.periods, context.history);
        BacktestSummary summary = summarize_backtest(*result.backtest);
        logger.log_debug(ctx, "Backtest complete", {
            {"comparisons", std::to_string(summary.comparisons)},
            {"periods", std::to_string(summary.periods)},
            {"mean_absolute_percent_error", std::to_string(summary.mean_absolute_percent_error)}
        });
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    ctx.phase.clear();
    logger.log_run_complete(ctx, result.periods.size(), result.warnings.size(), result.execution_time_ms);

    return result;
}

// ============================================================================
// run_forecasts
// ============================================================================

namespace {

void run_one(const ForecastContext& context, BatchOutcome& outcome) {
    outcome.company = company_label(context);
    try {
        outcome.result = run_forecast(context);
        outcome.success = true;
    } catch (const std::exception& e) {
        outcome.success = false;
        outcome.error_message = e.what();
        RunContext ctx(outcome.company, context.config.base_year.value_or(0));
        Logger::get_instance().log_error(ctx, e.what());
    }
}

} // anonymous namespace

std::vector<BatchOutcome> run_forecasts(const std::vector<ForecastContext>& contexts) {
    std::vector<BatchOutcome> outcomes(contexts.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 1)
    for (long i = 0; i < static_cast<long>(contexts.size()); ++i) {
        run_one(contexts[static_cast<size_t>(i)], outcomes[static_cast<size_t>(i)]);
    }
#else
    for (size_t i = 0; i < contexts.size(); ++i) {
        run_one(contexts[i], outcomes[i]);
    }
#endif

    return outcomes;
}

} // namespace finproj
