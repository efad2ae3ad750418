#include "errors.hpp"

namespace finproj {

std::string warning_kind_to_string(WarningKind kind) {
    switch (kind) {
        case WarningKind::NegativeDebt: return "negative_debt";
        case WarningKind::BalanceCheckFailure: return "balance_check_failure";
        default: return "unknown";
    }
}

ForecastWarning::ForecastWarning()
    : kind(WarningKind::BalanceCheckFailure), year(0), amount(0.0) {}

ForecastWarning::ForecastWarning(WarningKind k, int y, double a, const std::string& m)
    : kind(k), year(y), amount(a), message(m) {}

} // namespace finproj
