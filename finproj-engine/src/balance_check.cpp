#include "balance_check.hpp"
#include <algorithm>
#include <cmath>

namespace finproj {

BalanceCheckResult::BalanceCheckResult()
    : year(0), total_assets(0.0), total_liabilities_and_equity(0.0),
      residual(0.0), tolerance(0.0), balanced(true) {}

BalanceCheckResult check_balance(const BalanceSheetPeriod& bs,
                                 double absolute_tolerance,
                                 double relative_tolerance) {
    BalanceCheckResult result;
    result.year = bs.year;
    result.total_assets = bs.total_assets;
    result.total_liabilities_and_equity = bs.total_liabilities + bs.total_equity;
    result.residual = result.total_assets - result.total_liabilities_and_equity;
    result.tolerance = std::max(absolute_tolerance, relative_tolerance * std::fabs(bs.total_assets));
    result.balanced = std::fabs(result.residual) <= result.tolerance;
    return result;
}

} // namespace finproj
