#ifndef FINPROJ_BALANCE_CHECK_HPP
#define FINPROJ_BALANCE_CHECK_HPP

#include "balance_sheet.hpp"

namespace finproj {

struct BalanceCheckResult {
    int year;
    double total_assets;
    double total_liabilities_and_equity;
    double residual;                // Assets - (Liabilities + Equity)
    double tolerance;               // Tolerance applied to |residual|
    bool balanced;

    BalanceCheckResult();
};

// Balanced when |residual| <= max(absolute_tolerance, relative_tolerance × |total assets|).
// A non-zero residual in a forecast period means a flow was booked on one
// side of the sheet only.
BalanceCheckResult check_balance(const BalanceSheetPeriod& bs,
                                 double absolute_tolerance,
                                 double relative_tolerance = 0.0);

} // namespace finproj

#endif // FINPROJ_BALANCE_CHECK_HPP
