#ifndef FINPROJ_ERRORS_HPP
#define FINPROJ_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace finproj {

/**
 * @brief Base class for every error raised by a forecast run
 */
class ForecastError : public std::runtime_error {
public:
    explicit ForecastError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Not enough historical years to derive a required ratio
 *
 * Raised by the assumption resolver before any period is projected.
 */
class InsufficientHistoryError : public ForecastError {
public:
    explicit InsufficientHistoryError(const std::string& message)
        : ForecastError(message) {}
};

/**
 * @brief A required historical field or the base year is absent
 */
class MissingDataError : public ForecastError {
public:
    explicit MissingDataError(const std::string& message)
        : ForecastError(message) {}
};

/**
 * @brief Company configuration is unreadable or out of range
 */
class ConfigError : public ForecastError {
public:
    explicit ConfigError(const std::string& message)
        : ForecastError(message) {}
};

/**
 * @brief Kinds of numerical anomaly recovered during a run
 *
 * These are recorded on the result and logged; they never abort a run.
 */
enum class WarningKind : uint8_t {
    NegativeDebt = 0,           ///< A scheduled repayment exceeded the balance and was clamped
    BalanceCheckFailure = 1     ///< Assets minus liabilities and equity exceeded tolerance
};

std::string warning_kind_to_string(WarningKind kind);

/**
 * @brief A per-period anomaly recorded alongside normal output
 */
struct ForecastWarning {
    WarningKind kind;
    int year;
    double amount;              ///< Clamped excess or balance residual
    std::string message;

    ForecastWarning();
    ForecastWarning(WarningKind k, int y, double a, const std::string& m);
};

} // namespace finproj

#endif // FINPROJ_ERRORS_HPP
