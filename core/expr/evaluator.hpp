#pragma once

#include "expr/expression.hpp"
#include <optional>

namespace numseek {

/// Numeric Evaluator: applies operators without ever faulting.
/// Every domain violation, overflow or non-finite result comes back as
/// std::nullopt; callers drop those values silently.
class NumericEvaluator {
public:
    /// Results whose magnitude exceeds this are treated as overflow by POW.
    static constexpr double POW_LIMIT = 1e300;

    /// Exponent tolerance for raising a negative base to an integer power.
    static constexpr double INTEGER_EXPONENT_TOLERANCE = 1e-9;

    static std::optional<double> apply(UnaryOp op, double x);
    static std::optional<double> apply(BinaryOp op, double a, double b);

private:
    static std::optional<double> safePow(double base, double exponent);
    static std::optional<double> finiteOrNone(double v);
};

} // namespace numseek
