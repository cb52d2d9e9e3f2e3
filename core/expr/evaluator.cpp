#include "expr/evaluator.hpp"
#include <cmath>

namespace numseek {

std::optional<double> NumericEvaluator::apply(UnaryOp op, double x) {
    if (!std::isfinite(x)) return std::nullopt;

    switch (op) {
        case UnaryOp::SIN:  return finiteOrNone(std::sin(x));
        case UnaryOp::COS:  return finiteOrNone(std::cos(x));
        case UnaryOp::TAN:  return finiteOrNone(std::tan(x));
        case UnaryOp::EXP:  return finiteOrNone(std::exp(x));
        case UnaryOp::LN:
            if (x <= 0.0) return std::nullopt;
            return finiteOrNone(std::log(x));
        case UnaryOp::SQRT:
            if (x < 0.0) return std::nullopt;
            return finiteOrNone(std::sqrt(x));
        case UnaryOp::NEGATE:
            return -x;
    }
    return std::nullopt;
}

std::optional<double> NumericEvaluator::apply(BinaryOp op, double a, double b) {
    switch (op) {
        case BinaryOp::ADD: return finiteOrNone(a + b);
        case BinaryOp::SUB: return finiteOrNone(a - b);
        case BinaryOp::MUL: return finiteOrNone(a * b);
        case BinaryOp::DIV:
            if (b == 0.0) return std::nullopt;
            return finiteOrNone(a / b);
        case BinaryOp::POW:
            return safePow(a, b);
    }
    return std::nullopt;
}

std::optional<double> NumericEvaluator::safePow(double base, double exponent) {
    if (!std::isfinite(base) || !std::isfinite(exponent)) return std::nullopt;

    double v = 0.0;
    if (base < 0.0) {
        // Real powers of a negative base exist only for integer exponents.
        double rounded = std::round(exponent);
        if (std::fabs(exponent - rounded) > INTEGER_EXPONENT_TOLERANCE) {
            return std::nullopt;
        }
        v = std::pow(base, rounded);
    } else {
        v = std::pow(base, exponent);
    }

    if (!std::isfinite(v) || std::fabs(v) > POW_LIMIT) return std::nullopt;
    return v;
}

std::optional<double> NumericEvaluator::finiteOrNone(double v) {
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

} // namespace numseek
