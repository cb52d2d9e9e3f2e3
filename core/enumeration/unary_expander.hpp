#pragma once

#include "enumeration/level_expander.hpp"

namespace numseek {

/// Wraps every cost-(c-1) expression in each enabled unary function.
/// ln(exp(x)) and exp(ln(x)) are never produced: both are x again at a
/// higher cost. One enclosing negation is looked through, so ln(-(exp(x)))
/// is skipped too, but ln(-(-(exp(x)))) is not.
class UnaryExpander : public LevelExpander {
public:
    std::string name() const override;
    bool appliesTo(int cost) const override;
    LevelStatus expand(int cost, SearchContext& ctx,
                       std::vector<Expression>& out) const override;

    /// Cancellation rule: would applying `op` to `operand` undo a call?
    static bool cancels(UnaryOp op, const Expression& operand);
};

} // namespace numseek
