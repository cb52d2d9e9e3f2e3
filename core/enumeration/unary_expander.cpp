#include "enumeration/unary_expander.hpp"
#include "expr/evaluator.hpp"
#include "search/search_context.hpp"
#include <cmath>

namespace numseek {

std::string UnaryExpander::name() const { return "unary"; }

bool UnaryExpander::appliesTo(int cost) const { return cost >= 2; }

bool UnaryExpander::cancels(UnaryOp op, const Expression& operand) {
    if (op == UnaryOp::LN) return operand.isDirectCallOf(UnaryOp::EXP);
    if (op == UnaryOp::EXP) return operand.isDirectCallOf(UnaryOp::LN);
    return false;
}

LevelStatus UnaryExpander::expand(int cost, SearchContext& ctx,
                                  std::vector<Expression>& out) const {
    if (ctx.unary_ops.empty()) return LevelStatus::COMPLETE;

    for (const Expression& operand : ctx.memo.level(cost - 1)) {
        if (!ctx.guard.canContinue()) return LevelStatus::INTERRUPTED;
        if (!std::isfinite(operand.value)) continue;

        for (UnaryOp op : ctx.unary_ops) {
            if (!ctx.guard.canContinue()) return LevelStatus::INTERRUPTED;
            if (cancels(op, operand)) continue;

            auto v = NumericEvaluator::apply(op, operand.value);
            if (!v) continue;

            out.push_back(Expression::unary(op, operand, *v));
            const Expression& e = out.back();
            ctx.selector.consider(e.value, [&e] { return e.render(); });
        }
    }
    return LevelStatus::COMPLETE;
}

} // namespace numseek
