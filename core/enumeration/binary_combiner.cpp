#include "enumeration/binary_combiner.hpp"
#include "expr/evaluator.hpp"
#include "search/search_context.hpp"
#include <cmath>

namespace numseek {

std::string BinaryCombiner::name() const { return "binary"; }

bool BinaryCombiner::appliesTo(int cost) const { return cost >= 3; }

bool BinaryCombiner::isRightIdentity(BinaryOp op, double right, double epsilon) {
    switch (op) {
        case BinaryOp::ADD:
        case BinaryOp::SUB:
            return std::fabs(right) <= epsilon;
        case BinaryOp::MUL:
        case BinaryOp::DIV:
            return std::fabs(right - 1.0) <= epsilon;
        case BinaryOp::POW:
            return false;
    }
    return false;
}

bool BinaryCombiner::canonicalOrder(const Expression& left, const Expression& right) {
    if (left.value < right.value) return true;
    if (left.value > right.value) return false;
    return left.render() <= right.render();
}

LevelStatus BinaryCombiner::expand(int cost, SearchContext& ctx,
                                   std::vector<Expression>& out) const {
    const double epsilon = ctx.config.epsilon;

    for (int a_cost = 1; a_cost <= cost - 2; a_cost++) {
        int b_cost = cost - 1 - a_cost;
        const std::vector<Expression>& left_level = ctx.memo.level(a_cost);
        const std::vector<Expression>& right_level = ctx.memo.level(b_cost);

        for (const Expression& L : left_level) {
            if (!ctx.guard.canContinue()) return LevelStatus::INTERRUPTED;
            if (!std::isfinite(L.value)) continue;

            for (const Expression& R : right_level) {
                if (!ctx.guard.canContinue()) return LevelStatus::INTERRUPTED;
                if (!std::isfinite(R.value)) continue;

                for (BinaryOp op : ctx.binary_ops) {
                    if (!ctx.guard.canContinue()) return LevelStatus::INTERRUPTED;

                    if (isCommutative(op)) {
                        if (!isRightIdentity(op, R.value, epsilon) && canonicalOrder(L, R)) {
                            emit(op, L, R, ctx, out);
                        }
                        continue;
                    }

                    // Both orders; each is pruned on its own right operand.
                    if (!isRightIdentity(op, R.value, epsilon)) {
                        emit(op, L, R, ctx, out);
                    }
                    if (!isRightIdentity(op, L.value, epsilon)) {
                        emit(op, R, L, ctx, out);
                    }
                }
            }
        }
    }
    return LevelStatus::COMPLETE;
}

void BinaryCombiner::emit(BinaryOp op, const Expression& left, const Expression& right,
                          SearchContext& ctx, std::vector<Expression>& out) {
    auto v = NumericEvaluator::apply(op, left.value, right.value);
    if (!v) return;

    out.push_back(Expression::binary(op, left, right, *v));
    const Expression& e = out.back();
    ctx.selector.consider(e.value, [&e] { return e.render(); });
}

} // namespace numseek
