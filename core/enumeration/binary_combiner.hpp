#pragma once

#include "enumeration/level_expander.hpp"

namespace numseek {

/// Combines a cost-a and a cost-b expression with one binary operator,
/// for every split a + b + 1 = c.
///
/// Pruning:
/// - identity: no x + 0, x - 0, x * 1 or x / 1 (within epsilon) on the right
/// - commutativity: + and * only in canonical operand order
class BinaryCombiner : public LevelExpander {
public:
    std::string name() const override;
    bool appliesTo(int cost) const override;
    LevelStatus expand(int cost, SearchContext& ctx,
                       std::vector<Expression>& out) const override;

    /// Is `right` the identity element of `op` within epsilon?
    static bool isRightIdentity(BinaryOp op, double right, double epsilon);

    /// Canonical order for commutative operands: (value, text) of `left`
    /// is lexicographically <= that of `right`. Text is only rendered
    /// when the values tie.
    static bool canonicalOrder(const Expression& left, const Expression& right);

private:
    static void emit(BinaryOp op, const Expression& left, const Expression& right,
                     SearchContext& ctx, std::vector<Expression>& out);
};

} // namespace numseek
