#pragma once

#include <string>

namespace numseek {

// ─── Operators ─────────────────────────────────────────────────
// Declaration order is the order in which the enumerator applies them.

enum class UnaryOp {
    SIN,
    COS,
    TAN,
    EXP,
    LN,
    SQRT,
    NEGATE
};

enum class BinaryOp {
    ADD,
    SUB,
    MUL,
    DIV,
    POW
};

/// Function name as it appears in rendered text ("-" for negation).
const char* unaryName(UnaryOp op);

/// Infix symbol as it appears in rendered text.
const char* binarySymbol(BinaryOp op);

/// True for + and *, whose operand order does not change the value.
bool isCommutative(BinaryOp op);

// ─── Expression ────────────────────────────────────────────────
// One node of an operation tree. Children are owned by the MemoTable
// level that produced them, which outlives every node pointing at them.
// The textual form is never stored; render() builds it on demand.

struct Expression {
    enum class Kind {
        ATOM,
        UNARY,
        BINARY
    };

    Kind kind = Kind::ATOM;
    double value = 0.0;
    int cost = 1;
    std::string label;              // atoms only: literal or constant name
    UnaryOp unary_op = UnaryOp::NEGATE;
    BinaryOp binary_op = BinaryOp::ADD;
    const Expression* lhs = nullptr;  // operand of a unary node, left of a binary node
    const Expression* rhs = nullptr;

    static Expression atom(std::string label, double value);
    static Expression unary(UnaryOp op, const Expression& operand, double value);
    static Expression binary(BinaryOp op, const Expression& left,
                             const Expression& right, double value);

    /// Render the textual form, e.g. "sqrt((2 + pi))" or "-(ln(3))".
    std::string render() const;

    /// True when this node is a direct call of `fn`, looking through at
    /// most one enclosing negation. Atoms and binary nodes never match.
    bool isDirectCallOf(UnaryOp fn) const;

private:
    void renderInto(std::string& out) const;
};

} // namespace numseek
