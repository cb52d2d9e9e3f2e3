#include "expr/expression.hpp"
#include <utility>

namespace numseek {

const char* unaryName(UnaryOp op) {
    switch (op) {
        case UnaryOp::SIN:    return "sin";
        case UnaryOp::COS:    return "cos";
        case UnaryOp::TAN:    return "tan";
        case UnaryOp::EXP:    return "exp";
        case UnaryOp::LN:     return "ln";
        case UnaryOp::SQRT:   return "sqrt";
        case UnaryOp::NEGATE: return "-";
    }
    return "?";
}

const char* binarySymbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::ADD: return "+";
        case BinaryOp::SUB: return "-";
        case BinaryOp::MUL: return "*";
        case BinaryOp::DIV: return "/";
        case BinaryOp::POW: return "^";
    }
    return "?";
}

bool isCommutative(BinaryOp op) {
    return op == BinaryOp::ADD || op == BinaryOp::MUL;
}

Expression Expression::atom(std::string label, double value) {
    Expression e;
    e.kind = Kind::ATOM;
    e.value = value;
    e.cost = 1;
    e.label = std::move(label);
    return e;
}

Expression Expression::unary(UnaryOp op, const Expression& operand, double value) {
    Expression e;
    e.kind = Kind::UNARY;
    e.value = value;
    e.cost = operand.cost + 1;
    e.unary_op = op;
    e.lhs = &operand;
    return e;
}

Expression Expression::binary(BinaryOp op, const Expression& left,
                              const Expression& right, double value) {
    Expression e;
    e.kind = Kind::BINARY;
    e.value = value;
    e.cost = left.cost + right.cost + 1;
    e.binary_op = op;
    e.lhs = &left;
    e.rhs = &right;
    return e;
}

std::string Expression::render() const {
    std::string out;
    renderInto(out);
    return out;
}

void Expression::renderInto(std::string& out) const {
    switch (kind) {
        case Kind::ATOM:
            out += label;
            break;
        case Kind::UNARY:
            out += unaryName(unary_op);
            out += '(';
            lhs->renderInto(out);
            out += ')';
            break;
        case Kind::BINARY:
            out += '(';
            lhs->renderInto(out);
            out += ' ';
            out += binarySymbol(binary_op);
            out += ' ';
            rhs->renderInto(out);
            out += ')';
            break;
    }
}

bool Expression::isDirectCallOf(UnaryOp fn) const {
    const Expression* node = this;
    // Only one negation layer is looked through: -(-(exp(x))) does not match.
    if (node->kind == Kind::UNARY && node->unary_op == UnaryOp::NEGATE &&
        fn != UnaryOp::NEGATE) {
        node = node->lhs;
    }
    return node->kind == Kind::UNARY && node->unary_op == fn;
}

} // namespace numseek
