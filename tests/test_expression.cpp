#include <gtest/gtest.h>
#include "expr/expression.hpp"

using namespace numseek;

// ─── Rendering ─────────────────────────────────────────────────

TEST(ExpressionTest, AtomRendersLabel) {
    Expression pi = Expression::atom("pi", 3.14159);
    EXPECT_EQ(pi.render(), "pi");
    EXPECT_EQ(pi.cost, 1);
    EXPECT_EQ(pi.kind, Expression::Kind::ATOM);
}

TEST(ExpressionTest, UnaryRendersCall) {
    Expression two = Expression::atom("2", 2.0);
    Expression root = Expression::unary(UnaryOp::SQRT, two, 1.4142135623730951);
    EXPECT_EQ(root.render(), "sqrt(2)");
    EXPECT_EQ(root.cost, 2);

    Expression neg = Expression::unary(UnaryOp::NEGATE, root, -1.4142135623730951);
    EXPECT_EQ(neg.render(), "-(sqrt(2))");
    EXPECT_EQ(neg.cost, 3);
}

TEST(ExpressionTest, BinaryRendersParenthesized) {
    Expression one = Expression::atom("1", 1.0);
    Expression two = Expression::atom("2", 2.0);
    Expression root = Expression::unary(UnaryOp::SQRT, two, 1.4142135623730951);
    Expression sum = Expression::binary(BinaryOp::ADD, one, root, 2.4142135623730951);
    EXPECT_EQ(sum.render(), "(1 + sqrt(2))");
    EXPECT_EQ(sum.cost, 4);

    Expression power = Expression::binary(BinaryOp::POW, sum, two, 5.82842712474619);
    EXPECT_EQ(power.render(), "((1 + sqrt(2)) ^ 2)");
    EXPECT_EQ(power.cost, 6);
}

TEST(ExpressionTest, OperatorNames) {
    EXPECT_STREQ(unaryName(UnaryOp::LN), "ln");
    EXPECT_STREQ(unaryName(UnaryOp::NEGATE), "-");
    EXPECT_STREQ(binarySymbol(BinaryOp::DIV), "/");
    EXPECT_STREQ(binarySymbol(BinaryOp::POW), "^");
    EXPECT_TRUE(isCommutative(BinaryOp::ADD));
    EXPECT_TRUE(isCommutative(BinaryOp::MUL));
    EXPECT_FALSE(isCommutative(BinaryOp::SUB));
    EXPECT_FALSE(isCommutative(BinaryOp::DIV));
    EXPECT_FALSE(isCommutative(BinaryOp::POW));
}

// ─── Direct application ────────────────────────────────────────

TEST(ExpressionTest, DirectCallMatchesFunction) {
    Expression one = Expression::atom("1", 1.0);
    Expression e = Expression::unary(UnaryOp::EXP, one, 2.718281828459045);
    EXPECT_TRUE(e.isDirectCallOf(UnaryOp::EXP));
    EXPECT_FALSE(e.isDirectCallOf(UnaryOp::LN));
    EXPECT_FALSE(one.isDirectCallOf(UnaryOp::EXP));
}

TEST(ExpressionTest, DirectCallLooksThroughOneNegation) {
    Expression one = Expression::atom("1", 1.0);
    Expression e = Expression::unary(UnaryOp::EXP, one, 2.718281828459045);
    Expression neg = Expression::unary(UnaryOp::NEGATE, e, -2.718281828459045);
    Expression negneg = Expression::unary(UnaryOp::NEGATE, neg, 2.718281828459045);

    EXPECT_TRUE(neg.isDirectCallOf(UnaryOp::EXP));
    EXPECT_FALSE(negneg.isDirectCallOf(UnaryOp::EXP));
    EXPECT_TRUE(neg.isDirectCallOf(UnaryOp::NEGATE));
}

TEST(ExpressionTest, BinaryNodeIsNeverDirectCall) {
    Expression one = Expression::atom("1", 1.0);
    Expression e1 = Expression::unary(UnaryOp::EXP, one, 2.718281828459045);
    Expression sum = Expression::binary(BinaryOp::ADD, e1, e1, 5.43656365691809);
    // "(exp(1) + exp(1))" starts with "(exp(" but is not a call of exp.
    EXPECT_FALSE(sum.isDirectCallOf(UnaryOp::EXP));
}
