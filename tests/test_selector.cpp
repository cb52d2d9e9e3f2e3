#include <gtest/gtest.h>
#include "ranking/top_k_selector.hpp"
#include <cmath>
#include <limits>
#include <string>

using namespace numseek;

namespace {

TopKSelector::TextFn text(const std::string& s) {
    return [s] { return s; };
}

} // namespace

// ─── Bounded ranking ───────────────────────────────────────────

TEST(SelectorTest, KeepsClosestK) {
    TopKSelector sel(0.0, 3);
    for (double v : {5.0, 4.0, 3.0, 2.0, 1.0}) {
        sel.consider(v, text(std::to_string(static_cast<int>(v))));
        EXPECT_LE(sel.size(), 3u);
    }

    auto results = sel.results();
    ASSERT_EQ(results.size(), 3u);
    EXPECT_DOUBLE_EQ(results[0].value, 1.0);
    EXPECT_DOUBLE_EQ(results[1].value, 2.0);
    EXPECT_DOUBLE_EQ(results[2].value, 3.0);
    EXPECT_EQ(results[0].expression, "1");
    EXPECT_DOUBLE_EQ(sel.worstError(), 3.0);
}

TEST(SelectorTest, ReplacementNeedsStrictlySmallerError) {
    TopKSelector sel(0.0, 1);
    EXPECT_TRUE(sel.consider(1.0, text("one")));
    EXPECT_FALSE(sel.consider(-1.0, text("minus one")));

    auto results = sel.results();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].expression, "one");

    EXPECT_TRUE(sel.consider(0.5, text("half")));
    EXPECT_EQ(sel.results()[0].expression, "half");
}

TEST(SelectorTest, WorstErrorOfEmptySelectorIsInfinite) {
    TopKSelector sel(7.0, 4);
    EXPECT_TRUE(std::isinf(sel.worstError()));
    EXPECT_FALSE(sel.full());
}

// ─── Deduplication ─────────────────────────────────────────────

TEST(SelectorTest, DuplicateValuesAreDropped) {
    TopKSelector sel(0.0, 5);
    EXPECT_TRUE(sel.consider(2.0, text("2")));
    EXPECT_FALSE(sel.consider(2.0, text("(1 + 1)")));
    EXPECT_EQ(sel.size(), 1u);
    // Duplicates still count as considered.
    EXPECT_EQ(sel.consideredCount(), 2u);
    EXPECT_EQ(sel.results()[0].expression, "2");
}

TEST(SelectorTest, QuantizeUsesSeventeenDigits) {
    EXPECT_EQ(TopKSelector::quantize(0.0), TopKSelector::quantize(-0.0));
    EXPECT_EQ(TopKSelector::quantize(0.1 + 0.2), "0.30000000000000004");
    EXPECT_NE(TopKSelector::quantize(0.1 + 0.2), TopKSelector::quantize(0.3));
}

TEST(SelectorTest, EvictionKeepsDedupInSync) {
    TopKSelector sel(10.0, 2);
    sel.consider(1.0, text("a"));   // error 9
    sel.consider(2.0, text("b"));   // error 8
    sel.consider(9.0, text("c"));   // evicts a
    sel.consider(8.0, text("d"));   // evicts b
    EXPECT_EQ(sel.size(), 2u);

    EXPECT_FALSE(sel.consider(9.0, text("(4 + 5)")));
    auto results = sel.results();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].expression, "c");
    EXPECT_EQ(results[1].expression, "d");
}

// ─── Lazy text ─────────────────────────────────────────────────

TEST(SelectorTest, TextBuiltOnlyOnAcceptance) {
    int built = 0;
    auto counting = [&built] { built++; return std::string("x"); };

    TopKSelector sel(0.0, 1);
    sel.consider(1.0, counting);
    EXPECT_EQ(built, 1);
    sel.consider(2.0, counting);        // worse
    sel.consider(1.0, counting);        // duplicate
    sel.consider(std::nan(""), counting);
    sel.consider(std::numeric_limits<double>::infinity(), counting);
    EXPECT_EQ(built, 1);
    sel.consider(0.5, counting);        // better
    EXPECT_EQ(built, 2);
}

// ─── Keep-side filter ──────────────────────────────────────────

TEST(SelectorTest, KeepGreaterOnly) {
    TopKSelector sel(10.0, 5, KeepSide::GREATER, 1e-12);
    EXPECT_FALSE(sel.consider(10.0, text("10")));
    EXPECT_FALSE(sel.consider(9.0, text("9")));
    EXPECT_TRUE(sel.consider(11.0, text("11")));
    EXPECT_EQ(sel.consideredCount(), 1u);
    EXPECT_EQ(sel.size(), 1u);
}

TEST(SelectorTest, KeepLessOnly) {
    TopKSelector sel(10.0, 5, KeepSide::LESS, 1e-12);
    EXPECT_FALSE(sel.consider(10.0, text("10")));
    EXPECT_FALSE(sel.consider(11.0, text("11")));
    EXPECT_TRUE(sel.consider(9.0, text("9")));
    EXPECT_EQ(sel.consideredCount(), 1u);
}

// ─── Ordering ──────────────────────────────────────────────────

TEST(SelectorTest, TiesBrokenByText) {
    TopKSelector sel(0.0, 2);
    sel.consider(1.0, text("b"));
    sel.consider(-1.0, text("a"));
    auto results = sel.results();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].expression, "a");
    EXPECT_EQ(results[1].expression, "b");
}
