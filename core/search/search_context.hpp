#pragma once

#include "search/search_state.hpp"
#include "search/budget_guard.hpp"
#include "enumeration/memo_table.hpp"
#include "ranking/top_k_selector.hpp"
#include "expr/expression.hpp"

#include <atomic>
#include <vector>

namespace numseek {

/// All mutable state of one search run, handed to every expander.
/// Nothing here outlives the run except what results() copies out.
struct SearchContext {
    explicit SearchContext(const SearchConfig& cfg,
                           const std::atomic<bool>* stop_flag = nullptr);

    const SearchConfig& config;
    std::vector<UnaryOp> unary_ops;     // enabled, in application order
    std::vector<BinaryOp> binary_ops;
    MemoTable memo;
    TopKSelector selector;
    BudgetGuard guard;
};

/// Unary functions switched on in `config`, in sin..negate order.
std::vector<UnaryOp> enabledUnaryOps(const SearchConfig& config);

/// + - * / always, then ^ when use_pow is set.
std::vector<BinaryOp> enabledBinaryOps(const SearchConfig& config);

} // namespace numseek
