#pragma once

#include "expr/expression.hpp"
#include <string>
#include <vector>

namespace numseek {

struct SearchContext;

/// Outcome of filling one cost level.
enum class LevelStatus {
    COMPLETE,
    INTERRUPTED     // BudgetGuard fired; the partial level is discarded
};

/// Base class for the producers of a cost level.
/// E_c = atoms (c = 1) ∪ unary(E_{c-1}) ∪ binary(E_a, E_b) with a + b + 1 = c
/// Each expander reads completed levels from ctx.memo, appends the new
/// expressions to `out` and offers every finite value to ctx.selector.
class LevelExpander {
public:
    virtual ~LevelExpander() = default;

    /// Human-readable name of this expander.
    virtual std::string name() const = 0;

    /// Can this expander produce anything at `cost`?
    virtual bool appliesTo(int cost) const = 0;

    /// Append the cost-`cost` expressions this expander is responsible for.
    virtual LevelStatus expand(int cost, SearchContext& ctx,
                               std::vector<Expression>& out) const = 0;
};

} // namespace numseek
