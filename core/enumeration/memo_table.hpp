#pragma once

#include "expr/expression.hpp"
#include <cstddef>
#include <deque>
#include <vector>

namespace numseek {

/// Cost-indexed table of every expression produced at each exact cost.
/// Levels are appended in cost order and never touched again. Level
/// storage is a deque of vectors, so appending a level keeps every
/// Expression already stored at its address; later levels point into
/// earlier ones.
class MemoTable {
public:
    /// Has the level for `cost` been completed?
    bool has(int cost) const;

    /// Expressions of a completed level (empty for unknown costs).
    const std::vector<Expression>& level(int cost) const;

    /// Store the next level. `cost` must be highestLevel() + 1.
    /// Throws std::logic_error otherwise.
    void store(int cost, std::vector<Expression> expressions);

    int highestLevel() const { return static_cast<int>(levels_.size()); }
    size_t totalExpressions() const;

private:
    std::deque<std::vector<Expression>> levels_;  // levels_[c - 1] holds cost c
};

} // namespace numseek
