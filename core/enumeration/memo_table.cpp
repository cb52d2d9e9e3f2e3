#include "enumeration/memo_table.hpp"
#include <stdexcept>
#include <string>

namespace numseek {

bool MemoTable::has(int cost) const {
    return cost >= 1 && cost <= highestLevel();
}

const std::vector<Expression>& MemoTable::level(int cost) const {
    static const std::vector<Expression> kEmpty;
    if (!has(cost)) return kEmpty;
    return levels_[static_cast<size_t>(cost - 1)];
}

void MemoTable::store(int cost, std::vector<Expression> expressions) {
    if (cost != highestLevel() + 1) {
        throw std::logic_error("MemoTable level stored out of order: " +
                               std::to_string(cost));
    }
    levels_.push_back(std::move(expressions));
}

size_t MemoTable::totalExpressions() const {
    size_t total = 0;
    for (const auto& lvl : levels_) total += lvl.size();
    return total;
}

} // namespace numseek
