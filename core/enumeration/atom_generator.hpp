#pragma once

#include "enumeration/level_expander.hpp"

namespace numseek {

/// Cost-1 producer: integers 1..N as decimal literals, then every named
/// constant under its own name.
class AtomGenerator : public LevelExpander {
public:
    std::string name() const override;
    bool appliesTo(int cost) const override;
    LevelStatus expand(int cost, SearchContext& ctx,
                       std::vector<Expression>& out) const override;
};

} // namespace numseek
