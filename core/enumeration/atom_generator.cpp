#include "enumeration/atom_generator.hpp"
#include "search/search_context.hpp"
#include <string>

namespace numseek {

std::string AtomGenerator::name() const { return "atoms"; }

bool AtomGenerator::appliesTo(int cost) const { return cost == 1; }

LevelStatus AtomGenerator::expand(int /*cost*/, SearchContext& ctx,
                                  std::vector<Expression>& out) const {
    const SearchConfig& config = ctx.config;
    out.reserve(out.size() + static_cast<size_t>(config.atom_count) +
                config.constants.size());

    for (int n = 1; n <= config.atom_count; n++) {
        if (!ctx.guard.canContinue()) return LevelStatus::INTERRUPTED;
        out.push_back(Expression::atom(std::to_string(n), static_cast<double>(n)));
        const Expression& e = out.back();
        ctx.selector.consider(e.value, [&e] { return e.label; });
    }

    for (const NamedConstant& c : config.constants) {
        if (!ctx.guard.canContinue()) return LevelStatus::INTERRUPTED;
        out.push_back(Expression::atom(c.name, c.value));
        const Expression& e = out.back();
        ctx.selector.consider(e.value, [&e] { return e.label; });
    }

    return LevelStatus::COMPLETE;
}

} // namespace numseek
