#include "search/expression_search.hpp"
#include "search/search_context.hpp"
#include "enumeration/atom_generator.hpp"
#include "enumeration/unary_expander.hpp"
#include "enumeration/binary_combiner.hpp"

namespace numseek {

ExpressionSearch::ExpressionSearch() {
    expanders_.push_back(std::make_unique<AtomGenerator>());
    expanders_.push_back(std::make_unique<UnaryExpander>());
    expanders_.push_back(std::make_unique<BinaryCombiner>());
}

SearchResult ExpressionSearch::search(const SearchConfig& config) const {
    SearchContext ctx(config, stop_flag_);
    ctx.guard.start();

    SearchResult result;

    for (int cost = 1; cost <= config.max_cost; cost++) {
        if (!ctx.guard.canContinue()) break;

        std::vector<Expression> level;
        LevelStatus status = LevelStatus::COMPLETE;
        for (const auto& expander : expanders_) {
            if (!expander->appliesTo(cost)) continue;
            status = expander->expand(cost, ctx, level);
            if (status == LevelStatus::INTERRUPTED) break;
        }

        // A partial level is dropped; its candidates stay in the selector.
        if (status == LevelStatus::INTERRUPTED) break;

        ctx.memo.store(cost, std::move(level));
        result.max_level_reached = cost;

        if (progress_) {
            LevelProgress p;
            p.level = cost;
            p.elapsed_seconds = ctx.guard.elapsedSeconds();
            p.candidates_considered = ctx.selector.consideredCount();
            progress_(p);
        }
    }

    result.candidates = ctx.selector.results();
    result.candidates_considered = ctx.selector.consideredCount();
    result.elapsed_seconds = ctx.guard.elapsedSeconds();
    result.budget_exhausted = ctx.guard.fired();
    return result;
}

SearchResult runSearch(const SearchConfig& config, ProgressFn progress) {
    ExpressionSearch search;
    search.setProgressCallback(std::move(progress));
    return search.search(config);
}

} // namespace numseek
