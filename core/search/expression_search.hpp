#pragma once

#include "search/search_state.hpp"
#include "enumeration/level_expander.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace numseek {

/// Expression Search: cost-ordered exhaustive enumeration.
/// Level c is built from levels < c by the registered expanders (atoms,
/// unary, binary), stored in the memo table and never recomputed. Every
/// produced value is offered to the top-K selector as it appears, so a
/// run cut short by the budget still returns everything found so far.
class ExpressionSearch {
public:
    ExpressionSearch();

    /// Called once per completed cost level.
    void setProgressCallback(ProgressFn fn) { progress_ = std::move(fn); }

    /// Optional external stop request, polled with the budget.
    void setStopFlag(const std::atomic<bool>* flag) { stop_flag_ = flag; }

    /// Run the search for `config`. Never throws for a validated config.
    SearchResult search(const SearchConfig& config) const;

    /// Registered expanders in the order they fill a level.
    const std::vector<std::unique_ptr<LevelExpander>>& expanders() const {
        return expanders_;
    }

private:
    std::vector<std::unique_ptr<LevelExpander>> expanders_;
    ProgressFn progress_;
    const std::atomic<bool>* stop_flag_ = nullptr;
};

/// Convenience wrapper for a one-shot run.
SearchResult runSearch(const SearchConfig& config, ProgressFn progress = nullptr);

} // namespace numseek
