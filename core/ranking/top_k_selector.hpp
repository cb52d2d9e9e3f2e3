#pragma once

#include "search/search_state.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace numseek {

// ─── Top-K Selector ────────────────────────────────────────────
// Keeps the K distinct values closest to the target.
//
// Entries live in a max-heap keyed on error, so the worst retained
// candidate sits at heap_.front() and can be compared or evicted in
// O(1) / O(log K). A parallel set of quantized values (17 significant
// digits) rejects values that are already represented.

class TopKSelector {
public:
    using TextFn = std::function<std::string()>;

    TopKSelector(double target, size_t keep_top,
                 KeepSide keep_side = KeepSide::BOTH, double epsilon = 1e-12);

    /// Offer a candidate value. `make_text` is only invoked when the value
    /// is actually retained. Returns true if the candidate was retained.
    bool consider(double value, const TextFn& make_text);

    /// Retained candidates, ascending by error, ties broken by text.
    std::vector<CandidateRecord> results() const;

    /// Error of the worst retained candidate (+inf when empty).
    double worstError() const;

    size_t size() const { return heap_.size(); }
    bool full() const { return heap_.size() >= keep_top_; }

    /// Finite values that passed the side filter, duplicates included.
    uint64_t consideredCount() const { return considered_; }

    /// Dedup key: the value printed with 17 significant digits.
    static std::string quantize(double value);

private:
    double target_;
    size_t keep_top_;
    KeepSide keep_side_;
    double epsilon_;
    uint64_t considered_ = 0;

    std::vector<CandidateRecord> heap_;
    std::unordered_set<std::string> saved_keys_;

    bool passesSideFilter(double value) const;

    /// Heap order: larger error first, then larger text.
    static bool worseOnTop(const CandidateRecord& a, const CandidateRecord& b);
};

} // namespace numseek
