#include "ranking/top_k_selector.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace numseek {

TopKSelector::TopKSelector(double target, size_t keep_top,
                           KeepSide keep_side, double epsilon)
    : target_(target), keep_top_(keep_top),
      keep_side_(keep_side), epsilon_(epsilon) {
    heap_.reserve(keep_top_);
}

bool TopKSelector::consider(double value, const TextFn& make_text) {
    if (!std::isfinite(value)) return false;
    if (!passesSideFilter(value)) return false;
    considered_++;

    double error = std::fabs(target_ - value);
    std::string key = quantize(value);
    if (saved_keys_.count(key) > 0) return false;

    if (heap_.size() < keep_top_) {
        heap_.push_back({error, value, make_text()});
        std::push_heap(heap_.begin(), heap_.end(), worseOnTop);
        saved_keys_.insert(std::move(key));
        return true;
    }

    if (keep_top_ == 0 || !(error < heap_.front().error)) return false;

    // Replace the worst entry
    std::pop_heap(heap_.begin(), heap_.end(), worseOnTop);
    saved_keys_.erase(quantize(heap_.back().value));
    heap_.back() = {error, value, make_text()};
    std::push_heap(heap_.begin(), heap_.end(), worseOnTop);
    saved_keys_.insert(std::move(key));
    return true;
}

std::vector<CandidateRecord> TopKSelector::results() const {
    std::vector<CandidateRecord> sorted = heap_;
    std::sort(sorted.begin(), sorted.end(),
        [](const CandidateRecord& a, const CandidateRecord& b) {
            if (a.error != b.error) return a.error < b.error;
            return a.expression < b.expression;
        });
    return sorted;
}

double TopKSelector::worstError() const {
    if (heap_.empty()) return std::numeric_limits<double>::infinity();
    return heap_.front().error;
}

std::string TopKSelector::quantize(double value) {
    if (value == 0.0) value = 0.0;  // -0 and 0 share a key
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%.17g", value);
    return buf;
}

bool TopKSelector::passesSideFilter(double value) const {
    switch (keep_side_) {
        case KeepSide::GREATER: return value > target_ + epsilon_;
        case KeepSide::LESS:    return value < target_ - epsilon_;
        case KeepSide::BOTH:    return true;
    }
    return true;
}

bool TopKSelector::worseOnTop(const CandidateRecord& a, const CandidateRecord& b) {
    if (a.error != b.error) return a.error < b.error;
    return a.expression < b.expression;
}

} // namespace numseek
