#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace numseek {

/// Which side of the target a retained value may lie on.
enum class KeepSide {
    BOTH,
    GREATER,    // value > target + epsilon
    LESS        // value < target - epsilon
};

/// A named constant offered as a cost-1 atom, e.g. {"pi", 3.14159...}.
struct NamedConstant {
    std::string name;
    double value = 0.0;
};

/// Search configuration parameters.
/// The core assumes these have passed ConfigLoader::validate().
struct SearchConfig {
    int atom_count = 5;             // integer atoms 1..atom_count
    double target = 0.0;
    std::vector<NamedConstant> constants;

    bool use_sin = false;
    bool use_cos = false;
    bool use_tan = false;
    bool use_exp = false;
    bool use_ln = false;
    bool use_sqrt = false;
    bool use_neg = false;
    bool use_pow = false;

    int max_cost = 7;               // ceiling on atoms + operators
    double max_seconds = 10.0;      // wall-clock budget
    int keep_top = 10;              // K
    KeepSide keep_side = KeepSide::BOTH;
    double epsilon = 1e-12;
};

/// One retained approximation.
struct CandidateRecord {
    double error = 0.0;             // |target - value|
    double value = 0.0;
    std::string expression;
};

/// Reported once per completed cost level.
struct LevelProgress {
    int level = 0;
    double elapsed_seconds = 0.0;
    uint64_t candidates_considered = 0;
};

using ProgressFn = std::function<void(const LevelProgress&)>;

/// Result of a search run.
struct SearchResult {
    std::vector<CandidateRecord> candidates;   // ascending by error
    uint64_t candidates_considered = 0;
    int max_level_reached = 0;                 // highest fully completed level
    double elapsed_seconds = 0.0;
    bool budget_exhausted = false;             // time ran out or stop requested
};

} // namespace numseek
