#include "search/search_context.hpp"
#include <algorithm>

namespace numseek {

SearchContext::SearchContext(const SearchConfig& cfg,
                             const std::atomic<bool>* stop_flag)
    : config(cfg),
      unary_ops(enabledUnaryOps(cfg)),
      binary_ops(enabledBinaryOps(cfg)),
      selector(cfg.target, static_cast<size_t>(std::max(cfg.keep_top, 0)),
               cfg.keep_side, cfg.epsilon),
      guard(cfg.max_seconds, stop_flag) {}

std::vector<UnaryOp> enabledUnaryOps(const SearchConfig& config) {
    std::vector<UnaryOp> ops;
    if (config.use_sin)  ops.push_back(UnaryOp::SIN);
    if (config.use_cos)  ops.push_back(UnaryOp::COS);
    if (config.use_tan)  ops.push_back(UnaryOp::TAN);
    if (config.use_exp)  ops.push_back(UnaryOp::EXP);
    if (config.use_ln)   ops.push_back(UnaryOp::LN);
    if (config.use_sqrt) ops.push_back(UnaryOp::SQRT);
    if (config.use_neg)  ops.push_back(UnaryOp::NEGATE);
    return ops;
}

std::vector<BinaryOp> enabledBinaryOps(const SearchConfig& config) {
    std::vector<BinaryOp> ops = {
        BinaryOp::ADD, BinaryOp::SUB, BinaryOp::MUL, BinaryOp::DIV
    };
    if (config.use_pow) ops.push_back(BinaryOp::POW);
    return ops;
}

} // namespace numseek
