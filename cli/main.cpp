#include "config/config_loader.hpp"
#include "search/expression_search.hpp"

#include <atomic>
#include <csignal>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

std::atomic<bool> g_stop_requested{false};

void interrupt_handler(int) {
    g_stop_requested = true;
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] [TARGET]\n";
    std::cerr << "  -n N                 Integer atoms 1..N (default 5)\n";
    std::cerr << "  -c JSON              Named constants, e.g. '{\"pi\": 3.141592653589793}'\n";
    std::cerr << "  --config FILE        Load settings from a JSON file (options below override it)\n";
    std::cerr << "  --sin --cos --tan --exp --ln --sqrt --neg\n";
    std::cerr << "                       Enable a unary function\n";
    std::cerr << "  --all-unary          Enable every unary function\n";
    std::cerr << "  --pow                Enable the power operator\n";
    std::cerr << "  --max-cost C         Ceiling on atoms + operators (default 7)\n";
    std::cerr << "  --max-seconds S      Wall-clock budget (default 10)\n";
    std::cerr << "  --keep-top K         Number of candidates to keep (default 10)\n";
    std::cerr << "  --keep-side SIDE     greater, less or both (default both)\n";
    std::cerr << "  --epsilon E          Tolerance (default 1e-12)\n";
    std::cerr << "  -v                   Print per-level progress to stderr\n";
}

void print_results(const numseek::SearchConfig& config, const numseek::SearchResult& result) {
    std::cout << "Total expressions considered: " << result.candidates_considered << "\n";
    std::cout << "Max level reached: " << result.max_level_reached << "\n";
    if (result.budget_exhausted) {
        std::cout << "Stopped early after " << std::fixed << std::setprecision(2)
                  << result.elapsed_seconds << "s\n";
        std::cout.unsetf(std::ios::floatfield);
    }

    if (result.candidates.empty()) {
        std::cout << "No candidates found. Try increasing max_seconds or max_cost.\n";
        return;
    }

    std::cout << "Found " << result.candidates.size()
              << " candidates (top " << config.keep_top << ")\n";
    std::cout << std::left << std::setw(5) << "#"
              << std::setw(20) << "error"
              << std::setw(26) << "value"
              << "expression\n";
    for (size_t i = 0; i < result.candidates.size(); i++) {
        const auto& c = result.candidates[i];
        std::cout << std::left << std::setw(5) << (i + 1)
                  << std::setw(20) << std::setprecision(12) << c.error
                  << std::setw(26) << std::setprecision(17) << c.value
                  << c.expression << "\n";
    }
}

int main(int argc, char* argv[]) {
    numseek::SearchConfig config;
    bool verbose = false;

    try {
        // --config is applied first so the remaining options override it.
        for (int i = 1; i < argc; i++) {
            if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config = numseek::ConfigLoader::loadFile(argv[i + 1], config);
            }
        }

        for (int i = 1; i < argc; i++) {
            const char* arg = argv[i];
            bool has_value = i + 1 < argc;
            if (std::strcmp(arg, "--config") == 0 && has_value) {
                i++;
            } else if (std::strcmp(arg, "-n") == 0 && has_value) {
                config.atom_count = numseek::ConfigLoader::parseInteger(arg, argv[++i]);
            } else if (std::strcmp(arg, "-c") == 0 && has_value) {
                config.constants = numseek::ConfigLoader::parseConstants(argv[++i]);
            } else if (std::strcmp(arg, "--sin") == 0) {
                config.use_sin = true;
            } else if (std::strcmp(arg, "--cos") == 0) {
                config.use_cos = true;
            } else if (std::strcmp(arg, "--tan") == 0) {
                config.use_tan = true;
            } else if (std::strcmp(arg, "--exp") == 0) {
                config.use_exp = true;
            } else if (std::strcmp(arg, "--ln") == 0) {
                config.use_ln = true;
            } else if (std::strcmp(arg, "--sqrt") == 0) {
                config.use_sqrt = true;
            } else if (std::strcmp(arg, "--neg") == 0) {
                config.use_neg = true;
            } else if (std::strcmp(arg, "--all-unary") == 0) {
                config.use_sin = config.use_cos = config.use_tan = true;
                config.use_exp = config.use_ln = config.use_sqrt = true;
                config.use_neg = true;
            } else if (std::strcmp(arg, "--pow") == 0) {
                config.use_pow = true;
            } else if (std::strcmp(arg, "--max-cost") == 0 && has_value) {
                config.max_cost = numseek::ConfigLoader::parseInteger(arg, argv[++i]);
            } else if (std::strcmp(arg, "--max-seconds") == 0 && has_value) {
                config.max_seconds = numseek::ConfigLoader::parseNumber(arg, argv[++i]);
            } else if (std::strcmp(arg, "--keep-top") == 0 && has_value) {
                config.keep_top = numseek::ConfigLoader::parseInteger(arg, argv[++i]);
            } else if (std::strcmp(arg, "--keep-side") == 0 && has_value) {
                config.keep_side = numseek::ConfigLoader::parseKeepSide(argv[++i]);
            } else if (std::strcmp(arg, "--epsilon") == 0 && has_value) {
                config.epsilon = numseek::ConfigLoader::parseNumber(arg, argv[++i]);
            } else if (std::strcmp(arg, "-v") == 0) {
                verbose = true;
            } else if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (arg[0] != '-' || (arg[1] >= '0' && arg[1] <= '9') || arg[1] == '.') {
                config.target = numseek::ConfigLoader::parseNumber("TARGET", arg);
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 2;
            }
        }

        numseek::ConfigLoader::validate(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    std::signal(SIGINT, interrupt_handler);

    std::cout << "Starting enumeration: numbers 1.." << config.atom_count
              << "  target=" << std::setprecision(17) << config.target << "\n";
    std::cout << "max_cost=" << config.max_cost
              << "  max_seconds=" << config.max_seconds
              << "  keep_top=" << config.keep_top
              << "  keep_side=" << numseek::ConfigLoader::keepSideName(config.keep_side)
              << "\n";

    try {
        numseek::ExpressionSearch search;
        search.setStopFlag(&g_stop_requested);
        if (verbose) {
            search.setProgressCallback([](const numseek::LevelProgress& p) {
                std::cerr << "% level " << p.level
                          << " elapsed " << std::fixed << std::setprecision(2)
                          << p.elapsed_seconds << "s"
                          << " exprs " << p.candidates_considered << "\n";
                std::cerr.unsetf(std::ios::floatfield);
            });
        }

        numseek::SearchResult result = search.search(config);
        print_results(config, result);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
