// PyBind11 bindings for the numseek C++ core.
// Exposes configuration, search and result types to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "search/search_state.hpp"
#include "search/expression_search.hpp"
#include "config/config_loader.hpp"

namespace py = pybind11;

PYBIND11_MODULE(numseek_bindings, m) {
    m.doc() = "numseek C++ Core Bindings";

    // ── KeepSide ──
    py::enum_<numseek::KeepSide>(m, "KeepSide")
        .value("BOTH", numseek::KeepSide::BOTH)
        .value("GREATER", numseek::KeepSide::GREATER)
        .value("LESS", numseek::KeepSide::LESS);

    // ── NamedConstant ──
    py::class_<numseek::NamedConstant>(m, "NamedConstant")
        .def(py::init<>())
        .def(py::init([](std::string name, double value) {
            return numseek::NamedConstant{std::move(name), value};
        }))
        .def_readwrite("name", &numseek::NamedConstant::name)
        .def_readwrite("value", &numseek::NamedConstant::value);

    // ── SearchConfig ──
    py::class_<numseek::SearchConfig>(m, "SearchConfig")
        .def(py::init<>())
        .def_readwrite("atom_count", &numseek::SearchConfig::atom_count)
        .def_readwrite("target", &numseek::SearchConfig::target)
        .def_readwrite("constants", &numseek::SearchConfig::constants)
        .def_readwrite("use_sin", &numseek::SearchConfig::use_sin)
        .def_readwrite("use_cos", &numseek::SearchConfig::use_cos)
        .def_readwrite("use_tan", &numseek::SearchConfig::use_tan)
        .def_readwrite("use_exp", &numseek::SearchConfig::use_exp)
        .def_readwrite("use_ln", &numseek::SearchConfig::use_ln)
        .def_readwrite("use_sqrt", &numseek::SearchConfig::use_sqrt)
        .def_readwrite("use_neg", &numseek::SearchConfig::use_neg)
        .def_readwrite("use_pow", &numseek::SearchConfig::use_pow)
        .def_readwrite("max_cost", &numseek::SearchConfig::max_cost)
        .def_readwrite("max_seconds", &numseek::SearchConfig::max_seconds)
        .def_readwrite("keep_top", &numseek::SearchConfig::keep_top)
        .def_readwrite("keep_side", &numseek::SearchConfig::keep_side)
        .def_readwrite("epsilon", &numseek::SearchConfig::epsilon);

    // ── CandidateRecord ──
    py::class_<numseek::CandidateRecord>(m, "CandidateRecord")
        .def(py::init<>())
        .def_readwrite("error", &numseek::CandidateRecord::error)
        .def_readwrite("value", &numseek::CandidateRecord::value)
        .def_readwrite("expression", &numseek::CandidateRecord::expression);

    // ── LevelProgress ──
    py::class_<numseek::LevelProgress>(m, "LevelProgress")
        .def(py::init<>())
        .def_readwrite("level", &numseek::LevelProgress::level)
        .def_readwrite("elapsed_seconds", &numseek::LevelProgress::elapsed_seconds)
        .def_readwrite("candidates_considered", &numseek::LevelProgress::candidates_considered);

    // ── SearchResult ──
    py::class_<numseek::SearchResult>(m, "SearchResult")
        .def(py::init<>())
        .def_readwrite("candidates", &numseek::SearchResult::candidates)
        .def_readwrite("candidates_considered", &numseek::SearchResult::candidates_considered)
        .def_readwrite("max_level_reached", &numseek::SearchResult::max_level_reached)
        .def_readwrite("elapsed_seconds", &numseek::SearchResult::elapsed_seconds)
        .def_readwrite("budget_exhausted", &numseek::SearchResult::budget_exhausted);

    m.def("default_search_config", []() {
        return numseek::SearchConfig{};
    });

    m.def("parse_constants", &numseek::ConfigLoader::parseConstants, py::arg("json_text"));

    m.def("validate_config", &numseek::ConfigLoader::validate, py::arg("config"));

    m.def("run_search", [](const numseek::SearchConfig& config, numseek::ProgressFn progress) {
        numseek::ConfigLoader::validate(config);
        return numseek::runSearch(config, std::move(progress));
    }, py::arg("config"), py::arg("progress") = nullptr);
}
