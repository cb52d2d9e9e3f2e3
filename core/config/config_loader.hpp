#pragma once

#include "search/search_state.hpp"
#include <string>
#include <vector>

namespace Json { class Value; }

namespace numseek {

// ─── Config Loader ─────────────────────────────────────────────
// Turns user input into a SearchConfig and rejects anything the search
// core is not prepared for. The core itself performs no validation.
//
// JSON documents use these keys:
//   { "n": 4, "target": 24, "consts": {"pi": 3.14159},
//     "use_sin": false, ..., "use_pow": true,
//     "max_cost": 7, "max_seconds": 10, "keep_top": 10,
//     "keep_side": "both", "epsilon": 1e-12 }
// Missing keys keep their current value.

class ConfigLoader {
public:
    /// Parse a JSON object of name -> number. Throws std::invalid_argument.
    static std::vector<NamedConstant> parseConstants(const std::string& json_text);

    /// Read a JSON configuration file on top of `base`.
    /// Throws std::runtime_error if the file cannot be read and
    /// std::invalid_argument if its content is malformed.
    static SearchConfig loadFile(const std::string& path, SearchConfig base = {});

    /// Apply a JSON configuration document given as text.
    static SearchConfig loadString(const std::string& json_text, SearchConfig base = {});

    /// Throws std::invalid_argument describing the first bad field.
    static void validate(const SearchConfig& config);

    /// Parse a whole command-line value; trailing characters are an error.
    /// Throws std::invalid_argument naming `option`.
    static int parseInteger(const std::string& option, const std::string& text);
    static double parseNumber(const std::string& option, const std::string& text);

    static KeepSide parseKeepSide(const std::string& text);
    static std::string keepSideName(KeepSide side);

private:
    static Json::Value parseJson(const std::string& text, const std::string& what);
    static std::vector<NamedConstant> constantsFrom(const Json::Value& obj);
    static void applyJson(const Json::Value& root, SearchConfig& config);
    static void checkConstantName(const std::string& name);
};

} // namespace numseek
