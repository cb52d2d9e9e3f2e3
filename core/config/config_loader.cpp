#include "config/config_loader.hpp"

#include <json/json.h>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace numseek {

std::vector<NamedConstant> ConfigLoader::parseConstants(const std::string& json_text) {
    if (json_text.empty()) return {};
    return constantsFrom(parseJson(json_text, "constants"));
}

SearchConfig ConfigLoader::loadFile(const std::string& path, SearchConfig base) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return loadString(buf.str(), std::move(base));
}

SearchConfig ConfigLoader::loadString(const std::string& json_text, SearchConfig base) {
    Json::Value root = parseJson(json_text, "config");
    if (!root.isObject()) {
        throw std::invalid_argument("config must be a JSON object");
    }
    applyJson(root, base);
    return base;
}

void ConfigLoader::validate(const SearchConfig& config) {
    if (config.atom_count < 0) {
        throw std::invalid_argument("n must be >= 0, got " + std::to_string(config.atom_count));
    }
    if (!std::isfinite(config.target)) {
        throw std::invalid_argument("target must be a finite number");
    }
    for (const NamedConstant& c : config.constants) {
        checkConstantName(c.name);
        if (!std::isfinite(c.value)) {
            throw std::invalid_argument("constant '" + c.name + "' must be finite");
        }
    }
    if (config.max_cost < 1) {
        throw std::invalid_argument("max_cost must be >= 1, got " + std::to_string(config.max_cost));
    }
    if (!std::isfinite(config.max_seconds) || config.max_seconds < 0.0) {
        throw std::invalid_argument("max_seconds must be a non-negative number");
    }
    if (config.keep_top < 1) {
        throw std::invalid_argument("keep_top must be >= 1, got " + std::to_string(config.keep_top));
    }
    if (!std::isfinite(config.epsilon) || config.epsilon < 0.0) {
        throw std::invalid_argument("epsilon must be a non-negative number");
    }
}

KeepSide ConfigLoader::parseKeepSide(const std::string& text) {
    if (text == "both") return KeepSide::BOTH;
    if (text == "greater") return KeepSide::GREATER;
    if (text == "less") return KeepSide::LESS;
    throw std::invalid_argument("keep_side must be greater, less or both, got '" + text + "'");
}

int ConfigLoader::parseInteger(const std::string& option, const std::string& text) {
    size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(text, &pos);
    } catch (const std::invalid_argument&) {
        pos = 0;
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(option + " is out of range: '" + text + "'");
    }
    if (pos == 0 || pos != text.size()) {
        throw std::invalid_argument(option + " expects an integer, got '" + text + "'");
    }
    return value;
}

double ConfigLoader::parseNumber(const std::string& option, const std::string& text) {
    size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &pos);
    } catch (const std::invalid_argument&) {
        pos = 0;
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(option + " is out of range: '" + text + "'");
    }
    if (pos == 0 || pos != text.size()) {
        throw std::invalid_argument(option + " expects a number, got '" + text + "'");
    }
    return value;
}

std::string ConfigLoader::keepSideName(KeepSide side) {
    switch (side) {
        case KeepSide::GREATER: return "greater";
        case KeepSide::LESS:    return "less";
        case KeepSide::BOTH:    return "both";
    }
    return "both";
}

Json::Value ConfigLoader::parseJson(const std::string& text, const std::string& what) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    Json::Value root;
    std::string errs;
    std::istringstream in(text);
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        throw std::invalid_argument(what + " must be valid JSON: " + errs);
    }
    return root;
}

std::vector<NamedConstant> ConfigLoader::constantsFrom(const Json::Value& obj) {
    if (!obj.isObject()) {
        throw std::invalid_argument("constants must be a JSON object of name -> number");
    }

    // getMemberNames() is sorted, which fixes the atom order.
    std::vector<NamedConstant> constants;
    for (const std::string& name : obj.getMemberNames()) {
        const Json::Value& v = obj[name];
        if (!v.isNumeric()) {
            throw std::invalid_argument("constant '" + name + "' must be a number");
        }
        checkConstantName(name);
        NamedConstant c;
        c.name = name;
        c.value = v.asDouble();
        if (!std::isfinite(c.value)) {
            throw std::invalid_argument("constant '" + name + "' must be finite");
        }
        constants.push_back(c);
    }
    return constants;
}

void ConfigLoader::applyJson(const Json::Value& root, SearchConfig& config) {
    auto intField = [&](const char* key, int& field) {
        if (!root.isMember(key)) return;
        const Json::Value& v = root[key];
        if (!v.isInt()) throw std::invalid_argument(std::string(key) + " must be an integer");
        field = v.asInt();
    };
    auto doubleField = [&](const char* key, double& field) {
        if (!root.isMember(key)) return;
        const Json::Value& v = root[key];
        if (!v.isNumeric()) throw std::invalid_argument(std::string(key) + " must be a number");
        field = v.asDouble();
    };
    auto boolField = [&](const char* key, bool& field) {
        if (!root.isMember(key)) return;
        const Json::Value& v = root[key];
        if (!v.isBool()) throw std::invalid_argument(std::string(key) + " must be true or false");
        field = v.asBool();
    };

    intField("n", config.atom_count);
    doubleField("target", config.target);
    if (root.isMember("consts")) {
        config.constants = constantsFrom(root["consts"]);
    }

    boolField("use_sin", config.use_sin);
    boolField("use_cos", config.use_cos);
    boolField("use_tan", config.use_tan);
    boolField("use_exp", config.use_exp);
    boolField("use_ln", config.use_ln);
    boolField("use_sqrt", config.use_sqrt);
    boolField("use_neg", config.use_neg);
    boolField("use_pow", config.use_pow);

    intField("max_cost", config.max_cost);
    doubleField("max_seconds", config.max_seconds);
    intField("keep_top", config.keep_top);
    doubleField("epsilon", config.epsilon);

    if (root.isMember("keep_side")) {
        const Json::Value& v = root["keep_side"];
        if (!v.isString()) throw std::invalid_argument("keep_side must be a string");
        config.keep_side = parseKeepSide(v.asString());
    }
}

void ConfigLoader::checkConstantName(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("constant names must not be empty");
    }
    for (char ch : name) {
        if (ch == '(' || ch == ')' || ch == ' ' || ch == '\t' || ch == '\n') {
            throw std::invalid_argument("constant name '" + name +
                                        "' must not contain spaces or parentheses");
        }
    }
    // A numeric name would print exactly like an integer atom.
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (std::isdigit(first) || first == '.' || first == '+' || first == '-') {
        char* end = nullptr;
        std::strtod(name.c_str(), &end);
        if (end == name.c_str() + name.size()) {
            throw std::invalid_argument("constant name '" + name +
                                        "' must not be a number");
        }
    }
}

} // namespace numseek
