// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace ucop {

namespace {

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// Decimal or scientific notation; rejects things like "1.0.3" or "0x1F"
bool is_float(const std::string& s) {
    if (s.empty()) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    std::strtod(begin, &end);
    if (end != begin + s.size()) return false;
    // strtod also accepts "inf", "nan" and hex floats, YAML plain scalars do not
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.' && c != '-' && c != '+' && c != 'e' && c != 'E') {
            return false;
        }
    }
    return true;
}

nlohmann::json scalar_to_json(const YAML::Node& node) {
    const std::string& s = node.Scalar();

    // Quoted scalars carry the non-specific "!" tag and are always strings
    if (node.Tag() == "!") {
        return s;
    }

    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    if (s == "~" || s == "null" || s == "Null" || s == "NULL" || s.empty()) return nullptr;

    try {
        if (is_integer(s)) {
            return std::stoll(s);
        }
        if (is_float(s)) {
            return std::stod(s);
        }
    } catch (const std::out_of_range&) {
        // too large for a number, keep the text
        return s;
    }
    return s;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

nlohmann::json parse_yaml_document(const std::string& text) {
    return yaml_to_json(YAML::Load(text));
}

} // namespace ucop
