#ifndef UCOP_COMMON_UTILS_YAML_JSON_H
#define UCOP_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace ucop {

// Converts a YAML node to JSON. Quoted scalars stay strings, plain scalars
// are typed (bool, null, integer, float) the way YAML 1.2 core schema reads them.
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parses a YAML (or JSON, which is valid YAML) document. Throws YAML::Exception.
nlohmann::json parse_yaml_document(const std::string& text);

} // namespace ucop

#endif // UCOP_COMMON_UTILS_YAML_JSON_H
