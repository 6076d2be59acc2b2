/**
 * @file YamlConverter.hpp
 * @brief Bridge between yaml-cpp trees and nlohmann::json values.
 */
#pragma once

#include <string>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace taskweave::infrastructure {

/**
 * Converts between yaml-cpp trees and nlohmann::json values.
 *
 * Plain scalars are typed on the way in (null, bool, integer, float, else
 * string); quoted scalars always stay strings. Strings that would be typed
 * differently are quoted on the way out.
 */
class YamlConverter {
public:
    static nlohmann::json ToJson(const YAML::Node& node);
    static std::string Emit(const nlohmann::json& value);

private:
    static void EmitValue(YAML::Emitter& out, const nlohmann::json& value);
    static bool NeedsQuoting(const std::string& text);
};

} // namespace taskweave::infrastructure
