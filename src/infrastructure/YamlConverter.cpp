/**
 * @file YamlConverter.cpp
 * @brief Implementation of YamlConverter.
 */

#include "infrastructure/YamlConverter.hpp"

#include <algorithm>
#include <stdexcept>

namespace taskweave::infrastructure {

nlohmann::json YamlConverter::ToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;

        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(ToJson(item));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& entry : node) {
                obj[entry.first.as<std::string>()] = ToJson(entry.second);
            }
            return obj;
        }

        case YAML::NodeType::Scalar:
        default:
            break;
    }

    // "!" marks a quoted (non-plain) scalar.
    if (node.Tag() == "!") {
        return node.Scalar();
    }

    long long integer = 0;
    if (YAML::convert<long long>::decode(node, integer)) {
        return integer;
    }
    bool boolean = false;
    if (YAML::convert<bool>::decode(node, boolean)) {
        return boolean;
    }
    double real = 0.0;
    if (YAML::convert<double>::decode(node, real)) {
        return real;
    }
    return node.Scalar();
}

std::string YamlConverter::Emit(const nlohmann::json& value) {
    YAML::Emitter out;
    EmitValue(out, value);
    if (!out.good()) {
        throw std::runtime_error("YAML emitter failed: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

void YamlConverter::EmitValue(YAML::Emitter& out, const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::object:
            out << YAML::BeginMap;
            for (const auto& item : value.items()) {
                out << YAML::Key << item.key() << YAML::Value;
                EmitValue(out, item.value());
            }
            out << YAML::EndMap;
            break;

        case nlohmann::json::value_t::array: {
            // Lists of handles read best on one line.
            bool scalars = std::none_of(value.begin(), value.end(), [](const nlohmann::json& v) {
                return v.is_object() || v.is_array();
            });
            if (scalars) out << YAML::Flow;
            out << YAML::BeginSeq;
            for (const auto& item : value) {
                EmitValue(out, item);
            }
            out << YAML::EndSeq;
            break;
        }

        case nlohmann::json::value_t::string: {
            const auto& text = value.get_ref<const std::string&>();
            if (NeedsQuoting(text)) {
                out << YAML::DoubleQuoted << text;
            } else {
                out << text;
            }
            break;
        }

        case nlohmann::json::value_t::boolean:
            out << value.get<bool>();
            break;

        case nlohmann::json::value_t::number_integer:
            out << value.get<long long>();
            break;

        case nlohmann::json::value_t::number_unsigned:
            out << value.get<unsigned long long>();
            break;

        case nlohmann::json::value_t::number_float:
            out << value.get<double>();
            break;

        case nlohmann::json::value_t::null:
        default:
            out << YAML::Null;
            break;
    }
}

bool YamlConverter::NeedsQuoting(const std::string& text) {
    if (text.empty()) return true;
    if (text == "~" || text == "null" || text == "Null" || text == "NULL") return true;

    YAML::Node scalar(text);
    long long integer = 0;
    bool boolean = false;
    double real = 0.0;
    return YAML::convert<long long>::decode(scalar, integer) ||
           YAML::convert<bool>::decode(scalar, boolean) ||
           YAML::convert<double>::decode(scalar, real);
}

} // namespace taskweave::infrastructure
