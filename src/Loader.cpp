/**
 * @file Loader.cpp
 * @brief File loading implementation
 *
 * - JSON files (using nlohmann::json)
 * - YAML files (using yaml-cpp)
 * - TOML files (using toml++)
 */

#include "allof/Loader.hpp"
#include "allof/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace allof {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Convert string to lowercase.
 */
std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string location(int line, int column) {
    return "line " + std::to_string(line) + ", column " + std::to_string(column);
}

/**
 * @brief Convert toml++ node to a Value.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

/**
 * @brief Type a plain YAML scalar with the core schema.
 */
Value yaml_scalar_to_json(const YAML::Node& node) {
    const std::string& text = node.Scalar();

    // Quoted or explicitly tagged scalars are not re-typed.
    if (node.Tag() != "?") {
        return Value(text);
    }

    if (text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return Value(nullptr);
    }
    if (text == "true" || text == "True" || text == "TRUE") {
        return Value(true);
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return Value(false);
    }

    std::int64_t integer = 0;
    if (YAML::convert<std::int64_t>::decode(node, integer)) {
        return Value(integer);
    }
    double number = 0.0;
    if (YAML::convert<double>::decode(node, number)) {
        return Value(number);
    }
    return Value(text);
}

/**
 * @brief Convert a yaml-cpp node to a Value, keeping mapping order.
 */
Value yaml_to_json(const YAML::Node& node, const std::string& path) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return yaml_scalar_to_json(node);

        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& elem : node) {
                arr.push_back(yaml_to_json(elem, path));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& entry : node) {
                if (!entry.first.IsScalar()) {
                    throw ParseError(path, location(entry.first.Mark().line + 1,
                                                    entry.first.Mark().column + 1) +
                                           ": mapping keys must be scalars");
                }
                obj[entry.first.Scalar()] = yaml_to_json(entry.second, path);
            }
            return obj;
        }

        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// Single-format loading
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string content = read_file(path);
    try {
        return Value::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(path, e.what());
    }
}

Value load_yaml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::ParserException& e) {
        throw ParseError(path, location(e.mark.line + 1, e.mark.column + 1) + ": " + e.msg);
    } catch (const YAML::BadFile&) {
        throw FileNotFoundError(path);
    }
    return yaml_to_json(root, path);
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ParseError(path, location(static_cast<int>(e.source().begin.line),
                                        static_cast<int>(e.source().begin.column)) +
                               ": " + std::string(e.description()));
    }
    return toml_value_to_json(table);
}

// ============================================================================
// Auto-detect loading
// ============================================================================

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Value load_document_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".yaml" || ext == ".yml") {
        return load_yaml_file(path);
    }
    throw ParseError(path, "unsupported document type '" + ext +
                           "' (expected .json, .yaml or .yml)");
}

Value load_config_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw ConfigError("Unsupported config file type: " + ext + " (expected .json or .toml)");
}

} // namespace allof
