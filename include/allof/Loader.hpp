/**
 * @file Loader.hpp
 * @brief File loading for schema documents and option files
 *
 * Implements loading from:
 * - JSON files (using nlohmann::json, key order preserved)
 * - YAML files (using yaml-cpp)
 * - TOML files (using toml++), option files only
 */

#ifndef ALLOF_LOADER_HPP
#define ALLOF_LOADER_HPP

#include "allof/Value.hpp"
#include <string>

namespace allof {

// ============================================================================
// Single-format loading
// ============================================================================

/**
 * @brief Load a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed Value, objects in document order
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a YAML file.
 *
 * Plain scalars are typed with the YAML core schema (null, true/false,
 * integers, floats); quoted scalars stay strings. Mapping keys are
 * converted to strings.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if YAML syntax is invalid or uses non-scalar keys
 */
Value load_yaml_file(const std::string& path);

/**
 * @brief Load a TOML file.
 *
 * Dates and times are converted to their string form.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

// ============================================================================
// Auto-detect loading
// ============================================================================

/**
 * @brief Load an OpenAPI-style document, detecting format by extension.
 *
 * .json -> JSON, .yaml/.yml -> YAML.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError on syntax errors or an unsupported extension
 */
Value load_document_file(const std::string& path);

/**
 * @brief Load a merge-options file, detecting format by extension.
 *
 * .json -> JSON, .toml -> TOML.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError on syntax errors
 * @throws ConfigError if the extension is not .json or .toml
 */
Value load_config_file(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace allof

#endif // ALLOF_LOADER_HPP
