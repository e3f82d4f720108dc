/**
 * @file Options.hpp
 * @brief Merge engine options and their layered loading
 *
 * Precedence (lowest to highest):
 *   defaults -> config file (.json/.toml) -> environment (prefix) -> overrides
 *
 * Recognized keys:
 * - compatibility.old_merge_schemas (bool)
 * - max_composition_depth (positive integer)
 */

#ifndef ALLOF_OPTIONS_HPP
#define ALLOF_OPTIONS_HPP

#include "allof/Value.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace allof {

struct CompatibilityOptions {
    /// Route allOf merges to the legacy algorithm instead of this engine
    bool old_merge_schemas = false;
};

/**
 * @brief Options consumed by AllOfMerger
 */
struct MergeOptions {
    CompatibilityOptions compatibility;
    /// Maximum allOf nesting before CompositionDepthExceeded
    std::size_t max_composition_depth = 64;
};

/**
 * @brief Sources for load_merge_options()
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix;      // Environment variable prefix, e.g. "ALLOF"
    std::map<std::string, Value> overrides; // dot-keys, final precedence
};

/**
 * @brief Load options with precedence defaults -> file -> env -> overrides
 * @throws FileNotFoundError if file_path names a missing file
 * @throws ParseError if the file is malformed
 * @throws ConfigError for unsupported extensions or ill-typed values
 */
MergeOptions load_merge_options(const LoadOptions& opts);

/**
 * @brief Read MergeOptions from a value tree; unknown keys are ignored
 * @throws ConfigError if a recognized key has the wrong type
 */
MergeOptions merge_options_from_value(const Value& data);

Value merge_options_to_value(const MergeOptions& options);

/**
 * @brief Map an environment variable name (prefix removed) to a dot-key
 *
 * Lowercases, then `__` becomes `_` and `_` becomes `.`:
 *   - COMPATIBILITY_OLD__MERGE__SCHEMAS -> compatibility.old_merge_schemas
 *   - MAX__COMPOSITION__DEPTH -> max_composition_depth
 */
std::string transform_env_name(const std::string& name);

/**
 * @brief Parse an --overrides string: "k1:json, k2:json, ..."
 *
 * Commas inside braces or brackets belong to the value.
 * @throws ConfigError for a pair without a key or a ':'
 */
std::map<std::string, Value> parse_overrides(const std::string& s);

// Try parsing string as JSON, otherwise return it as a string.
Value parse_json_or_string(const std::string& raw);

} // namespace allof

#endif // ALLOF_OPTIONS_HPP
