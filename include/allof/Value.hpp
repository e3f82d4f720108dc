/**
 * @file Value.hpp
 * @brief Literal value type for schema documents
 *
 * Uses nlohmann::ordered_json as the underlying value model so that object
 * keys keep their document order. Literal schema content (enum members,
 * defaults, vendor extensions) and whole parsed documents are held as Values:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion ordered)
 */

#ifndef ALLOF_VALUE_HPP
#define ALLOF_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace allof {

/**
 * @brief JSON-like literal value
 *
 * Alias for nlohmann::ordered_json. Iteration over objects follows the
 * order keys were inserted, which keeps parsed documents and serialized
 * merge results in a reproducible order.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Render a Value compactly for diagnostics
 *
 * Long renderings are cut to @p max_length characters with a trailing
 * "..." so error messages stay on one line.
 */
inline std::string render_value(const Value& val, std::size_t max_length = 80) {
    std::string text = val.dump();
    if (text.size() > max_length) {
        text.resize(max_length);
        text += "...";
    }
    return text;
}

} // namespace allof

#endif // ALLOF_VALUE_HPP
