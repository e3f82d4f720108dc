/**
 * @file Codec.hpp
 * @brief Conversion between document nodes and the schema object model
 *
 * Reading:
 * - a node with "$ref" becomes a reference SchemaSource (siblings ignored)
 * - keys starting with "x-" become extensions
 * - "type" may be a string or an array holding exactly one string
 * - exclusiveMinimum/Maximum become BooleanBound (bool) or NumericBound (number)
 * - keys the model does not carry (title, description, items, ...) are ignored
 *
 * Writing emits keys in a fixed order and omits unset fields.
 */

#ifndef ALLOF_CODEC_HPP
#define ALLOF_CODEC_HPP

#include "allof/Schema.hpp"
#include "allof/Value.hpp"

#include <string>

namespace allof {

/**
 * @brief Build a SchemaValue from a schema object node
 * @param node Schema object (must not itself be a "$ref" node)
 * @param origin Document path recorded on nested sources
 * @throws ParseError if a keyword has the wrong shape
 */
SchemaValue schema_from_value(const Value& node, const std::string& origin = "");

/**
 * @brief Build a SchemaSource from a node that is either "$ref" or inline
 * @throws ParseError if the node is not an object or is malformed
 */
SchemaSource source_from_value(const Value& node, const std::string& origin = "");

/**
 * @brief Serialize a SchemaValue back to a schema object node
 */
Value schema_to_value(const SchemaValue& schema);

/**
 * @brief Serialize a SchemaSource: {"$ref": ...} for references, the
 *        serialized value for inline sources, null if it has neither
 */
Value source_to_value(const SchemaSource& source);

} // namespace allof

#endif // ALLOF_CODEC_HPP
