/**
 * @file Generator.hpp
 * @brief Type generation boundary
 *
 * The merge engine hands its final schema to a TypeGenerator. The engine
 * treats GeneratedType as opaque; SchemaDocumentGenerator is the generator
 * shipped here, which emits the schema as a JSON document.
 */

#ifndef ALLOF_GENERATOR_HPP
#define ALLOF_GENERATOR_HPP

#include "allof/Schema.hpp"
#include "allof/Value.hpp"

#include <string>
#include <vector>

namespace allof {

/**
 * @brief Result of generating a type from a schema
 */
struct GeneratedType {
    std::string name;                 ///< Type name derived from the path
    std::vector<std::string> path;    ///< Naming context, forwarded unchanged
    std::string reference;            ///< Source reference, when generated from one
    Value definition;                 ///< Generated definition
};

/**
 * @brief Generates a type from a schema source
 */
class TypeGenerator {
public:
    virtual ~TypeGenerator() = default;

    /**
     * @param source Schema to generate from (reference or inline)
     * @param path Naming context segments
     */
    virtual GeneratedType generate(const SchemaSource& source,
                                   const std::vector<std::string>& path) = 0;
};

/**
 * @brief Emits the schema itself as the generated definition
 *
 * Reference sources keep their reference: the definition is
 * {"$ref": ...} rather than a copy of the target.
 */
class SchemaDocumentGenerator : public TypeGenerator {
public:
    /**
     * @throws MissingSchemaValue for an inline source without a value
     */
    GeneratedType generate(const SchemaSource& source,
                           const std::vector<std::string>& path) override;
};

/**
 * @brief Derive a type name from a naming path
 *
 * Each segment is split on non-alphanumeric characters and every piece is
 * capitalized.
 *
 * Examples:
 * - {"components", "schemas", "pet_store"} → "ComponentsSchemasPetStore"
 * - {"Dog"} → "Dog"
 * - {} → "Schema"
 */
std::string type_name_for(const std::vector<std::string>& path);

} // namespace allof

#endif // ALLOF_GENERATOR_HPP
