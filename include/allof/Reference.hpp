/**
 * @file Reference.hpp
 * @brief Reference splitting and propagation of local references
 *
 * A schema copied out of an external document into a merge keeps nested
 * references that were local to its home document. Propagation qualifies
 * those references with the home document path so they still resolve.
 */

#ifndef ALLOF_REFERENCE_HPP
#define ALLOF_REFERENCE_HPP

#include "allof/Resolver.hpp"
#include "allof/Schema.hpp"

#include <string>

namespace allof {

/**
 * @brief A reference split on its fragment marker
 */
struct ReferenceParts {
    std::string document;   ///< Document path; empty for local references
    std::string fragment;   ///< Text after '#', without the marker
    bool has_fragment = false;
};

/**
 * @brief Split a reference string on '#'
 *
 * Examples:
 * - "other.yaml#/components/schemas/Pet" → {"other.yaml", "/components/schemas/Pet"}
 * - "#/components/schemas/Pet" → {"", "/components/schemas/Pet"}
 * - "other.yaml" → {"other.yaml", "", has_fragment=false}
 *
 * @throws UnsupportedReference if the reference is empty or holds more
 *         than one '#'
 */
ReferenceParts split_reference(const std::string& ref);

/**
 * @brief Dereference @p source, qualifying nested local property references
 *
 * Inline sources and local references return the dereferenced value as-is.
 * For an external reference, every property whose source is a local
 * reference is replaced, in a copy, by a source referring to
 * `<document> + <local ref>`, anchored at @p source's origin.
 *
 * @throws MissingSchemaValue if the source resolves to nothing
 * @throws UnsupportedReference if the reference cannot be split
 */
SchemaValue value_with_propagated_ref(const SchemaSource& source, Resolver& resolver);

} // namespace allof

#endif // ALLOF_REFERENCE_HPP
