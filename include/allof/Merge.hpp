/**
 * @file Merge.hpp
 * @brief Pairwise schema merge and transitive allOf flattening
 *
 * Field rules applied by SchemaMerger::merge, in evaluation order (the
 * first failing rule aborts the whole merge):
 * - extensions: union, second input wins on duplicate keys
 * - oneOf: concatenation of the inputs' own lists
 * - (each input with a nested allOf is now replaced by its flattening)
 * - allOf, enum, required: concatenation
 * - type: must agree when both are set
 * - format: must be equal
 * - default: at most one side may set it
 * - uniqueItems, nullable, readOnly, writeOnly: must be equal
 * - exclusiveMinimum/Maximum: same dialect and value when both are set
 * - properties: ordered union, second input wins on duplicate names
 * - additionalProperties: explicit false dominates; two schemas conflict
 */

#ifndef ALLOF_MERGE_HPP
#define ALLOF_MERGE_HPP

#include "allof/Resolver.hpp"
#include "allof/Schema.hpp"

#include <cstddef>
#include <vector>

namespace allof {

/**
 * @brief Merges dereferenced schema values
 *
 * Holds the Resolver used to dereference nested allOf entries and the
 * composition depth limit that guards against cyclic allOf graphs.
 */
class SchemaMerger {
public:
    static constexpr std::size_t kDefaultMaxDepth = 64;

    explicit SchemaMerger(Resolver& resolver, std::size_t max_depth = kDefaultMaxDepth);

    /**
     * @brief Merge two schema values into one
     *
     * Extensions and oneOf are taken from the inputs as given. After that,
     * an input carrying a non-empty allOf is replaced by the flattening of
     * that list, so composition never survives into the remaining fields.
     *
     * @param s1 Left-hand schema
     * @param s2 Right-hand schema
     * @param all_of_context Whether the merge is driven by an allOf. Accepted
     *        for symmetry with flatten(); no rule depends on it.
     * @return Newly built merged schema
     * @throws TransitiveFlattenError if flattening either side fails
     * @throws IncompatibleTypes, IncompatibleFormats, UndefinedDefaultMerge,
     *         ConflictingFlag, IncompatibleBoundDialect, ConflictingBound,
     *         UnsupportedAdditionalPropertiesMerge on field conflicts
     *
     * Examples:
     * ```cpp
     * // {type: object, properties: {name}, required: [name]}
     * // + {type: object, properties: {age}, required: [age]}
     * // → {type: object, properties: {name, age}, required: [name, age]}
     *
     * // {enum: [1, 2]} + {enum: [2, 3]} → {enum: [1, 2, 2, 3]}
     *
     * // {additionalProperties: false} + {additionalProperties: {type: string}}
     * // → {additionalProperties: false}
     * ```
     */
    SchemaValue merge(const SchemaValue& s1, const SchemaValue& s2, bool all_of_context) const;

    /**
     * @brief Collapse an allOf list into a single equivalent schema
     *
     * Dereferences every entry and folds merge() over them left to right
     * with all_of_context = true.
     *
     * @param all_of Non-empty list of sources
     * @throws std::invalid_argument if @p all_of is empty
     * @throws MissingSchemaValue if an entry does not dereference
     * @throws CompositionDepthExceeded past the depth limit
     */
    SchemaValue flatten(const std::vector<SchemaSource>& all_of) const;

    std::size_t max_depth() const noexcept { return max_depth_; }

private:
    SchemaValue merge_at(const SchemaValue& s1, const SchemaValue& s2,
                         bool all_of_context, std::size_t depth) const;
    SchemaValue flatten_at(const std::vector<SchemaSource>& all_of, std::size_t depth) const;

    Resolver& resolver_;
    std::size_t max_depth_;
};

} // namespace allof

#endif // ALLOF_MERGE_HPP
