/**
 * @file AllOf.hpp
 * @brief allOf merge entry point
 *
 * AllOfMerger folds an allOf list into one schema and hands it to a
 * TypeGenerator:
 *   sources -> dereference + propagate each -> pairwise merge, left to right
 *           -> generator
 *
 * Example:
 * ```cpp
 * DocumentSet docs("api.yaml");
 * SchemaDocumentGenerator generator;
 * AllOfMerger merger(docs, generator);
 *
 * auto dog = docs.resolve(docs.source("#/components/schemas/Dog"));
 * GeneratedType type = merger.merge_all_of(dog->all_of, {"Dog"});
 * ```
 */

#ifndef ALLOF_ALLOF_HPP
#define ALLOF_ALLOF_HPP

#include "allof/Generator.hpp"
#include "allof/Merge.hpp"
#include "allof/Options.hpp"
#include "allof/Resolver.hpp"
#include "allof/Schema.hpp"

#include <functional>
#include <string>
#include <vector>

namespace allof {

/**
 * @brief Alternate merge algorithm selected by compatibility.old_merge_schemas
 */
using LegacyMerge = std::function<GeneratedType(const std::vector<SchemaSource>& sources,
                                                 const std::vector<std::string>& path)>;

class AllOfMerger {
public:
    /**
     * @param resolver Dereferencing capability (must outlive the merger)
     * @param generator Type generator (must outlive the merger)
     * @param options Merge options; compatibility.old_merge_schemas routes
     *        every call to the legacy algorithm
     */
    AllOfMerger(Resolver& resolver, TypeGenerator& generator, MergeOptions options = {});

    /**
     * @brief Register the algorithm used when compatibility.old_merge_schemas is set
     */
    void set_legacy_merge(LegacyMerge legacy);

    /**
     * @brief Merge an allOf list and generate a type from the result
     *
     * - one source: generated directly, without merging or copying
     * - several: the propagated values are folded with SchemaMerger
     *
     * @param sources allOf entries in document order
     * @param path Naming context, forwarded unchanged to the generator
     * @throws std::invalid_argument if @p sources is empty
     * @throws ConfigError if legacy mode is set but no legacy merge is registered
     * @throws AllOfMergeError wrapping the cause of a failed pairwise merge
     * @throws MissingSchemaValue, UnsupportedReference while dereferencing
     */
    GeneratedType merge_all_of(const std::vector<SchemaSource>& sources,
                               const std::vector<std::string>& path);

    /**
     * @brief Fold the allOf list into one schema value without generating
     *
     * Same errors as merge_all_of() apart from the legacy redirect.
     */
    SchemaValue merge_values(const std::vector<SchemaSource>& sources) const;

    const MergeOptions& options() const noexcept { return options_; }

private:
    Resolver& resolver_;
    TypeGenerator& generator_;
    MergeOptions options_;
    LegacyMerge legacy_;
};

} // namespace allof

#endif // ALLOF_ALLOF_HPP
