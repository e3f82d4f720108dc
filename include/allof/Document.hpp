/**
 * @file Document.hpp
 * @brief Resolver over a set of loaded schema documents
 *
 * References are "<document>#<json pointer>". An empty document part means
 * the document the referring source came from (its origin). Relative
 * document paths are resolved against the directory of that origin, and
 * documents not yet known are loaded from disk on first use.
 */

#ifndef ALLOF_DOCUMENT_HPP
#define ALLOF_DOCUMENT_HPP

#include "allof/Resolver.hpp"
#include "allof/Schema.hpp"
#include "allof/Value.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace allof {

class DocumentSet : public Resolver {
public:
    /**
     * @brief Load the root document from disk
     * @throws FileNotFoundError, ParseError
     */
    explicit DocumentSet(const std::string& root_path);

    /**
     * @brief Use an in-memory root document
     * @param root_path Path the root is known by; external references
     *        resolve relative to its directory
     */
    DocumentSet(const std::string& root_path, Value root_document);

    /**
     * @brief Register an in-memory document under @p path
     *
     * Replaces any document already known by that path. Cached schema
     * values are discarded.
     */
    void add_document(const std::string& path, Value document);

    const std::string& root_path() const noexcept { return root_; }

    /**
     * @brief Reference source anchored at the root document
     *
     * Example: source("#/components/schemas/Pet")
     */
    SchemaSource source(const std::string& ref) const;

    /**
     * @brief Sources to merge for the schemas named by @p pointers
     *
     * One pointer whose schema carries an allOf list stands for that list.
     * Otherwise each pointer becomes a reference source, so a single schema
     * without allOf is generated as-is.
     *
     * @throws std::invalid_argument if @p pointers is empty
     * @throws MissingSchemaValue, UnsupportedReference as resolve()
     */
    std::vector<SchemaSource> composition_sources(const std::vector<std::string>& pointers);

    /**
     * @throws MissingSchemaValue if the pointer resolves to nothing
     * @throws UnsupportedReference for malformed references or $ref cycles
     * @throws FileNotFoundError, ParseError when loading a document fails
     */
    std::shared_ptr<const SchemaValue> resolve(const SchemaSource& source) override;

    /** Number of distinct schema values parsed so far */
    std::size_t cached_schemas() const noexcept { return cache_.size(); }

private:
    std::shared_ptr<const SchemaValue> resolve_chain(const SchemaSource& source,
                                                     std::set<std::string>& seen);
    std::string locate(const std::string& document, const std::string& origin) const;
    const Value& document(const std::string& path);

    std::string root_;
    std::map<std::string, Value> documents_;
    std::map<std::string, std::shared_ptr<const SchemaValue>> cache_;
};

/**
 * @brief Default naming path for the schema at @p pointer: its last segment
 *
 * "#/components/schemas/Dog" -> {"Dog"}; "#" and "" -> {}
 */
std::vector<std::string> path_for_pointer(const std::string& pointer);

} // namespace allof

#endif // ALLOF_DOCUMENT_HPP
