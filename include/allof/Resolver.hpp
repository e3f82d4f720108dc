/**
 * @file Resolver.hpp
 * @brief Dereferencing capability used by the merge engine
 */

#ifndef ALLOF_RESOLVER_HPP
#define ALLOF_RESOLVER_HPP

#include "allof/Schema.hpp"

#include <map>
#include <memory>
#include <string>

namespace allof {

/**
 * @brief Turns a SchemaSource into the SchemaValue it denotes
 *
 * Implementations return shared values; callers must not assume they own
 * them exclusively.
 */
class Resolver {
public:
    virtual ~Resolver() = default;

    /**
     * @throws MissingSchemaValue if the source denotes no value
     * @throws UnsupportedReference if the reference cannot be interpreted
     */
    virtual std::shared_ptr<const SchemaValue> resolve(const SchemaSource& source) = 0;
};

/**
 * @brief In-memory resolver keyed by reference string
 *
 * Inline sources and references with a pre-bound target resolve to that
 * value. Other references are looked up by their exact reference string.
 */
class SchemaRegistry : public Resolver {
public:
    /**
     * @brief Register (or replace) the value behind @p ref
     */
    void add(const std::string& ref, SchemaValue value);
    void add(const std::string& ref, std::shared_ptr<const SchemaValue> value);

    bool contains(const std::string& ref) const;

    std::shared_ptr<const SchemaValue> resolve(const SchemaSource& source) override;

private:
    std::map<std::string, std::shared_ptr<const SchemaValue>> schemas_;
};

} // namespace allof

#endif // ALLOF_RESOLVER_HPP
