/**
 * @file Resolver.cpp
 * @brief In-memory schema registry
 */

#include "allof/Resolver.hpp"
#include "allof/Errors.hpp"

namespace allof {

void SchemaRegistry::add(const std::string& ref, SchemaValue value) {
    schemas_[ref] = std::make_shared<SchemaValue>(std::move(value));
}

void SchemaRegistry::add(const std::string& ref, std::shared_ptr<const SchemaValue> value) {
    schemas_[ref] = std::move(value);
}

bool SchemaRegistry::contains(const std::string& ref) const {
    return schemas_.count(ref) > 0;
}

std::shared_ptr<const SchemaValue> SchemaRegistry::resolve(const SchemaSource& source) {
    if (source.target()) {
        return source.target();
    }
    if (source.is_reference()) {
        auto it = schemas_.find(source.ref());
        if (it != schemas_.end() && it->second) {
            return it->second;
        }
    }
    throw MissingSchemaValue(source.ref());
}

} // namespace allof
