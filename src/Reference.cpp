/**
 * @file Reference.cpp
 * @brief Reference splitting and propagation
 */

#include "allof/Reference.hpp"
#include "allof/Errors.hpp"

#include <algorithm>

namespace allof {

ReferenceParts split_reference(const std::string& ref) {
    if (ref.empty()) {
        throw UnsupportedReference(ref, "empty reference");
    }

    auto markers = std::count(ref.begin(), ref.end(), '#');
    if (markers > 1) {
        throw UnsupportedReference(ref, "more than one '#'");
    }

    ReferenceParts parts;
    auto pos = ref.find('#');
    if (pos == std::string::npos) {
        parts.document = ref;
        return parts;
    }
    parts.document = ref.substr(0, pos);
    parts.fragment = ref.substr(pos + 1);
    parts.has_fragment = true;
    return parts;
}

SchemaValue value_with_propagated_ref(const SchemaSource& source, Resolver& resolver) {
    auto value = resolver.resolve(source);
    if (!value) {
        throw MissingSchemaValue(source.ref());
    }

    if (!source.is_reference() || source.is_local_reference()) {
        return *value;
    }

    const ReferenceParts parts = split_reference(source.ref());

    // The shared value may be aliased by other sources; rewrite a copy.
    SchemaValue copy = *value;
    for (const auto& [name, property] : value->properties) {
        if (property.is_local_reference()) {
            copy.properties.set(name, property.relocated(parts.document + property.ref(),
                                                         source.origin()));
        }
    }
    return copy;
}

} // namespace allof
