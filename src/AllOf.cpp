/**
 * @file AllOf.cpp
 * @brief allOf merge orchestration
 */

#include "allof/AllOf.hpp"
#include "allof/Errors.hpp"
#include "allof/Reference.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace allof {

AllOfMerger::AllOfMerger(Resolver& resolver, TypeGenerator& generator, MergeOptions options)
    : resolver_(resolver)
    , generator_(generator)
    , options_(std::move(options))
{}

void AllOfMerger::set_legacy_merge(LegacyMerge legacy) {
    legacy_ = std::move(legacy);
}

GeneratedType AllOfMerger::merge_all_of(const std::vector<SchemaSource>& sources,
                                        const std::vector<std::string>& path) {
    if (options_.compatibility.old_merge_schemas) {
        if (!legacy_) {
            throw ConfigError("compatibility.old_merge_schemas is set but no legacy merge "
                              "algorithm is registered");
        }
        return legacy_(sources, path);
    }

    if (sources.empty()) {
        throw std::invalid_argument("allOf requires at least one schema");
    }

    if (sources.size() == 1) {
        return generator_.generate(sources.front(), path);
    }

    return generator_.generate(SchemaSource::from_value(merge_values(sources)), path);
}

SchemaValue AllOfMerger::merge_values(const std::vector<SchemaSource>& sources) const {
    if (sources.empty()) {
        throw std::invalid_argument("allOf requires at least one schema");
    }

    const SchemaMerger merger(resolver_, options_.max_composition_depth);

    SchemaValue schema = value_with_propagated_ref(sources.front(), resolver_);
    for (std::size_t i = 1; i < sources.size(); ++i) {
        SchemaValue next = value_with_propagated_ref(sources[i], resolver_);
        try {
            schema = merger.merge(schema, next, true);
        } catch (const MergeError& e) {
            std::throw_with_nested(AllOfMergeError(i, e.what()));
        }
    }
    return schema;
}

} // namespace allof
