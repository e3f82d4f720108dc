/**
 * @file Merge.cpp
 * @brief Implementation of pairwise schema merge and allOf flattening
 */

#include "allof/Merge.hpp"
#include "allof/Errors.hpp"

#include <exception>
#include <optional>
#include <stdexcept>

namespace allof {

namespace {

template <typename T>
void append(std::vector<T>& out, const std::vector<T>& in) {
    out.insert(out.end(), in.begin(), in.end());
}

bool merge_flag(const char* field, bool left, bool right) {
    if (left != right) {
        throw ConflictingFlag(field, left, right);
    }
    return left;
}

/**
 * @brief Visitor over a pair of exclusive bounds that are both present
 */
struct BoundMerge {
    const char* field;

    ExclusiveBound operator()(const BooleanBound& a, const BooleanBound& b) const {
        if (a.exclusive != b.exclusive) {
            throw ConflictingBound(field, describe_bound(a), describe_bound(b));
        }
        return a;
    }

    ExclusiveBound operator()(const NumericBound& a, const NumericBound& b) const {
        if (a.value != b.value) {
            throw ConflictingBound(field, describe_bound(a), describe_bound(b));
        }
        return a;
    }

    ExclusiveBound operator()(const BooleanBound& a, const NumericBound& b) const {
        throw IncompatibleBoundDialect(field, bound_dialect(a), bound_dialect(b));
    }

    ExclusiveBound operator()(const NumericBound& a, const BooleanBound& b) const {
        throw IncompatibleBoundDialect(field, bound_dialect(a), bound_dialect(b));
    }
};

std::optional<ExclusiveBound> merge_bound(const char* field,
                                          const std::optional<ExclusiveBound>& left,
                                          const std::optional<ExclusiveBound>& right) {
    if (!left) return right;
    if (!right) return left;
    return std::visit(BoundMerge{field}, *left, *right);
}

AdditionalProperties merge_additional_properties(const AdditionalProperties& left,
                                                 const AdditionalProperties& right) {
    if (left.is_explicit_false() || right.is_explicit_false()) {
        return AdditionalProperties::allowed(false);
    }
    if (left.is_schema()) {
        if (right.is_schema()) {
            throw UnsupportedAdditionalPropertiesMerge();
        }
        return left;
    }
    if (right.is_schema()) {
        return right;
    }
    if (left.is_explicit_true() || right.is_explicit_true()) {
        return AdditionalProperties::allowed(true);
    }
    return AdditionalProperties();
}

std::shared_ptr<const SchemaValue> dereference(Resolver& resolver, const SchemaSource& source) {
    auto value = resolver.resolve(source);
    if (!value) {
        throw MissingSchemaValue(source.ref());
    }
    return value;
}

} // anonymous namespace

SchemaMerger::SchemaMerger(Resolver& resolver, std::size_t max_depth)
    : resolver_(resolver)
    , max_depth_(max_depth)
{}

SchemaValue SchemaMerger::merge(const SchemaValue& s1, const SchemaValue& s2,
                                bool all_of_context) const {
    return merge_at(s1, s2, all_of_context, 0);
}

SchemaValue SchemaMerger::flatten(const std::vector<SchemaSource>& all_of) const {
    return flatten_at(all_of, 1);
}

SchemaValue SchemaMerger::flatten_at(const std::vector<SchemaSource>& all_of,
                                     std::size_t depth) const {
    if (all_of.empty()) {
        throw std::invalid_argument("cannot flatten an empty allOf list");
    }
    if (depth > max_depth_) {
        throw CompositionDepthExceeded(max_depth_);
    }

    auto first = dereference(resolver_, all_of.front());
    SchemaValue result = first->all_of.empty() ? *first : flatten_at(first->all_of, depth + 1);

    for (std::size_t i = 1; i < all_of.size(); ++i) {
        auto next = dereference(resolver_, all_of[i]);
        result = merge_at(result, *next, true, depth);
    }
    return result;
}

SchemaValue SchemaMerger::merge_at(const SchemaValue& s1, const SchemaValue& s2,
                                   bool all_of_context, std::size_t depth) const {
    (void)all_of_context; // no rule differs between allOf and other merges yet

    SchemaValue result;

    // A schema's own extensions and oneOf are kept even when it is replaced
    // by the flattening of its allOf below.
    if (s1.extensions || s2.extensions) {
        result.extensions = ExtensionMap();
        for (const auto* side : {&s1, &s2}) {
            if (!side->extensions) continue;
            for (const auto& [key, node] : *side->extensions) {
                result.extensions->set(key, node);
            }
        }
    }

    result.one_of = s1.one_of;
    append(result.one_of, s2.one_of);

    // Make allOf transitive: nested lists are collapsed before the remaining
    // fields are compared, so the result is flat.
    std::optional<SchemaValue> flat1;
    std::optional<SchemaValue> flat2;
    if (!s1.all_of.empty()) {
        try {
            flat1 = flatten_at(s1.all_of, depth + 1);
        } catch (const Error& e) {
            std::throw_with_nested(TransitiveFlattenError(1, e.what()));
        }
    }
    if (!s2.all_of.empty()) {
        try {
            flat2 = flatten_at(s2.all_of, depth + 1);
        } catch (const Error& e) {
            std::throw_with_nested(TransitiveFlattenError(2, e.what()));
        }
    }
    const SchemaValue& a = flat1 ? *flat1 : s1;
    const SchemaValue& b = flat2 ? *flat2 : s2;

    result.all_of = a.all_of;
    append(result.all_of, b.all_of);

    if (!a.type.empty() && !b.type.empty() && a.type != b.type) {
        throw IncompatibleTypes(a.type, b.type);
    }
    result.type = a.type.empty() ? b.type : a.type;

    if (a.format != b.format) {
        throw IncompatibleFormats(a.format, b.format);
    }
    result.format = a.format;

    // Union rather than intersection: the merged type stays permissive.
    result.enum_values = a.enum_values;
    append(result.enum_values, b.enum_values);

    if (a.default_value && b.default_value) {
        throw UndefinedDefaultMerge(render_value(*a.default_value), render_value(*b.default_value));
    }
    result.default_value = a.default_value ? a.default_value : b.default_value;

    result.unique_items = merge_flag("uniqueItems", a.unique_items, b.unique_items);

    result.exclusive_minimum = merge_bound("exclusiveMinimum", a.exclusive_minimum, b.exclusive_minimum);
    result.exclusive_maximum = merge_bound("exclusiveMaximum", a.exclusive_maximum, b.exclusive_maximum);

    result.nullable = merge_flag("nullable", a.nullable, b.nullable);
    result.read_only = merge_flag("readOnly", a.read_only, b.read_only);
    result.write_only = merge_flag("writeOnly", a.write_only, b.write_only);

    result.required = a.required;
    append(result.required, b.required);

    // Same-named properties are not compared; the second input wins.
    for (const auto& [name, source] : a.properties) {
        result.properties.set(name, source);
    }
    for (const auto& [name, source] : b.properties) {
        result.properties.set(name, source);
    }

    result.additional_properties =
        merge_additional_properties(a.additional_properties, b.additional_properties);

    return result;
}

} // namespace allof
