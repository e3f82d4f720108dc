/**
 * @file Schema.cpp
 * @brief SchemaSource, bound and additionalProperties helpers
 */

#include "allof/Schema.hpp"

#include <sstream>

namespace allof {

SchemaSource::SchemaSource(std::shared_ptr<const SchemaValue> value, std::string origin)
    : value_(std::move(value))
    , origin_(std::move(origin))
{}

SchemaSource SchemaSource::from_value(SchemaValue value, std::string origin) {
    return SchemaSource(std::make_shared<SchemaValue>(std::move(value)), std::move(origin));
}

SchemaSource SchemaSource::reference(std::string ref,
                                     std::shared_ptr<const SchemaValue> target,
                                     std::string origin) {
    SchemaSource source(std::move(target), std::move(origin));
    source.ref_ = std::move(ref);
    return source;
}

SchemaSource SchemaSource::relocated(std::string ref, std::string origin) const {
    SchemaSource copy = *this;
    copy.ref_ = std::move(ref);
    copy.origin_ = std::move(origin);
    return copy;
}

// ============================================================================
// Exclusive bounds
// ============================================================================

namespace {

struct DialectName {
    std::string operator()(const BooleanBound&) const { return "boolean"; }
    std::string operator()(const NumericBound&) const { return "numeric"; }
};

struct BoundLiteral {
    std::string operator()(const BooleanBound& b) const {
        return b.exclusive ? "true" : "false";
    }
    std::string operator()(const NumericBound& n) const {
        std::ostringstream oss;
        oss << n.value;
        return oss.str();
    }
};

} // anonymous namespace

std::string bound_dialect(const ExclusiveBound& bound) {
    return std::visit(DialectName{}, bound);
}

std::string describe_bound(const ExclusiveBound& bound) {
    return std::visit(BoundLiteral{}, bound);
}

// ============================================================================
// additionalProperties
// ============================================================================

AdditionalProperties AdditionalProperties::allowed(bool flag) {
    AdditionalProperties ap;
    ap.state_ = flag;
    return ap;
}

AdditionalProperties AdditionalProperties::schema(SchemaSource source) {
    AdditionalProperties ap;
    ap.state_ = std::move(source);
    return ap;
}

} // namespace allof
