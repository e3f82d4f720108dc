/**
 * @file Schema.hpp
 * @brief Schema object model: SchemaSource and SchemaValue
 *
 * A SchemaSource is a reference-or-inline handle; a SchemaValue is the
 * dereferenced structural node. SchemaValues are shared through
 * std::shared_ptr<const SchemaValue> and treated as immutable once built:
 * merge results are always new values.
 */

#ifndef ALLOF_SCHEMA_HPP
#define ALLOF_SCHEMA_HPP

#include "allof/OrderedMap.hpp"
#include "allof/Value.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace allof {

struct SchemaValue;

// ============================================================================
// SchemaSource
// ============================================================================

/**
 * @brief Reference-or-inline handle to a schema
 *
 * - Inline: holds the SchemaValue directly.
 * - Reference: holds a reference string, local ("#/components/schemas/X")
 *   or external ("other.yaml#/components/schemas/X"). A reference may carry
 *   a pre-bound target; otherwise a Resolver looks it up.
 *
 * origin() is the document the source belongs to. Empty means the root
 * document.
 */
class SchemaSource {
public:
    SchemaSource() = default;

    /**
     * @brief Inline source around a shared value
     */
    explicit SchemaSource(std::shared_ptr<const SchemaValue> value, std::string origin = "");

    /**
     * @brief Inline source owning a copy of @p value
     */
    static SchemaSource from_value(SchemaValue value, std::string origin = "");

    /**
     * @brief Reference source
     * @param ref Reference string (must not be empty)
     * @param target Pre-bound target value, or nullptr to resolve later
     * @param origin Document the reference is written in
     */
    static SchemaSource reference(std::string ref,
                                  std::shared_ptr<const SchemaValue> target = nullptr,
                                  std::string origin = "");

    bool is_reference() const noexcept { return !ref_.empty(); }

    /**
     * @brief True for references into the same document ("#...")
     */
    bool is_local_reference() const noexcept {
        return is_reference() && ref_.front() == '#';
    }

    /** Reference string; empty for inline sources. */
    const std::string& ref() const noexcept { return ref_; }

    /** Inline value or pre-bound reference target; may be null. */
    const std::shared_ptr<const SchemaValue>& target() const noexcept { return value_; }

    const std::string& origin() const noexcept { return origin_; }

    /**
     * @brief Copy of this source pointing at a rewritten reference
     *
     * Any pre-bound target is kept. The original source is not modified.
     */
    SchemaSource relocated(std::string ref, std::string origin) const;

private:
    std::string ref_;
    std::shared_ptr<const SchemaValue> value_;
    std::string origin_;
};

// ============================================================================
// Exclusive bounds
// ============================================================================

/**
 * @brief Older dialect: exclusiveMinimum/Maximum is a flag on minimum/maximum
 */
struct BooleanBound {
    bool exclusive = false;
};

/**
 * @brief Newer dialect: exclusiveMinimum/Maximum is the bound itself
 */
struct NumericBound {
    double value = 0.0;
};

using ExclusiveBound = std::variant<BooleanBound, NumericBound>;

/** "boolean" or "numeric" */
std::string bound_dialect(const ExclusiveBound& bound);

/** Bound rendered as its document literal ("true", "4.5", ...) */
std::string describe_bound(const ExclusiveBound& bound);

// ============================================================================
// additionalProperties
// ============================================================================

/**
 * @brief Tri-state additionalProperties: absent, boolean flag, or schema
 *
 * Explicit false is a distinct state from absent.
 */
class AdditionalProperties {
public:
    AdditionalProperties() = default;

    static AdditionalProperties allowed(bool flag);
    static AdditionalProperties schema(SchemaSource source);

    bool is_absent() const noexcept { return std::holds_alternative<std::monostate>(state_); }
    bool is_flag() const noexcept { return std::holds_alternative<bool>(state_); }
    bool is_schema() const noexcept { return std::holds_alternative<SchemaSource>(state_); }

    bool is_explicit_false() const noexcept { return is_flag() && !std::get<bool>(state_); }
    bool is_explicit_true() const noexcept { return is_flag() && std::get<bool>(state_); }

    /**
     * @throws std::bad_variant_access if not a schema
     */
    const SchemaSource& source() const { return std::get<SchemaSource>(state_); }

private:
    std::variant<std::monostate, bool, SchemaSource> state_;
};

// ============================================================================
// SchemaValue
// ============================================================================

using PropertyMap = OrderedMap<std::string, SchemaSource>;
using ExtensionMap = OrderedMap<std::string, Value>;

/**
 * @brief Dereferenced schema node
 *
 * `type` holds zero or one primitive tag; empty means unconstrained.
 */
struct SchemaValue {
    std::string type;
    std::string format;
    std::vector<Value> enum_values;
    std::optional<Value> default_value;
    std::optional<ExclusiveBound> exclusive_minimum;
    std::optional<ExclusiveBound> exclusive_maximum;
    bool unique_items = false;
    bool nullable = false;
    bool read_only = false;
    bool write_only = false;
    std::vector<std::string> required;
    PropertyMap properties;
    AdditionalProperties additional_properties;
    std::optional<ExtensionMap> extensions;
    std::vector<SchemaSource> all_of;
    std::vector<SchemaSource> one_of;
};

} // namespace allof

#endif // ALLOF_SCHEMA_HPP
