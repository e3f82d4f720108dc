/**
 * @file Errors.hpp
 * @brief Exception types for schema composition errors
 *
 * Error taxonomy:
 * - Error: Base class
 * - ConfigError: Invalid merge options
 * - FileNotFoundError: Document or config file not found
 * - ParseError: Malformed document/config text or schema node
 * - MergeError: Base of every failure raised while merging schemas
 *   - UnsupportedReference, MissingSchemaValue
 *   - IncompatibleTypes, IncompatibleFormats, UndefinedDefaultMerge
 *   - ConflictingFlag, IncompatibleBoundDialect, ConflictingBound
 *   - UnsupportedAdditionalPropertiesMerge
 *   - TransitiveFlattenError, CompositionDepthExceeded, AllOfMergeError
 *
 * Wrapping errors (TransitiveFlattenError, AllOfMergeError) are thrown with
 * std::throw_with_nested; std::rethrow_if_nested reaches the cause.
 *
 * There is no separate build error for a flatten step. When
 * SchemaMerger::flatten cannot dereference an entry, the resolver's
 * MissingSchemaValue or UnsupportedReference propagates unchanged. The same
 * holds when AllOfMerger::merge_all_of dereferences its sources. Only a
 * failure raised while a pairwise merge flattens a nested allOf arrives
 * wrapped, in TransitiveFlattenError.
 */

#ifndef ALLOF_ERRORS_HPP
#define ALLOF_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace allof {

/**
 * @brief Base class for all allof exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Merge options are invalid or cannot be honored
 */
class ConfigError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Document or configuration file not found
 */
class FileNotFoundError : public Error {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : Error("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document, config or schema node could not be parsed
 */
class ParseError : public Error {
public:
    /**
     * @brief Construct with source location and error details
     * @param source File path or document origin (may be empty)
     * @param details Detailed error message
     */
    ParseError(std::string source, std::string details)
        : Error("Parse error in '" + source + "': " + details)
        , source_(std::move(source))
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept {
        return source_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    std::string details_;
};

// ============================================================================
// Merge errors
// ============================================================================

/**
 * @brief Base class of every schema merge failure
 *
 * Carries the schema field the failure is about ("type", "default",
 * "exclusiveMinimum", ...). Empty when the failure is not tied to a field.
 */
class MergeError : public Error {
public:
    MergeError(const std::string& message, const std::string& field)
        : Error(message)
        , field_(field)
    {}

    const std::string& field() const noexcept {
        return field_;
    }

private:
    std::string field_;
};

/**
 * @brief Merge error between two conflicting field values
 *
 * The left/right values are rendered as text for reporting.
 */
class FieldConflictError : public MergeError {
public:
    FieldConflictError(const std::string& message, const std::string& field,
                       std::string left, std::string right)
        : MergeError(message + " (" + field + ": " + left + " vs " + right + ")", field)
        , left_(std::move(left))
        , right_(std::move(right))
    {}

    const std::string& left() const noexcept {
        return left_;
    }

    const std::string& right() const noexcept {
        return right_;
    }

private:
    std::string left_;
    std::string right_;
};

/**
 * @brief Reference string cannot be split into document and fragment
 */
class UnsupportedReference : public MergeError {
public:
    explicit UnsupportedReference(std::string reference, const std::string& reason = "")
        : MergeError("unsupported reference: " + reference +
                     (reason.empty() ? "" : " (" + reason + ")"), "$ref")
        , reference_(std::move(reference))
    {}

    const std::string& reference() const noexcept {
        return reference_;
    }

private:
    std::string reference_;
};

/**
 * @brief A schema source dereferenced to no value at all
 */
class MissingSchemaValue : public MergeError {
public:
    /**
     * @param reference The unresolved reference (empty for inline sources)
     */
    explicit MissingSchemaValue(std::string reference)
        : MergeError(reference.empty()
                         ? std::string("schema source has no value")
                         : "reference resolves to no schema value: " + reference,
                     "$ref")
        , reference_(std::move(reference))
    {}

    const std::string& reference() const noexcept {
        return reference_;
    }

private:
    std::string reference_;
};

class IncompatibleTypes : public FieldConflictError {
public:
    IncompatibleTypes(std::string left, std::string right)
        : FieldConflictError("can not merge incompatible types", "type",
                             std::move(left), std::move(right))
    {}
};

class IncompatibleFormats : public FieldConflictError {
public:
    IncompatibleFormats(std::string left, std::string right)
        : FieldConflictError("can not merge incompatible formats", "format",
                             std::move(left), std::move(right))
    {}
};

/**
 * @brief Both schemas declare a default; there is no rule to reconcile them
 */
class UndefinedDefaultMerge : public FieldConflictError {
public:
    UndefinedDefaultMerge(std::string left, std::string right)
        : FieldConflictError("merging two sets of defaults is undefined", "default",
                             std::move(left), std::move(right))
    {}
};

/**
 * @brief uniqueItems / nullable / readOnly / writeOnly disagree
 */
class ConflictingFlag : public FieldConflictError {
public:
    ConflictingFlag(const std::string& field, bool left, bool right)
        : FieldConflictError("merging two schemas with different " + field, field,
                             left ? "true" : "false", right ? "true" : "false")
    {}
};

/**
 * @brief One exclusive bound is a boolean flag and the other a number
 *
 * left()/right() hold the dialect names ("boolean" or "numeric").
 */
class IncompatibleBoundDialect : public FieldConflictError {
public:
    IncompatibleBoundDialect(const std::string& field, std::string left, std::string right)
        : FieldConflictError("can not merge " + field + " across boolean and numeric dialects",
                             field, std::move(left), std::move(right))
    {}
};

class ConflictingBound : public FieldConflictError {
public:
    ConflictingBound(const std::string& field, std::string left, std::string right)
        : FieldConflictError("merging two schemas with different " + field,
                             field, std::move(left), std::move(right))
    {}
};

class UnsupportedAdditionalPropertiesMerge : public MergeError {
public:
    UnsupportedAdditionalPropertiesMerge()
        : MergeError("merging two schemas with additional properties, this is unhandled",
                     "additionalProperties")
    {}
};

/**
 * @brief Flattening one side's nested allOf failed
 *
 * Thrown nested around the underlying cause.
 */
class TransitiveFlattenError : public MergeError {
public:
    /**
     * @param side 1 for the left-hand schema, 2 for the right-hand schema
     * @param cause what() of the underlying failure
     */
    TransitiveFlattenError(int side, const std::string& cause)
        : MergeError("error transitive merging AllOf on schema " + std::to_string(side) +
                     ": " + cause, "allOf")
        , side_(side)
    {}

    int side() const noexcept {
        return side_;
    }

private:
    int side_;
};

/**
 * @brief allOf nesting exceeded the configured depth (usually a cycle)
 */
class CompositionDepthExceeded : public MergeError {
public:
    explicit CompositionDepthExceeded(std::size_t limit)
        : MergeError("allOf composition nested deeper than " + std::to_string(limit) +
                     " levels (cyclic allOf?)", "allOf")
        , limit_(limit)
    {}

    std::size_t limit() const noexcept {
        return limit_;
    }

private:
    std::size_t limit_;
};

/**
 * @brief Folding the allOf list failed at source @c index()
 *
 * Thrown nested around the underlying cause.
 */
class AllOfMergeError : public MergeError {
public:
    AllOfMergeError(std::size_t index, const std::string& cause)
        : MergeError("error merging schemas for AllOf: " + cause, "allOf")
        , index_(index)
    {}

    /**
     * @brief Position in the allOf list of the source being merged in
     */
    std::size_t index() const noexcept {
        return index_;
    }

private:
    std::size_t index_;
};

} // namespace allof

#endif // ALLOF_ERRORS_HPP
