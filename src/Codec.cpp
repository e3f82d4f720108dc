/**
 * @file Codec.cpp
 * @brief Document node <-> SchemaValue conversion
 */

#include "allof/Codec.hpp"
#include "allof/Errors.hpp"

namespace allof {

namespace {

std::string where(const std::string& origin) {
    return origin.empty() ? std::string("<document>") : origin;
}

[[noreturn]] void bad_keyword(const std::string& origin, const std::string& key,
                              const std::string& expected, const Value& got) {
    throw ParseError(where(origin), "keyword '" + key + "' must be " + expected +
                                    ", got " + type_name(got));
}

std::string read_string(const Value& v, const std::string& key, const std::string& origin) {
    if (!v.is_string()) bad_keyword(origin, key, "a string", v);
    return v.get<std::string>();
}

bool read_bool(const Value& v, const std::string& key, const std::string& origin) {
    if (!v.is_boolean()) bad_keyword(origin, key, "a boolean", v);
    return v.get<bool>();
}

std::string read_type(const Value& v, const std::string& origin) {
    if (v.is_string()) {
        return v.get<std::string>();
    }
    if (v.is_array()) {
        if (v.empty()) {
            return "";
        }
        if (v.size() > 1) {
            throw ParseError(where(origin), "keyword 'type' lists " + std::to_string(v.size()) +
                                            " types; only one is supported");
        }
        return read_string(v.front(), "type", origin);
    }
    bad_keyword(origin, "type", "a string or a one-element array", v);
}

ExclusiveBound read_bound(const Value& v, const std::string& key, const std::string& origin) {
    if (v.is_boolean()) {
        return BooleanBound{v.get<bool>()};
    }
    if (v.is_number()) {
        return NumericBound{v.get<double>()};
    }
    bad_keyword(origin, key, "a boolean or a number", v);
}

std::vector<SchemaSource> read_sources(const Value& v, const std::string& key,
                                       const std::string& origin) {
    if (!v.is_array()) bad_keyword(origin, key, "an array", v);
    std::vector<SchemaSource> out;
    out.reserve(v.size());
    for (const auto& elem : v) {
        out.push_back(source_from_value(elem, origin));
    }
    return out;
}

Value bound_to_value(const ExclusiveBound& bound) {
    if (const auto* flag = std::get_if<BooleanBound>(&bound)) {
        return Value(flag->exclusive);
    }
    return Value(std::get<NumericBound>(bound).value);
}

Value sources_to_value(const std::vector<SchemaSource>& sources) {
    Value arr = Value::array();
    for (const auto& source : sources) {
        arr.push_back(source_to_value(source));
    }
    return arr;
}

} // anonymous namespace

// ============================================================================
// Reading
// ============================================================================

SchemaSource source_from_value(const Value& node, const std::string& origin) {
    if (!node.is_object()) {
        throw ParseError(where(origin), "schema must be an object, got " + type_name(node));
    }
    auto ref = node.find("$ref");
    if (ref != node.end()) {
        std::string text = read_string(*ref, "$ref", origin);
        if (text.empty()) {
            throw ParseError(where(origin), "keyword '$ref' must not be empty");
        }
        return SchemaSource::reference(std::move(text), nullptr, origin);
    }
    return SchemaSource::from_value(schema_from_value(node, origin), origin);
}

SchemaValue schema_from_value(const Value& node, const std::string& origin) {
    if (!node.is_object()) {
        throw ParseError(where(origin), "schema must be an object, got " + type_name(node));
    }

    SchemaValue schema;
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string& key = it.key();
        const Value& v = it.value();

        if (key == "type") {
            schema.type = read_type(v, origin);
        } else if (key == "format") {
            schema.format = read_string(v, key, origin);
        } else if (key == "enum") {
            if (!v.is_array()) bad_keyword(origin, key, "an array", v);
            schema.enum_values.assign(v.begin(), v.end());
        } else if (key == "default") {
            schema.default_value = v;
        } else if (key == "exclusiveMinimum") {
            schema.exclusive_minimum = read_bound(v, key, origin);
        } else if (key == "exclusiveMaximum") {
            schema.exclusive_maximum = read_bound(v, key, origin);
        } else if (key == "uniqueItems") {
            schema.unique_items = read_bool(v, key, origin);
        } else if (key == "nullable") {
            schema.nullable = read_bool(v, key, origin);
        } else if (key == "readOnly") {
            schema.read_only = read_bool(v, key, origin);
        } else if (key == "writeOnly") {
            schema.write_only = read_bool(v, key, origin);
        } else if (key == "required") {
            if (!v.is_array()) bad_keyword(origin, key, "an array of strings", v);
            for (const auto& name : v) {
                schema.required.push_back(read_string(name, key, origin));
            }
        } else if (key == "properties") {
            if (!v.is_object()) bad_keyword(origin, key, "an object", v);
            for (auto prop = v.begin(); prop != v.end(); ++prop) {
                schema.properties.set(prop.key(), source_from_value(prop.value(), origin));
            }
        } else if (key == "additionalProperties") {
            if (v.is_boolean()) {
                schema.additional_properties = AdditionalProperties::allowed(v.get<bool>());
            } else if (v.is_object()) {
                schema.additional_properties =
                    AdditionalProperties::schema(source_from_value(v, origin));
            } else {
                bad_keyword(origin, key, "a boolean or a schema", v);
            }
        } else if (key == "allOf") {
            schema.all_of = read_sources(v, key, origin);
        } else if (key == "oneOf") {
            schema.one_of = read_sources(v, key, origin);
        } else if (key.rfind("x-", 0) == 0) {
            if (!schema.extensions) {
                schema.extensions = ExtensionMap();
            }
            schema.extensions->set(key, v);
        }
    }
    return schema;
}

// ============================================================================
// Writing
// ============================================================================

Value source_to_value(const SchemaSource& source) {
    if (source.is_reference()) {
        Value ref = Value::object();
        ref["$ref"] = source.ref();
        return ref;
    }
    if (!source.target()) {
        return Value();
    }
    return schema_to_value(*source.target());
}

Value schema_to_value(const SchemaValue& schema) {
    Value out = Value::object();

    if (!schema.type.empty()) out["type"] = schema.type;
    if (!schema.format.empty()) out["format"] = schema.format;
    if (!schema.enum_values.empty()) out["enum"] = schema.enum_values;
    if (schema.default_value) out["default"] = *schema.default_value;
    if (schema.exclusive_minimum) out["exclusiveMinimum"] = bound_to_value(*schema.exclusive_minimum);
    if (schema.exclusive_maximum) out["exclusiveMaximum"] = bound_to_value(*schema.exclusive_maximum);
    if (schema.unique_items) out["uniqueItems"] = true;
    if (schema.nullable) out["nullable"] = true;
    if (schema.read_only) out["readOnly"] = true;
    if (schema.write_only) out["writeOnly"] = true;
    if (!schema.required.empty()) out["required"] = schema.required;

    if (!schema.properties.empty()) {
        Value props = Value::object();
        for (const auto& [name, source] : schema.properties) {
            props[name] = source_to_value(source);
        }
        out["properties"] = std::move(props);
    }

    const auto& ap = schema.additional_properties;
    if (ap.is_flag()) {
        out["additionalProperties"] = ap.is_explicit_true();
    } else if (ap.is_schema()) {
        out["additionalProperties"] = source_to_value(ap.source());
    }

    if (!schema.all_of.empty()) out["allOf"] = sources_to_value(schema.all_of);
    if (!schema.one_of.empty()) out["oneOf"] = sources_to_value(schema.one_of);

    if (schema.extensions) {
        for (const auto& [key, node] : *schema.extensions) {
            out[key] = node;
        }
    }
    return out;
}

} // namespace allof
