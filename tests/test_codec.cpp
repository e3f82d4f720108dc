/**
 * @file test_codec.cpp
 * @brief Tests for document node <-> SchemaValue conversion
 */

#include <gtest/gtest.h>
#include "allof/Codec.hpp"
#include "allof/Errors.hpp"

#include <string>
#include <vector>

using namespace allof;

// ============================================================================
// Reading
// ============================================================================

TEST(SchemaFromValue, ReadsScalarKeywords) {
    Value node = {
        {"type", "string"},
        {"format", "date-time"},
        {"enum", Value::array({"a", "b"})},
        {"default", "a"},
        {"nullable", true},
        {"readOnly", true},
        {"uniqueItems", false},
        {"title", "ignored"},
    };

    auto schema = schema_from_value(node);
    EXPECT_EQ(schema.type, "string");
    EXPECT_EQ(schema.format, "date-time");
    ASSERT_EQ(schema.enum_values.size(), 2u);
    EXPECT_EQ(schema.enum_values[1], "b");
    ASSERT_TRUE(schema.default_value.has_value());
    EXPECT_EQ(*schema.default_value, "a");
    EXPECT_TRUE(schema.nullable);
    EXPECT_TRUE(schema.read_only);
    EXPECT_FALSE(schema.write_only);
    EXPECT_FALSE(schema.unique_items);
}

TEST(SchemaFromValue, NullDefaultIsPresent) {
    auto schema = schema_from_value(Value{{"default", nullptr}});
    ASSERT_TRUE(schema.default_value.has_value());
    EXPECT_TRUE(schema.default_value->is_null());
}

TEST(SchemaFromValue, TypeArrayWithOneEntry) {
    EXPECT_EQ(schema_from_value(Value::parse(R"({"type": ["integer"]})")).type, "integer");
    EXPECT_THROW(schema_from_value(Value::parse(R"({"type": ["integer", "null"]})")), ParseError);
    EXPECT_THROW(schema_from_value(Value{{"type", 5}}), ParseError);
}

TEST(SchemaFromValue, BoundsFollowTheirDialect) {
    auto schema = schema_from_value(Value{{"exclusiveMinimum", true}, {"exclusiveMaximum", 9.5}});

    ASSERT_TRUE(schema.exclusive_minimum.has_value());
    EXPECT_EQ(bound_dialect(*schema.exclusive_minimum), "boolean");
    EXPECT_TRUE(std::get<BooleanBound>(*schema.exclusive_minimum).exclusive);

    ASSERT_TRUE(schema.exclusive_maximum.has_value());
    EXPECT_EQ(bound_dialect(*schema.exclusive_maximum), "numeric");
    EXPECT_DOUBLE_EQ(std::get<NumericBound>(*schema.exclusive_maximum).value, 9.5);
    EXPECT_EQ(describe_bound(*schema.exclusive_maximum), "9.5");

    EXPECT_THROW(schema_from_value(Value{{"exclusiveMinimum", "3"}}), ParseError);
}

TEST(SchemaFromValue, PropertiesKeepDocumentOrder) {
    Value node = Value::parse(R"({
        "type": "object",
        "required": ["zeta"],
        "properties": {
            "zeta": {"type": "string"},
            "alpha": {"$ref": "#/components/schemas/Alpha"},
            "mid": {"type": "integer"}
        }
    })");

    auto schema = schema_from_value(node, "api.yaml");
    ASSERT_EQ(schema.properties.size(), 3u);
    EXPECT_EQ(schema.properties.position("zeta"), 0u);
    EXPECT_EQ(schema.properties.position("alpha"), 1u);
    EXPECT_EQ(schema.properties.position("mid"), 2u);

    const auto& alpha = schema.properties.at("alpha");
    EXPECT_TRUE(alpha.is_local_reference());
    EXPECT_EQ(alpha.ref(), "#/components/schemas/Alpha");
    EXPECT_EQ(alpha.origin(), "api.yaml");

    EXPECT_EQ(schema.properties.at("zeta").target()->type, "string");
    EXPECT_EQ(schema.required, (std::vector<std::string>{"zeta"}));
}

TEST(SchemaFromValue, AdditionalPropertiesStates) {
    EXPECT_TRUE(schema_from_value(Value::object()).additional_properties.is_absent());
    EXPECT_TRUE(schema_from_value(Value{{"additionalProperties", false}})
                    .additional_properties.is_explicit_false());
    EXPECT_TRUE(schema_from_value(Value{{"additionalProperties", true}})
                    .additional_properties.is_explicit_true());

    auto schema = schema_from_value(Value::parse(R"({"additionalProperties": {"type": "string"}})"));
    ASSERT_TRUE(schema.additional_properties.is_schema());
    EXPECT_EQ(schema.additional_properties.source().target()->type, "string");

    EXPECT_THROW(schema_from_value(Value{{"additionalProperties", 1}}), ParseError);
}

TEST(SchemaFromValue, CompositionAndExtensions) {
    Value node = Value::parse(R"({
        "allOf": [{"$ref": "#/components/schemas/Base"}, {"type": "object"}],
        "oneOf": [{"$ref": "#/components/schemas/Cat"}],
        "x-go-type": "Pet",
        "x-order": 1
    })");

    auto schema = schema_from_value(node);
    ASSERT_EQ(schema.all_of.size(), 2u);
    EXPECT_EQ(schema.all_of[0].ref(), "#/components/schemas/Base");
    EXPECT_FALSE(schema.all_of[1].is_reference());
    ASSERT_EQ(schema.one_of.size(), 1u);

    ASSERT_TRUE(schema.extensions.has_value());
    EXPECT_EQ(schema.extensions->size(), 2u);
    EXPECT_EQ(schema.extensions->at("x-go-type"), "Pet");
    EXPECT_EQ(schema.extensions->position("x-order"), 1u);
}

TEST(SchemaFromValue, NoExtensionsMeansAbsent) {
    EXPECT_FALSE(schema_from_value(Value{{"type", "string"}}).extensions.has_value());
}

TEST(SchemaFromValue, RejectsWrongShapes) {
    EXPECT_THROW(schema_from_value(Value("string")), ParseError);
    EXPECT_THROW(schema_from_value(Value{{"nullable", "yes"}}), ParseError);
    EXPECT_THROW(schema_from_value(Value{{"required", "name"}}), ParseError);
    EXPECT_THROW(schema_from_value(Value::parse(R"({"properties": [1, 2]})")), ParseError);
    EXPECT_THROW(schema_from_value(Value::parse(R"({"allOf": {"type": "string"}})")), ParseError);
    EXPECT_THROW(schema_from_value(Value::parse(R"({"allOf": ["Base"]})")), ParseError);
}

TEST(SchemaFromValue, ParseErrorNamesTheOrigin) {
    try {
        schema_from_value(Value{{"format", 3}}, "pets.yaml");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.source(), "pets.yaml");
        EXPECT_NE(e.details().find("format"), std::string::npos);
    }
}

TEST(SourceFromValue, ReferenceIgnoresSiblings) {
    auto source = source_from_value(Value{{"$ref", "common.yaml#/Pet"}, {"type", "string"}}, "api.yaml");
    EXPECT_TRUE(source.is_reference());
    EXPECT_FALSE(source.is_local_reference());
    EXPECT_EQ(source.ref(), "common.yaml#/Pet");
    EXPECT_EQ(source.origin(), "api.yaml");
    EXPECT_FALSE(source.target());

    EXPECT_THROW(source_from_value(Value{{"$ref", ""}}), ParseError);
}

// ============================================================================
// Writing
// ============================================================================

TEST(SchemaToValue, FixedKeyOrderAndOmittedDefaults) {
    SchemaValue schema;
    schema.extensions = ExtensionMap{{"x-name", Value("Pet")}};
    schema.required = {"name"};
    schema.properties.set("name", SchemaSource::reference("#/components/schemas/Name"));
    schema.type = "object";
    schema.nullable = true;

    Value out = schema_to_value(schema);
    std::vector<std::string> keys;
    for (auto it = out.begin(); it != out.end(); ++it) keys.push_back(it.key());

    EXPECT_EQ(keys, (std::vector<std::string>{"type", "nullable", "required", "properties", "x-name"}));
    EXPECT_EQ(out["properties"]["name"]["$ref"], "#/components/schemas/Name");
    EXPECT_FALSE(out.contains("readOnly"));
    EXPECT_FALSE(out.contains("additionalProperties"));
}

TEST(SchemaToValue, DocumentRoundTrip) {
    Value node = Value::parse(R"({
        "type": "object",
        "required": ["id"],
        "properties": {"id": {"type": "integer", "format": "int64"}},
        "additionalProperties": false
    })");

    EXPECT_EQ(schema_to_value(schema_from_value(node)), node);
}

TEST(SourceToValue, InlineWithoutValueIsNull) {
    EXPECT_TRUE(source_to_value(SchemaSource()).is_null());
}
