/**
 * @file test_document.cpp
 * @brief Tests for the document set resolver and end-to-end allOf merging
 */

#include <gtest/gtest.h>
#include "allof/AllOf.hpp"
#include "allof/Document.hpp"
#include "allof/Errors.hpp"
#include "allof/Generator.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace allof;

namespace {

/**
 * @brief RAII helper for creating temporary directories.
 */
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() /
                      ("allof_test_dir_" + std::to_string(std::rand()))) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }

    std::string create_file(const std::string& name, const std::string& content) {
        fs::path file_path = path_ / name;
        fs::create_directories(file_path.parent_path());
        std::ofstream out(file_path);
        out << content;
        return file_path.string();
    }

private:
    fs::path path_;
};

const char* kApi =
    "openapi: 3.0.3\n"
    "components:\n"
    "  schemas:\n"
    "    Dog:\n"
    "      allOf:\n"
    "        - $ref: '#/components/schemas/Named'\n"
    "        - $ref: 'shared/common.yaml#/components/schemas/Owned'\n"
    "        - type: object\n"
    "          properties:\n"
    "            barks: {type: boolean}\n"
    "    Named:\n"
    "      type: object\n"
    "      required: [name]\n"
    "      properties:\n"
    "        name: {type: string}\n"
    "    Alias:\n"
    "      $ref: '#/components/schemas/Named'\n"
    "    LoopA:\n"
    "      $ref: '#/components/schemas/LoopB'\n"
    "    LoopB:\n"
    "      $ref: '#/components/schemas/LoopA'\n"
    "    Broken:\n"
    "      allOf:\n"
    "        - type: string\n"
    "        - type: integer\n";

const char* kCommon =
    "components:\n"
    "  schemas:\n"
    "    Owned:\n"
    "      type: object\n"
    "      properties:\n"
    "        owner:\n"
    "          $ref: '#/components/schemas/Owner'\n"
    "    Owner:\n"
    "      type: object\n"
    "      properties:\n"
    "        id: {type: integer, format: int64}\n";

class DocumentSetTest : public ::testing::Test {
protected:
    void SetUp() override {
        api_path = dir.create_file("api.yaml", kApi);
        dir.create_file("shared/common.yaml", kCommon);
    }

    TempDir dir;
    std::string api_path;
};

std::vector<std::string> property_names(const SchemaValue& v) {
    std::vector<std::string> names;
    for (const auto& [name, source] : v.properties) names.push_back(name);
    return names;
}

} // anonymous namespace

// ============================================================================
// Resolution
// ============================================================================

TEST_F(DocumentSetTest, ResolvesLocalPointer) {
    DocumentSet docs(api_path);
    auto named = docs.resolve(docs.source("#/components/schemas/Named"));

    ASSERT_NE(named, nullptr);
    EXPECT_EQ(named->type, "object");
    EXPECT_EQ(named->required, (std::vector<std::string>{"name"}));
    EXPECT_EQ(named->properties.at("name").target()->type, "string");
}

TEST_F(DocumentSetTest, ResolvesExternalDocumentRelativeToRoot) {
    DocumentSet docs(api_path);
    auto owner = docs.resolve(docs.source("shared/common.yaml#/components/schemas/Owner"));

    EXPECT_EQ(owner->type, "object");
    EXPECT_EQ(owner->properties.at("id").target()->format, "int64");
}

TEST_F(DocumentSetTest, NestedLocalRefResolvesInItsOwnDocument) {
    DocumentSet docs(api_path);
    auto owned = docs.resolve(docs.source("shared/common.yaml#/components/schemas/Owned"));

    const SchemaSource& owner = owned->properties.at("owner");
    EXPECT_TRUE(owner.is_local_reference());
    EXPECT_EQ(docs.resolve(owner)->properties.at("id").target()->type, "integer");
}

TEST_F(DocumentSetTest, ReferenceChainsShareCachedValue) {
    DocumentSet docs(api_path);
    auto alias = docs.resolve(docs.source("#/components/schemas/Alias"));
    auto named = docs.resolve(docs.source("#/components/schemas/Named"));

    EXPECT_EQ(alias, named);
    EXPECT_EQ(docs.cached_schemas(), 2u);
}

TEST_F(DocumentSetTest, ReferenceCycleIsUnsupported) {
    DocumentSet docs(api_path);
    EXPECT_THROW(docs.resolve(docs.source("#/components/schemas/LoopA")), UnsupportedReference);
}

TEST_F(DocumentSetTest, MissingPointerIsMissingValue) {
    DocumentSet docs(api_path);
    EXPECT_THROW(docs.resolve(docs.source("#/components/schemas/Cat")), MissingSchemaValue);
}

TEST_F(DocumentSetTest, MalformedReferencesAreUnsupported) {
    DocumentSet docs(api_path);
    EXPECT_THROW(docs.resolve(docs.source("#components/schemas/Named")), UnsupportedReference);
    EXPECT_THROW(docs.resolve(docs.source("a.yaml#/x#/y")), UnsupportedReference);
}

TEST_F(DocumentSetTest, MissingExternalDocument) {
    DocumentSet docs(api_path);
    EXPECT_THROW(docs.resolve(docs.source("absent.yaml#/components/schemas/X")), FileNotFoundError);
}

TEST(DocumentSet, InMemoryDocuments) {
    Value root = Value::parse(R"({
        "components": {"schemas": {"Pet": {"$ref": "models/pet.json#/Pet"}}}
    })");
    DocumentSet docs("/virtual/api.json", root);
    docs.add_document("/virtual/models/pet.json",
                      Value::parse(R"({"Pet": {"type": "object", "nullable": true}})"));

    auto pet = docs.resolve(docs.source("#/components/schemas/Pet"));
    EXPECT_EQ(pet->type, "object");
    EXPECT_TRUE(pet->nullable);
    EXPECT_EQ(docs.root_path(), "/virtual/api.json");
}

// ============================================================================
// Pointer selection
// ============================================================================

TEST_F(DocumentSetTest, SingleAllOfPointerStandsForItsList) {
    DocumentSet docs(api_path);
    auto sources = docs.composition_sources({"#/components/schemas/Dog"});

    ASSERT_EQ(sources.size(), 3u);
    EXPECT_EQ(sources[0].ref(), "#/components/schemas/Named");
    EXPECT_EQ(sources[1].ref(), "shared/common.yaml#/components/schemas/Owned");
    EXPECT_FALSE(sources[2].is_reference());
}

TEST_F(DocumentSetTest, PointerWithoutAllOfIsGeneratedAsIs) {
    DocumentSet docs(api_path);
    auto sources = docs.composition_sources({"#/components/schemas/Named"});

    ASSERT_EQ(sources.size(), 1u);
    EXPECT_TRUE(sources[0].is_reference());
    EXPECT_EQ(sources[0].ref(), "#/components/schemas/Named");

    SchemaDocumentGenerator generator;
    AllOfMerger merger(docs, generator);
    GeneratedType type = merger.merge_all_of(sources, path_for_pointer("#/components/schemas/Named"));
    EXPECT_EQ(type.name, "Named");
    EXPECT_EQ(type.reference, "#/components/schemas/Named");
    EXPECT_EQ(type.definition, Value::parse(R"({"$ref": "#/components/schemas/Named"})"));
}

TEST_F(DocumentSetTest, SeveralPointersAreMergedTogether) {
    DocumentSet docs(api_path);
    auto sources = docs.composition_sources({"#/components/schemas/Dog", "#/components/schemas/Named"});

    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(sources[0].ref(), "#/components/schemas/Dog");
    EXPECT_EQ(sources[1].ref(), "#/components/schemas/Named");
}

TEST_F(DocumentSetTest, CompositionSourcesErrors) {
    DocumentSet docs(api_path);
    EXPECT_THROW(docs.composition_sources({}), std::invalid_argument);
    EXPECT_THROW(docs.composition_sources({"#/components/schemas/Cat"}), MissingSchemaValue);
}

TEST(PathForPointer, TakesLastSegment) {
    EXPECT_EQ(path_for_pointer("#/components/schemas/Dog"), (std::vector<std::string>{"Dog"}));
    EXPECT_EQ(path_for_pointer("shared/common.yaml#/components/schemas/Owner"),
              (std::vector<std::string>{"Owner"}));
    EXPECT_EQ(path_for_pointer("Pet"), (std::vector<std::string>{"Pet"}));
    EXPECT_TRUE(path_for_pointer("#").empty());
    EXPECT_TRUE(path_for_pointer("").empty());
}

// ============================================================================
// End to end
// ============================================================================

TEST_F(DocumentSetTest, MergesAllOfAcrossDocuments) {
    DocumentSet docs(api_path);
    SchemaDocumentGenerator generator;
    AllOfMerger merger(docs, generator);

    auto dog = docs.resolve(docs.source("#/components/schemas/Dog"));
    ASSERT_EQ(dog->all_of.size(), 3u);

    SchemaValue merged = merger.merge_values(dog->all_of);
    EXPECT_EQ(merged.type, "object");
    EXPECT_TRUE(merged.all_of.empty());
    EXPECT_EQ(property_names(merged), (std::vector<std::string>{"name", "owner", "barks"}));
    EXPECT_EQ(merged.required, (std::vector<std::string>{"name"}));

    // The owner reference was local to common.yaml and now names it
    const SchemaSource& owner = merged.properties.at("owner");
    EXPECT_EQ(owner.ref(), "shared/common.yaml#/components/schemas/Owner");
    EXPECT_EQ(docs.resolve(owner)->properties.at("id").target()->format, "int64");

    // The cached document value still holds the local form
    auto owned = docs.resolve(docs.source("shared/common.yaml#/components/schemas/Owned"));
    EXPECT_EQ(owned->properties.at("owner").ref(), "#/components/schemas/Owner");
}

TEST_F(DocumentSetTest, GeneratesMergedSchemaDocument) {
    DocumentSet docs(api_path);
    SchemaDocumentGenerator generator;
    AllOfMerger merger(docs, generator);

    auto dog = docs.resolve(docs.source("#/components/schemas/Dog"));
    GeneratedType type = merger.merge_all_of(dog->all_of, {"components", "schemas", "Dog"});

    EXPECT_EQ(type.name, "ComponentsSchemasDog");
    EXPECT_TRUE(type.reference.empty());
    EXPECT_EQ(type.definition["type"], "object");
    EXPECT_EQ(type.definition["properties"]["owner"]["$ref"],
              "shared/common.yaml#/components/schemas/Owner");
    EXPECT_EQ(type.definition["properties"]["barks"]["type"], "boolean");
}

TEST_F(DocumentSetTest, IdentityGenerationKeepsReference) {
    DocumentSet docs(api_path);
    SchemaDocumentGenerator generator;
    AllOfMerger merger(docs, generator);

    auto source = docs.source("#/components/schemas/Named");
    GeneratedType merged = merger.merge_all_of({source}, {"Named"});
    GeneratedType direct = generator.generate(source, {"Named"});

    EXPECT_EQ(merged.name, direct.name);
    EXPECT_EQ(merged.reference, direct.reference);
    EXPECT_EQ(merged.definition, direct.definition);
}

TEST_F(DocumentSetTest, ConflictInDocumentIsReported) {
    DocumentSet docs(api_path);
    SchemaDocumentGenerator generator;
    AllOfMerger merger(docs, generator);

    auto broken = docs.resolve(docs.source("#/components/schemas/Broken"));
    EXPECT_THROW(merger.merge_all_of(broken->all_of, {"Broken"}), AllOfMergeError);
}
