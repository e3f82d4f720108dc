/**
 * @file Document.cpp
 * @brief Document set resolver implementation
 */

#include "allof/Document.hpp"
#include "allof/Codec.hpp"
#include "allof/Errors.hpp"
#include "allof/Loader.hpp"
#include "allof/Reference.hpp"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace allof {

namespace {

std::string normalize(const fs::path& p) {
    return p.lexically_normal().generic_string();
}

} // anonymous namespace

DocumentSet::DocumentSet(const std::string& root_path)
    : root_(normalize(root_path))
{
    documents_[root_] = load_document_file(root_path);
}

DocumentSet::DocumentSet(const std::string& root_path, Value root_document)
    : root_(normalize(root_path))
{
    documents_[root_] = std::move(root_document);
}

void DocumentSet::add_document(const std::string& path, Value document) {
    documents_[normalize(path)] = std::move(document);
    cache_.clear();
}

SchemaSource DocumentSet::source(const std::string& ref) const {
    return SchemaSource::reference(ref, nullptr, root_);
}

std::vector<SchemaSource> DocumentSet::composition_sources(const std::vector<std::string>& pointers) {
    if (pointers.empty()) {
        throw std::invalid_argument("composition_sources: no schema pointers given");
    }

    std::vector<SchemaSource> sources;
    for (const auto& pointer : pointers) {
        sources.push_back(source(pointer));
    }

    if (sources.size() == 1) {
        auto value = resolve(sources.front());
        if (!value->all_of.empty()) return value->all_of;
    }
    return sources;
}

std::string DocumentSet::locate(const std::string& document, const std::string& origin) const {
    const std::string& base = origin.empty() ? root_ : origin;
    if (document.empty()) {
        return normalize(base);
    }
    fs::path target(document);
    if (target.is_absolute()) {
        return normalize(target);
    }
    return normalize(fs::path(base).parent_path() / target);
}

const Value& DocumentSet::document(const std::string& path) {
    auto it = documents_.find(path);
    if (it == documents_.end()) {
        it = documents_.emplace(path, load_document_file(path)).first;
    }
    return it->second;
}

std::shared_ptr<const SchemaValue> DocumentSet::resolve(const SchemaSource& source) {
    std::set<std::string> seen;
    return resolve_chain(source, seen);
}

std::shared_ptr<const SchemaValue> DocumentSet::resolve_chain(const SchemaSource& source,
                                                              std::set<std::string>& seen) {
    if (source.target()) {
        return source.target();
    }
    if (!source.is_reference()) {
        throw MissingSchemaValue(source.ref());
    }

    const ReferenceParts parts = split_reference(source.ref());
    const std::string doc_path = locate(parts.document, source.origin());
    const std::string key = doc_path + "#" + parts.fragment;

    auto cached = cache_.find(key);
    if (cached != cache_.end()) {
        return cached->second;
    }
    if (!seen.insert(key).second) {
        throw UnsupportedReference(source.ref(), "reference cycle through " + key);
    }

    const Value& doc = document(doc_path);

    Value::json_pointer pointer;
    try {
        pointer = Value::json_pointer(parts.fragment);
    } catch (const nlohmann::json::parse_error& e) {
        throw UnsupportedReference(source.ref(), e.what());
    }

    const Value* node = nullptr;
    try {
        node = &doc.at(pointer);
    } catch (const nlohmann::json::exception&) {
        throw MissingSchemaValue(source.ref());
    }

    std::shared_ptr<const SchemaValue> value;
    if (node->is_object() && node->contains("$ref")) {
        // A reference to a reference: follow it from the target's document.
        value = resolve_chain(source_from_value(*node, doc_path), seen);
    } else {
        value = std::make_shared<SchemaValue>(schema_from_value(*node, doc_path));
    }
    cache_[key] = value;
    return value;
}

std::vector<std::string> path_for_pointer(const std::string& pointer) {
    auto pos = pointer.find_last_of("/#");
    std::string last = pos == std::string::npos ? pointer : pointer.substr(pos + 1);
    if (last.empty()) return {};
    return {last};
}

} // namespace allof
