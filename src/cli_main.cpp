#include <cxxopts.hpp>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "allof/AllOf.hpp"
#include "allof/Document.hpp"
#include "allof/Errors.hpp"
#include "allof/Generator.hpp"
#include "allof/Options.hpp"

using namespace allof;

namespace {

bool verbose = false;

void trace(const std::string& message) {
    if (verbose) std::cerr << "[allof] " << message << "\n";
}

void print_causes(const std::exception& e, int depth) {
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& cause) {
        std::cerr << std::string(static_cast<size_t>(depth) * 2, ' ') << "caused by: " << cause.what() << "\n";
        print_causes(cause, depth + 1);
    }
}

std::vector<std::string> split_list(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string token;
    std::istringstream iss(s);
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) out.push_back(token);
    }
    return out;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("allof", "Merge OpenAPI allOf compositions into a single schema");
        options.positional_help("DOCUMENT POINTER [POINTER...]");

        options.add_options()
            ("c,config", "Path to JSON/TOML merge options", cxxopts::value<std::string>())
            ("p,prefix", "Env-var prefix for options", cxxopts::value<std::string>()->default_value("ALLOF"))
            ("overrides", "Comma-separated dot:key,JSON_value pairs", cxxopts::value<std::string>()->default_value(""))
            ("n,name", "Comma-separated naming path for the generated type", cxxopts::value<std::string>())
            ("o,out", "Write the result to FILE instead of stdout", cxxopts::value<std::string>())
            ("indent", "JSON indentation", cxxopts::value<int>()->default_value("2"))
            ("v,verbose", "Print progress to stderr")
            ("h,help", "Show help");

        options.add_options()
            ("args", "Document and pointers", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"args"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }
        verbose = result.count("verbose") > 0;

        std::vector<std::string> args;
        if (result.count("args")) args = result["args"].as<std::vector<std::string>>();
        if (args.size() < 2) {
            std::cerr << "Error: expected DOCUMENT and at least one POINTER\n";
            std::cerr << options.help() << "\n";
            return 1;
        }

        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        load.prefix = result["prefix"].as<std::string>();
        load.overrides = parse_overrides(result["overrides"].as<std::string>());

        MergeOptions merge_options = load_merge_options(load);
        trace("options: " + merge_options_to_value(merge_options).dump());

        DocumentSet docs(args[0]);
        trace("loaded " + docs.root_path());

        std::vector<std::string> pointers(args.begin() + 1, args.end());
        std::vector<SchemaSource> sources = docs.composition_sources(pointers);

        std::vector<std::string> path = result.count("name")
            ? split_list(result["name"].as<std::string>(), ',')
            : path_for_pointer(args.back());

        SchemaDocumentGenerator generator;
        AllOfMerger merger(docs, generator, merge_options);
        trace("merging " + std::to_string(sources.size()) + " source(s)");
        GeneratedType type = merger.merge_all_of(sources, path);
        trace("resolved " + std::to_string(docs.cached_schemas()) + " schema value(s)");

        Value out = Value::object();
        out["name"] = type.name;
        out["path"] = type.path;
        out["reference"] = type.reference.empty() ? Value(nullptr) : Value(type.reference);
        out["schema"] = type.definition;

        const std::string text = out.dump(result["indent"].as<int>());
        if (result.count("out")) {
            const std::string file = result["out"].as<std::string>();
            std::ofstream ofs(file);
            if (!ofs) { std::cerr << "Error: cannot write to " << file << "\n"; return 1; }
            ofs << text << "\n";
            trace("wrote " + file);
        } else {
            std::cout << text << "\n";
        }
        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        print_causes(ex, 1);
        return 1;
    }
}
