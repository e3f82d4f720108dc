/**
 * @file Options.cpp
 * @brief Layered loading of merge options
 */

#include "allof/Options.hpp"
#include "allof/Errors.hpp"
#include "allof/Loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <utility>
#include <vector>

#include <unistd.h>

extern char **environ;

namespace allof {

namespace {

// Lay one source of options over the accumulated value. Keys the layer sets
// replace the accumulated ones; nested objects are patched key by key.
void apply_layer(Value& merged, const Value& layer, const std::string& origin) {
    if (!layer.is_object()) {
        throw ConfigError(origin + ": merge options must be an object, got " + type_name(layer));
    }
    merged.merge_patch(layer);
}

// Set a nested value by dot-notation, creating intermediate objects
void set_by_dot(Value& obj, const std::string& path, const Value& value) {
    std::vector<std::string> parts;
    std::string token;
    std::istringstream iss(path);
    while (std::getline(iss, token, '.')) {
        if (!token.empty()) parts.push_back(token);
    }
    if (parts.empty()) return;

    Value* cur = &obj;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        auto& p = parts[i];
        if (!cur->contains(p) || !(*cur)[p].is_object()) {
            (*cur)[p] = Value::object();
        }
        cur = &(*cur)[p];
    }
    (*cur)[parts.back()] = value;
}

// Variables named PREFIX_<rest>, as (rest, value) pairs
std::vector<std::pair<std::string, std::string>> prefixed_environment(const std::string& prefix) {
    std::vector<std::pair<std::string, std::string>> envs;
    if (!environ) return envs;
    for (char **env = environ; *env; ++env) {
        std::string entry(*env);
        auto pos = entry.find('=');
        if (pos == std::string::npos || pos <= prefix.size()) continue;
        if (entry.compare(0, prefix.size(), prefix) != 0) continue;
        envs.emplace_back(entry.substr(prefix.size(), pos - prefix.size()), entry.substr(pos + 1));
    }
    return envs;
}

Value environment_layer(const std::string& prefix) {
    // Prefix is normalized to end with exactly one '_'
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    Value layer = Value::object();
    if (normalized.empty()) return layer;
    normalized += "_";

    for (const auto& [name, raw] : prefixed_environment(normalized)) {
        std::string key = transform_env_name(name);
        if (key.empty()) continue;
        set_by_dot(layer, key, parse_json_or_string(raw));
    }
    return layer;
}

void trim(std::string& x) {
    size_t i = 0, j = x.size();
    while (i < j && std::isspace(static_cast<unsigned char>(x[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(x[j - 1]))) --j;
    x = x.substr(i, j - i);
}

} // anonymous namespace

std::string transform_env_name(const std::string& name) {
    static const std::string marker = "\x01";

    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string out;
    out.reserve(lower.size());
    for (size_t i = 0; i < lower.size(); ++i) {
        if (lower[i] == '_' && i + 1 < lower.size() && lower[i + 1] == '_') {
            out += marker;
            ++i;
        } else if (lower[i] == '_') {
            out += '.';
        } else {
            out += lower[i];
        }
    }
    std::replace(out.begin(), out.end(), marker[0], '_');
    return out;
}

Value parse_json_or_string(const std::string& raw) {
    Value parsed = Value::parse(raw, nullptr, false);
    if (parsed.is_discarded()) {
        return Value(raw);
    }
    return parsed;
}

std::map<std::string, Value> parse_overrides(const std::string& s) {
    std::map<std::string, Value> out;

    // Option values are booleans, numbers or small objects, so a comma only
    // separates pairs outside braces and brackets.
    std::vector<std::string> pairs;
    std::string buf;
    int depth = 0;
    for (char c : s) {
        if (c == '{' || c == '[') ++depth;
        if (c == '}' || c == ']') --depth;
        if (c == ',' && depth == 0) {
            pairs.push_back(buf);
            buf.clear();
            continue;
        }
        buf += c;
    }
    pairs.push_back(buf);

    for (auto& pair : pairs) {
        trim(pair);
        if (pair.empty()) continue;
        auto pos = pair.find(':');
        std::string key = pair.substr(0, pos);
        trim(key);
        if (pos == std::string::npos || key.empty()) {
            throw ConfigError("override '" + pair + "' is not of the form key:value");
        }
        std::string value = pair.substr(pos + 1);
        trim(value);
        out[key] = parse_json_or_string(value);
    }
    return out;
}

Value merge_options_to_value(const MergeOptions& options) {
    Value out = Value::object();
    out["compatibility"] = Value::object();
    out["compatibility"]["old_merge_schemas"] = options.compatibility.old_merge_schemas;
    out["max_composition_depth"] = options.max_composition_depth;
    return out;
}

MergeOptions merge_options_from_value(const Value& data) {
    MergeOptions out;
    if (!data.is_object()) {
        throw ConfigError("merge options must be an object, got " + type_name(data));
    }

    auto compat = data.find("compatibility");
    if (compat != data.end()) {
        if (!compat->is_object()) {
            throw ConfigError("'compatibility' must be an object, got " + type_name(*compat));
        }
        auto old_merge = compat->find("old_merge_schemas");
        if (old_merge != compat->end()) {
            if (!old_merge->is_boolean()) {
                throw ConfigError("'compatibility.old_merge_schemas' must be a boolean, got " +
                                  type_name(*old_merge));
            }
            out.compatibility.old_merge_schemas = old_merge->get<bool>();
        }
    }

    auto depth = data.find("max_composition_depth");
    if (depth != data.end()) {
        bool positive = depth->is_number_unsigned()
                            ? depth->get<std::uint64_t>() > 0
                            : depth->is_number_integer() && depth->get<std::int64_t>() > 0;
        if (!positive) {
            throw ConfigError("'max_composition_depth' must be a positive integer, got " +
                              render_value(*depth));
        }
        out.max_composition_depth = static_cast<std::size_t>(depth->get<std::uint64_t>());
    }
    return out;
}

MergeOptions load_merge_options(const LoadOptions& opts) {
    // 1) defaults
    Value merged = merge_options_to_value(MergeOptions{});

    // 2) file
    if (opts.file_path.has_value()) {
        apply_layer(merged, load_config_file(*opts.file_path), *opts.file_path);
    }

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        apply_layer(merged, environment_layer(*opts.prefix), "environment (" + *opts.prefix + ")");
    }

    // 4) overrides
    for (const auto& [k, v] : opts.overrides) {
        set_by_dot(merged, k, v);
    }

    return merge_options_from_value(merged);
}

} // namespace allof
