/**
 * @file Generator.cpp
 * @brief Schema document generator and type naming
 */

#include "allof/Generator.hpp"
#include "allof/Codec.hpp"
#include "allof/Errors.hpp"

#include <cctype>

namespace allof {

GeneratedType SchemaDocumentGenerator::generate(const SchemaSource& source,
                                                const std::vector<std::string>& path) {
    GeneratedType out;
    out.name = type_name_for(path);
    out.path = path;
    out.reference = source.ref();

    if (!source.is_reference() && !source.target()) {
        throw MissingSchemaValue(source.ref());
    }
    out.definition = source_to_value(source);
    return out;
}

std::string type_name_for(const std::vector<std::string>& path) {
    std::string name;
    for (const auto& segment : path) {
        bool start = true;
        for (char c : segment) {
            auto uc = static_cast<unsigned char>(c);
            if (!std::isalnum(uc)) {
                start = true;
                continue;
            }
            name += start ? static_cast<char>(std::toupper(uc)) : c;
            start = false;
        }
    }
    return name.empty() ? std::string("Schema") : name;
}

} // namespace allof
