#pragma once

#include <format>
#include <string>

#include "errors.hpp"
#include "parse_result.hpp"

namespace TaggedJson {

inline std::string JsonPathToString(const ParseResult& res) {
    std::string jsonPath = "$";
    for(const path::PathElement& e: res.errorPath()) {
        if(!e.is_index()) {
            jsonPath += "." + e.field_name;
        } else {
            jsonPath += "[" + std::to_string(e.array_index) + "]";
        }
    }
    return jsonPath;
}

// "When parsing $.shapes[1], parsing error 'EXPECTED_TYPE' in object: unrecognized ..."
inline std::string ParseResultToString(const ParseResult& res) {
    if(res) {
        return "no error";
    }
    std::string detail;
    if(!res.detail().empty()) {
        detail = ": " + res.detail();
    }
    return std::format("When parsing {}, parsing error '{}' in {}{}",
        JsonPathToString(res), error_to_string(res.error()), res.typeName(), detail);
}

inline std::string SerializeResultToString(const SerializeResult& res) {
    if(res) {
        return "no error";
    }
    return std::format("Serialization error '{}' in {}", error_to_string(res.error()), res.typeName());
}

} // namespace TaggedJson
