#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace TaggedJson {

namespace path {

struct PathElement {
    static constexpr std::size_t NOT_AN_INDEX = std::numeric_limits<std::size_t>::max();

    std::string field_name;
    std::size_t array_index = NOT_AN_INDEX;

    bool is_index() const { return array_index != NOT_AN_INDEX; }
};

} // namespace path


class ParseResult {
    ParseError m_error = ParseError::NO_ERROR;
    std::string_view m_typeName;
    std::string m_detail;
    std::vector<path::PathElement> currentPath; // outermost element first

public:
    ParseResult() = default;
    ParseResult(ParseError err, std::string_view typeName, std::string detail = {}):
        m_error(err), m_typeName(typeName), m_detail(std::move(detail))
    {}

    operator bool() const {
        return m_error == ParseError::NO_ERROR;
    }
    ParseError error() const {
        return m_error;
    }
    // Name of the payload type that reported the error
    std::string_view typeName() const {
        return m_typeName;
    }
    const std::string & detail() const {
        return m_detail;
    }
    const std::vector<path::PathElement> & errorPath() const {
        return currentPath;
    }

    ParseResult & prepend_field(std::string_view field) {
        currentPath.insert(currentPath.begin(), path::PathElement{std::string(field)});
        return *this;
    }
    ParseResult & prepend_index(std::size_t index) {
        currentPath.insert(currentPath.begin(), path::PathElement{{}, index});
        return *this;
    }
};


class SerializeResult {
    SerializeError m_error = SerializeError::NO_ERROR;
    std::string_view m_typeName;

public:
    SerializeResult() = default;
    SerializeResult(SerializeError err, std::string_view typeName):
        m_error(err), m_typeName(typeName)
    {}

    operator bool() const {
        return m_error == SerializeError::NO_ERROR;
    }
    SerializeError error() const {
        return m_error;
    }
    std::string_view typeName() const {
        return m_typeName;
    }
};

} // namespace TaggedJson
