#pragma once

#include <string_view>
namespace TaggedJson {


// ============================================================================
// Declaration Errors (definition time)
// ============================================================================

enum class DeclarationError {
    none,
    invalid_case_shape,
    empty_property_name,
    duplicate_tag
};

constexpr std::string_view declaration_error_to_string(DeclarationError e) {
    switch(e) {
    case DeclarationError::none:                return "none"; break;
    case DeclarationError::invalid_case_shape:  return "invalid_case_shape"; break;
    case DeclarationError::empty_property_name: return "empty_property_name"; break;
    case DeclarationError::duplicate_tag:       return "duplicate_tag"; break;
    }
    return "N/A";
}


// ============================================================================
// Schema Build Errors
// ============================================================================

enum class SchemaBuildError {
    none,
    not_a_reference
};

constexpr std::string_view schema_build_error_to_string(SchemaBuildError e) {
    switch(e) {
    case SchemaBuildError::none:            return "none"; break;
    case SchemaBuildError::not_a_reference: return "not_a_reference"; break;
    }
    return "N/A";
}


// ============================================================================
// Parse Errors (runtime, recoverable by the caller)
// ============================================================================

enum class ParseError {
    NO_ERROR,
    EXPECTED_TYPE,
    NON_OBJECT_IN_OBJECT_VALUE,
    MISSING_FIELD,
    NULL_IN_NON_OPTIONAL,
    NON_BOOL_JSON_IN_BOOL_VALUE,
    WRONG_JSON_FOR_NUMBER_STORAGE,
    NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE,
    NON_STRING_IN_STRING_STORAGE,
    NON_ARRAY_IN_ARRAY_LIKE_VALUE,
    READER_ERROR
};

constexpr std::string_view error_to_string(ParseError e) {
    switch(e) {
    case ParseError::NO_ERROR: return "NO_ERROR"; break;
    case ParseError::EXPECTED_TYPE: return "EXPECTED_TYPE"; break;
    case ParseError::NON_OBJECT_IN_OBJECT_VALUE: return "NON_OBJECT_IN_OBJECT_VALUE"; break;
    case ParseError::MISSING_FIELD: return "MISSING_FIELD"; break;
    case ParseError::NULL_IN_NON_OPTIONAL: return "NULL_IN_NON_OPTIONAL"; break;
    case ParseError::NON_BOOL_JSON_IN_BOOL_VALUE: return "NON_BOOL_JSON_IN_BOOL_VALUE"; break;
    case ParseError::WRONG_JSON_FOR_NUMBER_STORAGE: return "WRONG_JSON_FOR_NUMBER_STORAGE"; break;
    case ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE: return "NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE"; break;
    case ParseError::NON_STRING_IN_STRING_STORAGE: return "NON_STRING_IN_STRING_STORAGE"; break;
    case ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE: return "NON_ARRAY_IN_ARRAY_LIKE_VALUE"; break;
    case ParseError::READER_ERROR: return "READER_ERROR"; break;
    }
    return "N/A";
}


// ============================================================================
// Serialize Errors
// ============================================================================

enum class SerializeError {
    NO_ERROR,
    WRITER_ERROR,
    NON_OBJECT_PAYLOAD
};

constexpr std::string_view error_to_string(SerializeError e) {
    switch(e) {
    case SerializeError::NO_ERROR: return "NO_ERROR"; break;
    case SerializeError::WRITER_ERROR: return "WRITER_ERROR"; break;
    case SerializeError::NON_OBJECT_PAYLOAD: return "NON_OBJECT_PAYLOAD"; break;
    }
    return "N/A";
}

} // namespace TaggedJson
