#pragma once
#include <yyjson.h>

#include <array>
#include <concepts>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "annotated.hpp"
#include "meta_schema.hpp"
#include "parse_result.hpp"
#include "registry.hpp"

namespace TaggedJson {

// Capability record every payload type provides. Specializations expose:
//
//   static constexpr std::string_view name();
//   static constexpr bool is_required;          // false for nullable types
//   static constexpr bool schema_is_reference;  // schema_ref() names a registry entry
//   static SchemaRef schema_ref();
//   static void register_type(Registry&);
//   static ParseResult parse_from_json(T&, yyjson_val*);
//   static SerializeResult to_json(const T&, yyjson_mut_doc*, yyjson_mut_val*&);
template<class T>
struct TypeDescriptor;

template<class T>
concept PayloadType = requires(T& v, const T& cv, yyjson_val* in, yyjson_mut_doc* doc,
                               yyjson_mut_val*& out, Registry& registry) {
    { TypeDescriptor<T>::name() } -> std::convertible_to<std::string_view>;
    { TypeDescriptor<T>::is_required } -> std::convertible_to<bool>;
    { TypeDescriptor<T>::schema_is_reference } -> std::convertible_to<bool>;
    { TypeDescriptor<T>::schema_ref() } -> std::same_as<SchemaRef>;
    TypeDescriptor<T>::register_type(registry);
    { TypeDescriptor<T>::parse_from_json(v, in) } -> std::same_as<ParseResult>;
    { TypeDescriptor<T>::to_json(cv, doc, out) } -> std::same_as<SerializeResult>;
};

namespace descriptor_detail {

// Compile-time concatenation of names with static storage
template <const std::string_view&... Strs>
struct join {
    static constexpr auto impl() noexcept {
        constexpr std::size_t len = (Strs.size() + ... + 0);
        std::array<char, len + 1> arr{};
        std::size_t i = 0;
        auto append = [&](std::string_view s) {
            for (char c : s) arr[i++] = c;
        };
        (append(Strs), ...);
        arr[len] = 0;
        return arr;
    }
    static constexpr auto arr = impl();
    static constexpr std::string_view value {arr.data(), arr.size() - 1};
};

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cvref_t<T>, Template>::value;

template<class T>
consteval std::string_view integer_format() {
    if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) return "int8";
        else if constexpr (sizeof(T) == 2) return "int16";
        else if constexpr (sizeof(T) == 4) return "int32";
        else return "int64";
    } else {
        if constexpr (sizeof(T) == 1) return "uint8";
        else if constexpr (sizeof(T) == 2) return "uint16";
        else if constexpr (sizeof(T) == 4) return "uint32";
        else return "uint64";
    }
}

inline SerializeResult store(yyjson_mut_val* v, yyjson_mut_val*& out, std::string_view typeName) {
    if(!v) return SerializeResult(SerializeError::WRITER_ERROR, typeName);
    out = v;
    return {};
}

} // namespace descriptor_detail


template<>
struct TypeDescriptor<bool> {
    static constexpr bool is_required = true;
    static constexpr bool schema_is_reference = false;

    static constexpr std::string_view name() { return "boolean"; }

    static SchemaRef schema_ref() {
        return SchemaRef::Inline(MetaSchema("boolean"));
    }
    static void register_type(Registry&) {}

    static ParseResult parse_from_json(bool& out, yyjson_val* v) {
        if(!yyjson_is_bool(v)) {
            return ParseResult(ParseError::NON_BOOL_JSON_IN_BOOL_VALUE, name());
        }
        out = yyjson_get_bool(v);
        return {};
    }
    static SerializeResult to_json(const bool& v, yyjson_mut_doc* doc, yyjson_mut_val*& out) {
        return descriptor_detail::store(yyjson_mut_bool(doc, v), out, name());
    }
};


template<class T>
    requires (std::is_integral_v<T> && !std::is_same_v<T, bool>)
struct TypeDescriptor<T> {
    static constexpr bool is_required = true;
    static constexpr bool schema_is_reference = false;

private:
    static constexpr std::string_view prefix = "integer(";
    static constexpr std::string_view format = descriptor_detail::integer_format<T>();
    static constexpr std::string_view suffix = ")";
public:
    static constexpr std::string_view name() {
        return descriptor_detail::join<prefix, format, suffix>::value;
    }

    static SchemaRef schema_ref() {
        MetaSchema s("integer");
        s.format = std::string(format);
        return SchemaRef::Inline(std::move(s));
    }
    static void register_type(Registry&) {}

    static ParseResult parse_from_json(T& out, yyjson_val* v) {
        if(yyjson_is_sint(v)) {
            std::int64_t x = yyjson_get_sint(v);
            if(!std::in_range<T>(x)) {
                return ParseResult(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE, name(), std::to_string(x));
            }
            out = static_cast<T>(x);
        } else if(yyjson_is_uint(v)) {
            std::uint64_t x = yyjson_get_uint(v);
            if(!std::in_range<T>(x)) {
                return ParseResult(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE, name(), std::to_string(x));
            }
            out = static_cast<T>(x);
        } else {
            return ParseResult(ParseError::WRONG_JSON_FOR_NUMBER_STORAGE, name());
        }
        return {};
    }
    static SerializeResult to_json(const T& v, yyjson_mut_doc* doc, yyjson_mut_val*& out) {
        if constexpr (std::is_signed_v<T>) {
            return descriptor_detail::store(yyjson_mut_sint(doc, static_cast<std::int64_t>(v)), out, name());
        } else {
            return descriptor_detail::store(yyjson_mut_uint(doc, static_cast<std::uint64_t>(v)), out, name());
        }
    }
};


template<class T>
    requires std::is_floating_point_v<T>
struct TypeDescriptor<T> {
    static constexpr bool is_required = true;
    static constexpr bool schema_is_reference = false;

    static constexpr std::string_view name() {
        if constexpr (sizeof(T) == sizeof(float)) return "number(float)";
        else return "number(double)";
    }

    static SchemaRef schema_ref() {
        MetaSchema s("number");
        s.format = sizeof(T) == sizeof(float) ? "float" : "double";
        return SchemaRef::Inline(std::move(s));
    }
    static void register_type(Registry&) {}

    static ParseResult parse_from_json(T& out, yyjson_val* v) {
        if(!yyjson_is_num(v)) {
            return ParseResult(ParseError::WRONG_JSON_FOR_NUMBER_STORAGE, name());
        }
        double x = yyjson_get_num(v);
        if(x < double(std::numeric_limits<T>::lowest()) || x > double(std::numeric_limits<T>::max())) {
            return ParseResult(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE, name(), std::format("{}", x));
        }
        out = static_cast<T>(x);
        return {};
    }
    static SerializeResult to_json(const T& v, yyjson_mut_doc* doc, yyjson_mut_val*& out) {
        return descriptor_detail::store(yyjson_mut_real(doc, static_cast<double>(v)), out, name());
    }
};


template<>
struct TypeDescriptor<std::string> {
    static constexpr bool is_required = true;
    static constexpr bool schema_is_reference = false;

    static constexpr std::string_view name() { return "string"; }

    static SchemaRef schema_ref() {
        return SchemaRef::Inline(MetaSchema("string"));
    }
    static void register_type(Registry&) {}

    static ParseResult parse_from_json(std::string& out, yyjson_val* v) {
        if(!yyjson_is_str(v)) {
            return ParseResult(ParseError::NON_STRING_IN_STRING_STORAGE, name());
        }
        out.assign(yyjson_get_str(v), yyjson_get_len(v));
        return {};
    }
    static SerializeResult to_json(const std::string& v, yyjson_mut_doc* doc, yyjson_mut_val*& out) {
        return descriptor_detail::store(yyjson_mut_strncpy(doc, v.data(), v.size()), out, name());
    }
};


// Nullable: same name and schema as T, but not required
template<PayloadType T>
struct TypeDescriptor<std::optional<T>> {
    static constexpr bool is_required = false;
    static constexpr bool schema_is_reference = TypeDescriptor<T>::schema_is_reference;

    static constexpr std::string_view name() { return TypeDescriptor<T>::name(); }

    static SchemaRef schema_ref() { return TypeDescriptor<T>::schema_ref(); }
    static void register_type(Registry& registry) { TypeDescriptor<T>::register_type(registry); }

    static ParseResult parse_from_json(std::optional<T>& out, yyjson_val* v) {
        if(yyjson_is_null(v)) {
            out.reset();
            return {};
        }
        T value{};
        ParseResult r = TypeDescriptor<T>::parse_from_json(value, v);
        if(!r) return r;
        out = std::move(value);
        return {};
    }
    static SerializeResult to_json(const std::optional<T>& v, yyjson_mut_doc* doc, yyjson_mut_val*& out) {
        if(!v) {
            return descriptor_detail::store(yyjson_mut_null(doc), out, name());
        }
        return TypeDescriptor<T>::to_json(*v, doc, out);
    }
};


template<PayloadType T>
struct TypeDescriptor<std::vector<T>> {
    static constexpr bool is_required = true;
    static constexpr bool schema_is_reference = false;

private:
    static constexpr std::string_view open = "[";
    static constexpr std::string_view inner = TypeDescriptor<T>::name();
    static constexpr std::string_view close = "]";
public:
    static constexpr std::string_view name() {
        return descriptor_detail::join<open, inner, close>::value;
    }

    static SchemaRef schema_ref() {
        MetaSchema s("array");
        s.items = TypeDescriptor<T>::schema_ref();
        return SchemaRef::Inline(std::move(s));
    }
    static void register_type(Registry& registry) { TypeDescriptor<T>::register_type(registry); }

    static ParseResult parse_from_json(std::vector<T>& out, yyjson_val* v) {
        if(!yyjson_is_arr(v)) {
            return ParseResult(ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE, name());
        }
        std::vector<T> items;
        items.reserve(yyjson_arr_size(v));
        std::size_t idx, max;
        yyjson_val* item;
        yyjson_arr_foreach(v, idx, max, item) {
            T& slot = items.emplace_back();
            ParseResult r = TypeDescriptor<T>::parse_from_json(slot, item);
            if(!r) return r.prepend_index(idx);
        }
        out = std::move(items);
        return {};
    }
    static SerializeResult to_json(const std::vector<T>& v, yyjson_mut_doc* doc, yyjson_mut_val*& out) {
        yyjson_mut_val* arr = yyjson_mut_arr(doc);
        if(!arr) return SerializeResult(SerializeError::WRITER_ERROR, name());
        for(const T& item: v) {
            yyjson_mut_val* node = nullptr;
            SerializeResult r = TypeDescriptor<T>::to_json(item, doc, node);
            if(!r) return r;
            if(!yyjson_mut_arr_append(arr, node)) return SerializeResult(SerializeError::WRITER_ERROR, name());
        }
        out = arr;
        return {};
    }
};


// Annotated<T, Opts...> behaves as T; field options are read by the owning object
template<class T, class... Opts>
    requires PayloadType<T>
struct TypeDescriptor<Annotated<T, Opts...>> {
    using Inner = TypeDescriptor<T>;
    static constexpr bool is_required = Inner::is_required;
    static constexpr bool schema_is_reference = Inner::schema_is_reference;

    static constexpr std::string_view name() { return Inner::name(); }

    static SchemaRef schema_ref() { return Inner::schema_ref(); }
    static void register_type(Registry& registry) { Inner::register_type(registry); }

    static ParseResult parse_from_json(Annotated<T, Opts...>& out, yyjson_val* v) {
        return Inner::parse_from_json(out.value, v);
    }
    static SerializeResult to_json(const Annotated<T, Opts...>& v, yyjson_mut_doc* doc, yyjson_mut_val*& out) {
        return Inner::to_json(v.value, doc, out);
    }
};

} // namespace TaggedJson
