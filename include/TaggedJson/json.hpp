#pragma once
#include <yyjson.h>

#include <format>
#include <string>
#include <string_view>

#include "object.hpp"
#include "one_of.hpp"
#include "parse_result.hpp"
#include "registry.hpp"
#include "type_descriptor.hpp"
#include "yyjson.hpp"

namespace TaggedJson {

template<PayloadType T>
ParseResult Parse(T& obj, yyjson_val* v) {
    if(!v) {
        return ParseResult(ParseError::READER_ERROR, TypeDescriptor<T>::name(), "no JSON value");
    }
    return TypeDescriptor<T>::parse_from_json(obj, v);
}

// Parses JSON text into `obj`. On failure `obj` may be partially written.
template<PayloadType T>
ParseResult Parse(T& obj, std::string_view json, yyjson_read_flag flags = YYJSON_READ_NOFLAG) {
    YyjsonDocument doc(json, flags);
    if(!doc.ok()) {
        const yyjson_read_err& err = doc.error();
        return ParseResult(ParseError::READER_ERROR, TypeDescriptor<T>::name(),
            std::format("{} at byte {}", err.msg ? err.msg : "unknown error", err.pos));
    }
    return Parse(obj, doc.root());
}

template<PayloadType T>
SerializeResult ToJson(const T& obj, yyjson_mut_doc* doc, yyjson_mut_val*& out) {
    return TypeDescriptor<T>::to_json(obj, doc, out);
}

template<PayloadType T>
SerializeResult Serialize(const T& obj, std::string& out, yyjson_write_flag flags = TAGGEDJSON_WRITE_FLAGS) {
    YyjsonMutDocument doc;
    if(!doc.ok()) {
        return SerializeResult(SerializeError::WRITER_ERROR, TypeDescriptor<T>::name());
    }
    yyjson_mut_val* root = nullptr;
    SerializeResult r = ToJson(obj, doc.get(), root);
    if(!r) return r;
    doc.set_root(root);
    if(!doc.write(out, flags)) {
        return SerializeResult(SerializeError::WRITER_ERROR, TypeDescriptor<T>::name());
    }
    return {};
}

// Registers every named schema reachable from T
template<PayloadType T>
void RegisterType(Registry& registry) {
    TypeDescriptor<T>::register_type(registry);
}

template<PayloadType T>
SchemaRef SchemaOf() {
    return TypeDescriptor<T>::schema_ref();
}

} // namespace TaggedJson
