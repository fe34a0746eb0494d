#pragma once

#include <yyjson.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#ifndef TAGGEDJSON_SCHEMA_REF_PREFIX
#define TAGGEDJSON_SCHEMA_REF_PREFIX "#/components/schemas/"
#endif

namespace TaggedJson {

inline constexpr std::string_view schema_ref_prefix = TAGGEDJSON_SCHEMA_REF_PREFIX;

struct MetaSchema;

// Either an inline schema or the name of a schema registered in a Registry
class SchemaRef {
    std::variant<std::shared_ptr<const MetaSchema>, std::string> m_ref;

    explicit SchemaRef(std::shared_ptr<const MetaSchema> s): m_ref(std::move(s)) {}
    explicit SchemaRef(std::string name): m_ref(std::move(name)) {}
public:
    static SchemaRef Inline(MetaSchema schema);
    static SchemaRef Reference(std::string_view name) {
        return SchemaRef(std::string(name));
    }

    bool is_reference() const {
        return std::holds_alternative<std::string>(m_ref);
    }
    bool is_inline() const {
        return !is_reference();
    }

    // Registered name, or nullopt for an inline schema
    std::optional<std::string_view> unwrap_reference() const {
        if(const std::string* name = std::get_if<std::string>(&m_ref)) {
            return std::string_view(*name);
        }
        return std::nullopt;
    }
    // Inline schema, or nullptr for a reference
    const MetaSchema* unwrap_inline() const {
        if(const auto* s = std::get_if<std::shared_ptr<const MetaSchema>>(&m_ref)) {
            return s->get();
        }
        return nullptr;
    }

    friend bool operator==(const SchemaRef& lhs, const SchemaRef& rhs);
};

struct MetaExternalDocument {
    std::string url;
    std::optional<std::string> description;

    bool operator==(const MetaExternalDocument&) const = default;
};

struct MetaDiscriminatorObject {
    std::string property_name;
    std::vector<std::pair<std::string, std::string>> mapping; // tag -> "#/components/schemas/<name>"

    bool operator==(const MetaDiscriminatorObject&) const = default;
};

struct MetaSchema {
    std::string type;
    std::optional<std::string> format;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<MetaExternalDocument> external_docs;
    std::vector<std::string> required;
    std::vector<std::pair<std::string, SchemaRef>> properties;
    std::optional<SchemaRef> items;
    std::vector<std::string> enum_items;
    std::vector<SchemaRef> one_of;
    std::optional<MetaDiscriminatorObject> discriminator;

    MetaSchema() = default;
    explicit MetaSchema(std::string_view type_): type(type_) {}

    const SchemaRef* find_property(std::string_view name) const {
        for(const auto & [key, schema]: properties) {
            if(key == name) return &schema;
        }
        return nullptr;
    }

    bool operator==(const MetaSchema&) const = default;
};

inline SchemaRef SchemaRef::Inline(MetaSchema schema) {
    return SchemaRef(std::make_shared<const MetaSchema>(std::move(schema)));
}

inline bool operator==(const SchemaRef& lhs, const SchemaRef& rhs) {
    if(lhs.is_reference() != rhs.is_reference()) return false;
    if(lhs.is_reference()) {
        return *lhs.unwrap_reference() == *rhs.unwrap_reference();
    }
    return *lhs.unwrap_inline() == *rhs.unwrap_inline();
}

inline std::string reference_string(std::string_view name) {
    std::string s(schema_ref_prefix);
    s += name;
    return s;
}


// ============================================================================
// Schema output (yyjson DOM)
// ============================================================================

namespace schema_writer_detail {

inline bool add_string(yyjson_mut_doc* doc, yyjson_mut_val* obj, std::string_view key, std::string_view value) {
    yyjson_mut_val* k = yyjson_mut_strncpy(doc, key.data(), key.size());
    yyjson_mut_val* v = yyjson_mut_strncpy(doc, value.data(), value.size());
    if(!k || !v) return false;
    return yyjson_mut_obj_add(obj, k, v);
}

inline bool add_value(yyjson_mut_doc* doc, yyjson_mut_val* obj, std::string_view key, yyjson_mut_val* value) {
    if(!value) return false;
    yyjson_mut_val* k = yyjson_mut_strncpy(doc, key.data(), key.size());
    if(!k) return false;
    return yyjson_mut_obj_add(obj, k, value);
}

inline yyjson_mut_val* string_array(yyjson_mut_doc* doc, const std::vector<std::string>& items) {
    yyjson_mut_val* arr = yyjson_mut_arr(doc);
    if(!arr) return nullptr;
    for(const auto& item: items) {
        yyjson_mut_val* v = yyjson_mut_strncpy(doc, item.data(), item.size());
        if(!v || !yyjson_mut_arr_append(arr, v)) return nullptr;
    }
    return arr;
}

} // namespace schema_writer_detail

inline yyjson_mut_val* WriteSchema(const SchemaRef& ref, yyjson_mut_doc* doc);

// Writes one schema object; keys follow the OpenAPI order type, format, title,
// description, externalDocs, required, properties, items, enum, oneOf, discriminator
inline yyjson_mut_val* WriteSchema(const MetaSchema& schema, yyjson_mut_doc* doc) {
    using namespace schema_writer_detail;
    yyjson_mut_val* obj = yyjson_mut_obj(doc);
    if(!obj) return nullptr;

    if(!schema.type.empty() && !add_string(doc, obj, "type", schema.type)) return nullptr;
    if(schema.format && !add_string(doc, obj, "format", *schema.format)) return nullptr;
    if(schema.title && !add_string(doc, obj, "title", *schema.title)) return nullptr;
    if(schema.description && !add_string(doc, obj, "description", *schema.description)) return nullptr;
    if(schema.external_docs) {
        yyjson_mut_val* docs = yyjson_mut_obj(doc);
        if(!docs) return nullptr;
        if(!add_string(doc, docs, "url", schema.external_docs->url)) return nullptr;
        if(schema.external_docs->description
            && !add_string(doc, docs, "description", *schema.external_docs->description)) return nullptr;
        if(!add_value(doc, obj, "externalDocs", docs)) return nullptr;
    }
    if(!schema.required.empty()) {
        if(!add_value(doc, obj, "required", string_array(doc, schema.required))) return nullptr;
    }
    if(!schema.properties.empty()) {
        yyjson_mut_val* props = yyjson_mut_obj(doc);
        if(!props) return nullptr;
        for(const auto & [name, prop]: schema.properties) {
            if(!add_value(doc, props, name, WriteSchema(prop, doc))) return nullptr;
        }
        if(!add_value(doc, obj, "properties", props)) return nullptr;
    }
    if(schema.items) {
        if(!add_value(doc, obj, "items", WriteSchema(*schema.items, doc))) return nullptr;
    }
    if(!schema.enum_items.empty()) {
        if(!add_value(doc, obj, "enum", string_array(doc, schema.enum_items))) return nullptr;
    }
    if(!schema.one_of.empty()) {
        yyjson_mut_val* arr = yyjson_mut_arr(doc);
        if(!arr) return nullptr;
        for(const auto& alt: schema.one_of) {
            yyjson_mut_val* v = WriteSchema(alt, doc);
            if(!v || !yyjson_mut_arr_append(arr, v)) return nullptr;
        }
        if(!add_value(doc, obj, "oneOf", arr)) return nullptr;
    }
    if(schema.discriminator) {
        yyjson_mut_val* disc = yyjson_mut_obj(doc);
        if(!disc) return nullptr;
        if(!add_string(doc, disc, "propertyName", schema.discriminator->property_name)) return nullptr;
        if(!schema.discriminator->mapping.empty()) {
            yyjson_mut_val* map = yyjson_mut_obj(doc);
            if(!map) return nullptr;
            for(const auto & [tag, ref]: schema.discriminator->mapping) {
                if(!add_string(doc, map, tag, ref)) return nullptr;
            }
            if(!add_value(doc, disc, "mapping", map)) return nullptr;
        }
        if(!add_value(doc, obj, "discriminator", disc)) return nullptr;
    }
    return obj;
}

inline yyjson_mut_val* WriteSchema(const SchemaRef& ref, yyjson_mut_doc* doc) {
    if(auto name = ref.unwrap_reference()) {
        yyjson_mut_val* obj = yyjson_mut_obj(doc);
        if(!obj) return nullptr;
        if(!schema_writer_detail::add_string(doc, obj, "$ref", reference_string(*name))) return nullptr;
        return obj;
    }
    return WriteSchema(*ref.unwrap_inline(), doc);
}

} // namespace TaggedJson
