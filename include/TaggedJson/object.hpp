#pragma once

#include <yyjson.h>

#include <cstddef>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "options.hpp"
#include "struct_introspection.hpp"
#include "type_descriptor.hpp"

namespace TaggedJson {

namespace object_detail {

template<class Field>
struct wrapper_options {
    using type = OptionsPack<>;
};

template<class T, class... Opts>
struct wrapper_options<Annotated<T, Opts...>> {
    using type = OptionsPack<Opts...>;
};

template<class T, std::size_t I>
struct ObjectField {
    using type = std::remove_cvref_t<introspection::structureElementTypeByIndex<I, T>>;
    using descriptor = TypeDescriptor<type>;

    using Opts = options::detail::field_options<
        typename options::detail::merge_options<
            typename options::detail::merge_options<
                typename options::detail::has_field_annotation_specialization_impl<T, I>::Options,
                introspection::structureElementOptions<I, T>
            >::type,
            typename wrapper_options<type>::type
        >::type
    >;

    static constexpr std::string_view key() {
        if constexpr (Opts::template has_option<options::detail::key_tag>) {
            return Opts::template get_option<options::detail::key_tag>::desc.toStringView();
        } else {
            return introspection::structureElementNameByIndex<I, T>;
        }
    }
};

} // namespace object_detail


template<class T>
concept ObjectLike = std::is_class_v<T>
    && !std::ranges::range<T>
    && !descriptor_detail::is_specialization_of_v<T, Annotated>
    && (std::is_aggregate_v<T> || introspection::detail::has_struct_meta_specialization<T>);


// Plain structs: a named schema registered once, referenced from everywhere else.
// Properties not declared by the struct are ignored on input, which is what lets a
// struct sit inside a OneOf next to the discriminator property.
template<class T>
    requires ObjectLike<T>
struct TypeDescriptor<T> {
    using Opts = options::detail::annotation_options<T>;
    static_assert(Opts::template has_option<options::detail::name_tag>,
        "[[[ TaggedJson ]]] object types need a name: specialize Annotated<T> with OptionsPack<options::name<...>>");

    static constexpr std::size_t fieldsCount = introspection::structureElementsCount<T>;

    static constexpr bool is_required = true;
    static constexpr bool schema_is_reference = true;

    static constexpr std::string_view name() {
        return Opts::template get_option<options::detail::name_tag>::desc.toStringView();
    }

    static SchemaRef schema_ref() {
        return SchemaRef::Reference(name());
    }

    static void register_type(Registry& registry) {
        registry.create_schema(name(), [&registry] {
            MetaSchema schema("object");
            if(auto t = options::detail::option_text<Opts, options::detail::title_tag>()) {
                schema.title = std::string(*t);
            }
            if(auto d = options::detail::option_text<Opts, options::detail::description_tag>()) {
                schema.description = std::string(*d);
            }
            [&]<std::size_t... I>(std::index_sequence<I...>) {
                (add_property<I>(schema, registry), ...);
            }(std::make_index_sequence<fieldsCount>{});
            return schema;
        });
    }

    static ParseResult parse_from_json(T& out, yyjson_val* v) {
        if(!yyjson_is_obj(v)) {
            return ParseResult(ParseError::NON_OBJECT_IN_OBJECT_VALUE, name());
        }
        ParseResult result;
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            ((result = parse_field<I>(out, v)) && ...);
        }(std::make_index_sequence<fieldsCount>{});
        return result;
    }

    static SerializeResult to_json(const T& value, yyjson_mut_doc* doc, yyjson_mut_val*& out) {
        yyjson_mut_val* obj = yyjson_mut_obj(doc);
        if(!obj) return SerializeResult(SerializeError::WRITER_ERROR, name());
        SerializeResult result;
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            ((result = write_field<I>(value, doc, obj)) && ...);
        }(std::make_index_sequence<fieldsCount>{});
        if(result) out = obj;
        return result;
    }

private:
    template<std::size_t I>
    static void add_property(MetaSchema& schema, Registry& registry) {
        using F = object_detail::ObjectField<T, I>;
        F::descriptor::register_type(registry);

        SchemaRef prop = F::descriptor::schema_ref();
        if(auto d = options::detail::option_text<typename F::Opts, options::detail::description_tag>()) {
            if(const MetaSchema* inl = prop.unwrap_inline()) {
                MetaSchema copy = *inl;
                copy.description = std::string(*d);
                prop = SchemaRef::Inline(std::move(copy));
            }
        }
        schema.properties.emplace_back(std::string(F::key()), std::move(prop));
        if constexpr (F::descriptor::is_required) {
            schema.required.emplace_back(F::key());
        }
    }

    template<std::size_t I>
    static ParseResult parse_field(T& out, yyjson_val* obj) {
        using F = object_detail::ObjectField<T, I>;
        constexpr std::string_view key = F::key();
        auto & field = introspection::getStructElementByIndex<I>(out);

        yyjson_val* fv = yyjson_obj_getn(obj, key.data(), key.size());
        if(!fv || yyjson_is_null(fv)) {
            if constexpr (F::descriptor::is_required) {
                if(!fv) {
                    return ParseResult(ParseError::MISSING_FIELD, name(), std::string(key));
                }
                return ParseResult(ParseError::NULL_IN_NON_OPTIONAL, name()).prepend_field(key);
            } else {
                field = typename F::type{};
                return {};
            }
        }
        ParseResult r = F::descriptor::parse_from_json(field, fv);
        if(!r) r.prepend_field(key);
        return r;
    }

    template<std::size_t I>
    static SerializeResult write_field(const T& value, yyjson_mut_doc* doc, yyjson_mut_val* obj) {
        using F = object_detail::ObjectField<T, I>;
        constexpr std::string_view key = F::key();
        const auto & field = introspection::getStructElementByIndex<I>(value);

        yyjson_mut_val* node = nullptr;
        SerializeResult r = F::descriptor::to_json(field, doc, node);
        if(!r) return r;
        if constexpr (!F::descriptor::is_required) {
            if(yyjson_mut_is_null(node)) return {};
        }
        yyjson_mut_val* k = yyjson_mut_strncpy(doc, key.data(), key.size());
        if(!k || !yyjson_mut_obj_add(obj, k, node)) {
            return SerializeResult(SerializeError::WRITER_ERROR, name());
        }
        return {};
    }
};

} // namespace TaggedJson
