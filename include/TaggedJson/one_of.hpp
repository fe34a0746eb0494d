#pragma once
#include <yyjson.h>

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "const_string.hpp"
#include "declaration.hpp"
#include "options.hpp"
#include "schema_builder.hpp"
#include "type_descriptor.hpp"
#include "yyjson.hpp"

namespace TaggedJson {

namespace one_of_detail {

// Payload slot of a malformed case; only reachable after a failed static_assert
struct invalid_payload {
    bool operator==(const invalid_payload&) const = default;
};

template<class... Ts>
struct type_list {
    static constexpr std::size_t size = sizeof...(Ts);
};

template<class L1, class L2> struct concat;
template<class... A, class... B> struct concat<type_list<A...>, type_list<B...>> {
    using type = type_list<A..., B...>;
};

template<template<class> class Pred, class... Ts>
struct filter {
    using type = type_list<>;
};

template<template<class> class Pred, class T, class... Ts>
struct filter<Pred, T, Ts...> {
    using type = typename concat<
        std::conditional_t<Pred<T>::value, type_list<T>, type_list<>>,
        typename filter<Pred, Ts...>::type
    >::type;
};

template<class T>
struct is_option : std::bool_constant<options::detail::OptionLike<T>> {};

template<class T>
struct is_not_option : std::bool_constant<!options::detail::OptionLike<T>> {};

template<class L> struct single_payload {
    using type = invalid_payload;
};
template<class T> struct single_payload<type_list<T>> {
    using type = T;
};

template<class L> struct as_options;
template<class... Ts> struct as_options<type_list<Ts...>> {
    using type = options::detail::field_options<OptionsPack<Ts...>>;
};

} // namespace one_of_detail


// One alternative of a OneOf: an identifier, exactly one payload type and
// optionally options::mapping<"tag">.
//
//   Case<"Circle", Circle>
//   Case<"Square", Square, options::mapping<"sq">>
template<ConstString Identifier, class... Elements>
struct Case {
    static constexpr auto identifier = Identifier;

    using payloads = typename one_of_detail::filter<one_of_detail::is_not_option, Elements...>::type;
    using Opts = typename one_of_detail::as_options<
        typename one_of_detail::filter<one_of_detail::is_option, Elements...>::type
    >::type;

    static constexpr std::size_t payload_count = payloads::size;
    using payload_type = typename one_of_detail::single_payload<payloads>::type;

    static constexpr bool has_mapping = Opts::template has_option<options::detail::mapping_tag>;
};


namespace one_of_detail {

template<class T>
struct is_case : std::false_type {};

template<ConstString Identifier, class... Elements>
struct is_case<Case<Identifier, Elements...>> : std::true_type {};

template<class T>
struct is_other : std::bool_constant<!is_case<T>::value && !options::detail::OptionLike<T>> {};

template<class L> struct variant_of;
template<class... Cs> struct variant_of<type_list<Cs...>> {
    using type = std::variant<typename Cs::payload_type...>;
};

template<class P>
constexpr PayloadInfo payload_info() {
    return PayloadInfo{
        TypeDescriptor<P>::name(),
        &TypeDescriptor<P>::schema_ref,
        &TypeDescriptor<P>::register_type
    };
}

template<class C>
consteval CaseDeclaration case_declaration() {
    CaseDeclaration d;
    d.identifier = C::identifier.toStringView();
    d.payloadCount = C::payload_count;
    if constexpr (C::payload_count == 1) {
        d.payload = payload_info<typename C::payload_type>();
    }
    d.explicitTag = options::detail::option_text<typename C::Opts, options::detail::mapping_tag>();
    return d;
}

template<class Opts>
consteval std::optional<ExternalDocsRef> docs_of() {
    if constexpr (Opts::template has_option<options::detail::external_docs_tag>) {
        using Docs = typename Opts::template get_option<options::detail::external_docs_tag>;
        ExternalDocsRef ref;
        ref.url = Docs::url.toStringView();
        if constexpr (!Docs::desc.empty()) {
            ref.description = Docs::desc.toStringView();
        }
        return ref;
    } else {
        return std::nullopt;
    }
}

template<class Opts, class... Cs>
consteval UnionDeclaration<sizeof...(Cs)> make_declaration(type_list<Cs...>) {
    using namespace options::detail;
    UnionDeclaration<sizeof...(Cs)> decl{};
    decl.name = option_text<Opts, name_tag>().value_or("object");
    decl.title = option_text<Opts, title_tag>();
    decl.description = option_text<Opts, description_tag>();
    decl.discriminatorProperty = option_text<Opts, property_name_tag>().value_or("");
    decl.externalDocs = docs_of<Opts>();
    decl.cases = {case_declaration<Cs>()...};
    return decl;
}

template<class C>
consteval bool payload_is_valid() {
    if constexpr (C::payload_count == 1) {
        return PayloadType<typename C::payload_type>;
    } else {
        return true;
    }
}

template<class C>
consteval bool mapping_has_reference() {
    if constexpr (C::has_mapping && C::payload_count == 1) {
        return TypeDescriptor<typename C::payload_type>::schema_is_reference;
    } else {
        return true;
    }
}

template<class... Cs>
consteval bool payloads_are_valid(type_list<Cs...>) {
    return (payload_is_valid<Cs>() && ...);
}

template<class... Cs>
consteval bool mappings_have_references(type_list<Cs...>) {
    return (mapping_has_reference<Cs>() && ...);
}

template<std::size_t N>
consteval bool identifiers_are_unique(const UnionDeclaration<N>& decl) {
    for(std::size_t i = 0; i < N; i ++) {
        for(std::size_t j = i + 1; j < N; j ++) {
            if(decl.cases[i].identifier == decl.cases[j].identifier) return false;
        }
    }
    return true;
}

template<std::size_t N>
consteval std::size_t case_index(const UnionDeclaration<N>& decl, std::string_view identifier) {
    for(std::size_t i = 0; i < N; i ++) {
        if(decl.cases[i].identifier == identifier) return i;
    }
    return N;
}

// Everything derived from the declaration, computed once at compile time
template<class... Elements>
struct OneOfTraits {
    using CaseList = typename filter<is_case, Elements...>::type;
    using Opts = typename as_options<typename filter<is_option, Elements...>::type>::type;

    static_assert(filter<is_other, Elements...>::type::size == 0,
        "[[[ TaggedJson ]]] OneOf accepts only options and Case<...> entries");
    static_assert(CaseList::size > 0, "[[[ TaggedJson ]]] OneOf needs at least one Case");
    static_assert(Opts::template has_option<options::detail::property_name_tag>,
        "[[[ TaggedJson ]]] OneOf requires options::property_name<...>");

    static_assert(payloads_are_valid(CaseList{}),
        "[[[ TaggedJson ]]] OneOf payload type has no TypeDescriptor");

    static constexpr std::size_t case_count = CaseList::size;
    using variant_type = typename variant_of<CaseList>::type;

    static constexpr UnionDeclaration<case_count> declaration = make_declaration<Opts>(CaseList{});
    static constexpr ResolveResult<case_count> resolution = resolve(declaration);

    static_assert(resolution.error() != DeclarationError::empty_property_name,
        "[[[ TaggedJson ]]] OneOf discriminator property name is empty");
    static_assert(resolution.error() != DeclarationError::invalid_case_shape,
        "[[[ TaggedJson ]]] every OneOf case must wrap exactly one payload type");
    static_assert(!resolution || check_unique_tags(resolution.cases()) == DeclarationError::none,
        "[[[ TaggedJson ]]] two OneOf cases resolve to the same discriminator tag");
    static_assert(identifiers_are_unique(declaration),
        "[[[ TaggedJson ]]] OneOf case identifiers must be unique");
    static_assert(mappings_have_references(CaseList{}),
        "[[[ TaggedJson ]]] a case with options::mapping needs a payload whose schema is a named reference");

    template<ConstString Identifier>
    static constexpr std::size_t index_of = case_index(declaration, Identifier.toStringView());
};

} // namespace one_of_detail


// Discriminated union value: holds the payload of exactly one case.
//
//   using Shape = OneOf<
//       options::property_name<"type">,
//       Case<"Circle", Circle>,
//       Case<"Square", Square, options::mapping<"sq">>
//   >;
//
// On the wire the payload's own object carries the discriminator property:
//   {"type":"sq","side":3}
template<class... Elements>
class OneOf {
public:
    using traits = one_of_detail::OneOfTraits<Elements...>;
    using variant_type = typename traits::variant_type;
    static constexpr std::size_t case_count = traits::case_count;

    template<ConstString Identifier>
    static constexpr std::size_t index_of = traits::template index_of<Identifier>;

    variant_type value;

    constexpr OneOf() = default;

    template<std::size_t I, class... Args>
    constexpr explicit OneOf(std::in_place_index_t<I> i, Args&&... args)
        : value(i, std::forward<Args>(args)...)
    {}

    template<ConstString Identifier, class... Args>
    static constexpr OneOf make(Args&&... args) {
        static_assert(index_of<Identifier> < case_count, "[[[ TaggedJson ]]] no case with this identifier");
        return OneOf(std::in_place_index<index_of<Identifier>>, std::forward<Args>(args)...);
    }

    template<ConstString Identifier, class... Args>
    constexpr auto& emplace(Args&&... args) {
        static_assert(index_of<Identifier> < case_count, "[[[ TaggedJson ]]] no case with this identifier");
        return value.template emplace<index_of<Identifier>>(std::forward<Args>(args)...);
    }

    template<ConstString Identifier>
    constexpr bool is() const {
        static_assert(index_of<Identifier> < case_count, "[[[ TaggedJson ]]] no case with this identifier");
        return value.index() == index_of<Identifier>;
    }

    template<ConstString Identifier>
    constexpr auto& get() {
        static_assert(index_of<Identifier> < case_count, "[[[ TaggedJson ]]] no case with this identifier");
        return std::get<index_of<Identifier>>(value);
    }
    template<ConstString Identifier>
    constexpr const auto& get() const {
        static_assert(index_of<Identifier> < case_count, "[[[ TaggedJson ]]] no case with this identifier");
        return std::get<index_of<Identifier>>(value);
    }

    constexpr std::size_t index() const {
        return value.index();
    }

    // Discriminator value of the active case; empty while valueless_by_exception()
    constexpr std::string_view tag() const {
        if(value.valueless_by_exception()) return {};
        return traits::resolution.cases()[value.index()].tag;
    }
    constexpr std::string_view case_identifier() const {
        if(value.valueless_by_exception()) return {};
        return traits::declaration.cases[value.index()].identifier;
    }

    template<class Visitor>
    decltype(auto) visit(Visitor&& vis) {
        return std::visit(std::forward<Visitor>(vis), value);
    }
    template<class Visitor>
    decltype(auto) visit(Visitor&& vis) const {
        return std::visit(std::forward<Visitor>(vis), value);
    }

    friend bool operator==(const OneOf&, const OneOf&) = default;
};


template<class... Elements>
struct TypeDescriptor<OneOf<Elements...>> {
    using U = OneOf<Elements...>;
    using traits = typename U::traits;
    using variant_type = typename U::variant_type;

    static constexpr bool is_required = true;
    static constexpr bool schema_is_reference = false;

    static constexpr std::string_view name() {
        return traits::declaration.name;
    }

    static constexpr std::string_view property_name() {
        return traits::declaration.discriminatorProperty;
    }

    // Built on first use, then shared for the life of the process
    static SchemaRef schema_ref() {
        static const SchemaRef schema = build_schema();
        return schema;
    }

    static void register_type(Registry& registry) {
        for(const CaseDeclaration& c: traits::declaration.cases) {
            c.payload.register_type(registry);
        }
    }

    static ParseResult parse_from_json(U& out, yyjson_val* v) {
        if(!yyjson_is_obj(v)) {
            return ParseResult(ParseError::EXPECTED_TYPE, name(),
                std::format("expected a JSON object, got {}", yyjson_get_type_desc(v)));
        }
        constexpr std::string_view prop = property_name();
        yyjson_val* d = yyjson_obj_getn(v, prop.data(), prop.size());
        if(!d) {
            return ParseResult(ParseError::EXPECTED_TYPE, name(),
                std::format("missing discriminator property '{}'", prop));
        }
        if(yyjson_is_str(d)) {
            std::string_view tag = string_of(d);
            for(const ResolvedCase& c: traits::resolution.cases()) {
                if(c.tag == tag) {
                    return parse_case(c.caseIndex, out, v, std::make_index_sequence<traits::case_count>{});
                }
            }
            return ParseResult(ParseError::EXPECTED_TYPE, name(),
                std::format("unrecognized discriminator value \"{}\" in property '{}'", tag, prop));
        }
        return ParseResult(ParseError::EXPECTED_TYPE, name(),
            std::format("discriminator property '{}' holds {}, not a string", prop, yyjson_get_type_desc(d)));
    }

    static SerializeResult to_json(const U& u, yyjson_mut_doc* doc, yyjson_mut_val*& out) {
        if(u.value.valueless_by_exception()) {
            return SerializeResult(SerializeError::WRITER_ERROR, name());
        }
        yyjson_mut_val* node = nullptr;
        SerializeResult r = write_case(u, doc, node, std::make_index_sequence<traits::case_count>{});
        if(!r) return r;
        if(!yyjson_mut_is_obj(node)) {
            return SerializeResult(SerializeError::NON_OBJECT_PAYLOAD, name());
        }

        constexpr std::string_view prop = property_name();
        const std::string_view tag = u.tag();
        yyjson_mut_obj_remove_keyn(node, prop.data(), prop.size());
        yyjson_mut_val* k = yyjson_mut_strncpy(doc, prop.data(), prop.size());
        yyjson_mut_val* t = yyjson_mut_strncpy(doc, tag.data(), tag.size());
        if(!k || !t || !yyjson_mut_obj_insert(node, k, t, 0)) {
            return SerializeResult(SerializeError::WRITER_ERROR, name());
        }
        out = node;
        return {};
    }

private:
    static SchemaRef build_schema() {
        SchemaBuildResult r = BuildSchema(traits::declaration, traits::resolution.cases());
        if(!r) {
            // Only reachable through a TypeDescriptor whose schema_is_reference lies
            throw std::logic_error(std::format("TaggedJson: case '{}' of '{}': {}",
                traits::declaration.cases[r.errorCase()].identifier, name(),
                schema_build_error_to_string(r.error())));
        }
        return SchemaRef::Inline(std::move(r).schema());
    }

    template<std::size_t I>
    static ParseResult parse_alternative(U& out, yyjson_val* v) {
        using P = std::variant_alternative_t<I, variant_type>;
        P payload{};
        ParseResult r = TypeDescriptor<P>::parse_from_json(payload, v);
        if(r) {
            out.value.template emplace<I>(std::move(payload));
        }
        return r;
    }

    template<std::size_t... I>
    static ParseResult parse_case(std::size_t index, U& out, yyjson_val* v, std::index_sequence<I...>) {
        ParseResult result;
        ((index == I ? (result = parse_alternative<I>(out, v), true) : false) || ...);
        return result;
    }

    template<std::size_t... I>
    static SerializeResult write_case(const U& u, yyjson_mut_doc* doc, yyjson_mut_val*& node, std::index_sequence<I...>) {
        SerializeResult result;
        ((u.value.index() == I
            ? (result = TypeDescriptor<std::variant_alternative_t<I, variant_type>>::to_json(std::get<I>(u.value), doc, node), true)
            : false) || ...);
        return result;
    }
};

} // namespace TaggedJson
