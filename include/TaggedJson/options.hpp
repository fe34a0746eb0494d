#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <optional>
#include "annotated.hpp"
#include "const_string.hpp"

namespace TaggedJson {


namespace options {

namespace detail {

struct option_tag{};

struct name_tag : option_tag {};
struct key_tag : option_tag {};
struct title_tag : option_tag {};
struct description_tag : option_tag {};
struct external_docs_tag : option_tag {};
struct property_name_tag : option_tag {};
struct mapping_tag : option_tag {};
}

// Name of a payload type. Doubles as the implicit discriminator tag and as the
// key the type's schema is registered under.
template<ConstString Desc>
struct name {
    static_assert(Desc.check(), "[[[ TaggedJson ]]] type name contains control characters");
    static_assert(!Desc.empty(), "[[[ TaggedJson ]]] type name is empty");
    using tag = detail::name_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "name";
    }
};

template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ TaggedJson ]]] Json key contains control characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

template<ConstString Desc>
struct title {
    using tag = detail::title_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "title";
    }
};

template<ConstString Desc>
struct description {
    using tag = detail::description_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "description";
    }
};

template<ConstString Url, ConstString Desc = "">
struct external_docs {
    static_assert(!Url.empty(), "[[[ TaggedJson ]]] external_docs requires an url");
    using tag = detail::external_docs_tag;
    static constexpr auto url = Url;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "external_docs";
    }
};

// JSON property that carries the discriminator of a OneOf
template<ConstString Desc>
struct property_name {
    static_assert(Desc.check(), "[[[ TaggedJson ]]] discriminator property contains control characters");
    using tag = detail::property_name_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "property_name";
    }
};

// Explicit discriminator value of a OneOf case
template<ConstString Desc>
struct mapping {
    static_assert(Desc.check(), "[[[ TaggedJson ]]] mapping contains control characters");
    using tag = detail::mapping_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "mapping";
    }
};

namespace detail {

template<class Opt>
concept OptionLike = requires { typename Opt::tag; }
    && std::is_base_of_v<option_tag, typename Opt::tag>;

template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


// === find_option_by_tag ===

template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

struct no_options {
    template<class Tag>
    static constexpr bool has_option = false;

    template<class Tag>
    using get_option = void;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;

};

// Text of a string-valued option, or nullopt when the option is absent
template<class Opts, class Tag>
constexpr std::optional<std::string_view> option_text() {
    if constexpr (Opts::template has_option<Tag>) {
        return Opts::template get_option<Tag>::desc.toStringView();
    } else {
        return std::nullopt;
    }
}


template<class T>
struct is_options_pack : std::false_type {};

template<class... Opts>
struct is_options_pack<OptionsPack<Opts...>> : std::true_type {};

template<class T>
inline constexpr bool is_options_pack_v = is_options_pack<T>::value;


template<class T, class = void>
struct has_annotation_specialization_impl : std::false_type {};

template<class T>
struct has_annotation_specialization_impl<T,
                                          std::void_t<typename Annotated<T>::Options>
                                          > : std::bool_constant<
                                                                 is_options_pack_v<typename Annotated<T>::Options>
                                                                    && (Annotated<T>::Options::Count > 0)
                                                                 > {};

template<class T>
inline constexpr bool has_annotation_specialization =
    has_annotation_specialization_impl<T>::value;

template<class Field>
struct annotation_meta{};

// Base: non-annotated
template<class T>
    requires (!has_annotation_specialization<T>)
struct annotation_meta<T> {
    using options = no_options;
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ TaggedJson ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};


template <class P1, class P2> struct merge_options;
template <class ... Opts1, class ... Opts2> struct merge_options<OptionsPack<Opts1...>, OptionsPack<Opts2...>> {
    using type = OptionsPack<Opts1..., Opts2...>;
};


// Annotated<T, Opts...>; options of an external Annotated<T> specialization are appended
template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using external_opts =
        std::conditional_t<has_annotation_specialization<T>,
                           typename Annotated<T>::Options,
                           OptionsPack<>>;
    using options = field_options<typename merge_options<OptionsPack<Opts...>, external_opts>::type>;
};


// Externally Annotated<T>
template<class T> requires has_annotation_specialization<T>
struct annotation_meta<T> {
    using options = field_options<typename Annotated<T>::Options>;
};

// Entry point with decay
template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

template<class Field>
using annotation_options = typename annotation_meta_getter<Field>::options;


template<class T, std::size_t I, class = void>
struct has_field_annotation_specialization_impl : std::false_type {
    using Options = OptionsPack<>;
};

template<class T, std::size_t I>
struct has_field_annotation_specialization_impl<T, I,
                                          std::void_t<typename AnnotatedField<T, I>::Options>
                                          > : std::bool_constant<
                                                  is_options_pack_v<typename AnnotatedField<T, I>::Options>
                                                  && (AnnotatedField<T, I>::Options::Count > 0)
                                                  > {
    using Options = typename AnnotatedField<T, I>::Options;
};

} // namespace detail


} //namespace options


} // namespace TaggedJson
