#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "const_string.hpp"
#include "annotated.hpp"

namespace TaggedJson {

// Explicit field list for types PFR cannot reflect (or to rename/annotate fields):
//
//   template<> struct TaggedJson::StructMeta<Motor> {
//       using Fields = StructFields<
//           Field<&Motor::speed, "speed", description<"rpm">>
//       >;
//   };
template <class T>
struct StructMeta {

};
template <auto MPtr, ConstString key, class ... Opts>
struct Field;

template <typename C, typename T, T C::*MPtr, ConstString key, class ... Opts>
struct Field<MPtr, key, Opts...>{
    using ClassT = C;
    using ValueT = T;
    using OptionsP = OptionsPack<Opts...>;
    static constexpr ConstString Name  = key;
    static constexpr  T C::* MemberP = MPtr;

};

template <class ... F>
struct StructFields{
    using FieldsTuple = std::tuple<F...>;
};


namespace introspection {

namespace detail {


template<class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(StructT & s) {
        return (pfr::get<Index>(s));
    }

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
        return (pfr::get<Index>(s));
    }

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template<std::size_t Index>
    using structureElementTypeByIndex = pfr::tuple_element_t<Index, StructT>;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, StructT>();
};

template<class T>
struct is_fields_pack : std::false_type {};

template<class... F>
struct is_fields_pack<StructFields<F...>> : std::true_type {};

template<class T>
inline constexpr bool is_fields_pack_v = is_fields_pack<T>::value;


template<class T, class = void>
struct has_struct_meta_specialization_impl : std::false_type {};

template<class T>
struct has_struct_meta_specialization_impl<T,
                                          std::void_t<typename StructMeta<T>::Fields>
                                          > : std::bool_constant<
                                                  is_fields_pack_v<typename StructMeta<T>::Fields>
                                                  > {};

template<class T>
inline constexpr bool has_struct_meta_specialization =
    has_struct_meta_specialization_impl<T>::value;

// Explicitly listed fields
template <class T>
requires (has_struct_meta_specialization<T>)
struct IntrospectionImpl<T> {
    using Fields = typename StructMeta<T>::Fields::FieldsTuple;
    static constexpr std::size_t structureElementsCount = std::tuple_size_v<Fields>;

    template<std::size_t Index>
    using FieldAt = std::tuple_element_t<Index, Fields>;

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(T & s) {
        return (s.*(FieldAt<Index>::MemberP));
    }

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(const T & s) {
        return (s.*(FieldAt<Index>::MemberP));
    }

    template<std::size_t Index>
    using structureElementTypeByIndex = typename FieldAt<Index>::ValueT;

    template<std::size_t Index>
    using structureElementOptions = typename FieldAt<Index>::OptionsP;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex =
        FieldAt<Index>::Name.toStringView();
};


template<class T, std::size_t Index, class = void>
struct meta_field_options {
    using type = OptionsPack<>;
};

template<class T, std::size_t Index>
struct meta_field_options<T, Index, std::void_t<typename IntrospectionImpl<T>::template structureElementOptions<Index>>> {
    using type = typename IntrospectionImpl<T>::template structureElementOptions<Index>;
};

}
template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return (Impl::template getStructElementByIndex<Index>(s));
}

template<class StructT>
static constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementTypeByIndex<Index>;

template<std::size_t Index, class StructT>
static constexpr std::string_view structureElementNameByIndex = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementNameByIndex<Index>;

// Options listed in a StructMeta Field<...> entry (empty for PFR-reflected fields)
template<std::size_t Index, class StructT>
using structureElementOptions = typename detail::meta_field_options<std::remove_cv_t<StructT>, Index>::type;

}
}
