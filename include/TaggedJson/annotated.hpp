#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <utility>

namespace TaggedJson {

template <class... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);
};

template <class T, typename... Options>
struct Annotated {
    T value{};
    using value_type = T;
    // Conversions/forwarding so descriptors can treat Annotated<T> like T

    constexpr Annotated() = default;
    constexpr Annotated(const Annotated&) = default;
    constexpr Annotated(Annotated&&) = default;
    constexpr Annotated& operator=(const Annotated&) = default;
    constexpr Annotated& operator=(Annotated&&) = default;

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator T&()             { return value; }
    constexpr operator const T&() const { return value; }

    constexpr T*       operator->()       { return std::addressof(value); }
    constexpr const T* operator->() const { return std::addressof(value); }

    constexpr T&       get()       { return value; }
    constexpr const T& get() const { return value; }
};

template <class T, class... O>
using A = Annotated<T, O...>;

// Options attached to the I-th field of aggregate T from outside the type:
//   template<> struct TaggedJson::AnnotatedField<Circle, 0> { using Options = OptionsPack<description<"...">>; };
template <class T, std::size_t I>
struct AnnotatedField {};

template<class T, class... OptsL, class... OptsR>
constexpr bool operator==(const Annotated<T, OptsL...>& lhs,
                const Annotated<T, OptsR...>& rhs)
    noexcept(noexcept(lhs.value == rhs.value))
{
    return lhs.value == rhs.value;
}

template<class T, class... Opts, class U>
    requires requires (const T& t, const U& u) { t == u; }
constexpr bool operator==(const Annotated<T, Opts...>& lhs,
                const U& rhs)
    noexcept(noexcept(std::declval<const T&>() == std::declval<const U&>()))
{
    return lhs.value == rhs;
}

} // namespace TaggedJson
