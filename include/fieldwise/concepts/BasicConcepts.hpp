#pragma once
#include <concepts>
#include <optional>
#include <type_traits>

#include "fieldwise/traits/TypeTraits.hpp"


namespace fieldwise::concepts {


template <typename T>
concept HasEquality = requires(T const& lhs, T const& rhs) {
    { lhs == rhs } -> std::convertible_to<bool>;
};

// bool T::equals(T const&) const, parameter exactly T
template <typename T>
concept HasSameTypeEquals = std::is_class_v<T> && requires { static_cast<bool (T::*)(T const&) const>(&T::equals); };

// an equals() accepting T, but not declared for T itself (base parameter, by value, template, ...)
template <typename T>
concept HasLooseEquals = std::is_class_v<T> && !HasSameTypeEquals<T> && requires(T const& lhs, T const& rhs) {
    { lhs.equals(rhs) } -> std::convertible_to<bool>;
};

template <typename T>
concept ObjectHandle =
    traits::HandleTraits<std::remove_cv_t<T>>::isHandle && std::is_class_v<traits::Pointee_t<T>>;


namespace internal {

template <typename T>
struct NativeEquality
: std::bool_constant<
      std::is_arithmetic_v<T> || std::is_enum_v<T> || std::is_null_pointer_v<T>
      || (std::is_pointer_v<T> && !std::is_class_v<std::remove_pointer_t<T>>)
      || (std::is_class_v<T> && !ObjectHandle<T> && HasEquality<T>)> {};

// std::optional<X>::operator== is unconstrained, decide on X
template <typename T>
struct NativeEquality<std::optional<T>> : NativeEquality<std::remove_cv_t<T>> {};

} // namespace internal

// primitive, enum, user operator== or optional of those
template <typename T>
concept NativeEquality = internal::NativeEquality<std::remove_cv_t<T>>::value;


} // namespace fieldwise::concepts
