#pragma once
#include <cstddef>
#include <tuple>
#include <type_traits>

#include <boost/hana/concept/struct.hpp>


namespace fieldwise::concepts {


// BOOST_HANA_DEFINE_STRUCT / BOOST_HANA_ADAPT_STRUCT
template <typename T>
concept HanaStruct = std::is_class_v<T> && boost::hana::Struct<T>::value;

// std::tuple, std::pair, std::array
template <typename T>
concept TupleLike = std::is_class_v<T> && !HanaStruct<T> && requires {
    { std::tuple_size<T>::value } -> std::convertible_to<std::size_t>;
};

// layout known at compile time, no registration needed
template <typename T>
concept CompileTimeLayout = HanaStruct<T> || TupleLike<T>;


} // namespace fieldwise::concepts
