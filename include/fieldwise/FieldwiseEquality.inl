#pragma once
#include "FieldwiseEquality.hpp"
#include "fieldwise/runtime/ComparatorCache.hpp"
#include "fieldwise/runtime/detail/DescriptorRegistry.hpp"


namespace fieldwise {

template <typename T>
bool equal(T const& lhs, T const& rhs) {
    return ComparatorCache::get<T>()(std::addressof(lhs), std::addressof(rhs));
}

template <typename T>
bool equalGeneric(T const* lhs, T const* rhs) {
    if (lhs == nullptr || rhs == nullptr) {
        return lhs == rhs;
    }
    return equal<T>(*lhs, *rhs);
}

template <typename T>
TypedComparator<T> comparatorFor() {
    return TypedComparator<T>{ComparatorCache::get<T>()};
}

template <typename T>
std::string describe() {
    return ComparatorCache::descriptor<T>().toString();
}

template <typename T>
bool isRegistered() {
    return detail::DescriptorRegistry::instance().contains(reflection::getTypeId<T>());
}


} // namespace fieldwise
