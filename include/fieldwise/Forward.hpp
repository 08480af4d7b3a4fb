#pragma once
#include <cstdint>
#include <functional>
#include <string_view>


namespace fieldwise {

class FieldwiseException;
class Comparator;
class ComparatorCache;

template <typename T>
class TypedComparator;

namespace meta {
struct FieldDefine;
class TypeDefine;
class TypeDescriptor;
} // namespace meta


// 读取字段地址 / Reads the address of a field off an instance of its owner
using FieldAccessor = std::function<void const*(void const* instance)>;

// 比较两个字段值 (字段地址) / Compares two field values, given their addresses
using FieldEqualsCallback = bool (*)(void const* lhs, void const* rhs);

// handle / optional -> referenced value, nullptr when absent
using UnwrapCallback = void const* (*)(void const* handle);

// Derived* -> Base*
using UpcastCallback = void const* (*)(void const* derived);


enum class ShapeCategory : uint8_t {
    Reference,        // U*, std::shared_ptr<U>, std::unique_ptr<U>
    ValueType,        // plain class type
    NullableValueType // std::optional<U>
};

enum class EqualityStrategy : uint8_t {
    NativeOperator,      // operator==
    StronglyTypedEquals, // bool equals(F const&) const
    GenericFallback      // content / identity comparison
};

[[nodiscard]] constexpr std::string_view toString(ShapeCategory shape) noexcept {
    switch (shape) {
    case ShapeCategory::Reference:
        return "Reference";
    case ShapeCategory::ValueType:
        return "ValueType";
    case ShapeCategory::NullableValueType:
        return "NullableValueType";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view toString(EqualityStrategy strategy) noexcept {
    switch (strategy) {
    case EqualityStrategy::NativeOperator:
        return "NativeOperator";
    case EqualityStrategy::StronglyTypedEquals:
        return "StronglyTypedEquals";
    case EqualityStrategy::GenericFallback:
        return "GenericFallback";
    }
    return "Unknown";
}

} // namespace fieldwise
