#pragma once
#include "fieldwise/Forward.hpp"
#include "fieldwise/concepts/BasicConcepts.hpp"
#include "fieldwise/concepts/LayoutConcepts.hpp"
#include "fieldwise/traits/TypeTraits.hpp"

#include <cstring>
#include <type_traits>

namespace fieldwise::bind::adapter {


namespace internal {

// 嵌套类型自己的比较器 / Compare through the nested type's own cached comparator (ComparatorCache.hpp)
template <typename T>
bool delegateEquals(void const* lhs, void const* rhs);

// 已注册布局优先, 否则逐字节 / Registered layout if there is one, bytes otherwise (ComparatorCache.hpp)
template <typename T>
bool registeredOrBytesEquals(void const* lhs, void const* rhs);

template <typename F, bool = concepts::ObjectHandle<F>>
struct ComparedType {
    using type = F;
};

template <typename F>
struct ComparedType<F, true> {
    using type = traits::Pointee_t<F>;
};

} // namespace internal


/**
 * 字段比较策略的选择 / Equality strategy selection for one field type
 *
 * 对象句柄 (P*, shared_ptr<P>, unique_ptr<P>) 的标志位描述的是 P.
 * For object handles (P*, shared_ptr<P>, unique_ptr<P>) the flags describe the referenced class P.
 */
template <typename F>
struct FieldTraits {
    using Field    = std::remove_cvref_t<F>;
    using Compared = typename internal::ComparedType<Field>::type;

    static constexpr bool isHandle    = concepts::ObjectHandle<Field>;
    static constexpr bool isValueType = !isHandle;

    static constexpr bool hasNativeEqualityOperator =
        isHandle ? concepts::HasEquality<Compared> : concepts::NativeEquality<Field>;
    static constexpr bool hasStronglyTypedEqualsMethod = concepts::HasSameTypeEquals<Compared>;

    static constexpr EqualityStrategy strategy = hasNativeEqualityOperator ? EqualityStrategy::NativeOperator
                                               : hasStronglyTypedEqualsMethod
                                                   ? EqualityStrategy::StronglyTypedEquals
                                                   : EqualityStrategy::GenericFallback;
};


template <typename H>
FieldEqualsCallback bindHandleEquals() {
    using Handle = traits::HandleTraits<H>;
    using P      = typename Handle::Pointee;

    if constexpr (concepts::HasEquality<P>) {
        return [](void const* lhs, void const* rhs) -> bool {
            auto a = static_cast<P const*>(Handle::get(*static_cast<H const*>(lhs)));
            auto b = static_cast<P const*>(Handle::get(*static_cast<H const*>(rhs)));
            if (a == nullptr || b == nullptr) {
                return a == b;
            }
            return static_cast<bool>(*a == *b);
        };
    } else if constexpr (concepts::HasSameTypeEquals<P>) {
        return [](void const* lhs, void const* rhs) -> bool {
            auto a = static_cast<P const*>(Handle::get(*static_cast<H const*>(lhs)));
            auto b = static_cast<P const*>(Handle::get(*static_cast<H const*>(rhs)));
            if (a == nullptr || b == nullptr) {
                return a == b;
            }
            return static_cast<bool>(a->equals(*b));
        };
    } else if constexpr (concepts::HasLooseEquals<P>) {
        // equals() with a mismatched parameter is not trusted with null, guard first
        return [](void const* lhs, void const* rhs) -> bool {
            auto a = static_cast<P const*>(Handle::get(*static_cast<H const*>(lhs)));
            auto b = static_cast<P const*>(Handle::get(*static_cast<H const*>(rhs)));
            if (a == nullptr || b == nullptr) {
                return a == b;
            }
            return a == b || static_cast<bool>(a->equals(*b));
        };
    } else {
        // reference equality
        return [](void const* lhs, void const* rhs) -> bool {
            return Handle::get(*static_cast<H const*>(lhs)) == Handle::get(*static_cast<H const*>(rhs));
        };
    }
}

template <typename F>
FieldEqualsCallback bindContentEquals() {
    if constexpr (concepts::CompileTimeLayout<F>) {
        return &internal::delegateEquals<F>;
    } else if constexpr (traits::IsOptional_v<F>) {
        // the payload of an empty optional is indeterminate, never compare its bytes
        return &internal::delegateEquals<F>;
    } else if constexpr (concepts::HasLooseEquals<F>) {
        return [](void const* lhs, void const* rhs) -> bool {
            return static_cast<bool>(static_cast<F const*>(lhs)->equals(*static_cast<F const*>(rhs)));
        };
    } else if constexpr (std::has_unique_object_representations_v<F>) {
        if constexpr (std::is_class_v<F>) {
            // a registered define may leave members out, looked up on each comparison
            return &internal::registeredOrBytesEquals<F>;
        } else {
            return [](void const* lhs, void const* rhs) -> bool { return std::memcmp(lhs, rhs, sizeof(F)) == 0; };
        }
    } else if constexpr (std::is_class_v<F>) {
        // registered layout
        return &internal::delegateEquals<F>;
    } else {
        static_assert(traits::AlwaysFalse_v<F>, "no equality available for this field type");
        return nullptr;
    }
}

template <typename F>
FieldEqualsCallback bindFieldEquals() {
    using Traits = FieldTraits<F>;
    using Field  = typename Traits::Field;

    if constexpr (Traits::isHandle) {
        return bindHandleEquals<Field>();
    } else if constexpr (Traits::strategy == EqualityStrategy::NativeOperator) {
        return [](void const* lhs, void const* rhs) -> bool {
            return static_cast<bool>(*static_cast<Field const*>(lhs) == *static_cast<Field const*>(rhs));
        };
    } else if constexpr (Traits::strategy == EqualityStrategy::StronglyTypedEquals) {
        return [](void const* lhs, void const* rhs) -> bool {
            return static_cast<bool>(static_cast<Field const*>(lhs)->equals(*static_cast<Field const*>(rhs)));
        };
    } else {
        return bindContentEquals<Field>();
    }
}

// U 整体作为唯一字段, 不会回到 U 自己的比较器 / U compared as a whole, never through U's own comparator
template <typename U>
FieldEqualsCallback bindSelfEquals() {
    using Traits = FieldTraits<U>;

    if constexpr (Traits::strategy != EqualityStrategy::GenericFallback || concepts::HasLooseEquals<U>) {
        return bindFieldEquals<U>();
    } else {
        static_assert(std::has_unique_object_representations_v<U>, "no equality available for this type");
        return [](void const* lhs, void const* rhs) -> bool { return std::memcmp(lhs, rhs, sizeof(U)) == 0; };
    }
}


} // namespace fieldwise::bind::adapter
