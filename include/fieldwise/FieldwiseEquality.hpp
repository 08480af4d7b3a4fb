#pragma once
#include "fieldwise/FieldwiseException.hpp"
#include "fieldwise/Forward.hpp"
#include "fieldwise/meta/TypeDefine.hpp"
#include "fieldwise/runtime/Comparator.hpp"
#include "fieldwise/runtime/ComparatorCache.hpp"

#include <memory>
#include <string>


namespace fieldwise {


/**
 * 类型化的比较器句柄 / Typed handle on the cached comparator of T
 * @note 可复制, 生命周期为整个进程 / Copyable, valid for the lifetime of the process
 */
template <typename T>
class TypedComparator {
public:
    explicit TypedComparator(Comparator const& erased) noexcept : erased_(&erased) {}

    [[nodiscard]] bool operator()(T const& lhs, T const& rhs) const {
        return (*erased_)(std::addressof(lhs), std::addressof(rhs));
    }

    [[nodiscard]] Comparator const& erased() const noexcept { return *erased_; }

private:
    Comparator const* erased_;
};


/**
 * 字段级相等 / Field-wise equality of two values of the static type T
 *
 * @note 只比较静态类型 T 可见的字段. 若运行期类型是 T 的子类, 子类新增的字段不会参与比较.
 * @note Only the fields of the static type T take part. Fields a runtime subtype adds are never inspected.
 * @note 无布局的类按自身的 operator== / equals / 字节比较 / A class without a layout is compared through its own
 *       operator==, equals() or bytes, as a field of that type would be
 * @note 先比较后注册的类型仍沿用已缓存的比较器 / Register a type before its first comparison, cached comparators are
 *       never rebuilt
 * @throws FieldwiseException (IntrospectionError) if T has no field layout and no equality of its own
 */
template <typename T>
[[nodiscard]] bool equal(T const& lhs, T const& rhs);

/**
 * 允许缺省值的版本 / Variant for values that may be absent
 * both absent -> true, one absent -> false, otherwise equal<T>(*lhs, *rhs)
 */
template <typename T>
[[nodiscard]] bool equalGeneric(T const* lhs, T const* rhs);

template <typename T>
[[nodiscard]] TypedComparator<T> comparatorFor();

// e.g. for diagnostics in failed test assertions
template <typename T>
[[nodiscard]] std::string describe();


/**
 * 注册一个类型布局 / Register a type layout built with bind::defineType
 * @return false if this define is already registered
 * @throws std::logic_error if a different define is already registered for the same type
 */
FIELDWISE_EXTERN bool registerType(meta::TypeDefine const& def);

template <typename T>
[[nodiscard]] bool isRegistered();


} // namespace fieldwise

#include "FieldwiseEquality.inl"
