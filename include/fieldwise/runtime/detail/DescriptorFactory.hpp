#pragma once
#include "fieldwise/FieldwiseException.hpp"
#include "fieldwise/Forward.hpp"
#include "fieldwise/bind/adapter/FieldAdapter.hpp"
#include "fieldwise/concepts/BasicConcepts.hpp"
#include "fieldwise/concepts/LayoutConcepts.hpp"
#include "fieldwise/meta/FieldDefine.hpp"
#include "fieldwise/meta/TypeDescriptor.hpp"
#include "fieldwise/reflection/TypeId.hpp"
#include "fieldwise/runtime/detail/DescriptorRegistry.hpp"
#include "fieldwise/traits/TypeTraits.hpp"

#include <format>
#include <memory>
#include <optional>
#include <type_traits>
#include <vector>


namespace fieldwise::detail {


// U 自身的相等性可用 (不再经由注册表) / U compares itself without going back to the registry
template <typename U>
concept SelfComparable = concepts::NativeEquality<U> || concepts::HasSameTypeEquals<U> || concepts::HasLooseEquals<U>
                      || std::has_unique_object_representations_v<U>;

/**
 * 类型 U 的全部字段 / Every field of class U
 * Hana struct > tuple-like > registered TypeDefine > U itself as the single field "self"
 * @throws FieldwiseException (IntrospectionError) if U has no known layout and no equality of its own
 */
template <typename U>
std::vector<meta::FieldDefine> collectFields() {
    static_assert(std::is_class_v<U>, "fieldwise compares class types only");

    if constexpr (concepts::HanaStruct<U>) {
        return bind::adapter::bindHanaFields<U>();
    } else if constexpr (concepts::TupleLike<U>) {
        return bind::adapter::bindTupleFields<U>();
    } else {
        constexpr auto id  = reflection::getTypeId<U>();
        auto const*    def = DescriptorRegistry::instance().find(id);
        if (def != nullptr) {
            return def->flattenFields();
        }
        if constexpr (SelfComparable<U>) {
            std::vector<meta::FieldDefine> fields;
            fields.emplace_back(bind::adapter::makeSelfField<U>());
            return fields;
        } else {
            throw FieldwiseException(
                FieldwiseException::Type::IntrospectionError,
                std::format("Type {} has no field layout, register a TypeDefine for it", id.str())
            );
        }
    }
}

template <typename T>
meta::TypeDescriptor buildDescriptor() {
    using Type = std::remove_cv_t<T>;

    if constexpr (traits::IsOptional_v<Type>) {
        using U = std::remove_cv_t<typename Type::value_type>;
        static_assert(!concepts::ObjectHandle<U>, "std::optional of an object handle is not supported");

        return meta::TypeDescriptor{
            reflection::getTypeId<Type>(),
            ShapeCategory::NullableValueType,
            collectFields<U>(),
            reflection::getTypeId<U>(),
            reflection::getTypeId<U>(),
            [](void const* handle) -> void const* {
                auto const& opt = *static_cast<Type const*>(handle);
                return opt.has_value() ? static_cast<void const*>(std::addressof(*opt)) : nullptr;
            }
        };
    } else if constexpr (concepts::ObjectHandle<Type>) {
        using P = traits::Pointee_t<Type>;

        return meta::TypeDescriptor{
            reflection::getTypeId<Type>(),
            ShapeCategory::Reference,
            collectFields<P>(),
            std::nullopt,
            reflection::getTypeId<P>(),
            [](void const* handle) -> void const* {
                return traits::HandleTraits<Type>::get(*static_cast<Type const*>(handle));
            }
        };
    } else {
        return meta::TypeDescriptor{
            reflection::getTypeId<Type>(),
            ShapeCategory::ValueType,
            collectFields<Type>(),
            std::nullopt,
            reflection::getTypeId<Type>(),
            nullptr
        };
    }
}


} // namespace fieldwise::detail
