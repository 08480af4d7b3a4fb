#pragma once
#include "fieldwise/Forward.hpp"
#include "fieldwise/reflection/TypeId.hpp"

#include <string>
#include <utility>


namespace fieldwise::meta {


/**
 * 一个字段的描述 / Describes one field of a type
 *
 * accessor_ 把宿主对象地址映射到字段地址, equals_ 比较两个字段地址上的值.
 * accessor_ maps the owner's address to the field's address, equals_ compares the values at two field addresses.
 */
struct FieldDefine {
    std::string const         name_;
    reflection::TypeId const  typeId_; // declared type
    FieldAccessor const       accessor_;
    bool const                isValueType_;
    bool const                hasNativeEqualityOperator_;
    bool const                hasStronglyTypedEqualsMethod_;
    EqualityStrategy const    strategy_;
    FieldEqualsCallback const equals_;

    explicit FieldDefine(
        std::string         name,
        reflection::TypeId  typeId,
        FieldAccessor       accessor,
        bool                isValueType,
        bool                hasNativeEqualityOperator,
        bool                hasStronglyTypedEqualsMethod,
        EqualityStrategy    strategy,
        FieldEqualsCallback equals
    )
    : name_(std::move(name)),
      typeId_(typeId),
      accessor_(std::move(accessor)),
      isValueType_(isValueType),
      hasNativeEqualityOperator_(hasNativeEqualityOperator),
      hasStronglyTypedEqualsMethod_(hasStronglyTypedEqualsMethod),
      strategy_(strategy),
      equals_(equals) {}

    /**
     * 同一字段, 但从派生类实例读取 / The same field, read off an instance of a derived type
     * @param upcast converts the derived instance address to the address of this field's owner
     */
    [[nodiscard]] FieldDefine rebase(UpcastCallback upcast) const {
        return FieldDefine{
            name_,
            typeId_,
            [inner = accessor_, upcast](void const* instance) -> void const* { return inner(upcast(instance)); },
            isValueType_,
            hasNativeEqualityOperator_,
            hasStronglyTypedEqualsMethod_,
            strategy_,
            equals_
        };
    }

    [[nodiscard]] bool equals(void const* lhsInstance, void const* rhsInstance) const {
        return equals_(accessor_(lhsInstance), accessor_(rhsInstance));
    }
};


} // namespace fieldwise::meta
