#pragma once
#include "fieldwise/Forward.hpp"
#include "fieldwise/Global.hpp"
#include "fieldwise/meta/FieldDefine.hpp"
#include "fieldwise/reflection/TypeId.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>


namespace fieldwise::meta {


/**
 * 为一个静态类型 T 构建的描述 / Descriptor built once for one static type T
 *
 * fields_ 是 T (或其句柄/optional 所指类型) 的全部字段, 可直接从 unwrap_ 的结果上读取.
 * fields_ are readable off the value reached through unwrap_ (or off T itself for ValueType).
 */
class FIELDWISE_EXTERN TypeDescriptor {
public:
    reflection::TypeId const                typeId_;
    ShapeCategory const                     shape_;
    std::vector<FieldDefine> const          fields_;
    std::optional<reflection::TypeId> const underlying_; // NullableValueType only
    reflection::TypeId const                fieldOwner_; // type the fields are read from
    UnwrapCallback const                    unwrap_{nullptr};

    explicit TypeDescriptor(
        reflection::TypeId                typeId,
        ShapeCategory                     shape,
        std::vector<FieldDefine>          fields,
        std::optional<reflection::TypeId> underlying,
        reflection::TypeId                fieldOwner,
        UnwrapCallback                    unwrap
    )
    : typeId_(typeId),
      shape_(shape),
      fields_(std::move(fields)),
      underlying_(underlying),
      fieldOwner_(fieldOwner),
      unwrap_(unwrap) {}

    [[nodiscard]] FieldDefine const* findField(std::string const& name) const;

    /**
     * e.g.
     * SampleStruct : ValueType {
     *     a : int [NativeOperator]
     * }
     */
    [[nodiscard]] std::string toString() const;
};


} // namespace fieldwise::meta
