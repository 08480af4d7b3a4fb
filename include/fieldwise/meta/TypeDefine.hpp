#pragma once
#include "fieldwise/Forward.hpp"
#include "fieldwise/Global.hpp"
#include "fieldwise/meta/FieldDefine.hpp"
#include "fieldwise/reflection/TypeId.hpp"

#include <string>
#include <utility>
#include <vector>


namespace fieldwise::meta {


/**
 * 用户注册的类型布局 / A field layout registered by the user, built by TypeDefineBuilder
 *
 * @lifetime: Static or longer than every comparator built from it
 */
class FIELDWISE_EXTERN TypeDefine {
public:
    std::string const              name_;
    std::vector<FieldDefine> const fields_;
    TypeDefine const*              base_{nullptr};
    UpcastCallback const           upcast_{nullptr}; // this type -> base_ type
    reflection::TypeId const       typeId_;

    explicit TypeDefine(
        std::string              name,
        std::vector<FieldDefine> fields,
        TypeDefine const*        base,
        UpcastCallback           upcast,
        reflection::TypeId       typeId
    )
    : name_(std::move(name)),
      fields_(std::move(fields)),
      base_(base),
      upcast_(upcast),
      typeId_(typeId) {}

    /**
     * 展开继承链上的全部字段 / Every field along the base chain, readable off an instance of this type
     * @note 根基类字段在前, 然后按注册顺序 / Root base fields first, then registration order
     */
    [[nodiscard]] std::vector<FieldDefine> flattenFields() const;
};


} // namespace fieldwise::meta
