#pragma once
#include "fieldwise/Forward.hpp"
#include "fieldwise/bind/adapter/FieldAdapter.hpp"
#include "fieldwise/meta/FieldDefine.hpp"
#include "fieldwise/meta/TypeDefine.hpp"
#include "fieldwise/reflection/TypeId.hpp"
#include "fieldwise/runtime/ComparatorCache.hpp"

#include <concepts>
#include <format>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>


namespace fieldwise::bind {


template <typename Class>
struct TypeDefineBuilder {
    static_assert(std::is_class_v<Class>, "TypeDefineBuilder only accept class type!");

private:
    std::string                    name_;
    std::vector<meta::FieldDefine> fields_;
    meta::TypeDefine const*        base_   = nullptr;
    UpcastCallback                 upcast_ = nullptr;
    reflection::TypeId             baseId_{""};

public:
    explicit TypeDefineBuilder(std::string name) : name_(std::move(name)) {}

    // 注册字段 / Register a data member, private ones included when built inside the class scope
    template <typename Member>
    auto& field(std::string name, Member member)
        requires std::is_member_object_pointer_v<Member>
    {
        fields_.emplace_back(adapter::bindField<Class>(std::move(name), member));
        return *this;
    }

    /**
     * 设置继承关系 / Set base class
     * @note 基类的字段会先于本类字段参与比较
     * @note Fields of the base chain are compared before this class's own fields
     */
    template <typename Base>
    auto& extends(meta::TypeDefine const& parent)
        requires(std::derived_from<Class, Base> && !std::same_as<Class, Base>)
    {
        base_   = &parent;
        baseId_ = reflection::getTypeId<Base>();
        upcast_ = [](void const* derived) -> void const* {
            return static_cast<Base const*>(static_cast<Class const*>(derived));
        };
        return *this;
    }

    [[nodiscard]] meta::TypeDefine build() {
        if (base_ != nullptr && !(base_->typeId_ == baseId_)) {
            throw std::logic_error(
                std::format("{} extends {}, but the given define describes {}", name_, baseId_.str(), base_->typeId_.str())
            );
        }
        std::unordered_set<std::string> names;
        for (auto const& f : fields_) {
            if (!names.insert(f.name_).second) {
                throw std::logic_error(std::format("Field {} of {} defined twice", f.name_, name_));
            }
        }

        constexpr auto typeId = reflection::getTypeId<Class>();

        return meta::TypeDefine{std::move(name_), std::move(fields_), base_, upcast_, typeId};
    }
};


template <typename C>
inline auto defineType(std::string name) {
    return TypeDefineBuilder<C>(std::move(name));
}


} // namespace fieldwise::bind
