#pragma once
#include "fieldwise/Forward.hpp"
#include "fieldwise/bind/adapter/StrategyAdapter.hpp"
#include "fieldwise/concepts/LayoutConcepts.hpp"
#include "fieldwise/meta/FieldDefine.hpp"
#include "fieldwise/reflection/TypeId.hpp"

#include <boost/hana/accessors.hpp>
#include <boost/hana/first.hpp>
#include <boost/hana/for_each.hpp>
#include <boost/hana/second.hpp>
#include <boost/hana/string.hpp>

#include <cstddef>
#include <format>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace fieldwise::bind::adapter {


template <typename F>
meta::FieldDefine makeField(std::string name, FieldAccessor accessor) {
    using Traits = FieldTraits<F>;
    return meta::FieldDefine{
        std::move(name),
        reflection::getTypeId<typename Traits::Field>(),
        std::move(accessor),
        Traits::isValueType,
        Traits::hasNativeEqualityOperator,
        Traits::hasStronglyTypedEqualsMethod,
        Traits::strategy,
        bindFieldEquals<F>()
    };
}

// 无布局的类型自身 / A type without a layout, read as one field covering the whole instance
template <typename U>
meta::FieldDefine makeSelfField() {
    using Traits = FieldTraits<U>;
    return meta::FieldDefine{
        "self",
        reflection::getTypeId<U>(),
        [](void const* instance) -> void const* { return instance; },
        Traits::isValueType,
        Traits::hasNativeEqualityOperator,
        Traits::hasStronglyTypedEqualsMethod,
        Traits::strategy,
        bindSelfEquals<U>()
    };
}

// 成员变量 / Data member, Owner is C or one of its bases
template <typename C, typename Ty, typename Owner>
    requires std::is_base_of_v<Owner, C>
meta::FieldDefine bindField(std::string name, Ty Owner::* member) {
    return makeField<Ty>(std::move(name), [member](void const* instance) -> void const* {
        return std::addressof(static_cast<C const*>(instance)->*member);
    });
}

template <typename U>
    requires concepts::HanaStruct<U>
std::vector<meta::FieldDefine> bindHanaFields() {
    std::vector<meta::FieldDefine> fields;
    boost::hana::for_each(boost::hana::accessors<U>(), [&fields](auto pair) {
        auto getter = boost::hana::second(pair);
        using Ty    = std::remove_cvref_t<std::invoke_result_t<decltype(getter), U const&>>;
        fields.emplace_back(makeField<Ty>(
            boost::hana::to<char const*>(boost::hana::first(pair)),
            [getter](void const* instance) -> void const* {
                return std::addressof(getter(*static_cast<U const*>(instance)));
            }
        ));
    });
    return fields;
}

namespace internal {

template <typename U, std::size_t... I>
std::vector<meta::FieldDefine> bindTupleFieldsImpl(std::index_sequence<I...>) {
    std::vector<meta::FieldDefine> fields;
    fields.reserve(sizeof...(I));
    (fields.emplace_back(makeField<std::tuple_element_t<I, U>>(
         std::format("get<{}>", I),
         [](void const* instance) -> void const* {
             return std::addressof(std::get<I>(*static_cast<U const*>(instance)));
         }
     )),
     ...);
    return fields;
}

} // namespace internal

template <typename U>
    requires concepts::TupleLike<U>
std::vector<meta::FieldDefine> bindTupleFields() {
    return internal::bindTupleFieldsImpl<U>(std::make_index_sequence<std::tuple_size_v<U>>());
}


} // namespace fieldwise::bind::adapter
