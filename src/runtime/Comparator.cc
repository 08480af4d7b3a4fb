#include "fieldwise/runtime/Comparator.hpp"
#include "fieldwise/meta/FieldDefine.hpp"
#include "fieldwise/meta/TypeDescriptor.hpp"

#include <stdexcept>
#include <utility>


namespace fieldwise {


Comparator::Comparator(ShapeCategory shape, std::vector<FieldCheck> checks, UnwrapCallback unwrap)
: shape_(shape),
  checks_(std::move(checks)),
  unwrap_(unwrap) {
    if (shape_ != ShapeCategory::ValueType && unwrap_ == nullptr) {
        throw std::logic_error("Comparator for a Reference or NullableValueType shape requires an unwrap callback");
    }
}

Comparator Comparator::assemble(meta::TypeDescriptor const& descriptor) {
    std::vector<FieldCheck> checks;
    checks.reserve(descriptor.fields_.size());
    for (auto const& field : descriptor.fields_) {
        checks.push_back(FieldCheck{field.accessor_, field.equals_});
    }
    return Comparator{descriptor.shape_, std::move(checks), descriptor.unwrap_};
}

bool Comparator::operator()(void const* lhs, void const* rhs) const {
    switch (shape_) {
    case ShapeCategory::ValueType:
        return fieldwiseEqual(lhs, rhs);

    case ShapeCategory::Reference:
    case ShapeCategory::NullableValueType: {
        // null handle / empty optional
        auto a = unwrap_(lhs);
        auto b = unwrap_(rhs);
        if (a == nullptr || b == nullptr) {
            return a == b;
        }
        return fieldwiseEqual(a, b);
    }
    }
    return false;
}

bool Comparator::fieldwiseEqual(void const* lhs, void const* rhs) const {
    for (auto const& check : checks_) {
        if (!check.equals_(check.accessor_(lhs), check.accessor_(rhs))) {
            return false;
        }
    }
    return true;
}

ShapeCategory Comparator::shape() const noexcept { return shape_; }

std::size_t Comparator::fieldCount() const noexcept { return checks_.size(); }


} // namespace fieldwise
