#pragma once
#include "fieldwise/Forward.hpp"
#include "fieldwise/Global.hpp"

#include <cstddef>
#include <vector>


namespace fieldwise {


/**
 * 合成的比较器 / A synthesized comparator for one static type T
 *
 * operator() 接受两个 T 的地址. 比较器不可变, 可并发调用.
 * operator() takes the addresses of two T values. Immutable, safe to call concurrently.
 */
class FIELDWISE_EXTERN Comparator final {
public:
    struct FieldCheck {
        FieldAccessor       accessor_;
        FieldEqualsCallback equals_;
    };

    explicit Comparator(ShapeCategory shape, std::vector<FieldCheck> checks, UnwrapCallback unwrap);

    /**
     * 由描述组装比较器 / Assemble the comparator for a descriptor
     * @note 只复制字段检查, 不持有 descriptor 的引用 / Copies the checks, keeps no reference to the descriptor
     */
    [[nodiscard]] static Comparator assemble(meta::TypeDescriptor const& descriptor);

    [[nodiscard]] bool operator()(void const* lhs, void const* rhs) const;

    // AND over all field checks, left to right, stops at the first mismatch
    [[nodiscard]] bool fieldwiseEqual(void const* lhs, void const* rhs) const;

    [[nodiscard]] ShapeCategory shape() const noexcept;
    [[nodiscard]] std::size_t   fieldCount() const noexcept;

private:
    ShapeCategory           shape_;
    std::vector<FieldCheck> checks_;
    UnwrapCallback          unwrap_{nullptr};
};


} // namespace fieldwise
