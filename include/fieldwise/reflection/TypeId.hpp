#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "fieldwise/traits/TypeTraits.hpp"

namespace fieldwise::reflection {


/**
 * 类型标识 / Identity of a static type, the key of the define registry and of the comparator cache
 * @note 哈希相同时仍比较类型名 / Equal only when both hash and type name match
 */
struct TypeId {
    std::string_view s;
    uint64_t         h;

    constexpr explicit TypeId(std::string_view s, uint64_t h) noexcept : s(s), h(h) {}
    constexpr explicit TypeId(std::string_view s) noexcept : s(s), h(fnv1a(s)) {}

    [[nodiscard]] constexpr std::string_view str() const noexcept { return s; }
    [[nodiscard]] constexpr uint64_t         hash() const noexcept { return h; }

    constexpr bool operator==(TypeId const& other) const noexcept { return other.h == h && other.s == s; }

    template <typename T>
    [[nodiscard]] constexpr bool isSameOf() const noexcept {
        return TypeId{traits::TypeUnPrefixId_v<T>} == *this;
    }

    static constexpr uint64_t fnv1a(std::string_view s) noexcept {
        uint64_t h = 1469598103934665603ull;
        for (char c : s) h = (h ^ static_cast<unsigned char>(c)) * 1099511628211ull;
        return h;
    }
};

struct TypeIdHasher {
    std::size_t operator()(TypeId const& id) const noexcept { return static_cast<std::size_t>(id.h); }
};

template <typename T>
[[nodiscard]] constexpr TypeId getTypeId() noexcept {
    return TypeId{traits::TypeUnPrefixId_v<T>};
}

} // namespace fieldwise::reflection
