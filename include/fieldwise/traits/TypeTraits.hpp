#pragma once
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>

namespace fieldwise::traits {


namespace internal {

template <typename T>
consteval std::string_view getRawTypeId() noexcept {
#if defined(_MSC_VER)
    constexpr std::string_view s{__FUNCSIG__};
    constexpr std::string_view f{"getRawTypeId<"};
    constexpr std::string_view e{">(void) noexcept"};
    constexpr auto             p = s.find(f) + f.size();
    return s.substr(p, s.size() - p - e.size());
#elif defined(__clang__)
    constexpr std::string_view s{__PRETTY_FUNCTION__};
    constexpr std::string_view f{"[T = "};
    constexpr std::string_view e{"]"};
    constexpr auto             p = s.find(f) + f.size();
    return s.substr(p, s.size() - p - e.size());
#else
    // gcc: "... [with T = int; std::string_view = std::basic_string_view<char>]"
    constexpr std::string_view s{__PRETTY_FUNCTION__};
    constexpr std::string_view f{"[with T = "};
    constexpr auto             p = s.find(f) + f.size();
    constexpr auto             q = s.find(';', p) == std::string_view::npos ? s.rfind(']') : s.find(';', p);
    return s.substr(p, q - p);
#endif
}

constexpr std::string_view removeTypePrefix(std::string_view s) noexcept {
    auto trim = [&](std::string_view prefix) {
        if (s.starts_with(prefix)) s.remove_prefix(prefix.size());
    };
    trim("enum ");
    trim("class ");
    trim("struct ");
    trim("union ");
    return s;
}

} // namespace internal

template <typename T>
constexpr std::string_view TypeRawId_v = internal::getRawTypeId<T>();

template <typename T>
constexpr std::string_view TypeUnPrefixId_v = internal::removeTypePrefix(TypeRawId_v<T>);

template <typename>
constexpr bool AlwaysFalse_v = false;


template <typename T>
struct IsOptional : std::false_type {};

template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T>
constexpr bool IsOptional_v = IsOptional<std::remove_cv_t<T>>::value;


/**
 * 对象句柄 (C++ 中的引用类型) / Object handles, the C++ reference types
 * Handle<T>::Pointee is the referenced type, get() reads the raw address.
 */
template <typename T>
struct HandleTraits {
    static constexpr bool isHandle = false;
};

template <typename T>
struct HandleTraits<T*> {
    static constexpr bool isHandle = true;
    using Pointee                  = std::remove_cv_t<T>;

    static constexpr void const* get(T* const& ptr) noexcept { return ptr; }
};

template <typename T>
struct HandleTraits<std::shared_ptr<T>> {
    static constexpr bool isHandle = true;
    using Pointee                  = std::remove_cv_t<T>;

    static void const* get(std::shared_ptr<T> const& ptr) noexcept { return ptr.get(); }
};

template <typename T, typename D>
struct HandleTraits<std::unique_ptr<T, D>> {
    static constexpr bool isHandle = true;
    using Pointee                  = std::remove_cv_t<T>;

    static void const* get(std::unique_ptr<T, D> const& ptr) noexcept { return ptr.get(); }
};

template <typename T>
using Pointee_t = typename HandleTraits<std::remove_cv_t<T>>::Pointee;


} // namespace fieldwise::traits
