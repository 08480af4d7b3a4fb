#pragma once
#include "fieldwise/Forward.hpp"
#include "fieldwise/Global.hpp"
#include "fieldwise/bind/adapter/StrategyAdapter.hpp"
#include "fieldwise/meta/TypeDescriptor.hpp"
#include "fieldwise/reflection/TypeId.hpp"
#include "fieldwise/runtime/Comparator.hpp"
#include "fieldwise/runtime/detail/DescriptorFactory.hpp"
#include "fieldwise/runtime/detail/DescriptorRegistry.hpp"

#include <cstddef>
#include <cstring>
#include <memory>
#include <mutex>
#include <unordered_map>


namespace fieldwise {


/**
 * 进程级比较器缓存 / Process-wide comparator cache, keyed by the static type's TypeId
 *
 * @note 只追加, 永不失效 / Append only, entries are never evicted
 * @note 并发首次构建可能重复执行, 先插入者胜出, 其余结果被丢弃
 *       Concurrent first builds may run redundantly, the first insert wins and the others are discarded
 * @note 构建失败不会被缓存 / A failed build is not cached, the next request builds again
 */
class FIELDWISE_EXTERN ComparatorCache final {
public:
    FIELDWISE_DISABLE_COPY_MOVE(ComparatorCache);

    struct Entry {
        meta::TypeDescriptor const descriptor_;
        Comparator const           comparator_;

        explicit Entry(meta::TypeDescriptor descriptor);
    };
    using EntryFactory = std::unique_ptr<Entry const> (*)();

    static ComparatorCache& instance();

    template <typename T>
    [[nodiscard]] static Comparator const& get() {
        return entry<T>().comparator_;
    }

    template <typename T>
    [[nodiscard]] static meta::TypeDescriptor const& descriptor() {
        return entry<T>().descriptor_;
    }

    template <typename T>
    [[nodiscard]] static Entry const& entry() {
        constexpr auto id = reflection::getTypeId<T>();
        return instance().getOrBuild(id, []() -> std::unique_ptr<Entry const> {
            return std::make_unique<Entry const>(detail::buildDescriptor<T>());
        });
    }

    Entry const& getOrBuild(reflection::TypeId id, EntryFactory factory);

    template <typename T>
    [[nodiscard]] bool contains() const {
        return contains(reflection::getTypeId<T>());
    }

    [[nodiscard]] bool contains(reflection::TypeId id) const;

    [[nodiscard]] std::size_t size() const;

private:
    ComparatorCache() = default;

    mutable std::mutex                                          mutex_;
    std::unordered_map<reflection::TypeId, std::unique_ptr<Entry const>, reflection::TypeIdHasher> entries_;
};


namespace bind::adapter::internal {

template <typename T>
bool delegateEquals(void const* lhs, void const* rhs) {
    return ComparatorCache::get<T>()(lhs, rhs);
}

template <typename T>
bool registeredOrBytesEquals(void const* lhs, void const* rhs) {
    if (detail::DescriptorRegistry::instance().contains(reflection::getTypeId<T>())) {
        return ComparatorCache::get<T>()(lhs, rhs);
    }
    return std::memcmp(lhs, rhs, sizeof(T)) == 0;
}

} // namespace bind::adapter::internal

} // namespace fieldwise
