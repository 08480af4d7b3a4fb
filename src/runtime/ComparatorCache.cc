#include "fieldwise/runtime/ComparatorCache.hpp"

#include <utility>


namespace fieldwise {


ComparatorCache::Entry::Entry(meta::TypeDescriptor descriptor)
: descriptor_(std::move(descriptor)),
  comparator_(Comparator::assemble(descriptor_)) {}


ComparatorCache& ComparatorCache::instance() {
    static ComparatorCache cache;
    return cache;
}

ComparatorCache::Entry const& ComparatorCache::getOrBuild(reflection::TypeId id, EntryFactory factory) {
    {
        std::lock_guard lock{mutex_};
        if (auto iter = entries_.find(id); iter != entries_.end()) {
            return *iter->second;
        }
    }

    // built outside the lock, a concurrent duplicate is dropped by try_emplace
    auto built = factory();

    std::lock_guard lock{mutex_};
    auto iter = entries_.try_emplace(id, std::move(built)).first;
    return *iter->second;
}

bool ComparatorCache::contains(reflection::TypeId id) const {
    std::lock_guard lock{mutex_};
    return entries_.contains(id);
}

std::size_t ComparatorCache::size() const {
    std::lock_guard lock{mutex_};
    return entries_.size();
}


} // namespace fieldwise
