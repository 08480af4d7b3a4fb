#include "fieldwise/runtime/detail/DescriptorRegistry.hpp"

#include <format>
#include <stdexcept>


namespace fieldwise::detail {


DescriptorRegistry& DescriptorRegistry::instance() {
    static DescriptorRegistry registry;
    return registry;
}

bool DescriptorRegistry::tryRegister(meta::TypeDefine const& def) {
    std::lock_guard lock{mutex_};
    auto [iter, inserted] = defines_.try_emplace(def.typeId_, &def);
    if (inserted) {
        return true;
    }
    if (iter->second != &def) {
        throw std::logic_error(
            std::format("Type {} already registered as {}", def.typeId_.str(), iter->second->name_)
        );
    }
    return false;
}

meta::TypeDefine const* DescriptorRegistry::find(reflection::TypeId id) const {
    std::lock_guard lock{mutex_};
    auto iter = defines_.find(id);
    return iter == defines_.end() ? nullptr : iter->second;
}

bool DescriptorRegistry::contains(reflection::TypeId id) const { return find(id) != nullptr; }


} // namespace fieldwise::detail
