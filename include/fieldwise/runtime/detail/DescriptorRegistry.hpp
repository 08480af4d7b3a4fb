#pragma once
#include "fieldwise/Global.hpp"
#include "fieldwise/meta/TypeDefine.hpp"
#include "fieldwise/reflection/TypeId.hpp"

#include <mutex>
#include <unordered_map>


namespace fieldwise::detail {


/**
 * 进程级的类型布局注册表 / Process-wide registry of user defined type layouts, keyed by TypeId
 * @note 只追加, 不会移除 / Append only
 */
class FIELDWISE_EXTERN DescriptorRegistry final {
public:
    FIELDWISE_DISABLE_COPY_MOVE(DescriptorRegistry);

    static DescriptorRegistry& instance();

    /**
     * @return false if this very define is already registered
     * @throws std::logic_error if another define is registered for the same type
     */
    bool tryRegister(meta::TypeDefine const& def);

    [[nodiscard]] meta::TypeDefine const* find(reflection::TypeId id) const;

    [[nodiscard]] bool contains(reflection::TypeId id) const;

private:
    DescriptorRegistry() = default;

    mutable std::mutex                                       mutex_;
    std::unordered_map<reflection::TypeId, meta::TypeDefine const*, reflection::TypeIdHasher> defines_;
};


} // namespace fieldwise::detail
