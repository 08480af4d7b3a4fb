#include "fieldwise/meta/TypeDefine.hpp"

#include <vector>


namespace fieldwise::meta {


std::vector<FieldDefine> TypeDefine::flattenFields() const {
    std::vector<FieldDefine> result;
    if (base_ != nullptr) {
        for (auto const& inherited : base_->flattenFields()) {
            result.emplace_back(inherited.rebase(upcast_));
        }
    }
    for (auto const& own : fields_) {
        result.emplace_back(own);
    }
    return result;
}


} // namespace fieldwise::meta
