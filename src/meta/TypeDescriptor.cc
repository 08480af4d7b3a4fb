#include "fieldwise/meta/TypeDescriptor.hpp"

#include <algorithm>
#include <format>
#include <iterator>


namespace fieldwise::meta {


FieldDefine const* TypeDescriptor::findField(std::string const& name) const {
    auto iter = std::find_if(fields_.begin(), fields_.end(), [&name](FieldDefine const& field) {
        return field.name_ == name;
    });
    return iter == fields_.end() ? nullptr : &*iter;
}

std::string TypeDescriptor::toString() const {
    std::string out = std::format("{} : {}", typeId_.str(), fieldwise::toString(shape_));
    if (fieldOwner_ != typeId_) {
        std::format_to(std::back_inserter(out), " of {}", fieldOwner_.str());
    }
    out += " {\n";
    for (auto const& field : fields_) {
        std::format_to(
            std::back_inserter(out),
            "    {} : {} [{}]\n",
            field.name_,
            field.typeId_.str(),
            fieldwise::toString(field.strategy_)
        );
    }
    out += "}";
    return out;
}


} // namespace fieldwise::meta
