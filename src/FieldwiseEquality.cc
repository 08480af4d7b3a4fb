#include "fieldwise/FieldwiseEquality.hpp"
#include "fieldwise/runtime/detail/DescriptorRegistry.hpp"


namespace fieldwise {


bool registerType(meta::TypeDefine const& def) { return detail::DescriptorRegistry::instance().tryRegister(def); }


} // namespace fieldwise
