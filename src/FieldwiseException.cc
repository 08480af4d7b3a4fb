#include "fieldwise/FieldwiseException.hpp"

#include <exception>
#include <utility>


namespace fieldwise {

struct FieldwiseException::ExceptionContext {
    Type        type_{Type::Any};
    std::string message_{};
};

FieldwiseException::FieldwiseException(std::string message, Type type)
: FieldwiseException{type, std::move(message)} {}

FieldwiseException::FieldwiseException(Type type, std::string message)
: std::exception(),
  data_(std::make_shared<ExceptionContext>()) {
    data_->type_    = type;
    data_->message_ = std::move(message);
}

FieldwiseException::Type FieldwiseException::type() const noexcept { return data_->type_; }

char const* FieldwiseException::what() const noexcept { return data_->message_.c_str(); }

std::string FieldwiseException::message() const noexcept { return data_->message_; }


} // namespace fieldwise
