#pragma once
#include "fieldwise/Global.hpp"

#include <exception>
#include <memory>
#include <string>


namespace fieldwise {


/**
 * 库运行期错误 / Runtime failure raised by the library itself
 * @note 用户的 operator== / equals 抛出的异常不会被包装, 原样传递给调用者
 * @note Exceptions thrown by user equality (operator==, equals) are never wrapped and reach the caller unchanged
 */
class FIELDWISE_EXTERN FieldwiseException final : public std::exception {
public:
    enum class Type {
        Any,
        IntrospectionError // no field layout available for a type
    };

    explicit FieldwiseException(std::string message, Type type = Type::Any);
    explicit FieldwiseException(Type type, std::string message);

    // The C++ standard requires exception classes to be reproducible
    FieldwiseException(FieldwiseException const&)                = default;
    FieldwiseException& operator=(FieldwiseException const&)     = default;
    FieldwiseException(FieldwiseException&&) noexcept            = default;
    FieldwiseException& operator=(FieldwiseException&&) noexcept = default;

    [[nodiscard]] Type type() const noexcept;

    [[nodiscard]] char const* what() const noexcept override;

    [[nodiscard]] std::string message() const noexcept;

private:
    struct ExceptionContext;
    std::shared_ptr<ExceptionContext> data_{nullptr};
};


} // namespace fieldwise
