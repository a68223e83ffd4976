#include <string>

#include "function_literal.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto function_literal::string() const -> std::string
{
    if (parameter_type != nullptr) {
        return fmt::format("\\({} : {}) -> {}", parameter, parameter_type->string(), body->string());
    }
    return fmt::format("\\{} -> {}", parameter, body->string());
}

void function_literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
