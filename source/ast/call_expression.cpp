#include <string>

#include "call_expression.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto call_expression::string() const -> std::string
{
    return fmt::format("({} {})", function->string(), argument->string());
}

void call_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
