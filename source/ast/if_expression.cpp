#include <string>

#include "if_expression.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto if_expression::string() const -> std::string
{
    return fmt::format("if {} then {} else {}", condition->string(), consequence->string(), alternative->string());
}

void if_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
