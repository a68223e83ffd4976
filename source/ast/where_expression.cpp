#include <string>

#include "where_expression.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto where_expression::string() const -> std::string
{
    return fmt::format("{} where {}", body->string(), join(groups, "; "));
}

void where_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
