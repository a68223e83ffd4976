#include <string>
#include <vector>

#include "aggregate_expressions.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "util.hpp"
#include "visitor.hpp"

auto list_expression::string() const -> std::string
{
    return fmt::format("[{}]", join(elements, ", "));
}

void list_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto tuple_expression::string() const -> std::string
{
    return fmt::format("({})", join(elements, ", "));
}

void tuple_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto record_expression::string() const -> std::string
{
    std::vector<std::string> strs;
    for (const auto& [name, value] : fields) {
        strs.push_back(fmt::format("{} = {}", name, value->string()));
    }
    return fmt::format("{{{}}}", fmt::join(strs, ", "));
}

void record_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
