#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "selector.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto selector::tuple_sel(std::size_t index, std::optional<std::size_t> arity) -> selector
{
    return selector {.k = kind::tuple, .index = index, .field = {}, .size = arity, .field_names = {}};
}

auto selector::record_sel(std::string field, std::optional<std::vector<std::string>> fields) -> selector
{
    return selector {.k = kind::record, .index = 0, .field = std::move(field), .size = {}, .field_names = std::move(fields)};
}

auto selector::list_sel(std::size_t index, std::optional<std::size_t> length) -> selector
{
    return selector {.k = kind::list, .index = index, .field = {}, .size = length, .field_names = {}};
}

auto selector::string() const -> std::string
{
    switch (k) {
        case kind::tuple:
            return std::to_string(index);
        case kind::record:
            return field;
        case kind::list:
            return fmt::format("@{}", index);
    }
    return "?";
}

auto select_expression::string() const -> std::string
{
    return fmt::format("{}.{}", target->string(), sel.string());
}

void select_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto update_expression::string() const -> std::string
{
    return fmt::format("{{ {} | {} = {} }}", target->string(), sel.string(), value->string());
}

void update_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
