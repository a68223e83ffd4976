#pragma once

#include <string>
#include <utility>
#include <vector>

#include "expression.hpp"
#include "type.hpp"

struct list_expression final : expression
{
    list_expression(expressions elems, const type_expr* elem_type)
        : elements {std::move(elems)}
        , element_type {elem_type}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expressions elements;
    const type_expr* element_type {};
};

struct tuple_expression final : expression
{
    explicit tuple_expression(expressions elems)
        : elements {std::move(elems)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expressions elements;
};

struct record_expression final : expression
{
    using field = std::pair<std::string, const expression*>;

    explicit record_expression(std::vector<field> flds)
        : fields {std::move(flds)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::vector<field> fields;
};
