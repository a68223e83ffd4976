#pragma once

#include <string>
#include <utility>

#include "declaration.hpp"
#include "expression.hpp"

struct where_expression final : expression
{
    where_expression(const expression* bod, decl_groups grps)
        : body {bod}
        , groups {std::move(grps)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    const expression* body {};
    decl_groups groups;
};
