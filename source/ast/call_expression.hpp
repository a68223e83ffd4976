#pragma once

#include <string>

#include "expression.hpp"

struct call_expression final : expression
{
    call_expression(const expression* func, const expression* arg)
        : function {func}
        , argument {arg}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    const expression* function {};
    const expression* argument {};
};
