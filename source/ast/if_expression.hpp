#pragma once

#include <string>

#include "expression.hpp"
#include "type.hpp"

struct if_expression final : expression
{
    if_expression(const type_expr* type, const expression* cond, const expression* cons, const expression* alt)
        : result_type {type}
        , condition {cond}
        , consequence {cons}
        , alternative {alt}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    const type_expr* result_type {};
    const expression* condition {};
    const expression* consequence {};
    const expression* alternative {};
};
