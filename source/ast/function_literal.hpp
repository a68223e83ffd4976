#pragma once

#include <string>
#include <utility>

#include "expression.hpp"
#include "type.hpp"

struct function_literal final : expression
{
    function_literal(std::string param, const type_expr* param_type, const expression* bod)
        : parameter {std::move(param)}
        , parameter_type {param_type}
        , body {bod}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string parameter;
    const type_expr* parameter_type {};
    const expression* body {};
};
