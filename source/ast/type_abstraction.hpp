#pragma once

#include <string>
#include <utility>

#include "expression.hpp"
#include "type.hpp"

struct type_abstraction final : expression
{
    type_abstraction(type_param param, const expression* bod)
        : parameter {std::move(param)}
        , body {bod}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    type_param parameter;
    const expression* body {};
};

struct type_application final : expression
{
    type_application(const expression* expr, const type_expr* arg)
        : function {expr}
        , argument {arg}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    const expression* function {};
    const type_expr* argument {};
};

// Evidence for constraints has no runtime representation.
struct proof_abstraction final : expression
{
    proof_abstraction(const type_expr* prop, const expression* bod)
        : property {prop}
        , body {bod}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    const type_expr* property {};
    const expression* body {};
};

struct proof_application final : expression
{
    explicit proof_application(const expression* expr)
        : body {expr}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    const expression* body {};
};
