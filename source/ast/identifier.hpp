#pragma once

#include <string>
#include <utility>

#include "expression.hpp"

struct identifier final : expression
{
    explicit identifier(std::string val)
        : value {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string value;
};
