#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "declaration.hpp"
#include "expression.hpp"
#include "type.hpp"

struct match final
{
    enum class kind : std::uint8_t
    {
        from,
        let,
    };

    [[nodiscard]] auto string() const -> std::string;

    kind k {};
    // from
    std::string name;
    const type_expr* length {};
    const type_expr* element_type {};
    const expression* source {};
    // let
    const decl* binding {};
};

auto from(std::string name, const type_expr* len, const type_expr* elem_type, const expression* source)
    -> const match*;
auto let(const decl* binding) -> const match*;

using matches = std::vector<const match*>;

struct comprehension_expression final : expression
{
    comprehension_expression(const type_expr* len,
                             const type_expr* elem_type,
                             const expression* hd,
                             std::vector<matches> arms)
        : length {len}
        , element_type {elem_type}
        , head {hd}
        , branches {std::move(arms)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    const type_expr* length {};
    const type_expr* element_type {};
    const expression* head {};
    std::vector<matches> branches;
};
