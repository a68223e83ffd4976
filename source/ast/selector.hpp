#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "expression.hpp"
#include "type.hpp"

struct selector final
{
    enum class kind : std::uint8_t
    {
        tuple,
        record,
        list,
    };

    static auto tuple_sel(std::size_t index, std::optional<std::size_t> arity = {}) -> selector;
    static auto record_sel(std::string field, std::optional<std::vector<std::string>> fields = {}) -> selector;
    static auto list_sel(std::size_t index, std::optional<std::size_t> length = {}) -> selector;

    [[nodiscard]] auto string() const -> std::string;

    kind k {};
    std::size_t index {};
    std::string field;
    // shape of the container as seen by the type checker, when known
    std::optional<std::size_t> size;
    std::optional<std::vector<std::string>> field_names;
};

struct select_expression final : expression
{
    select_expression(const expression* expr, selector sel)
        : target {expr}
        , sel {std::move(sel)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    const expression* target {};
    selector sel;
};

struct update_expression final : expression
{
    update_expression(const type_expr* type, const expression* expr, selector sel, const expression* val)
        : target_type {type}
        , target {expr}
        , sel {std::move(sel)}
        , value {val}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    const type_expr* target_type {};
    const expression* target {};
    selector sel;
    const expression* value {};
};
