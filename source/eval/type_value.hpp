#pragma once

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <ast/type.hpp>
#include <fmt/ostream.h>

#include "nat.hpp"

// Runtime representation of a value type after all type variables are known.
struct tvalue final
{
    enum class kind : std::uint8_t
    {
        bit,
        integer,
        seq,
        stream,
        tuple,
        record,
        function,
    };

    static auto bit() -> tvalue;
    static auto integer() -> tvalue;
    static auto seq(std::uint64_t len, tvalue elem) -> tvalue;
    static auto stream(tvalue elem) -> tvalue;
    static auto sequence(nat len, tvalue elem) -> tvalue;
    static auto tuple(std::vector<tvalue> elems) -> tvalue;
    static auto record(std::vector<std::pair<std::string, tvalue>> fields) -> tvalue;
    static auto function(tvalue arg, tvalue res) -> tvalue;

    [[nodiscard]] auto is(kind knd) const -> bool { return k == knd; }

    [[nodiscard]] auto element() const -> const tvalue&;
    [[nodiscard]] auto length() const -> nat;
    [[nodiscard]] auto string() const -> std::string;

    auto operator==(const tvalue& other) const -> bool = default;

    kind k {};
    std::uint64_t len {};
    // seq/stream: element; tuple: components; record: field types; function: argument, result
    std::vector<tvalue> elems;
    std::vector<std::string> fields;
};

auto operator<<(std::ostream& ostrm, const tvalue& type) -> std::ostream&;

template<>
struct fmt::formatter<tvalue> : ostream_formatter
{
};

using type_binding = std::variant<nat, tvalue>;
using type_env = std::map<std::string, type_binding>;

auto eval_num_type(const type_env& env, const type_expr* type) -> nat;
auto eval_value_type(const type_env& env, const type_expr* type) -> tvalue;
auto eval_type(const type_env& env, const type_expr* type) -> type_binding;
