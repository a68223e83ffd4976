#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/ostream.h>

enum class type_kind : std::uint8_t
{
    type,
    num,
    prop,
};

auto operator<<(std::ostream& ostrm, type_kind knd) -> std::ostream&;

template<>
struct fmt::formatter<type_kind> : ostream_formatter
{
};

struct type_param
{
    std::string name;
    type_kind kind {type_kind::type};
};

struct type_expr final
{
    enum class tag : std::uint8_t
    {
        var,
        num,
        inf,
        bit,
        integer,
        seq,
        tuple,
        record,
        function,
        add,
        sub,
        mul,
        min,
        max,
    };

    [[nodiscard]] auto string() const -> std::string;

    tag t {};
    std::string name;
    std::uint64_t number {};
    // seq: length, element; function: argument, result; operators: lhs, rhs
    std::vector<const type_expr*> args;
    std::vector<std::string> fields;
};

struct schema final
{
    [[nodiscard]] auto string() const -> std::string;

    std::vector<type_param> params;
    std::vector<const type_expr*> props;
    const type_expr* type {};
};

auto t_var(std::string name) -> const type_expr*;
auto t_num(std::uint64_t num) -> const type_expr*;
auto t_inf() -> const type_expr*;
auto t_bit() -> const type_expr*;
auto t_integer() -> const type_expr*;
auto t_seq(const type_expr* len, const type_expr* elem) -> const type_expr*;
auto t_word(std::uint64_t width) -> const type_expr*;
auto t_stream(const type_expr* elem) -> const type_expr*;
auto t_tuple(std::vector<const type_expr*> elems) -> const type_expr*;
auto t_record(std::vector<std::pair<std::string, const type_expr*>> fields) -> const type_expr*;
auto t_fun(const type_expr* arg, const type_expr* res) -> const type_expr*;
auto t_op(type_expr::tag oper, const type_expr* lhs, const type_expr* rhs) -> const type_expr*;

auto mono(const type_expr* type) -> const schema*;
