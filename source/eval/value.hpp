#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <overloaded.hpp>

#include "error.hpp"
#include "nat.hpp"
#include "seq_map.hpp"
#include "thunk.hpp"
#include "type_value.hpp"

template<typename Sym>
struct generic_value final
{
    using bit_type = typename Sym::bit_type;
    using word_type = typename Sym::word_type;
    using integer_type = typename Sym::integer_type;
    using lazy = lazy_value<Sym>;

    struct bit
    {
        bit_type value;
    };

    struct integer
    {
        integer_type value;
    };

    struct word
    {
        word_type value;
    };

    struct seq
    {
        nat length;
        tvalue element;
        seq_map<Sym> values;
    };

    struct tuple
    {
        std::vector<lazy> elements;
    };

    // fields in canonical (sorted) order
    struct record
    {
        std::map<std::string, lazy> fields;
    };

    struct function
    {
        std::function<generic_value(lazy)> apply;
    };

    struct poly
    {
        std::function<generic_value(const tvalue&)> apply;
    };

    struct num_poly
    {
        std::function<generic_value(const nat&)> apply;
    };

    // stands for a computation known to fail; fails when its shape is demanded
    struct error
    {
        eval_error::kind kind {};
        std::string message;
    };

    std::variant<bit, integer, word, seq, tuple, record, function, poly, num_poly, error> data;
};

template<typename Sym>
auto kind_name(const generic_value<Sym>& val) -> std::string_view
{
    using value_type = generic_value<Sym>;
    return std::visit(overloaded {
                          [](const typename value_type::bit&) -> std::string_view { return "bit"; },
                          [](const typename value_type::integer&) -> std::string_view { return "integer"; },
                          [](const typename value_type::word&) -> std::string_view { return "word"; },
                          [](const typename value_type::seq&) -> std::string_view { return "sequence"; },
                          [](const typename value_type::tuple&) -> std::string_view { return "tuple"; },
                          [](const typename value_type::record&) -> std::string_view { return "record"; },
                          [](const typename value_type::function&) -> std::string_view { return "function"; },
                          [](const typename value_type::poly&) -> std::string_view { return "polymorphic value"; },
                          [](const typename value_type::num_poly&) -> std::string_view
                          { return "numeric polymorphic value"; },
                          [](const typename value_type::error&) -> std::string_view { return "error"; },
                      },
                      val.data);
}

template<typename Sym>
auto is_error(const generic_value<Sym>& val) -> bool
{
    return std::holds_alternative<typename generic_value<Sym>::error>(val.data);
}

// Returns the requested alternative. An error placeholder raises its error, any
// other shape is a broken invariant.
template<typename Alt, typename Sym>
auto value_as(const generic_value<Sym>& val, std::string_view expected) -> const Alt&
{
    if (const auto* alt = std::get_if<Alt>(&val.data)) {
        return *alt;
    }
    if (const auto* err = std::get_if<typename generic_value<Sym>::error>(&val.data)) {
        throw eval_error(err->kind, err->message);
    }
    eval_panic("value_as", {fmt::format("expected a {}, got a {}", expected, kind_name(val))});
}

template<typename Sym>
auto from_bit(const generic_value<Sym>& val) -> typename Sym::bit_type
{
    return value_as<typename generic_value<Sym>::bit>(val, "bit").value;
}

template<typename Sym>
auto from_integer(const generic_value<Sym>& val) -> typename Sym::integer_type
{
    return value_as<typename generic_value<Sym>::integer>(val, "integer").value;
}

template<typename Sym>
auto from_tuple(const generic_value<Sym>& val) -> const std::vector<lazy_value<Sym>>&
{
    return value_as<typename generic_value<Sym>::tuple>(val, "tuple").elements;
}

template<typename Sym>
auto from_record(const generic_value<Sym>& val) -> const std::map<std::string, lazy_value<Sym>>&
{
    return value_as<typename generic_value<Sym>::record>(val, "record").fields;
}

template<typename Sym>
auto from_fun(const generic_value<Sym>& val) -> const std::function<generic_value<Sym>(lazy_value<Sym>)>&
{
    return value_as<typename generic_value<Sym>::function>(val, "function").apply;
}

template<typename Sym>
auto make_bit(typename Sym::bit_type bit) -> generic_value<Sym>
{
    return generic_value<Sym> {typename generic_value<Sym>::bit {std::move(bit)}};
}

template<typename Sym>
auto make_integer(typename Sym::integer_type integer) -> generic_value<Sym>
{
    return generic_value<Sym> {typename generic_value<Sym>::integer {std::move(integer)}};
}

template<typename Sym>
auto make_word(typename Sym::word_type word) -> generic_value<Sym>
{
    return generic_value<Sym> {typename generic_value<Sym>::word {std::move(word)}};
}

template<typename Sym>
auto make_seq(nat len, tvalue elem, seq_map<Sym> vals) -> generic_value<Sym>
{
    return generic_value<Sym> {typename generic_value<Sym>::seq {len, std::move(elem), std::move(vals)}};
}

template<typename Sym>
auto make_tuple(std::vector<lazy_value<Sym>> elems) -> generic_value<Sym>
{
    return generic_value<Sym> {typename generic_value<Sym>::tuple {std::move(elems)}};
}

template<typename Sym>
auto make_record(std::map<std::string, lazy_value<Sym>> fields) -> generic_value<Sym>
{
    return generic_value<Sym> {typename generic_value<Sym>::record {std::move(fields)}};
}

template<typename Sym>
auto make_fun(std::function<generic_value<Sym>(lazy_value<Sym>)> func) -> generic_value<Sym>
{
    return generic_value<Sym> {typename generic_value<Sym>::function {std::move(func)}};
}

template<typename Sym>
auto make_poly(std::function<generic_value<Sym>(const tvalue&)> func) -> generic_value<Sym>
{
    return generic_value<Sym> {typename generic_value<Sym>::poly {std::move(func)}};
}

template<typename Sym>
auto make_num_poly(std::function<generic_value<Sym>(const nat&)> func) -> generic_value<Sym>
{
    return generic_value<Sym> {typename generic_value<Sym>::num_poly {std::move(func)}};
}

template<typename Sym>
auto make_error_value(eval_error::kind knd, std::string message) -> generic_value<Sym>
{
    return generic_value<Sym> {typename generic_value<Sym>::error {knd, std::move(message)}};
}

// Implementations of primitive declarations, looked up by name. An empty result
// leaves the primitive unimplemented.
template<typename Sym>
using primitive_table = std::function<std::optional<generic_value<Sym>>(const std::string&)>;
